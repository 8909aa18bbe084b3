#include <atomic>
#include <chrono>
#include <cstdlib>
#include <iostream>
#include <memory>
#include <string>
#include <thread>
#include <ftxui/component/component.hpp>
#include <ftxui/component/screen_interactive.hpp>
#include "bags/coingecko_client.hpp"
#include "bags/config.hpp"
#include "bags/controller.hpp"
#include "bags/input_machine.hpp"
#include "bags/logger.hpp"
#include "bags/notifier.hpp"
#include "bags/refresh_scheduler.hpp"
#include "bags/router.hpp"
#include "bags/secure_store.hpp"
#include "bags/state.hpp"

using namespace ftxui;

namespace {

void printUsage(const char* program) {
  std::cout << "bags - terminal crypto market tracker" << std::endl;
  std::cout << std::endl;
  std::cout << "Usage: " << program << " [options]" << std::endl;
  std::cout << std::endl;
  std::cout << "Options:" << std::endl;
  std::cout << "  --config <path>  Configuration file (default " << bags::Config::defaultConfigPath() << ")" << std::endl;
  std::cout << "  --data <path>    Encrypted store (default " << bags::Config::defaultStorePath() << ")" << std::endl;
  std::cout << "  --version, -v    Show version information" << std::endl;
  std::cout << "  --help, -h       Show this help message" << std::endl;
  std::cout << std::endl;
  std::cout << "Controls:" << std::endl;
  std::cout << "  j/k, arrows      Move selection" << std::endl;
  std::cout << "  Tab, 1-3         Markets / Favourites / Portfolio" << std::endl;
  std::cout << "  /                Filter by name or symbol" << std::endl;
  std::cout << "  s                Sort picker" << std::endl;
  std::cout << "  Enter            Price chart" << std::endl;
  std::cout << "  f                Toggle favourite" << std::endl;
  std::cout << "  a / b / d        Edit amount / buy price, delete holding" << std::endl;
  std::cout << "  A / X            Add price alert, remove alerts" << std::endl;
  std::cout << "  c                Search and add a coin" << std::endl;
  std::cout << "  S                Settings" << std::endl;
  std::cout << "  r                Refresh now" << std::endl;
  std::cout << "  q / Ctrl+C       Quit" << std::endl;
}

} // namespace

int main(int argc, char* argv[]) {
  std::string config_path = bags::Config::defaultConfigPath();
  std::string store_path = bags::Config::defaultStorePath();

  // Handle command-line arguments
  for (int i = 1; i < argc; i++) {
    std::string arg = argv[i];
    if (arg == "--version" || arg == "-v") {
      std::cout << "bags v1.0.0" << std::endl;
      return 0;
    } else if (arg == "--help" || arg == "-h") {
      printUsage(argv[0]);
      return 0;
    } else if ((arg == "--config" || arg == "--data") && i + 1 < argc) {
      (arg == "--config" ? config_path : store_path) = argv[++i];
    } else {
      std::cerr << "Unknown option: " << arg << std::endl;
      printUsage(argv[0]);
      return 2;
    }
  }

  bags::Config config;
  const bool config_ok = config.load(config_path);
  const auto& app_config = config.getAppConfig();

  auto& logger = bags::Logger::getInstance();
  if (!logger.initialize(app_config.log_file, bags::Logger::stringToLevel(app_config.log_level),
                         false, static_cast<size_t>(app_config.max_log_size_mb))) {
    std::cerr << "Warning: logging to " << app_config.log_file << " is unavailable" << std::endl;
  }
  if (!config_ok) {
    LOG_WARN("Config " + config_path + " is invalid, running with defaults");
  }
  LOG_INFO("Starting bags, store " + store_path);

  bags::AppState state;
  state.mode = bags::mode::Locked{!bags::EncryptedFileStore::exists(store_path), "", ""};

  bags::SystemNotifier notifier;
  bags::MarketSourceFactory source_factory = [](const bags::Settings& settings) {
    return std::unique_ptr<bags::MarketDataSource>(
        std::make_unique<bags::CoinGeckoClient>(settings.coingecko_api_key));
  };
  bags::StoreOpener store_opener = [store_path](const std::string& password) {
    return std::unique_ptr<bags::SecureStore>(bags::EncryptedFileStore::open(store_path, password));
  };

  bags::AppController controller(state, config, source_factory, store_opener, notifier);
  bags::InputStateMachine machine(state, controller);

  auto screen = ScreenInteractive::Fullscreen();
  auto router = bags::MakeRouter(state, controller, machine, [&screen] { screen.Exit(); });

  // Idle tick: drives scheduled refreshes, chart harvesting and error expiry
  std::atomic<bool> running{true};
  std::thread tick_thread([&screen, &running]() {
    while (running.load()) {
      std::this_thread::sleep_for(bags::RefreshScheduler::kTickInterval);
      screen.PostEvent(Event::Custom);
    }
  });

  screen.Loop(router);

  running.store(false);
  tick_thread.join();

  LOG_INFO("bags exiting");
  logger.shutdown();
  return 0;
}
