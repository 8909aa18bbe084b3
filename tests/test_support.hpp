#pragma once
#include <chrono>
#include <filesystem>
#include <future>
#include <map>
#include <memory>
#include <optional>
#include <random>
#include <string>
#include <system_error>
#include <utility>
#include <vector>
#include "bags/controller.hpp"
#include "bags/domain.hpp"
#include "bags/market_data.hpp"
#include "bags/notifier.hpp"
#include "bags/secure_store.hpp"

// In-memory collaborators shared by the test programs

namespace test {

template <typename T>
std::future<T> ready(T value) {
  std::promise<T> promise;
  promise.set_value(std::move(value));
  return promise.get_future();
}

template <typename T>
std::future<T> failed(const std::string& message) {
  std::promise<T> promise;
  promise.set_exception(std::make_exception_ptr(bags::MarketDataError(message)));
  return promise.get_future();
}

template <typename T>
std::future<T> systemFailure() {
  return bags::runDetached([]() -> T {
    throw std::system_error(std::make_error_code(std::errc::no_such_file_or_directory),
                            "set_default_verify_paths");
  });
}

inline bags::Coin makeCoin(const std::string& id, const std::string& name, const std::string& symbol,
                           double price, std::optional<uint32_t> rank = std::nullopt,
                           std::optional<double> change_24h = std::nullopt) {
  bags::Coin coin;
  coin.id = id;
  coin.name = name;
  coin.symbol = symbol;
  coin.current_price = price;
  coin.market_cap_rank = rank;
  coin.price_change_24h = change_24h;
  return coin;
}

// What the fake provider serves, and how often it was asked
struct FakeMarket {
  std::vector<bags::Coin> coins;
  std::map<std::string, bags::Coin> singles;
  std::map<std::pair<std::string, int>, std::vector<double>> series;
  std::vector<bags::SearchResult> search_results;

  bool fail_snapshot = false;
  bool fail_series = false;
  bool fail_search = false;
  // Workers die with a non-provider exception, as a TLS setup failure would
  bool system_failures = false;
  // Series requests stay unresolved until complete() is called
  bool defer_series = false;
  std::map<std::pair<std::string, int>, std::promise<std::vector<double>>> deferred;

  int snapshot_calls = 0;
  int series_calls = 0;
  int single_calls = 0;
  int search_calls = 0;
  std::string last_currency;

  void complete(const std::string& coin_id, int days, std::vector<double> values) {
    auto it = deferred.find({coin_id, days});
    if (it != deferred.end()) {
      it->second.set_value(std::move(values));
      deferred.erase(it);
    }
  }

  void fail(const std::string& coin_id, int days, const std::string& message) {
    auto it = deferred.find({coin_id, days});
    if (it != deferred.end()) {
      it->second.set_exception(std::make_exception_ptr(bags::MarketDataError(message)));
      deferred.erase(it);
    }
  }
};

class FakeMarketSource : public bags::MarketDataSource {
public:
  explicit FakeMarketSource(std::shared_ptr<FakeMarket> market) : market_(std::move(market)) {}

  std::future<std::vector<bags::Coin>> fetchSnapshot(const std::string& currency, size_t) override {
    ++market_->snapshot_calls;
    market_->last_currency = currency;
    if (market_->system_failures) return systemFailure<std::vector<bags::Coin>>();
    if (market_->fail_snapshot) return failed<std::vector<bags::Coin>>("HTTP 503: service unavailable");
    return ready(market_->coins);
  }

  std::future<std::vector<double>> fetchSeries(const std::string& coin_id, const std::string&, int days) override {
    ++market_->series_calls;
    if (market_->fail_series) return failed<std::vector<double>>("HTTP 429: rate limited");
    if (market_->defer_series) {
      auto& promise = market_->deferred[{coin_id, days}];
      promise = std::promise<std::vector<double>>();
      return promise.get_future();
    }
    auto it = market_->series.find({coin_id, days});
    return ready(it != market_->series.end() ? it->second : std::vector<double>{});
  }

  std::future<std::vector<bags::SearchResult>> search(const std::string&) override {
    ++market_->search_calls;
    if (market_->system_failures) return systemFailure<std::vector<bags::SearchResult>>();
    if (market_->fail_search) return failed<std::vector<bags::SearchResult>>("HTTP 500: search down");
    return ready(market_->search_results);
  }

  std::future<std::optional<bags::Coin>> fetchSingle(const std::string& coin_id, const std::string&) override {
    ++market_->single_calls;
    auto it = market_->singles.find(coin_id);
    return ready(it != market_->singles.end() ? std::optional<bags::Coin>(it->second) : std::nullopt);
  }

  std::future<bags::GlobalStats> fetchGlobalStats(const std::string&) override {
    if (market_->system_failures) return systemFailure<bags::GlobalStats>();
    bags::GlobalStats stats;
    stats.total_market_cap = 2.5e12;
    stats.btc_dominance = 52.3;
    return ready(stats);
  }

  std::future<bags::Sentiment> fetchSentiment() override {
    return failed<bags::Sentiment>("sentiment offline");
  }

private:
  std::shared_ptr<FakeMarket> market_;
};

struct Notification {
  bags::NotificationMethod method;
  std::string topic;
  std::string title;
  std::string body;
};

class RecordingNotifier : public bags::Notifier {
public:
  void send(bags::NotificationMethod method, const std::string& topic,
            const std::string& title, const std::string& body) override {
    sent.push_back({method, topic, title, body});
  }

  std::vector<Notification> sent;
};

// Scratch directory removed on scope exit
class TempDir {
public:
  TempDir() {
    std::random_device rd;
    path_ = std::filesystem::temp_directory_path() / ("bags-test-" + std::to_string(rd()));
    std::filesystem::create_directories(path_);
  }
  ~TempDir() {
    std::error_code ec;
    std::filesystem::remove_all(path_, ec);
  }
  TempDir(const TempDir&) = delete;
  TempDir& operator=(const TempDir&) = delete;

  const std::filesystem::path& path() const { return path_; }
  std::string file(const std::string& name) const { return (path_ / name).string(); }

private:
  std::filesystem::path path_;
};

// Controller wired to fakes and an in-memory store
struct Harness {
  TempDir dir;
  std::shared_ptr<FakeMarket> market = std::make_shared<FakeMarket>();
  RecordingNotifier notifier;
  bags::AppState state;
  bags::Config config;
  bags::DocumentStore* store = nullptr;  // owned by the controller's session store
  std::unique_ptr<bags::AppController> controller;

  Harness() {
    config.setConfigFilePath(dir.file("config.json"));
    auto factory = [m = market](const bags::Settings&) {
      return std::unique_ptr<bags::MarketDataSource>(std::make_unique<FakeMarketSource>(m));
    };
    auto opener = [this](const std::string& password) {
      if (password != "hunter2") throw bags::WrongPasswordError();
      auto doc = std::make_unique<bags::DocumentStore>();
      store = doc.get();
      return std::unique_ptr<bags::SecureStore>(std::move(doc));
    };
    controller = std::make_unique<bags::AppController>(state, config, factory, opener, notifier);
  }

  void unlock() {
    controller->unlock("hunter2");
    state.mode = bags::mode::Browsing{};
    if (auto* engine = controller->alertEngine()) {
      engine->setBellHandler([] {});
    }
  }
};

} // namespace test
