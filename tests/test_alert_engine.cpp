#include "bags/alert_engine.hpp"
#include "test_support.hpp"
#include <cassert>
#include <future>
#include <iostream>
#include <thread>

using bags::AlertDirection;

namespace {

struct Fixture {
  bags::DocumentStore* doc = nullptr;
  std::unique_ptr<bags::SessionStore> store;
  test::RecordingNotifier notifier;
  std::unique_ptr<bags::AlertEngine> engine;
  bags::AppState state;
  int bells = 0;

  Fixture() {
    auto owned = std::make_unique<bags::DocumentStore>();
    doc = owned.get();
    store = std::make_unique<bags::SessionStore>(std::move(owned));
    engine = std::make_unique<bags::AlertEngine>(*store, notifier);
    engine->setBellHandler([this] { ++bells; });
    state.mode = bags::mode::Browsing{};
    state.settings.notification_method = bags::NotificationMethod::Desktop;
    state.market.coins = {test::makeCoin("btc", "Bitcoin", "btc", 50000, 1)};
  }

  int64_t addAlert(double target, AlertDirection direction) {
    int64_t id = doc->insertAlert("btc", target, direction);
    state.portfolio.alerts = doc->alerts();
    return id;
  }
};

} // namespace

void test_above_triggers() {
  Fixture f;
  int64_t id = f.addAlert(48000, AlertDirection::Above);

  auto fired = f.engine->evaluate(f.state);
  assert(fired.size() == 1);
  assert(fired[0].alert_id == id);
  assert(fired[0].price == 50000);
  assert(f.state.portfolio.alerts[0].triggered);
  assert(f.state.portfolio.alerts[0].triggered_price == 50000.0);
  assert(f.state.ui.alert_flash == std::optional<std::string>("btc"));
  assert(f.bells == 1);
  assert(f.notifier.sent.size() == 1);
  assert(f.notifier.sent[0].title == "bags: Bitcoin alert");
  assert(f.notifier.sent[0].body == "Bitcoin hit above target 48000.00 (now 50000.00)");

  // Persisted through the non-blocking path
  auto stored = f.doc->alerts();
  assert(stored.size() == 1 && stored[0].triggered);
  assert(stored[0].triggered_price == 50000.0);

  std::cout << "✅ Above alert trigger test passed" << std::endl;
}

void test_below_does_not_trigger() {
  Fixture f;
  f.addAlert(48000, AlertDirection::Below);

  auto fired = f.engine->evaluate(f.state);
  assert(fired.empty());
  assert(!f.state.portfolio.alerts[0].triggered);
  assert(f.notifier.sent.empty());
  assert(f.bells == 0);

  // Boundary: Below fires at equality
  f.state.market.coins[0].current_price = 48000;
  assert(f.engine->evaluate(f.state).size() == 1);

  std::cout << "✅ Below alert test passed" << std::endl;
}

void test_no_duplicate_notification() {
  Fixture f;
  f.addAlert(48000, AlertDirection::Above);

  assert(f.engine->evaluate(f.state).size() == 1);
  assert(f.engine->evaluate(f.state).empty());

  // Price dropping back does not re-arm
  f.state.market.coins[0].current_price = 40000;
  assert(f.engine->evaluate(f.state).empty());
  f.state.market.coins[0].current_price = 60000;
  assert(f.engine->evaluate(f.state).empty());
  assert(f.notifier.sent.size() == 1);
  assert(f.bells == 1);

  std::cout << "✅ No duplicate notification test passed" << std::endl;
}

void test_no_notification_when_disabled() {
  Fixture f;
  f.state.settings.notification_method = bags::NotificationMethod::None;
  f.addAlert(1000, AlertDirection::Above);

  assert(f.engine->evaluate(f.state).size() == 1);
  assert(f.notifier.sent.empty());
  assert(f.bells == 1);

  std::cout << "✅ Notifications disabled test passed" << std::endl;
}

void test_coin_missing_from_snapshot() {
  Fixture f;
  f.doc->insertAlert("doge", 0.01, AlertDirection::Above);
  f.state.portfolio.alerts = f.doc->alerts();

  assert(f.engine->evaluate(f.state).empty());
  assert(!f.state.portfolio.alerts[0].triggered);

  std::cout << "✅ Missing coin test passed" << std::endl;
}

void test_busy_store_queues_write() {
  Fixture f;
  f.addAlert(48000, AlertDirection::Above);

  // Another thread holds the store while the alert fires
  std::promise<void> locked;
  std::promise<void> release;
  std::thread holder([&] {
    auto guard = f.store->acquire();
    locked.set_value();
    release.get_future().wait();
  });
  locked.get_future().wait();

  auto fired = f.engine->evaluate(f.state);
  assert(fired.size() == 1);
  assert(f.state.portfolio.alerts[0].triggered);
  assert(f.engine->pendingWrites() == 1);
  assert(!f.doc->alerts()[0].triggered);

  release.set_value();
  holder.join();

  // Retried on the next evaluation, without firing again
  assert(f.engine->evaluate(f.state).empty());
  assert(f.engine->pendingWrites() == 0);
  assert(f.doc->alerts()[0].triggered);
  assert(f.notifier.sent.size() == 1);

  std::cout << "✅ Busy store retry test passed" << std::endl;
}

void test_merge_keeps_memory_trigger() {
  bags::PriceAlert fired;
  fired.id = 1;
  fired.coin_id = "btc";
  fired.target_price = 48000;
  fired.triggered = true;
  fired.triggered_price = 50000;

  bags::PriceAlert stale = fired;
  stale.triggered = false;
  stale.triggered_price.reset();

  bags::PriceAlert other;
  other.id = 2;
  other.coin_id = "eth";

  auto merged = bags::AlertEngine::merge({fired}, {stale, other});
  assert(merged.size() == 2);
  assert(merged[0].triggered);
  assert(merged[0].triggered_price == 50000.0);
  assert(!merged[1].triggered);

  // Alerts deleted from the store disappear
  merged = bags::AlertEngine::merge({fired, other}, {other});
  assert(merged.size() == 1 && merged[0].id == 2);

  std::cout << "✅ Alert merge test passed" << std::endl;
}

int main() {
  std::cout << "Running AlertEngine tests..." << std::endl;

  test_above_triggers();
  test_below_does_not_trigger();
  test_no_duplicate_notification();
  test_no_notification_when_disabled();
  test_coin_missing_from_snapshot();
  test_busy_store_queues_write();
  test_merge_keeps_memory_trigger();

  std::cout << "🎉 All AlertEngine tests passed" << std::endl;
  return 0;
}
