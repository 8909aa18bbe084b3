#include "bags/alert_engine.hpp"
#include "bags/logger.hpp"
#include <cstdio>
#include <iostream>
#include <unordered_map>

namespace bags {

AlertEngine::AlertEngine(SessionStore& store, Notifier& notifier)
  : store_(store)
  , notifier_(notifier)
  , bell_([] { std::cout << '\a' << std::flush; }) {
}

std::string AlertEngine::notificationTitle(const AlertEvent& event) {
  return "bags: " + event.coin_name + " alert";
}

std::string AlertEngine::notificationBody(const AlertEvent& event) {
  char buffer[256];
  std::snprintf(buffer, sizeof(buffer), "%s hit %s target %.2f (now %.2f)",
                event.coin_name.c_str(), toString(event.direction), event.target_price, event.price);
  return buffer;
}

bool AlertEngine::persistTrigger(int64_t alert_id, double price) {
  try {
    return store_.tryWithLock([&](SecureStore& store) {
      store.markAlertTriggered(alert_id, price);
    });
  } catch (const StoreError& e) {
    LOG_WARN("Persisting alert " + std::to_string(alert_id) + " failed: " + e.what());
    return false;
  }
}

size_t AlertEngine::flushPending() {
  for (auto it = pending_.begin(); it != pending_.end();) {
    if (persistTrigger(it->first, it->second)) {
      it = pending_.erase(it);
    } else {
      ++it;
    }
  }
  return pending_.size();
}

std::vector<AlertEvent> AlertEngine::evaluate(AppState& state, Clock::time_point now) {
  flushPending();

  std::vector<AlertEvent> fired;
  for (auto& alert : state.portfolio.alerts) {
    if (alert.triggered) {
      continue;
    }
    const Coin* coin = state.findCoin(alert.coin_id);
    if (!coin || !alert.isTriggeredBy(coin->current_price)) {
      continue;
    }

    alert.triggered = true;
    alert.triggered_price = coin->current_price;

    AlertEvent event;
    event.alert_id = alert.id;
    event.coin_id = coin->id;
    event.coin_name = coin->name;
    event.direction = alert.direction;
    event.target_price = alert.target_price;
    event.price = coin->current_price;

    LOG_INFO("Alert " + std::to_string(alert.id) + " fired: " + notificationBody(event));

    state.flashAlert(coin->id, now);
    if (bell_) {
      bell_();
    }
    if (state.settings.notification_method != NotificationMethod::None) {
      notifier_.send(state.settings.notification_method, state.settings.ntfy_topic,
                     notificationTitle(event), notificationBody(event));
    }
    if (!persistTrigger(alert.id, coin->current_price)) {
      pending_.emplace_back(alert.id, coin->current_price);
    }

    fired.push_back(std::move(event));
  }
  return fired;
}

std::vector<PriceAlert> AlertEngine::merge(const std::vector<PriceAlert>& current,
                                           std::vector<PriceAlert> stored) {
  std::unordered_map<int64_t, const PriceAlert*> in_memory;
  for (const auto& alert : current) {
    in_memory[alert.id] = &alert;
  }
  for (auto& alert : stored) {
    auto it = in_memory.find(alert.id);
    if (it != in_memory.end() && it->second->triggered && !alert.triggered) {
      alert.triggered = true;
      alert.triggered_price = it->second->triggered_price;
    }
  }
  return stored;
}

} // namespace bags
