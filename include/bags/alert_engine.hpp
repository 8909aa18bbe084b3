#pragma once
#include <cstdint>
#include <functional>
#include <string>
#include <utility>
#include <vector>
#include "notifier.hpp"
#include "session_store.hpp"
#include "state.hpp"

namespace bags {

struct AlertEvent {
  int64_t alert_id = 0;
  std::string coin_id;
  std::string coin_name;
  AlertDirection direction = AlertDirection::Above;
  double target_price = 0.0;
  double price = 0.0;
};

/**
 * Fires armed alerts against the current snapshot. An alert moves to triggered
 * exactly once; the in-memory flag is set before any side effect so a repeat
 * evaluation of the same snapshot does nothing.
 *
 * Persisting the flag uses the non-blocking store lock. Writes that cannot be
 * made right away are queued and retried at the start of each evaluation.
 */
class AlertEngine {
public:
  using BellHandler = std::function<void()>;

  AlertEngine(SessionStore& store, Notifier& notifier);

  std::vector<AlertEvent> evaluate(AppState& state, Clock::time_point now = Clock::now());

  // Reconciles alerts re-read from the store with the in-memory list; an
  // alert already triggered in memory stays triggered.
  static std::vector<PriceAlert> merge(const std::vector<PriceAlert>& current,
                                       std::vector<PriceAlert> stored);

  void setBellHandler(BellHandler bell) { bell_ = std::move(bell); }
  size_t pendingWrites() const noexcept { return pending_.size(); }
  // Retries queued trigger writes; returns how many are still outstanding
  size_t flushPending();

  static std::string notificationTitle(const AlertEvent& event);
  static std::string notificationBody(const AlertEvent& event);

private:
  SessionStore& store_;
  Notifier& notifier_;
  BellHandler bell_;
  std::vector<std::pair<int64_t, double>> pending_;

  bool persistTrigger(int64_t alert_id, double price);
};

} // namespace bags
