#pragma once
#include <chrono>
#include <optional>

namespace bags {

/**
 * Decides when the idle tick should re-synchronise the snapshot.
 * Measured from the last attempt, successful or not, so a failing provider
 * is retried at the configured pace rather than on every tick.
 */
class RefreshScheduler {
public:
  using Clock = std::chrono::steady_clock;

  static constexpr std::chrono::seconds kMinInterval{30};
  static constexpr std::chrono::milliseconds kTickInterval{250};

  explicit RefreshScheduler(std::chrono::seconds interval = std::chrono::seconds(60));

  void setInterval(std::chrono::seconds interval) noexcept;
  std::chrono::seconds interval() const noexcept { return interval_; }

  bool isDue(Clock::time_point now) const noexcept;
  void markAttempt(Clock::time_point now) noexcept { last_attempt_ = now; }
  std::optional<Clock::time_point> lastAttempt() const noexcept { return last_attempt_; }

private:
  std::chrono::seconds interval_;
  std::optional<Clock::time_point> last_attempt_;
};

} // namespace bags
