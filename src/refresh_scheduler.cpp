#include "bags/refresh_scheduler.hpp"
#include <algorithm>

namespace bags {

RefreshScheduler::RefreshScheduler(std::chrono::seconds interval)
  : interval_(std::max(interval, kMinInterval)) {
}

void RefreshScheduler::setInterval(std::chrono::seconds interval) noexcept {
  interval_ = std::max(interval, kMinInterval);
}

bool RefreshScheduler::isDue(Clock::time_point now) const noexcept {
  if (!last_attempt_) {
    return true;
  }
  return now - *last_attempt_ >= interval_;
}

} // namespace bags
