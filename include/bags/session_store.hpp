#pragma once
#include <memory>
#include <mutex>
#include <utility>
#include "secure_store.hpp"

namespace bags {

/**
 * The unlocked store behind a single mutex, shared between the event loop
 * and background work. User-initiated access blocks; alert persistence uses
 * tryWithLock so a busy store never stalls evaluation.
 */
class SessionStore {
public:
  explicit SessionStore(std::unique_ptr<SecureStore> store) : store_(std::move(store)) {}

  SessionStore(const SessionStore&) = delete;
  SessionStore& operator=(const SessionStore&) = delete;

  template <typename Fn>
  auto withLock(Fn&& fn) -> decltype(fn(std::declval<SecureStore&>())) {
    std::lock_guard<std::mutex> lock(mutex_);
    return fn(*store_);
  }

  // Runs fn only if the lock is free right now; returns whether it ran
  template <typename Fn>
  bool tryWithLock(Fn&& fn) {
    std::unique_lock<std::mutex> lock(mutex_, std::try_to_lock);
    if (!lock.owns_lock()) {
      return false;
    }
    fn(*store_);
    return true;
  }

  // Holds the lock for as long as the returned guard lives
  std::unique_lock<std::mutex> acquire() { return std::unique_lock<std::mutex>(mutex_); }

private:
  std::mutex mutex_;
  std::unique_ptr<SecureStore> store_;
};

} // namespace bags
