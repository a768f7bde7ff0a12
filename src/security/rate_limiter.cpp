#include "fsgate/security/rate_limiter.hpp"

#include <system_error>

namespace fsgate::security {

RateLimiter::RateLimiter() : RateLimiter(RateLimitOptions{}) {}

RateLimiter::RateLimiter(RateLimitOptions options) : options_(options) {}

RateLimiter &RateLimiter::instance() {
  static RateLimiter limiter;
  return limiter;
}

void RateLimiter::prune_locked(std::deque<Clock::time_point> &calls,
                               const Clock::time_point now) const {
  // A call exactly one window old no longer counts.
  const auto cutoff = now - options_.window;
  while (!calls.empty() && calls.front() <= cutoff) {
    calls.pop_front();
  }
}

void RateLimiter::evict_stale_locked(const Clock::time_point now) {
  if (calls_by_operation_.size() <= options_.eviction_threshold) {
    return;
  }
  for (auto it = calls_by_operation_.begin(); it != calls_by_operation_.end();) {
    prune_locked(it->second, now);
    if (it->second.empty()) {
      it = calls_by_operation_.erase(it);
    } else {
      ++it;
    }
  }
}

common::Status RateLimiter::check(const std::string &operation) {
  return check_at(operation, Clock::now());
}

common::Status RateLimiter::check_at(const std::string &operation, const Clock::time_point now) {
  std::unique_lock<std::mutex> lock(mutex_, std::defer_lock);
  try {
    lock.lock();
  } catch (const std::system_error &ex) {
    return common::Status::error(common::ErrorCode::Internal,
                                 std::string("rate limiter unavailable: ") + ex.what());
  }

  evict_stale_locked(now);

  auto &calls = calls_by_operation_[operation];
  prune_locked(calls, now);
  if (calls.size() >= options_.max_calls) {
    return common::Status::error(common::ErrorCode::RateLimitExceeded,
                                 "rate limit exceeded for " + operation);
  }
  calls.push_back(now);
  return common::Status::success();
}

std::size_t RateLimiter::in_window(const std::string &operation) {
  return in_window_at(operation, Clock::now());
}

std::size_t RateLimiter::in_window_at(const std::string &operation, const Clock::time_point now) {
  std::lock_guard<std::mutex> lock(mutex_);
  const auto it = calls_by_operation_.find(operation);
  if (it == calls_by_operation_.end()) {
    return 0;
  }
  prune_locked(it->second, now);
  return it->second.size();
}

std::size_t RateLimiter::tracked_operations() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return calls_by_operation_.size();
}

void RateLimiter::reset() {
  std::lock_guard<std::mutex> lock(mutex_);
  calls_by_operation_.clear();
}

} // namespace fsgate::security
