#pragma once

#include "fsgate/common/result.hpp"

#include <chrono>
#include <cstddef>
#include <deque>
#include <mutex>
#include <string>
#include <unordered_map>

namespace fsgate::security {

constexpr std::size_t MAX_CALLS_PER_WINDOW = 10;
constexpr std::chrono::milliseconds RATE_LIMIT_WINDOW{1000};

struct RateLimitOptions {
  std::size_t max_calls = MAX_CALLS_PER_WINDOW;
  std::chrono::milliseconds window = RATE_LIMIT_WINDOW;
  /// Tracked operation names above which empty entries are evicted during a check.
  std::size_t eviction_threshold = 64;
};

/// Sliding-window admission per operation name. At most `max_calls` checks succeed in
/// any trailing `window`, counted separately for each name. A rejected check records
/// nothing. All state sits behind one mutex, so checks are linearizable across names.
class RateLimiter {
public:
  using Clock = std::chrono::steady_clock;

  RateLimiter();
  explicit RateLimiter(RateLimitOptions options);

  RateLimiter(const RateLimiter &) = delete;
  RateLimiter &operator=(const RateLimiter &) = delete;

  /// Process-wide limiter shared by every gateway that does not bring its own.
  static RateLimiter &instance();

  [[nodiscard]] common::Status check(const std::string &operation);
  [[nodiscard]] common::Status check_at(const std::string &operation, Clock::time_point now);

  [[nodiscard]] std::size_t in_window(const std::string &operation);
  [[nodiscard]] std::size_t in_window_at(const std::string &operation, Clock::time_point now);
  [[nodiscard]] std::size_t tracked_operations() const;
  void reset();

  [[nodiscard]] const RateLimitOptions &options() const { return options_; }

private:
  void prune_locked(std::deque<Clock::time_point> &calls, Clock::time_point now) const;
  void evict_stale_locked(Clock::time_point now);

  RateLimitOptions options_;
  mutable std::mutex mutex_;
  std::unordered_map<std::string, std::deque<Clock::time_point>> calls_by_operation_;
};

} // namespace fsgate::security
