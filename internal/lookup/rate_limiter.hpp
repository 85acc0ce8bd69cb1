#pragma once

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <mutex>
#include <optional>

namespace cic::lookup {

/*
  Serializes outbound requests to at most one per `min_interval`.

  Callers are served in arrival order (ticket queue). Acquire() returns once
  the caller's slot has opened; the caller issues its request immediately
  afterwards. Only the watermark and the queue are guarded, never the request.
*/
class RateLimiter {
 public:
  using Clock = std::chrono::steady_clock;

  explicit RateLimiter(std::chrono::milliseconds min_interval);

  // Blocks until this caller may send. Returns the granted slot time.
  Clock::time_point Acquire();

  std::chrono::milliseconds MinInterval() const {
    return min_interval_;
  }

 private:
  const std::chrono::milliseconds min_interval_;

  std::mutex                       mutex_;
  std::condition_variable          cv_;
  uint64_t                         next_ticket_ = 0;
  uint64_t                         serving_     = 0;
  std::optional<Clock::time_point> last_request_;
};

} // namespace cic::lookup
