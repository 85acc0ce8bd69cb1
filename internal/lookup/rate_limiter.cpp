#include "rate_limiter.hpp"

#include <thread>

namespace cic::lookup {

RateLimiter::RateLimiter(std::chrono::milliseconds min_interval) : min_interval_(min_interval) {
}

RateLimiter::Clock::time_point RateLimiter::Acquire() {
  std::unique_lock lock(mutex_);

  const uint64_t ticket = next_ticket_++;
  cv_.wait(lock, [&] { return serving_ == ticket; });

  // later tickets stay parked on serving_ while we sleep unlocked
  if (last_request_) {
    const auto slot = *last_request_ + min_interval_;
    lock.unlock();
    std::this_thread::sleep_until(slot);
    lock.lock();
  }

  const auto granted = Clock::now();
  last_request_      = granted;
  ++serving_;

  lock.unlock();
  cv_.notify_all();
  return granted;
}

} // namespace cic::lookup
