#include "util/rate_limiter.hpp"
#include <algorithm>
#include <thread>

namespace util {

RateLimiter::RateLimiter(int per_minute)
    : capacity_(std::max(1, per_minute)), tokens_(capacity_),
      per_ms_(capacity_ / 60'000.0), last_(Clock::now()) {}

void RateLimiter::set_rate(int per_minute){
    std::lock_guard<std::mutex> lk(mtx_);
    capacity_ = std::max(1, per_minute);
    per_ms_ = capacity_ / 60'000.0;
    tokens_ = std::min(tokens_, capacity_);
}

int RateLimiter::rate() const {
    std::lock_guard<std::mutex> lk(mtx_);
    return static_cast<int>(capacity_);
}

void RateLimiter::refill(Clock::time_point now){
    if (now <= last_) return;
    const double ms = std::chrono::duration<double, std::milli>(now - last_).count();
    tokens_ = std::min(capacity_, tokens_ + ms * per_ms_);
    last_ = now;
}

bool RateLimiter::try_acquire(Clock::time_point now){
    std::lock_guard<std::mutex> lk(mtx_);
    refill(now);
    if (tokens_ < 1.0) return false;
    tokens_ -= 1.0;
    return true;
}

RateLimiter::Clock::duration RateLimiter::wait_time(Clock::time_point now){
    std::lock_guard<std::mutex> lk(mtx_);
    refill(now);
    if (tokens_ >= 1.0) return Clock::duration::zero();
    const double ms = (1.0 - tokens_) / per_ms_;
    return std::chrono::duration_cast<Clock::duration>(std::chrono::duration<double, std::milli>(ms));
}

void RateLimiter::acquire(){
    while (!try_acquire(Clock::now()))
        std::this_thread::sleep_for(std::max<Clock::duration>(wait_time(Clock::now()), std::chrono::milliseconds(1)));
}

} // namespace util
