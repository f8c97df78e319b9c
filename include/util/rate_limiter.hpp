#pragma once
#include <chrono>
#include <mutex>

namespace util {

// Token bucket: percenkénti keret, folyamatos feltöltéssel
class RateLimiter {
public:
    using Clock = std::chrono::steady_clock;

    explicit RateLimiter(int per_minute);

    // Keret módosítása (session váltáskor); a tokenek a kapacitásra vágódnak
    void set_rate(int per_minute);
    int rate() const;

    bool try_acquire(Clock::time_point now);
    bool try_acquire() { return try_acquire(Clock::now()); }

    // Blokkol, amíg token nem lesz
    void acquire();

    // Mennyit kell várni a következő tokenig
    Clock::duration wait_time(Clock::time_point now);

private:
    void refill(Clock::time_point now);

    mutable std::mutex mtx_;
    double capacity_;
    double tokens_;
    double per_ms_;
    Clock::time_point last_;
};

} // namespace util
