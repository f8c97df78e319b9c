#pragma once
#include <algorithm>
#include <chrono>
#include <exception>
#include <thread>
#include <spdlog/spdlog.h>

namespace util {

struct RetryPolicy {
    int max_attempts{3};
    std::chrono::milliseconds initial_delay{200};
    double backoff{2.0};
    std::chrono::milliseconds max_delay{5'000};
};

// f() újrapróbálása exponenciális várakozással; az utolsó hibát továbbdobja
template <typename F>
auto with_retry(F&& f, const RetryPolicy& p, const char* what) -> decltype(f()) {
    auto delay = p.initial_delay;
    for (int attempt = 1;; ++attempt){
        try {
            return f();
        } catch (const std::exception& e){
            if (attempt >= p.max_attempts){
                spdlog::error("{} failed after {} attempts: {}", what, attempt, e.what());
                throw;
            }
            spdlog::warn("{} attempt {} failed: {} (retry in {} ms)", what, attempt, e.what(), delay.count());
        }
        std::this_thread::sleep_for(delay);
        delay = std::min(p.max_delay, std::chrono::milliseconds(
            static_cast<long long>(static_cast<double>(delay.count()) * p.backoff)));
    }
}

} // namespace util
