#pragma once
#include <cstdint>
#include <optional>
#include "core/config.hpp"

namespace exec {

// Szimbólumonkénti állapot; csak a saját scan ciklusa írja
struct ThrottleState {
    std::optional<std::int64_t> last_signal_ms;
    int count_today{0};
    int day_key{0};          // yyyymmdd, Eastern
};

class SignalThrottle {
public:
    explicit SignalThrottle(core::ThrottleConfig cfg) : cfg_(cfg) {}

    // Napváltáskor nulláz (ezért módosíthatja az állapotot), majd ellenőriz
    bool allows(ThrottleState& st, std::int64_t now_ms) const;

    // Elfogadott jel rögzítése
    void record(ThrottleState& st, std::int64_t now_ms) const;

    // allows + record egyben
    bool try_acquire(ThrottleState& st, std::int64_t now_ms) const;

private:
    void roll_day(ThrottleState& st, std::int64_t now_ms) const;

    core::ThrottleConfig cfg_;
};

} // namespace exec
