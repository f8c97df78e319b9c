#include "exec/throttle.hpp"
#include "session/eastern_time.hpp"

namespace exec {

void SignalThrottle::roll_day(ThrottleState& st, std::int64_t now_ms) const {
    const int d = sess::eastern_day_key(now_ms);
    if (d != st.day_key){ st.day_key = d; st.count_today = 0; } // új nap -> reset
}

bool SignalThrottle::allows(ThrottleState& st, std::int64_t now_ms) const {
    roll_day(st, now_ms);
    if (st.count_today >= cfg_.max_signals_per_day) return false;
    if (st.last_signal_ms && now_ms - *st.last_signal_ms < cfg_.cooldown_ms) return false;
    return true;
}

void SignalThrottle::record(ThrottleState& st, std::int64_t now_ms) const {
    roll_day(st, now_ms);
    ++st.count_today;
    st.last_signal_ms = now_ms;
}

bool SignalThrottle::try_acquire(ThrottleState& st, std::int64_t now_ms) const {
    if (!allows(st, now_ms)) return false;
    record(st, now_ms);
    return true;
}

} // namespace exec
