#include "session/session.hpp"
#include "session/eastern_time.hpp"

namespace sess {

static SessionInfo make(Session s, const core::SessionParams& p){
    return {s, p.scan_interval, p.risk_multiplier, p.api_budget_per_minute, p.families};
}

SessionInfo classify_minutes(int m, const core::SessionConfig& cfg){
    if (!cfg.session_based) return make(Session::Intraday, cfg.intraday);
    if (m >= cfg.premarket_start && m < cfg.market_open)  return make(Session::Premarket, cfg.premarket);
    if (m >= cfg.market_open     && m < cfg.market_close) return make(Session::Intraday, cfg.intraday);
    if (m >= cfg.market_close    && m < cfg.afterhours_end) return make(Session::Afterhours, cfg.afterhours);
    return make(Session::Closed, cfg.closed);
}

SessionInfo classify(std::int64_t utc_ms, const core::SessionConfig& cfg){
    return classify_minutes(to_eastern(utc_ms).minute_of_day, cfg);
}

SessionInfo classify(std::chrono::system_clock::time_point tp, const core::SessionConfig& cfg){
    using namespace std::chrono;
    return classify(duration_cast<milliseconds>(tp.time_since_epoch()).count(), cfg);
}

} // namespace sess
