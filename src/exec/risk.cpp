#include "exec/risk.hpp"
#include <algorithm>
#include <cmath>
#include <spdlog/spdlog.h>

namespace exec {

double TradeLevelCalculator::stop_for(const RiskInput& in) const {
    const bool bull = in.dir == core::Direction::Bullish;
    if (cfg_.stop_policy == core::StopPolicy::Atr)
        return bull ? in.entry - in.atr * cfg_.atr_multiplier : in.entry + in.atr * cfg_.atr_multiplier;
    const double buf = std::abs(in.anchor) * cfg_.stop_buffer;
    return bull ? in.anchor - buf : in.anchor + buf;
}

RiskDecision TradeLevelCalculator::compute(const RiskInput& in, const AccountContext& acct) const {
    RiskDecision d;
    auto& lv = d.levels;
    const bool bull = in.dir == core::Direction::Bullish;

    lv.entry = in.entry;
    lv.stop = stop_for(in);
    lv.risk_per_unit = bull ? lv.entry - lv.stop : lv.stop - lv.entry;

    if (!std::isfinite(lv.risk_per_unit) || lv.risk_per_unit <= 0.0){
        lv.position_size = 0.0;
        d.reason = "non-positive risk distance";
        spdlog::warn("degenerate risk: {} entry={} stop={}, signal dropped",
                     core::to_string(in.dir), lv.entry, lv.stop);
        return d;
    }

    const double reward = lv.risk_per_unit * cfg_.reward_multiplier;
    lv.target = bull ? lv.entry + reward : lv.entry - reward;
    lv.rr = reward / lv.risk_per_unit;

    const double budget = acct.equity * acct.max_risk_per_trade * in.session_risk_multiplier;
    double size = budget / lv.risk_per_unit;
    if (lv.entry > 0.0)
        size = std::min(size, acct.equity * acct.max_position_fraction / lv.entry);
    lv.position_size = std::max(0.0, size);
    lv.risk_amount = lv.position_size * lv.risk_per_unit;

    if (lv.position_size <= 0.0){
        d.reason = "zero position size";
        spdlog::warn("zero position size: equity={} session multiplier={}", acct.equity, in.session_risk_multiplier);
        return d;
    }
    d.accepted = true;
    return d;
}

double signal_confidence(double weighted_score, bool agreement, double bonus){
    return core::clamp01(weighted_score / 100.0 + (agreement ? bonus : 0.0));
}

} // namespace exec
