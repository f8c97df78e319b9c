#include "strategy/harmonic.hpp"
#include <algorithm>
#include <cmath>
#include <spdlog/spdlog.h>

namespace strat {

std::vector<Candidate> HarmonicDetector::detect(const std::vector<core::Candle>& bars,
                                                const sess::SessionInfo& session) const {
    std::vector<Candidate> out;
    if (!session.allows(core::PatternFamily::Harmonic) || bars.size() < cfg_.min_history) return out;

    const auto swings = extract_swings(bars, cfg_.swing_lookback, cfg_.min_history);
    const auto& last = bars.back();

    for (const auto& p : find_abcd_patterns(swings, cfg_)){
        if (!is_fresh(p, last.ts_ms, cfg_.pattern_ttl_ms)) continue;
        if (std::abs(last.close - p.d.price) > std::abs(p.d.price) * fib_tolerance_) continue;

        Candidate c;
        c.label = "ABCD";
        c.family = core::PatternFamily::Harmonic;
        c.dir = p.dir;
        c.entry = last.close;
        c.anchor = p.a.price;
        c.ref_price = p.d.price;
        c.ref_index = p.d.index;
        c.ts_ms = p.d.ts_ms;
        c.fib_targets = p.targets.all();
        c.abcd = p;
        out.push_back(std::move(c));
    }
    if (!out.empty())
        spdlog::debug("{} ABCD: {} swing, {} friss minta", last.symbol, swings.size(), out.size());
    return out;
}

bool HarmonicDetector::finalize(Candidate& c, const ConfluenceResult& r) const {
    if (!r.eligible || !r.passed(core::Factor::Fibonacci)) return false;
    const double strength = std::min(cfg_.strength_cap, r.weighted_score);
    if (strength < cfg_.min_strength) return false;

    c.strength = strength;
    if (c.abcd){
        c.abcd->strength = strength;
        c.abcd->flags.trend_alignment        = r.passed(core::Factor::Trend);
        c.abcd->flags.volume_confirmation    = r.passed(core::Factor::Volume);
        c.abcd->flags.technical_confirmation = r.passed(core::Factor::Technical);
    }
    return true;
}

} // namespace strat
