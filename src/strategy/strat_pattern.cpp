#include "strategy/strat_pattern.hpp"
#include <algorithm>
#include <array>

namespace strat {

using core::Direction;

std::optional<StratPattern> match_pattern(BarType t12, BarType t23){
    if (t23 != BarType::Up && t23 != BarType::Down) return std::nullopt;
    if (t12 == BarType::Down && t23 == BarType::Down) return std::nullopt;
    if (t12 == BarType::Up && t23 == BarType::Up) return std::nullopt;

    StratPattern p;
    p.first = t12; p.second = t23;
    p.dir = t23 == BarType::Up ? Direction::Bullish : Direction::Bearish;
    p.label = std::string(to_string(t12)) + "->" + to_string(t23);
    return p;
}

static double volume_ratio(const core::Candle& prev, const core::Candle& cur){
    if (!prev.volume || !cur.volume || *prev.volume <= 0.0) return 0.0;
    return *cur.volume / *prev.volume;
}

std::optional<StratPattern> recognize(const core::Candle& b1, const core::Candle& b2,
                                      const core::Candle& b3, const core::StratConfig& cfg){
    const auto t12 = classify(&b1, b2, cfg.equal_bars_inside);
    const auto t23 = classify(&b2, b3, cfg.equal_bars_inside);
    if (!t12 || !t23) return std::nullopt;

    auto p = match_pattern(*t12, *t23);
    if (!p) return std::nullopt;
    const bool bull = p->dir == Direction::Bullish;

    double s = cfg.base_strength;
    if (volume_ratio(b2, b3) > 1.2) s += 10;
    if (b3.range > b2.range * 1.1) s += 8;
    if (bull ? b3.bullish() : b3.bearish()) s += 5;
    if (bull ? b3.close > b2.high : b3.close < b2.low) s += 12;
    p->strength = std::min(100.0, s);

    if (p->strength < cfg.min_strength) return std::nullopt;
    return p;
}

double strat_confidence(const core::Candle& b1, const core::Candle& b2,
                        const core::Candle& b3, const StratPattern& p){
    const bool bull = p.dir == Direction::Bullish;
    double c = p.strength;

    const double vr = volume_ratio(b2, b3);
    if (vr > 1.5) c += 10;
    else if (vr > 1.2) c += 5;

    const double avg_range = (b1.range + b2.range + b3.range) / 3.0;
    if (b3.range > 1.2 * avg_range) c += 8;
    if (bull ? b3.close > b2.close : b3.close < b2.close) c += 5;
    if (bull ? b3.close > b1.close : b3.close < b1.close) c += 3;
    return std::min(100.0, c);
}

std::vector<double> fib_retracements(const std::vector<core::Candle>& bars, std::size_t lookback){
    static constexpr std::array<double, 5> kLevels{0.236, 0.382, 0.5, 0.618, 0.786};
    if (bars.empty() || lookback == 0) return {};
    const std::size_t n = std::min(bars.size(), lookback);
    double hi = bars[bars.size() - n].high, lo = bars[bars.size() - n].low;
    for (std::size_t i = bars.size() - n; i < bars.size(); ++i){
        hi = std::max(hi, bars[i].high);
        lo = std::min(lo, bars[i].low);
    }
    std::vector<double> out;
    for (double lvl : kLevels) out.push_back(hi - (hi - lo) * lvl);
    return out;
}

std::vector<Candidate> StratDetector::detect(const std::vector<core::Candle>& bars,
                                             const sess::SessionInfo& session) const {
    if (!session.allows(core::PatternFamily::Strat) || bars.size() < warmup_bars()) return {};
    const auto& b1 = bars[bars.size() - 3];
    const auto& b2 = bars[bars.size() - 2];
    const auto& b3 = bars.back();

    const auto p = recognize(b1, b2, b3, cfg_);
    if (!p) return {};
    if (strat_confidence(b1, b2, b3, *p) < cfg_.min_confidence) return {};

    Candidate c;
    c.label = p->label;
    c.family = core::PatternFamily::Strat;
    c.dir = p->dir;
    c.strength = p->strength;
    c.entry = b3.close;
    c.ref_price = b3.close;
    c.anchor = p->dir == Direction::Bullish ? std::min(b2.low, b3.low) : std::max(b2.high, b3.high);
    c.ref_index = bars.size() - 1;
    c.ts_ms = b3.ts_ms;
    c.fib_targets = fib_retracements(bars, cfg_.fib_lookback);
    return {c};
}

} // namespace strat
