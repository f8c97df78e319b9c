#include "strategy/session_patterns.hpp"
#include <algorithm>
#include "strategy/strat_pattern.hpp"

namespace strat {

using core::Direction;
using core::PatternFamily;

namespace {
constexpr std::size_t kVolumeAvgBars = 20;
constexpr std::size_t kMomentumBars  = 5;
constexpr int kMomentumMin           = 3;

std::optional<Direction> colour(const core::Candle& c){
    if (c.bullish()) return Direction::Bullish;
    if (c.bearish()) return Direction::Bearish;
    return std::nullopt;
}
} // namespace

Candidate SessionPatternDetector::make(const std::vector<core::Candle>& bars, PatternFamily f,
                                       std::string label, Direction dir, double base) const {
    const auto& b = bars.back();
    Candidate c;
    c.label = std::move(label);
    c.family = f;
    c.dir = dir;
    c.strength = base;   // a session szorzó a detect()-ben kerül rá
    c.entry = b.close;
    c.ref_price = b.close;
    c.anchor = dir == Direction::Bullish ? b.low : b.high;
    c.ref_index = bars.size() - 1;
    c.ts_ms = b.ts_ms;
    c.fib_targets = fib_retracements(bars, fib_lookback_);
    return c;
}

std::optional<Candidate> SessionPatternDetector::gap(const std::vector<core::Candle>& bars) const {
    const auto& prev = bars[bars.size() - 2];
    const auto& cur = bars.back();
    if (prev.close <= 0.0) return std::nullopt;
    const double g = (cur.open - prev.close) / prev.close;
    if (g >= cfg_.gap_threshold && cur.bullish())
        return make(bars, PatternFamily::Gap, "gap_up", Direction::Bullish, kGapBase);
    if (g <= -cfg_.gap_threshold && cur.bearish())
        return make(bars, PatternFamily::Gap, "gap_down", Direction::Bearish, kGapBase);
    return std::nullopt;
}

std::optional<Candidate> SessionPatternDetector::volume_spike(const std::vector<core::Candle>& bars) const {
    const auto& cur = bars.back();
    const auto dir = colour(cur);
    if (!cur.volume || !dir || bars.size() < kVolumeAvgBars + 1) return std::nullopt;

    double sum = 0.0;
    for (std::size_t i = bars.size() - 1 - kVolumeAvgBars; i + 1 < bars.size(); ++i){
        if (!bars[i].volume) return std::nullopt;
        sum += *bars[i].volume;
    }
    const double avg = sum / kVolumeAvgBars;
    if (avg <= 0.0 || *cur.volume <= avg * cfg_.volume_spike_multiplier) return std::nullopt;
    return make(bars, PatternFamily::VolumeSpike, "volume_spike", *dir, kVolumeBase);
}

std::optional<Candidate> SessionPatternDetector::momentum(const std::vector<core::Candle>& bars) const {
    const auto dir = colour(bars.back());
    if (!dir || bars.size() < kMomentumBars) return std::nullopt;
    int same = 0;
    for (std::size_t i = bars.size() - kMomentumBars; i < bars.size(); ++i)
        if (colour(bars[i]) == dir) ++same;
    if (same < kMomentumMin) return std::nullopt;
    return make(bars, PatternFamily::Momentum, "momentum", *dir, kMomentumBase);
}

std::optional<Candidate> SessionPatternDetector::reversal(const std::vector<core::Candle>& bars) const {
    const auto& prev = bars[bars.size() - 2];
    const auto& cur = bars.back();
    const auto dir = colour(cur);
    if (!dir || cur.range <= prev.range * cfg_.reversal_range_ratio) return std::nullopt;
    return make(bars, PatternFamily::Reversal, "reversal", *dir, kReversalBase);
}

std::vector<Candidate> SessionPatternDetector::detect(const std::vector<core::Candle>& bars,
                                                      const sess::SessionInfo& session) const {
    std::vector<Candidate> out;
    if (bars.size() < warmup_bars()) return out;

    auto add = [&](PatternFamily f, std::optional<Candidate> c){
        if (!c || !session.allows(f)) return;
        c->strength = std::min(100.0, c->strength * session.risk_multiplier);
        if (c->strength >= cfg_.min_strength) out.push_back(std::move(*c));
    };
    if (session.allows(PatternFamily::Gap))         add(PatternFamily::Gap, gap(bars));
    if (session.allows(PatternFamily::VolumeSpike)) add(PatternFamily::VolumeSpike, volume_spike(bars));
    if (session.allows(PatternFamily::Momentum))    add(PatternFamily::Momentum, momentum(bars));
    if (session.allows(PatternFamily::Reversal))    add(PatternFamily::Reversal, reversal(bars));
    return out;
}

} // namespace strat
