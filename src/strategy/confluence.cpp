#include "strategy/confluence.hpp"
#include <algorithm>
#include <cmath>
#include "strategy/tech_patterns.hpp"

namespace strat {

using core::Direction;
using core::Factor;

std::string ConfluenceResult::passed_list() const {
    std::string out;
    for (const auto& f : breakdown){
        if (!f.passed) continue;
        if (!out.empty()) out += ",";
        out += core::to_string(f.factor);
    }
    return out;
}

bool ConfluenceScorer::fibonacci(const Candidate& c) const {
    const double tol = std::abs(c.ref_price) * cfg_.fib_tolerance;
    return std::any_of(c.fib_targets.begin(), c.fib_targets.end(),
                       [&](double t){ return std::abs(c.ref_price - t) <= tol; });
}

bool ConfluenceScorer::trend(const Candidate& c, const ind::IndicatorSnapshot& s, double price) const {
    if (!cfg_.check_trend) return true;
    // price > EMA20 > EMA50 > EMA100 (bullish), fordítva bearish
    double prev = price;
    for (auto p : cfg_.ema_periods){
        const auto e = s.ema_at(p);
        if (!e) return false;
        if (c.dir == Direction::Bullish ? !(prev > *e) : !(prev < *e)) return false;
        prev = *e;
    }
    return true;
}

bool ConfluenceScorer::volume(const ind::IndicatorSnapshot& s, const core::Candle& ref) const {
    if (!cfg_.check_volume) return true;
    if (!ref.volume || !s.volume_sma) return false;
    return *ref.volume > *s.volume_sma * cfg_.volume_multiplier;
}

bool ConfluenceScorer::technical(const Candidate& c, const std::vector<core::Candle>& window) const {
    if (!cfg_.check_technical) return true;
    const std::size_t n = std::min(window.size(), cfg_.technical_window);
    const std::vector<core::Candle> w(window.end() - static_cast<std::ptrdiff_t>(n), window.end());
    const auto found = detect_technical(w);
    return std::any_of(found.begin(), found.end(), [&](TechPattern p){ return matches(p, c.dir); });
}

bool ConfluenceScorer::rsi(const Candidate& c, double v) const {
    const bool neutral = v > cfg_.rsi_neutral_low && v < cfg_.rsi_neutral_high;
    if (c.dir == Direction::Bullish) return v < cfg_.rsi_oversold || neutral;
    return v > cfg_.rsi_overbought || neutral;
}

bool ConfluenceScorer::macd(const Candidate& c, const ind::Macd& m) const {
    if (c.dir == Direction::Bullish) return m.histogram > 0.0 && m.macd > m.signal;
    return m.histogram < 0.0 && m.macd < m.signal;
}

ConfluenceResult ConfluenceScorer::score(const Candidate& c, const ind::IndicatorSnapshot& snap,
                                         const std::vector<core::Candle>& window) const {
    ConfluenceResult r;
    if (window.empty()) return r;
    const auto& ref = window.back();

    const std::array<bool, core::kFactorCount> passed{
        fibonacci(c),
        trend(c, snap, ref.close),
        volume(snap, ref),
        technical(c, window),
        rsi(c, snap.rsi),
        macd(c, snap.macd)};

    double acc = 0.0;
    for (std::size_t i = 0; i < core::kFactorCount; ++i){
        r.breakdown[i] = {static_cast<Factor>(i), passed[i], cfg_.weights[i]};
        if (passed[i]){ ++r.satisfied; acc += cfg_.weights[i]; }
    }
    r.weighted_score = std::min(100.0, acc * 10.0);
    r.eligible = r.satisfied >= cfg_.min_count && r.weighted_score >= cfg_.min_score;
    return r;
}

} // namespace strat
