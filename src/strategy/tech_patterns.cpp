#include "strategy/tech_patterns.hpp"
#include <algorithm>
#include <cmath>

namespace strat {

const char* to_string(TechPattern p){
    switch (p){
        case TechPattern::BullishEngulfing:        return "bullish_engulfing";
        case TechPattern::BearishEngulfing:        return "bearish_engulfing";
        case TechPattern::Doji:                    return "doji";
        case TechPattern::Hammer:                  return "hammer";
        case TechPattern::ShootingStar:            return "shooting_star";
        case TechPattern::DoubleTop:               return "double_top";
        case TechPattern::DoubleBottom:            return "double_bottom";
        case TechPattern::HeadAndShoulders:        return "head_and_shoulders";
        case TechPattern::InverseHeadAndShoulders: return "inverse_head_and_shoulders";
        case TechPattern::AscendingTriangle:       return "ascending_triangle";
        case TechPattern::DescendingTriangle:      return "descending_triangle";
    }
    return "doji";
}

std::optional<core::Direction> direction_of(TechPattern p){
    switch (p){
        case TechPattern::BullishEngulfing:
        case TechPattern::Hammer:
        case TechPattern::DoubleBottom:
        case TechPattern::InverseHeadAndShoulders:
        case TechPattern::AscendingTriangle:
            return core::Direction::Bullish;
        case TechPattern::Doji:
            return std::nullopt;
        default:
            return core::Direction::Bearish;
    }
}

bool matches(TechPattern p, core::Direction dir){
    const auto d = direction_of(p);
    return !d || *d == dir;
}

namespace {

constexpr double kDojiBody      = 0.10;  // test < range 10%-a
constexpr double kDoubleTol     = 0.01;  // két csúcs 1%-on belül
constexpr double kSlopeFlat     = 0.001; // relatív meredekség / bar
constexpr std::size_t kTriangle = 10;
constexpr std::size_t kHsBars   = 7;
constexpr std::size_t kDoubleWindow = 20;

double body(const core::Candle& c){ return std::abs(c.close - c.open); }
double upper_shadow(const core::Candle& c){ return c.high - std::max(c.open, c.close); }
double lower_shadow(const core::Candle& c){ return std::min(c.open, c.close) - c.low; }

// Legkisebb négyzetes meredekség, az átlagárral normálva
double rel_slope(const std::vector<double>& y){
    const double n = static_cast<double>(y.size());
    double sx = 0, sy = 0, sxx = 0, sxy = 0;
    for (std::size_t i = 0; i < y.size(); ++i){
        const double x = static_cast<double>(i);
        sx += x; sy += y[i]; sxx += x * x; sxy += x * y[i];
    }
    const double den = n * sxx - sx * sx;
    if (den == 0.0 || sy == 0.0) return 0.0;
    const double slope = (n * sxy - sx * sy) / den;
    return slope / (sy / n);
}

void candle_patterns(const std::vector<core::Candle>& w, std::vector<TechPattern>& out){
    const auto& c = w.back();
    const double rng = c.high - c.low;
    if (rng <= 0.0) return;

    if (body(c) < kDojiBody * rng) out.push_back(TechPattern::Doji);
    if (lower_shadow(c) >= 2.0 * body(c) && upper_shadow(c) < body(c)) out.push_back(TechPattern::Hammer);
    if (upper_shadow(c) >= 2.0 * body(c) && lower_shadow(c) < body(c)) out.push_back(TechPattern::ShootingStar);

    if (w.size() >= 2){
        const auto& p = w[w.size() - 2];
        if (p.bearish() && c.bullish() && c.open <= p.close && c.close >= p.open)
            out.push_back(TechPattern::BullishEngulfing);
        if (p.bullish() && c.bearish() && c.open >= p.close && c.close <= p.open)
            out.push_back(TechPattern::BearishEngulfing);
    }
}

void double_patterns(const std::vector<core::Candle>& w, std::vector<TechPattern>& out){
    const std::size_t n = std::min(w.size(), kDoubleWindow);
    if (n < 5) return;
    const std::size_t first = w.size() - n;

    std::vector<double> peaks, troughs;
    for (std::size_t i = first + 1; i + 1 < w.size(); ++i){
        if (w[i].high > w[i-1].high && w[i].high >= w[i+1].high) peaks.push_back(w[i].high);
        if (w[i].low  < w[i-1].low  && w[i].low  <= w[i+1].low)  troughs.push_back(w[i].low);
    }
    const double close = w.back().close;
    if (peaks.size() >= 2){
        const double p1 = peaks[peaks.size() - 2], p2 = peaks.back();
        if (std::abs(p1 - p2) <= kDoubleTol * std::max(p1, p2) && close < std::min(p1, p2))
            out.push_back(TechPattern::DoubleTop);
    }
    if (troughs.size() >= 2){
        const double t1 = troughs[troughs.size() - 2], t2 = troughs.back();
        if (std::abs(t1 - t2) <= kDoubleTol * std::max(t1, t2) && close > std::max(t1, t2))
            out.push_back(TechPattern::DoubleBottom);
    }
}

// 7 bar: váll (1), fej (3), váll (5) indexeken
void head_shoulders(const std::vector<core::Candle>& w, std::vector<TechPattern>& out){
    if (w.size() < kHsBars) return;
    const std::size_t s = w.size() - kHsBars;
    auto h = [&](std::size_t i){ return w[s + i].high; };
    auto l = [&](std::size_t i){ return w[s + i].low; };

    const bool peaks = h(1) > h(0) && h(1) > h(2) && h(3) > h(2) && h(3) > h(4) && h(5) > h(4) && h(5) > h(6);
    if (peaks && h(3) > h(1) && h(3) > h(5) && std::abs(h(1) - h(5)) <= kDoubleTol * h(3))
        out.push_back(TechPattern::HeadAndShoulders);

    const bool troughs = l(1) < l(0) && l(1) < l(2) && l(3) < l(2) && l(3) < l(4) && l(5) < l(4) && l(5) < l(6);
    if (troughs && l(3) < l(1) && l(3) < l(5) && std::abs(l(1) - l(5)) <= kDoubleTol * std::max(l(1), l(5)))
        out.push_back(TechPattern::InverseHeadAndShoulders);
}

void triangles(const std::vector<core::Candle>& w, std::vector<TechPattern>& out){
    if (w.size() < kTriangle) return;
    std::vector<double> highs, lows;
    for (std::size_t i = w.size() - kTriangle; i < w.size(); ++i){
        highs.push_back(w[i].high);
        lows.push_back(w[i].low);
    }
    const double hs = rel_slope(highs), ls = rel_slope(lows);
    if (std::abs(hs) < kSlopeFlat && ls > kSlopeFlat)  out.push_back(TechPattern::AscendingTriangle);
    if (std::abs(ls) < kSlopeFlat && hs < -kSlopeFlat) out.push_back(TechPattern::DescendingTriangle);
}

} // namespace

std::vector<TechPattern> detect_technical(const std::vector<core::Candle>& window){
    std::vector<TechPattern> out;
    if (window.empty()) return out;
    candle_patterns(window, out);
    double_patterns(window, out);
    head_shoulders(window, out);
    triangles(window, out);
    return out;
}

bool technical_agreement(const std::vector<core::Candle>& window, core::Direction dir, std::size_t bars){
    for (std::size_t k = 0; k < bars && k < window.size(); ++k){
        const std::vector<core::Candle> w(window.begin(), window.end() - static_cast<std::ptrdiff_t>(k));
        for (auto p : detect_technical(w)){
            const auto d = direction_of(p);
            if (d && *d == dir) return true;
        }
    }
    return false;
}

} // namespace strat
