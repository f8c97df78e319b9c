#include "strategy/abcd.hpp"
#include <cmath>

namespace strat {

std::optional<double> target_extension(double r){
    if (r <= 0.618) return 1.618;
    if (r <= 0.786) return 1.27;
    if (r <= 0.886) return 1.0;
    return std::nullopt;
}

static bool alternates(const SwingPoint& a, const SwingPoint& b, const SwingPoint& c, const SwingPoint& d){
    return a.kind != b.kind && b.kind != c.kind && c.kind != d.kind;
}

std::optional<AbcdPattern> validate_group(const SwingPoint& a, const SwingPoint& b,
                                          const SwingPoint& c, const SwingPoint& d,
                                          const core::AbcdConfig& cfg){
    if (cfg.require_alternation && !alternates(a, b, c, d)) return std::nullopt;
    if (a.price <= 0.0) return std::nullopt;

    AbcdPattern p;
    p.a = a; p.b = b; p.c = c; p.d = d;
    p.ab_length = std::abs(b.price - a.price);
    p.bc_length = std::abs(c.price - b.price);
    p.cd_length = std::abs(d.price - c.price);

    const double min_size = a.price * cfg.min_swing_size_pct / 100.0;
    if (p.ab_length < min_size || p.cd_length < min_size || p.ab_length <= 0.0) return std::nullopt;

    p.bc_retracement = p.bc_length / p.ab_length;
    p.abcd_ratio     = p.cd_length / p.ab_length;
    if (p.bc_retracement < cfg.bc_retracement_min || p.bc_retracement > cfg.bc_retracement_max) return std::nullopt;
    if (p.abcd_ratio < cfg.abcd_ratio_min || p.abcd_ratio > cfg.abcd_ratio_max) return std::nullopt;

    const auto ext = target_extension(p.bc_retracement);
    if (!ext) return std::nullopt;

    p.dir = a.price < b.price ? core::Direction::Bullish : core::Direction::Bearish;
    const double sign = p.dir == core::Direction::Bullish ? 1.0 : -1.0;
    p.target_extension = *ext;
    p.projected_d = c.price + sign * p.bc_length * *ext;

    // a létra a választott bázisról (projected D) indul, BC egységekben;
    // 100%-os sávnál ez pontosan a C-ből vetített 1.27 / 1.618 / 2.0 / 2.618
    const auto level = [&](double k){ return p.projected_d + sign * p.bc_length * (k - 1.0); };
    p.targets.ext127 = level(1.27);
    p.targets.ext161 = level(1.618);
    p.targets.ext200 = level(2.0);
    p.targets.ext261 = level(2.618);
    return p;
}

std::vector<AbcdPattern> find_abcd_patterns(const std::vector<SwingPoint>& s, const core::AbcdConfig& cfg){
    std::vector<AbcdPattern> out;
    if (s.size() < 4) return out;
    std::size_t groups = 0;
    for (std::size_t i = s.size() - 4; groups < cfg.max_groups; --i){
        ++groups;
        if (auto p = validate_group(s[i], s[i+1], s[i+2], s[i+3], cfg)) out.push_back(*p);
        if (i == 0) break;
    }
    return out;
}

bool near_extension(const AbcdPattern& p, double tolerance){
    const double tol = std::abs(p.d.price) * tolerance;
    for (double t : p.targets.all())
        if (std::abs(p.d.price - t) <= tol) return true;
    return false;
}

bool is_fresh(const AbcdPattern& p, std::int64_t latest_ts_ms, std::int64_t ttl_ms){
    return latest_ts_ms - p.d.ts_ms <= ttl_ms;
}

} // namespace strat
