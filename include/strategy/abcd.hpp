#pragma once
#include <optional>
#include <vector>
#include "core/config.hpp"
#include "strategy/swing.hpp"

namespace strat {

struct FibTargets {
    double ext127{}, ext161{}, ext200{}, ext261{};
    std::vector<double> all() const { return {ext127, ext161, ext200, ext261}; }
};

struct ConfluenceFlags {
    bool trend_alignment{false};
    bool volume_confirmation{false};
    bool technical_confirmation{false};
};

struct AbcdPattern {
    SwingPoint a, b, c, d;
    double ab_length{}, bc_length{}, cd_length{};
    double bc_retracement{};
    double abcd_ratio{};
    FibTargets targets;          // BC láb vetítése a projected D bázisról
    double target_extension{};   // 1.618 / 1.27 / 1.0
    double projected_d{};
    core::Direction dir{core::Direction::Bullish};
    ConfluenceFlags flags;
    double strength{};
};

// BC retracement -> cél extension; nullopt, ha egyik sávba sem esik
std::optional<double> target_extension(double bc_retracement);

// Egy 4 swinges csoport geometriai validálása (confluence nélkül)
std::optional<AbcdPattern> validate_group(const SwingPoint& a, const SwingPoint& b,
                                          const SwingPoint& c, const SwingPoint& d,
                                          const core::AbcdConfig& cfg);

// Csoportok a legutolsótól visszafelé, legfeljebb max_groups; a sorrend is ez
std::vector<AbcdPattern> find_abcd_patterns(const std::vector<SwingPoint>& swings,
                                            const core::AbcdConfig& cfg);

// D a tolerancián belül van valamelyik extension célon
bool near_extension(const AbcdPattern& p, double tolerance);

bool is_fresh(const AbcdPattern& p, std::int64_t latest_ts_ms, std::int64_t ttl_ms);

} // namespace strat
