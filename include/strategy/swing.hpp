#pragma once
#include <cstdint>
#include <vector>
#include "core/types.hpp"

namespace strat {

enum class SwingKind { High, Low };

inline const char* to_string(SwingKind k) { return k == SwingKind::High ? "high" : "low"; }

struct SwingPoint {
    std::size_t index{};       // index a snapshotban
    double price{};
    std::int64_t ts_ms{};
    SwingKind kind{SwingKind::High};
};

// Swing high: a high szigorú maximum ±lookback baron belül; különben swing low,
// ha a low szigorú minimum. min_history-nál rövidebb snapshotra üres.
std::vector<SwingPoint> extract_swings(const std::vector<core::Candle>& bars,
                                       std::size_t lookback, std::size_t min_history);

} // namespace strat
