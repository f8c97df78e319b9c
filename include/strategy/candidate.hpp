#pragma once
#include <cstdint>
#include <optional>
#include <string>
#include <vector>
#include "core/types.hpp"
#include "strategy/abcd.hpp"

namespace strat {

// Detektor kimenet, még pontozás előtt
struct Candidate {
    std::string label;                  // pl. "2D->2U", "ABCD", "gap_up"
    core::PatternFamily family{core::PatternFamily::Strat};
    core::Direction dir{core::Direction::Bullish};
    double strength{};                  // 0..100
    double entry{};
    double anchor{};                    // stop horgony (pattern szint)
    double ref_price{};                 // ehhez mérjük a fib célokat
    std::size_t ref_index{};            // referencia bar a snapshotban
    std::int64_t ts_ms{};               // referencia bar ideje
    std::vector<double> fib_targets;
    std::optional<AbcdPattern> abcd;
};

} // namespace strat
