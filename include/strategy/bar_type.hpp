#pragma once
#include <optional>
#include "core/types.hpp"

namespace strat {

// Strat bar típusok: "1", "2U", "2D", "3"
enum class BarType { Inside, Up, Down, Outside };

inline const char* to_string(BarType t) {
    switch (t) {
        case BarType::Inside:  return "1";
        case BarType::Up:      return "2U";
        case BarType::Down:    return "2D";
        case BarType::Outside: return "3";
    }
    return "1";
}

// prev == nullptr -> nincs típus. Pontos egyezés (high és low) -> Inside,
// ha equal_inside; különben nullopt.
std::optional<BarType> classify(const core::Candle* prev, const core::Candle& curr, bool equal_inside = true);

} // namespace strat
