#pragma once
#include <optional>
#include <vector>
#include "core/types.hpp"

namespace strat {

enum class TechPattern {
    BullishEngulfing, BearishEngulfing, Doji, Hammer, ShootingStar,
    DoubleTop, DoubleBottom, HeadAndShoulders, InverseHeadAndShoulders,
    AscendingTriangle, DescendingTriangle
};

const char* to_string(TechPattern p);

// Doji: nincs iránya
std::optional<core::Direction> direction_of(TechPattern p);

// Irány-egyezés; a doji mindkét irányhoz illeszkedik
bool matches(TechPattern p, core::Direction dir);

// Az ablak utolsó barjára érvényes minták
std::vector<TechPattern> detect_technical(const std::vector<core::Candle>& window);

// Irányított (nem doji) minta a `dir` irányban az utolsó `bars` bar valamelyikén
bool technical_agreement(const std::vector<core::Candle>& window, core::Direction dir, std::size_t bars);

} // namespace strat
