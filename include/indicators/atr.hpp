#pragma once
#include <vector>
#include <cstddef>
#include "core/types.hpp"

namespace ind {

// Wilder ATR; egyetlen barnál a bar range-e
double compute_atr(const std::vector<core::Candle>& bars, std::size_t period = 14);

} // namespace ind
