#pragma once
#include <vector>
#include <cstddef>

namespace ind {

// Wilder-simított RSI; kevés adatnál 50 (semleges)
double compute_rsi(const std::vector<double>& closes, std::size_t period);

} // namespace ind
