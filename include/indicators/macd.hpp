#pragma once
#include <vector>
#include <cstddef>

namespace ind {

struct Macd { double macd{}, signal{}, histogram{}; };

// macd = EMA(fast) - EMA(slow), signal = EMA(macd sor, signal_p)
Macd compute_macd(const std::vector<double>& closes, std::size_t fast = 12,
                  std::size_t slow = 26, std::size_t signal_p = 9);

} // namespace ind
