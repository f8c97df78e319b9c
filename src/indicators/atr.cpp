#include "indicators/atr.hpp"
#include <algorithm>
#include <cmath>

namespace ind {

static double true_range(const core::Candle& prev, const core::Candle& cur){
    return std::max({cur.high - cur.low, std::abs(cur.high - prev.close), std::abs(cur.low - prev.close)});
}

double compute_atr(const std::vector<core::Candle>& b, std::size_t p){
    if (b.empty()) return 0.0;
    if (b.size() == 1 || p == 0) return b.back().high - b.back().low;

    const std::size_t n = b.size() - 1; // TR-ek száma
    if (n < p){
        double s = 0.0;
        for (std::size_t i = 1; i < b.size(); ++i) s += true_range(b[i-1], b[i]);
        return s / n;
    }
    double atr = 0.0;
    for (std::size_t i = 1; i <= p; ++i) atr += true_range(b[i-1], b[i]);
    atr /= p;
    for (std::size_t i = p + 1; i < b.size(); ++i)
        atr = (atr * (p - 1) + true_range(b[i-1], b[i])) / p;
    return atr;
}

} // namespace ind
