#include "indicators/rsi.hpp"
#include <algorithm>

namespace ind {

double compute_rsi(const std::vector<double>& c, std::size_t p){
    if (p == 0 || c.size() <= p) return 50.0;
    double g = 0.0, l = 0.0;
    for (std::size_t i = 1; i <= p; ++i){
        const double d = c[i] - c[i-1];
        if (d >= 0) g += d; else l -= d;
    }
    g /= p; l /= p;
    for (std::size_t i = p + 1; i < c.size(); ++i){
        const double d = c[i] - c[i-1];
        g = (g * (p - 1) + std::max(d, 0.0)) / p;
        l = (l * (p - 1) + std::max(-d, 0.0)) / p;
    }
    if (g == 0 && l == 0) return 50.0;
    if (l == 0) return 100.0;
    const double rs  = g / l;
    const double rsi = 100.0 - (100.0 / (1.0 + rs));
    return std::clamp(rsi, 0.0, 100.0);
}

} // namespace ind
