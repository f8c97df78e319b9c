#include "indicators/sma_ema.hpp"
#include <numeric>

namespace ind {

std::optional<double> compute_sma(const std::vector<double>& v, std::size_t p){
    if (p == 0 || v.size() < p) return std::nullopt;
    const auto first = v.end() - static_cast<std::ptrdiff_t>(p);
    return std::accumulate(first, v.end(), 0.0) / static_cast<double>(p);
}

std::vector<double> ema_series(const std::vector<double>& v, std::size_t p){
    if (p == 0 || v.size() < p) return {};
    std::vector<double> out;
    out.reserve(v.size() - p + 1);
    const double k = 2.0 / (p + 1.0);
    const auto seed_end = v.begin() + static_cast<std::ptrdiff_t>(p);
    double e = std::accumulate(v.begin(), seed_end, 0.0) / static_cast<double>(p);
    out.push_back(e);
    for (auto it = seed_end; it != v.end(); ++it){
        e = *it * k + e * (1.0 - k);
        out.push_back(e);
    }
    return out;
}

double compute_ema(const std::vector<double>& v, std::size_t p){
    if (v.empty()) return 0.0;
    const auto s = ema_series(v, p);
    return s.empty() ? *compute_sma(v, v.size()) : s.back();
}

} // namespace ind
