#include "indicators/bollinger.hpp"
#include <cmath>
#include <numeric>
#include "indicators/sma_ema.hpp"

namespace ind {

std::optional<BB> compute_bb(const std::vector<double>& v, std::size_t p, double k){
    const auto mid = compute_sma(v, p);
    if (!mid) return std::nullopt;
    const auto first = v.end() - static_cast<std::ptrdiff_t>(p);
    const double ss = std::accumulate(first, v.end(), 0.0,
                                      [m = *mid](double acc, double x){ return acc + (x - m) * (x - m); });
    const double sd = std::sqrt(ss / static_cast<double>(p));
    return BB{*mid, *mid + k * sd, *mid - k * sd};
}

} // namespace ind
