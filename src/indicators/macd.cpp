#include "indicators/macd.hpp"
#include "indicators/sma_ema.hpp"

namespace ind {

Macd compute_macd(const std::vector<double>& closes, std::size_t fast, std::size_t slow, std::size_t signal_p){
    const auto f = ema_series(closes, fast);
    const auto s = ema_series(closes, slow);
    if (f.empty() || s.empty()) return {};

    // mindkét sor a closes végéhez igazodik
    std::vector<double> line(s.size());
    const std::size_t off = f.size() - s.size();
    for (std::size_t i = 0; i < s.size(); ++i) line[i] = f[i + off] - s[i];

    Macd m;
    m.macd = line.back();
    const auto sig = ema_series(line, signal_p);
    m.signal = sig.empty() ? compute_sma(line, line.size()).value_or(m.macd) : sig.back();
    m.histogram = m.macd - m.signal;
    return m;
}

} // namespace ind
