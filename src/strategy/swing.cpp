#include "strategy/swing.hpp"

namespace strat {

std::vector<SwingPoint> extract_swings(const std::vector<core::Candle>& bars,
                                       std::size_t lookback, std::size_t min_history){
    std::vector<SwingPoint> out;
    if (bars.size() < min_history || lookback == 0 || bars.size() < 2 * lookback + 1) return out;

    for (std::size_t i = lookback; i + lookback < bars.size(); ++i){
        bool is_high = true, is_low = true;
        for (std::size_t j = i - lookback; j <= i + lookback; ++j){
            if (j == i) continue;
            if (bars[j].high >= bars[i].high) is_high = false;
            if (bars[j].low  <= bars[i].low)  is_low  = false;
        }
        // ha mindkettő, high-nak számít
        if (is_high)     out.push_back({i, bars[i].high, bars[i].ts_ms, SwingKind::High});
        else if (is_low) out.push_back({i, bars[i].low,  bars[i].ts_ms, SwingKind::Low});
    }
    return out;
}

} // namespace strat
