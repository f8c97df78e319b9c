#include "strategy/bar_type.hpp"

namespace strat {

std::optional<BarType> classify(const core::Candle* prev, const core::Candle& curr, bool equal_inside){
    if (!prev) return std::nullopt;
    const double dh = curr.high - prev->high;
    const double dl = curr.low - prev->low;

    if (dh == 0.0 && dl == 0.0){
        if (equal_inside) return BarType::Inside;
        return std::nullopt;
    }
    if (dh < 0.0 && dl > 0.0)   return BarType::Inside;
    if (dh >= 0.0 && dl >= 0.0) return BarType::Up;
    if (dh <= 0.0 && dl <= 0.0) return BarType::Down;
    return BarType::Outside;    // dh > 0 && dl < 0
}

} // namespace strat
