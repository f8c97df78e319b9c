#include "core/history.hpp"
#include <algorithm>

namespace core {

bool SymbolHistory::append(Candle c){
    if (!bars_.empty() && c.ts_ms <= bars_.back().ts_ms) return false;
    bars_.push_back(std::move(c));
    while (bars_.size() > max_len_) bars_.pop_front();
    return true;
}

void SymbolHistory::set_max_len(std::size_t n){
    max_len_ = std::max<std::size_t>(1, n);
    while (bars_.size() > max_len_) bars_.pop_front();
}

std::vector<Candle> SymbolHistory::window(std::size_t end_index, std::size_t lookback) const {
    if (bars_.empty() || lookback == 0) return {};
    end_index = std::min(end_index, bars_.size() - 1);
    const std::size_t first = (end_index + 1 > lookback) ? end_index + 1 - lookback : 0;
    return {bars_.begin() + static_cast<std::ptrdiff_t>(first),
            bars_.begin() + static_cast<std::ptrdiff_t>(end_index + 1)};
}

} // namespace core
