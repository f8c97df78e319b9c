#pragma once
#include <deque>
#include <vector>
#include <cstddef>
#include "core/candle.hpp"

namespace core {

// Szimbólumonkénti, korlátos gyertya-ablak. Csak a saját scan ciklusa írja.
class SymbolHistory {
public:
    explicit SymbolHistory(std::size_t max_len = 200) : max_len_(max_len) {}

    // false, ha a timestamp nem nő szigorúan (duplikált vagy régebbi bar)
    bool append(Candle c);

    void set_max_len(std::size_t n);
    std::size_t max_len() const { return max_len_; }

    std::size_t size() const { return bars_.size(); }
    bool empty() const { return bars_.empty(); }
    const Candle& operator[](std::size_t i) const { return bars_[i]; }
    const Candle& back() const { return bars_.back(); }
    void clear() { bars_.clear(); }

    // Másolat a teljes ablakról, a detektorok ezen dolgoznak
    std::vector<Candle> snapshot() const { return {bars_.begin(), bars_.end()}; }

    // Legfeljebb `lookback` bar, az `end_index`-et is beleértve
    std::vector<Candle> window(std::size_t end_index, std::size_t lookback) const;

private:
    std::deque<Candle> bars_;
    std::size_t max_len_;
};

} // namespace core
