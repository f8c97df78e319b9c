#pragma once
#include <cstdint>
#include <optional>
#include <string>
#include "core/types.hpp"

namespace core {

// Nyers rekord a feedből; a számmezők szövegként jönnek (CSV, JSON string)
struct RawCandle {
    std::string symbol;
    std::string interval{"5m"};
    std::int64_t ts_ms{};
    std::string open;
    std::string high;
    std::string low;
    std::string close;
    std::string volume;  // üres = nincs volume
};

enum class RejectReason { None, NonNumeric, InvalidOhlc, SubMinimumRange, OutOfOrder };

inline const char* to_string(RejectReason r) {
    switch (r) {
        case RejectReason::None:            return "none";
        case RejectReason::NonNumeric:      return "non-numeric";
        case RejectReason::InvalidOhlc:     return "invalid-ohlc";
        case RejectReason::SubMinimumRange: return "sub-minimum-range";
        case RejectReason::OutOfOrder:      return "out-of-order";
    }
    return "none";
}

struct ValidationResult {
    std::optional<Candle> candle;
    RejectReason reason{RejectReason::None};

    bool ok() const { return candle.has_value(); }
};

// Teljes mezőt kell számként értelmezni, NaN/inf nem fogadható el
std::optional<double> parse_number(const std::string& s);

// Tiszta függvény: nem logol, nem dob
ValidationResult validate_candle(const RawCandle& raw, double min_bar_range);

// Már numerikus OHLC-ből (tesztek, belső források)
ValidationResult validate_candle(const std::string& symbol, Timeframe tf, std::int64_t ts_ms,
                                 double open, double high, double low, double close,
                                 std::optional<double> volume, double min_bar_range);

} // namespace core
