#include "core/candle.hpp"
#include <algorithm>
#include <cerrno>
#include <cmath>
#include <cstdlib>

namespace core {

std::optional<double> parse_number(const std::string& s){
    if (s.empty()) return std::nullopt;
    const char* begin = s.c_str();
    char* end = nullptr;
    errno = 0;
    const double v = std::strtod(begin, &end);
    if (end == begin || errno == ERANGE) return std::nullopt;
    while (*end == ' ' || *end == '\t' || *end == '\r') ++end;
    if (*end != '\0') return std::nullopt;
    if (!std::isfinite(v)) return std::nullopt;
    return v;
}

ValidationResult validate_candle(const std::string& symbol, Timeframe tf, std::int64_t ts_ms,
                                 double open, double high, double low, double close,
                                 std::optional<double> volume, double min_bar_range){
    if (!std::isfinite(open) || !std::isfinite(high) || !std::isfinite(low) || !std::isfinite(close)
        || (volume && (!std::isfinite(*volume) || *volume < 0.0)))
        return {std::nullopt, RejectReason::NonNumeric};

    if (high < std::max(open, close) || low > std::min(open, close) || high <= low)
        return {std::nullopt, RejectReason::InvalidOhlc};

    const double range = high - low;
    if (range < min_bar_range)
        return {std::nullopt, RejectReason::SubMinimumRange};

    Candle c;
    c.symbol = symbol;
    c.interval = tf;
    c.ts_ms = ts_ms;
    c.open = open; c.high = high; c.low = low; c.close = close;
    c.volume = volume;
    c.range = range;
    return {std::move(c), RejectReason::None};
}

ValidationResult validate_candle(const RawCandle& raw, double min_bar_range){
    const auto o = parse_number(raw.open);
    const auto h = parse_number(raw.high);
    const auto l = parse_number(raw.low);
    const auto c = parse_number(raw.close);
    if (!o || !h || !l || !c) return {std::nullopt, RejectReason::NonNumeric};

    std::optional<double> v;
    if (!raw.volume.empty()){
        v = parse_number(raw.volume);
        if (!v) return {std::nullopt, RejectReason::NonNumeric};
    }

    // ismeretlen intervallum is parse-hibának számít
    const auto tf = parse_timeframe(raw.interval);
    if (!tf) return {std::nullopt, RejectReason::NonNumeric};

    return validate_candle(raw.symbol, *tf, raw.ts_ms, *o, *h, *l, *c, v, min_bar_range);
}

} // namespace core
