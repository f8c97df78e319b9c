#pragma once
#include <cstdint>
#include <optional>
#include <string>
#include <vector>
#include <algorithm>

namespace core {

// Időkeret
enum class Timeframe { M1, M3, M5, M15, M30, H1, H4, D1 };

inline const char* to_string(Timeframe tf) {
    switch (tf) {
        case Timeframe::M1:  return "1m";
        case Timeframe::M3:  return "3m";
        case Timeframe::M5:  return "5m";
        case Timeframe::M15: return "15m";
        case Timeframe::M30: return "30m";
        case Timeframe::H1:  return "1h";
        case Timeframe::H4:  return "4h";
        case Timeframe::D1:  return "1d";
    }
    return "1m";
}

inline std::optional<Timeframe> parse_timeframe(const std::string& s) {
    static const std::pair<const char*, Timeframe> map[] = {
        {"1m", Timeframe::M1}, {"3m", Timeframe::M3}, {"5m", Timeframe::M5},
        {"15m", Timeframe::M15}, {"30m", Timeframe::M30}, {"1h", Timeframe::H1},
        {"4h", Timeframe::H4}, {"1d", Timeframe::D1}};
    for (const auto& [name, tf] : map)
        if (s == name) return tf;
    return std::nullopt;
}

// Validált OHLCV gyertya, validálás után nem módosul
struct Candle {
    std::string symbol;
    Timeframe interval{Timeframe::M5};
    std::int64_t ts_ms{};          // bar open time (ms, UTC)
    double open{};
    double high{};
    double low{};
    double close{};
    std::optional<double> volume;  // egyes feedek nem adnak volument
    double range{};                // high - low

    double vol() const { return volume.value_or(0.0); }
    bool bullish() const { return close > open; }
    bool bearish() const { return close < open; }
};

// Minta iránya
enum class Direction { Bullish, Bearish };

inline const char* to_string(Direction d) {
    return d == Direction::Bullish ? "bullish" : "bearish";
}

// Jel típus (a kiadott TradeSignal-ben)
enum class Signal { Long, Short, Neutral };

inline const char* to_string(Signal s) {
    switch (s) {
        case Signal::Long:  return "LONG";
        case Signal::Short: return "SHORT";
        default:            return "WAIT";
    }
}

inline Signal to_signal(Direction d) {
    return d == Direction::Bullish ? Signal::Long : Signal::Short;
}

// Mintacsaládok; a session dönti el, melyik aktív
enum class PatternFamily { Strat, Harmonic, Gap, VolumeSpike, Momentum, Reversal };

inline const char* to_string(PatternFamily f) {
    switch (f) {
        case PatternFamily::Strat:       return "strat";
        case PatternFamily::Harmonic:    return "harmonic";
        case PatternFamily::Gap:         return "gap";
        case PatternFamily::VolumeSpike: return "volume_spike";
        case PatternFamily::Momentum:    return "momentum";
        case PatternFamily::Reversal:    return "reversal";
    }
    return "strat";
}

inline std::optional<PatternFamily> parse_family(const std::string& s) {
    for (auto f : {PatternFamily::Strat, PatternFamily::Harmonic, PatternFamily::Gap,
                   PatternFamily::VolumeSpike, PatternFamily::Momentum, PatternFamily::Reversal})
        if (s == to_string(f)) return f;
    return std::nullopt;
}

// Kényelmi clamp 0..1 közé
inline double clamp01(double v) {
    return std::max(0.0, std::min(1.0, v));
}

} // namespace core
