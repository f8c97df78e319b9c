#pragma once
#include <array>
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "core/types.hpp"

namespace core {

// Konfigurációs hiba: indításkor végzetes
class ConfigError : public std::runtime_error {
public:
    explicit ConfigError(const std::string& what) : std::runtime_error(what) {}
};

struct LoggingConfig {
    std::string level{"info"};
    std::string file;            // üres = csak konzol
};

struct ValidatorConfig {
    double min_bar_range{0.01};
    std::size_t max_history{200};
};

struct StratConfig {
    double base_strength{50.0};
    double min_strength{40.0};
    double min_confidence{55.0};
    bool equal_bars_inside{true};    // pontos egyezés (high és low) -> Inside
    std::size_t fib_lookback{20};
};

struct AbcdConfig {
    std::size_t swing_lookback{5};   // ±L bar
    std::size_t min_history{50};
    std::size_t max_groups{20};
    double min_swing_size_pct{0.5};  // A árának %-a
    double fib_tolerance{0.02};
    double bc_retracement_min{0.382};
    double bc_retracement_max{0.886};
    double abcd_ratio_min{0.618};
    double abcd_ratio_max{1.618};
    double min_strength{70.0};
    double strength_cap{95.0};
    std::int64_t pattern_ttl_ms{24LL * 60 * 60 * 1000};
    bool require_alternation{true};
};

enum class Factor { Fibonacci, Trend, Volume, Technical, Rsi, Macd };
inline constexpr std::size_t kFactorCount = 6;

inline const char* to_string(Factor f) {
    switch (f) {
        case Factor::Fibonacci: return "fibonacci";
        case Factor::Trend:     return "trend";
        case Factor::Volume:    return "volume";
        case Factor::Technical: return "technical";
        case Factor::Rsi:       return "rsi";
        case Factor::Macd:      return "macd";
    }
    return "fibonacci";
}

struct ConfluenceConfig {
    // sorrend: Factor enum szerint
    std::array<double, kFactorCount> weights{3.0, 2.0, 2.0, 2.0, 1.0, 1.0};
    int min_count{4};
    double min_score{50.0};
    double fib_tolerance{0.02};
    double volume_multiplier{1.2};
    std::vector<std::size_t> ema_periods{20, 50, 100};
    double rsi_oversold{30.0};
    double rsi_overbought{70.0};
    double rsi_neutral_low{40.0};
    double rsi_neutral_high{60.0};
    bool check_trend{true};
    bool check_volume{true};
    bool check_technical{true};
    std::size_t technical_window{20};
};

struct IndicatorConfig {
    std::size_t lookback{120};
    std::size_t rsi_period{14};
    std::size_t macd_fast{12};
    std::size_t macd_slow{26};
    std::size_t macd_signal{9};
    std::size_t volume_sma{20};
    std::size_t bb_period{20};
    double bb_k{2.0};
    std::size_t atr_period{14};
};

struct SessionParams {
    std::chrono::milliseconds scan_interval{60'000};
    double risk_multiplier{1.0};
    int api_budget_per_minute{60};
    std::vector<PatternFamily> families;
};

struct SessionConfig {
    bool session_based{true};
    int premarket_start{4 * 60};      // perc éjfél óta, Eastern
    int market_open{9 * 60 + 30};
    int market_close{16 * 60};
    int afterhours_end{20 * 60};
    SessionParams premarket{std::chrono::milliseconds{2 * 60'000}, 0.7, 30,
        {PatternFamily::Strat, PatternFamily::Harmonic, PatternFamily::Gap, PatternFamily::VolumeSpike}};
    SessionParams intraday{std::chrono::milliseconds{60'000}, 1.0, 60,
        {PatternFamily::Strat, PatternFamily::Harmonic, PatternFamily::Momentum}};
    SessionParams afterhours{std::chrono::milliseconds{5 * 60'000}, 0.5, 15,
        {PatternFamily::Strat, PatternFamily::Harmonic, PatternFamily::Reversal}};
    SessionParams closed{std::chrono::milliseconds{10 * 60'000}, 0.3, 5, {}};
    double gap_threshold{0.02};
    double volume_spike_multiplier{2.0};
    double reversal_range_ratio{0.5};
    double min_strength{50.0};
};

enum class StopPolicy { PatternAnchor, Atr };

struct RiskConfig {
    double max_risk_per_trade{0.02};
    double max_position_fraction{0.10};
    double reward_multiplier{2.0};
    StopPolicy stop_policy{StopPolicy::PatternAnchor};
    double stop_buffer{0.005};
    double atr_multiplier{2.0};
    double agreement_bonus{0.05};
    std::size_t agreement_window{3};
};

struct ThrottleConfig {
    int max_signals_per_day{10};
    std::int64_t cooldown_ms{5 * 60'000};
};

struct ScannerConfig {
    std::vector<std::string> watchlist;
    Timeframe interval{Timeframe::M5};
    std::size_t workers{4};
    double equity{50'000.0};
};

struct EngineConfig {
    LoggingConfig logging;
    ValidatorConfig validator;
    StratConfig strat;
    AbcdConfig abcd;
    ConfluenceConfig confluence;
    IndicatorConfig indicators;
    SessionConfig session;
    RiskConfig risk;
    ThrottleConfig throttle;
    ScannerConfig scanner;
};

// Az indikátor snapshothoz szükséges legkisebb ablak (bar)
std::size_t indicator_warmup(const IndicatorConfig& ind, const std::vector<std::size_t>& ema_periods);

// "HH:MM" -> perc éjfél óta; nullopt ha rossz formátum
std::optional<int> parse_hhmm(const std::string& s);

void from_json(const nlohmann::json& j, EngineConfig& c);

// Az összes hibát összegyűjti, és egyetlen ConfigError-t dob
void validate(const EngineConfig& c);

EngineConfig load_config(const std::filesystem::path& path);
EngineConfig parse_config(const std::string& text);

// Aktív konfiguráció + hot reload a fájl módosítási ideje alapján
class ConfigStore {
public:
    explicit ConfigStore(EngineConfig initial);
    static ConfigStore from_file(const std::filesystem::path& path);

    std::shared_ptr<const EngineConfig> current() const;

    // true, ha új konfiguráció lett aktív; hibás fájlnál a régi marad
    bool reload_if_changed();

private:
    ConfigStore(EngineConfig initial, std::filesystem::path path, std::filesystem::file_time_type mtime);

    mutable std::mutex mtx_;
    std::shared_ptr<const EngineConfig> current_;
    std::filesystem::path path_;
    std::filesystem::file_time_type mtime_{};
};

} // namespace core
