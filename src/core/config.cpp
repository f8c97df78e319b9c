#include "core/config.hpp"
#include <fstream>
#include <sstream>
#include <algorithm>
#include <functional>
#include <spdlog/spdlog.h>
#include <fmt/format.h>

using json = nlohmann::json;

namespace core {

std::optional<int> parse_hhmm(const std::string& s){
    const auto pos = s.find(':');
    if (pos == std::string::npos || pos == 0 || pos > 2 || s.size() != pos + 3) return std::nullopt;
    int h = 0, m = 0;
    for (std::size_t i = 0; i < s.size(); ++i){
        if (i == pos) continue;
        if (s[i] < '0' || s[i] > '9') return std::nullopt;
    }
    h = std::stoi(s.substr(0, pos));
    m = std::stoi(s.substr(pos + 1));
    if (h > 23 || m > 59) return std::nullopt;
    return h * 60 + m;
}

std::size_t indicator_warmup(const IndicatorConfig& ind, const std::vector<std::size_t>& ema_periods){
    std::size_t w = std::max({ind.rsi_period + 1, ind.macd_slow + ind.macd_signal, ind.bb_period,
                              ind.atr_period + 1, ind.volume_sma + 1});
    for (auto p : ema_periods) w = std::max(w, p);
    return w;
}

namespace {

template <typename T>
void read(const json& j, const char* key, T& out){
    if (j.contains(key) && !j[key].is_null()) out = j.value(key, out);
}

void read_hhmm(const json& j, const char* key, int& out){
    if (!j.contains(key)) return;
    const auto s = j[key].get<std::string>();
    const auto v = parse_hhmm(s);
    if (!v) throw ConfigError(fmt::format("session.{}: invalid time '{}', expected HH:MM", key, s));
    out = *v;
}

void read_session(const json& j, const char* key, SessionParams& p){
    if (!j.contains(key)) return;
    const auto& s = j[key];
    if (s.contains("scan_interval_ms")) p.scan_interval = std::chrono::milliseconds{s["scan_interval_ms"].get<std::int64_t>()};
    read(s, "risk_multiplier", p.risk_multiplier);
    read(s, "api_budget_per_minute", p.api_budget_per_minute);
    if (s.contains("families")){
        p.families.clear();
        for (const auto& f : s["families"]){
            const auto name = f.get<std::string>();
            const auto fam = parse_family(name);
            if (!fam) throw ConfigError(fmt::format("session.{}.families: unknown family '{}'", key, name));
            p.families.push_back(*fam);
        }
    }
}

} // namespace

void from_json(const json& j, EngineConfig& c){
    if (j.contains("logging")){
        const auto& s = j["logging"];
        read(s, "level", c.logging.level);
        read(s, "file", c.logging.file);
    }
    if (j.contains("validator")){
        const auto& s = j["validator"];
        read(s, "min_bar_range", c.validator.min_bar_range);
        read(s, "max_history", c.validator.max_history);
    }
    if (j.contains("strat")){
        const auto& s = j["strat"];
        read(s, "base_strength", c.strat.base_strength);
        read(s, "min_strength", c.strat.min_strength);
        read(s, "min_confidence", c.strat.min_confidence);
        read(s, "equal_bars_inside", c.strat.equal_bars_inside);
        read(s, "fib_lookback", c.strat.fib_lookback);
    }
    if (j.contains("abcd")){
        const auto& s = j["abcd"];
        read(s, "swing_lookback", c.abcd.swing_lookback);
        read(s, "min_history", c.abcd.min_history);
        read(s, "max_groups", c.abcd.max_groups);
        read(s, "min_swing_size_pct", c.abcd.min_swing_size_pct);
        read(s, "fib_tolerance", c.abcd.fib_tolerance);
        read(s, "bc_retracement_min", c.abcd.bc_retracement_min);
        read(s, "bc_retracement_max", c.abcd.bc_retracement_max);
        read(s, "abcd_ratio_min", c.abcd.abcd_ratio_min);
        read(s, "abcd_ratio_max", c.abcd.abcd_ratio_max);
        read(s, "min_strength", c.abcd.min_strength);
        read(s, "strength_cap", c.abcd.strength_cap);
        read(s, "pattern_ttl_ms", c.abcd.pattern_ttl_ms);
        read(s, "require_alternation", c.abcd.require_alternation);
    }
    if (j.contains("confluence")){
        const auto& s = j["confluence"];
        if (s.contains("weights")){
            const auto& w = s["weights"];
            for (std::size_t i = 0; i < kFactorCount; ++i)
                read(w, to_string(static_cast<Factor>(i)), c.confluence.weights[i]);
        }
        read(s, "min_count", c.confluence.min_count);
        read(s, "min_score", c.confluence.min_score);
        read(s, "fib_tolerance", c.confluence.fib_tolerance);
        read(s, "volume_multiplier", c.confluence.volume_multiplier);
        read(s, "ema_periods", c.confluence.ema_periods);
        read(s, "rsi_oversold", c.confluence.rsi_oversold);
        read(s, "rsi_overbought", c.confluence.rsi_overbought);
        read(s, "rsi_neutral_low", c.confluence.rsi_neutral_low);
        read(s, "rsi_neutral_high", c.confluence.rsi_neutral_high);
        read(s, "check_trend", c.confluence.check_trend);
        read(s, "check_volume", c.confluence.check_volume);
        read(s, "check_technical", c.confluence.check_technical);
        read(s, "technical_window", c.confluence.technical_window);
    }
    if (j.contains("indicators")){
        const auto& s = j["indicators"];
        read(s, "lookback", c.indicators.lookback);
        read(s, "rsi_period", c.indicators.rsi_period);
        read(s, "macd_fast", c.indicators.macd_fast);
        read(s, "macd_slow", c.indicators.macd_slow);
        read(s, "macd_signal", c.indicators.macd_signal);
        read(s, "volume_sma", c.indicators.volume_sma);
        read(s, "bb_period", c.indicators.bb_period);
        read(s, "bb_k", c.indicators.bb_k);
        read(s, "atr_period", c.indicators.atr_period);
    }
    if (j.contains("session")){
        const auto& s = j["session"];
        read(s, "session_based", c.session.session_based);
        read_hhmm(s, "premarket_start", c.session.premarket_start);
        read_hhmm(s, "market_open", c.session.market_open);
        read_hhmm(s, "market_close", c.session.market_close);
        read_hhmm(s, "afterhours_end", c.session.afterhours_end);
        read_session(s, "premarket", c.session.premarket);
        read_session(s, "intraday", c.session.intraday);
        read_session(s, "afterhours", c.session.afterhours);
        read_session(s, "closed", c.session.closed);
        read(s, "gap_threshold", c.session.gap_threshold);
        read(s, "volume_spike_multiplier", c.session.volume_spike_multiplier);
        read(s, "reversal_range_ratio", c.session.reversal_range_ratio);
        read(s, "min_strength", c.session.min_strength);
    }
    if (j.contains("risk")){
        const auto& s = j["risk"];
        read(s, "max_risk_per_trade", c.risk.max_risk_per_trade);
        read(s, "max_position_fraction", c.risk.max_position_fraction);
        read(s, "reward_multiplier", c.risk.reward_multiplier);
        if (s.contains("stop_policy")){
            const auto p = s["stop_policy"].get<std::string>();
            if (p == "anchor" || p == "pattern_anchor") c.risk.stop_policy = StopPolicy::PatternAnchor;
            else if (p == "atr") c.risk.stop_policy = StopPolicy::Atr;
            else throw ConfigError(fmt::format("risk.stop_policy: unknown policy '{}'", p));
        }
        read(s, "stop_buffer", c.risk.stop_buffer);
        read(s, "atr_multiplier", c.risk.atr_multiplier);
        read(s, "agreement_bonus", c.risk.agreement_bonus);
        read(s, "agreement_window", c.risk.agreement_window);
    }
    if (j.contains("throttle")){
        const auto& s = j["throttle"];
        read(s, "max_signals_per_day", c.throttle.max_signals_per_day);
        read(s, "cooldown_ms", c.throttle.cooldown_ms);
    }
    if (j.contains("scanner")){
        const auto& s = j["scanner"];
        read(s, "watchlist", c.scanner.watchlist);
        if (s.contains("interval")){
            const auto name = s["interval"].get<std::string>();
            const auto tf = parse_timeframe(name);
            if (!tf) throw ConfigError(fmt::format("scanner.interval: unknown interval '{}'", name));
            c.scanner.interval = *tf;
        }
        read(s, "workers", c.scanner.workers);
        read(s, "equity", c.scanner.equity);
    }
}

void validate(const EngineConfig& c){
    std::vector<std::string> errors;
    auto check = [&errors](bool ok, std::string msg){ if (!ok) errors.push_back(std::move(msg)); };

    check(c.validator.min_bar_range >= 0.0, "validator.min_bar_range must be >= 0");
    check(c.validator.max_history >= 3, "validator.max_history must be at least 3");

    check(c.strat.min_strength >= 0.0 && c.strat.min_strength <= 100.0, "strat.min_strength must be in [0,100]");
    check(c.strat.min_confidence >= 0.0 && c.strat.min_confidence <= 100.0, "strat.min_confidence must be in [0,100]");
    check(c.strat.fib_lookback >= 3, "strat.fib_lookback must be at least 3");

    const auto& a = c.abcd;
    check(a.swing_lookback >= 1, "abcd.swing_lookback must be >= 1");
    check(a.min_history >= 2 * a.swing_lookback + 4, "abcd.min_history too small for the swing lookback");
    check(c.validator.max_history >= a.min_history, "validator.max_history must be >= abcd.min_history");
    check(a.max_groups >= 1, "abcd.max_groups must be >= 1");
    check(a.fib_tolerance > 0.0 && a.fib_tolerance < 1.0, "abcd.fib_tolerance must be in (0,1)");
    check(a.bc_retracement_min > 0.0 && a.bc_retracement_min < a.bc_retracement_max && a.bc_retracement_max <= 1.0,
          "abcd.bc_retracement bounds must satisfy 0 < min < max <= 1");
    check(a.abcd_ratio_min > 0.0 && a.abcd_ratio_min < a.abcd_ratio_max, "abcd.abcd_ratio bounds must satisfy 0 < min < max");
    check(a.min_strength <= a.strength_cap, "abcd.min_strength must not exceed abcd.strength_cap");
    check(a.pattern_ttl_ms > 0, "abcd.pattern_ttl_ms must be > 0");

    const auto& f = c.confluence;
    for (std::size_t i = 0; i < kFactorCount; ++i)
        check(f.weights[i] >= 0.0, fmt::format("confluence.weights.{} must be >= 0", to_string(static_cast<Factor>(i))));
    check(f.min_count >= 1 && f.min_count <= static_cast<int>(kFactorCount),
          fmt::format("confluence.min_count must be in [1,{}]", kFactorCount));
    check(f.min_score >= 0.0 && f.min_score <= 100.0, "confluence.min_score must be in [0,100]");
    check(f.fib_tolerance > 0.0 && f.fib_tolerance < 1.0, "confluence.fib_tolerance must be in (0,1)");
    check(f.volume_multiplier > 0.0, "confluence.volume_multiplier must be > 0");
    check(!f.ema_periods.empty(), "confluence.ema_periods must not be empty");
    check(std::adjacent_find(f.ema_periods.begin(), f.ema_periods.end(), std::greater_equal<std::size_t>{}) == f.ema_periods.end(),
          "confluence.ema_periods must be strictly increasing");
    check(f.rsi_oversold < f.rsi_overbought, "confluence.rsi_oversold must be below rsi_overbought");
    check(f.rsi_neutral_low < f.rsi_neutral_high, "confluence.rsi_neutral band is empty");

    const auto& ind = c.indicators;
    check(ind.macd_fast < ind.macd_slow, "indicators.macd_fast must be below macd_slow");
    check(ind.rsi_period >= 2 && ind.volume_sma >= 1 && ind.bb_period >= 2 && ind.atr_period >= 1,
          "indicators periods must be positive");
    check(!f.ema_periods.empty() && ind.lookback >= f.ema_periods.back(), "indicators.lookback must cover the longest EMA");
    const auto warmup = indicator_warmup(ind, f.ema_periods);
    check(ind.lookback >= warmup, fmt::format("indicators.lookback must be at least the indicator warmup ({} bars)", warmup));
    check(c.validator.max_history >= warmup,
          fmt::format("validator.max_history must be at least the indicator warmup ({} bars)", warmup));

    const auto& s = c.session;
    check(s.premarket_start < s.market_open && s.market_open < s.market_close && s.market_close < s.afterhours_end,
          "session boundaries must be strictly increasing");
    for (const auto& [name, p] : {std::pair<const char*, const SessionParams*>{"premarket", &s.premarket},
                                  {"intraday", &s.intraday}, {"afterhours", &s.afterhours}, {"closed", &s.closed}}){
        check(p->risk_multiplier >= 0.0 && p->risk_multiplier <= 1.0,
              fmt::format("session.{}.risk_multiplier must be in [0,1]", name));
        check(p->api_budget_per_minute >= 1, fmt::format("session.{}.api_budget_per_minute must be >= 1", name));
    }
    check(s.premarket.scan_interval >= std::chrono::seconds{30}, "session.premarket.scan_interval_ms must be at least 30s");
    check(s.intraday.scan_interval >= std::chrono::seconds{10}, "session.intraday.scan_interval_ms must be at least 10s");
    check(s.afterhours.scan_interval >= std::chrono::seconds{60}, "session.afterhours.scan_interval_ms must be at least 1 minute");
    check(s.closed.scan_interval >= std::chrono::seconds{60}, "session.closed.scan_interval_ms must be at least 1 minute");

    const auto& r = c.risk;
    check(r.max_risk_per_trade > 0.0 && r.max_risk_per_trade <= 1.0, "risk.max_risk_per_trade must be in (0,1]");
    check(r.max_position_fraction > 0.0 && r.max_position_fraction <= 1.0, "risk.max_position_fraction must be in (0,1]");
    check(r.reward_multiplier > 0.0, "risk.reward_multiplier must be > 0");
    check(r.stop_buffer >= 0.0 && r.stop_buffer < 1.0, "risk.stop_buffer must be in [0,1)");
    check(r.atr_multiplier > 0.0, "risk.atr_multiplier must be > 0");
    check(r.agreement_bonus >= 0.0 && r.agreement_bonus <= 1.0, "risk.agreement_bonus must be in [0,1]");

    check(c.throttle.max_signals_per_day >= 1, "throttle.max_signals_per_day must be >= 1");
    check(c.throttle.cooldown_ms >= 0, "throttle.cooldown_ms must be >= 0");

    check(c.scanner.workers >= 1, "scanner.workers must be >= 1");
    check(c.scanner.equity > 0.0, "scanner.equity must be > 0");

    if (errors.empty()) return;
    std::ostringstream oss;
    oss << "invalid configuration:";
    for (const auto& e : errors) oss << "\n  - " << e;
    throw ConfigError(oss.str());
}

EngineConfig parse_config(const std::string& text){
    EngineConfig c;
    try {
        from_json(json::parse(text), c);
    } catch (const json::exception& e){
        throw ConfigError(fmt::format("config parse error: {}", e.what()));
    }
    validate(c);
    return c;
}

EngineConfig load_config(const std::filesystem::path& path){
    std::ifstream f(path);
    if (!f.good()) throw ConfigError(fmt::format("cannot open config file: {}", path.string()));
    std::stringstream ss; ss << f.rdbuf();
    return parse_config(ss.str());
}

ConfigStore::ConfigStore(EngineConfig initial)
    : current_(std::make_shared<const EngineConfig>(std::move(initial))) {}

ConfigStore::ConfigStore(EngineConfig initial, std::filesystem::path path, std::filesystem::file_time_type mtime)
    : current_(std::make_shared<const EngineConfig>(std::move(initial))), path_(std::move(path)), mtime_(mtime) {}

ConfigStore ConfigStore::from_file(const std::filesystem::path& path){
    auto cfg = load_config(path);
    std::error_code ec;
    const auto mtime = std::filesystem::last_write_time(path, ec);
    return ConfigStore(std::move(cfg), path, ec ? std::filesystem::file_time_type{} : mtime);
}

std::shared_ptr<const EngineConfig> ConfigStore::current() const {
    std::lock_guard<std::mutex> lk(mtx_);
    return current_;
}

bool ConfigStore::reload_if_changed(){
    if (path_.empty()) return false;
    std::error_code ec;
    const auto mtime = std::filesystem::last_write_time(path_, ec);
    if (ec){
        spdlog::warn("config reload: cannot stat {}: {}", path_.string(), ec.message());
        return false;
    }
    {
        std::lock_guard<std::mutex> lk(mtx_);
        if (mtime == mtime_) return false;
        mtime_ = mtime;
    }
    try {
        auto next = std::make_shared<const EngineConfig>(load_config(path_));
        std::lock_guard<std::mutex> lk(mtx_);
        current_ = std::move(next);
    } catch (const ConfigError& e){
        spdlog::error("config reload rejected, keeping previous configuration: {}", e.what());
        return false;
    }
    spdlog::info("configuration reloaded from {}", path_.string());
    return true;
}

} // namespace core
