#include <catch2/catch.hpp>
#include <chrono>
#include <filesystem>
#include <fstream>
#include "core/config.hpp"

using namespace core;
namespace fs = std::filesystem;

TEST_CASE("defaults are valid", "[config]") {
    EngineConfig c;
    CHECK_NOTHROW(validate(c));
    CHECK(c.confluence.min_count == 4);
    CHECK(c.throttle.cooldown_ms == 300'000);
}

TEST_CASE("hh:mm parsing", "[config]") {
    CHECK(parse_hhmm("09:30") == 570);
    CHECK(parse_hhmm("4:00") == 240);
    CHECK(parse_hhmm("23:59") == 1439);
    CHECK_FALSE(parse_hhmm("24:00"));
    CHECK_FALSE(parse_hhmm("9:3"));
    CHECK_FALSE(parse_hhmm("ab:cd"));
    CHECK_FALSE(parse_hhmm(""));
}

TEST_CASE("json overrides", "[config]") {
    const auto c = parse_config(R"({
        "logging": {"level": "debug"},
        "confluence": {"weights": {"fibonacci": 4, "macd": 0.5}, "min_count": 3, "ema_periods": [10, 30]},
        "session": {
            "market_open": "09:45",
            "premarket": {"families": ["strat", "gap"], "risk_multiplier": 0.6}
        },
        "risk": {"stop_policy": "atr", "atr_multiplier": 1.5},
        "scanner": {"watchlist": ["AAPL", "MSFT"], "interval": "1m", "workers": 2},
        "unknown_section": {"x": 1}
    })");
    CHECK(c.logging.level == "debug");
    CHECK(c.confluence.weights[0] == Approx(4.0));
    CHECK(c.confluence.weights[5] == Approx(0.5));
    CHECK(c.confluence.weights[1] == Approx(2.0));
    CHECK(c.confluence.min_count == 3);
    CHECK(c.confluence.ema_periods == std::vector<std::size_t>{10, 30});
    CHECK(c.session.market_open == 585);
    CHECK(c.session.premarket.families.size() == 2);
    CHECK(c.session.premarket.risk_multiplier == Approx(0.6));
    CHECK(c.risk.stop_policy == StopPolicy::Atr);
    CHECK(c.scanner.watchlist.size() == 2);
    CHECK(c.scanner.interval == Timeframe::M1);
    CHECK(c.scanner.workers == 2);
}

TEST_CASE("invalid configuration fails fast", "[config]") {
    CHECK_THROWS_AS(parse_config(R"({"confluence": {"min_count": 7}})"), ConfigError);
    CHECK_THROWS_AS(parse_config(R"({"session": {"intraday": {"risk_multiplier": 1.5}}})"), ConfigError);
    CHECK_THROWS_AS(parse_config(R"({"session": {"intraday": {"scan_interval_ms": 5000}}})"), ConfigError);
    CHECK_THROWS_AS(parse_config(R"({"session": {"market_open": "25:00"}})"), ConfigError);
    CHECK_THROWS_AS(parse_config(R"({"session": {"market_open": "17:00"}})"), ConfigError);
    CHECK_THROWS_AS(parse_config(R"({"session": {"intraday": {"families": ["unicorn"]}}})"), ConfigError);
    CHECK_THROWS_AS(parse_config(R"({"risk": {"stop_policy": "magic"}})"), ConfigError);
    CHECK_THROWS_AS(parse_config(R"({"abcd": {"bc_retracement_min": 0.9}})"), ConfigError);
    CHECK_THROWS_AS(parse_config(R"({"throttle": {"max_signals_per_day": 0}})"), ConfigError);
    CHECK_THROWS_AS(parse_config(R"({"risk": {"max_risk_per_trade": "high"}})"), ConfigError);
    CHECK_THROWS_AS(parse_config("{not json"), ConfigError);
    CHECK_THROWS_AS(load_config("/nonexistent/stratscan.json"), ConfigError);
}

TEST_CASE("ema ladder and history must fit the indicators", "[config]") {
    CHECK_THROWS_AS(parse_config(R"({"confluence": {"ema_periods": [20, 20, 50]}})"), ConfigError);
    CHECK_THROWS_AS(parse_config(R"({"confluence": {"ema_periods": [50, 20]}})"), ConfigError);
    CHECK_NOTHROW(parse_config(R"({"confluence": {"ema_periods": [9, 21]}})"));

    CHECK(indicator_warmup(IndicatorConfig{}, {20, 50, 100}) == 100);
    CHECK(indicator_warmup(IndicatorConfig{}, {9, 21}) == 35);

    try {
        parse_config(R"({"validator": {"max_history": 60}})");
        FAIL("expected ConfigError");
    } catch (const ConfigError& e){
        CHECK(std::string(e.what()).find("validator.max_history must be at least the indicator warmup (100 bars)")
              != std::string::npos);
    }
    CHECK_NOTHROW(parse_config(R"({"validator": {"max_history": 60}, "confluence": {"ema_periods": [9, 21]}})"));
}

TEST_CASE("validation reports every problem", "[config]") {
    try {
        parse_config(R"({"confluence": {"min_count": 0}, "risk": {"reward_multiplier": -1}})");
        FAIL("expected ConfigError");
    } catch (const ConfigError& e) {
        const std::string msg = e.what();
        CHECK(msg.find("confluence.min_count") != std::string::npos);
        CHECK(msg.find("risk.reward_multiplier") != std::string::npos);
    }
}

TEST_CASE("config store hot reload", "[config]") {
    const auto path = fs::temp_directory_path() / "stratscan_config_test.json";
    {
        std::ofstream f(path);
        f << R"({"throttle": {"max_signals_per_day": 3}})";
    }
    auto store = ConfigStore::from_file(path);
    CHECK(store.current()->throttle.max_signals_per_day == 3);
    CHECK_FALSE(store.reload_if_changed());

    const auto bump = [&]{
        fs::last_write_time(path, fs::last_write_time(path) + std::chrono::seconds(2));
    };

    SECTION("a valid change is applied") {
        { std::ofstream f(path); f << R"({"throttle": {"max_signals_per_day": 7}})"; }
        bump();
        CHECK(store.reload_if_changed());
        CHECK(store.current()->throttle.max_signals_per_day == 7);
    }
    SECTION("an invalid change keeps the previous config") {
        const auto before = store.current();
        { std::ofstream f(path); f << R"({"throttle": {"max_signals_per_day": -1}})"; }
        bump();
        CHECK_FALSE(store.reload_if_changed());
        CHECK(store.current() == before);
        CHECK(store.current()->throttle.max_signals_per_day == 3);
    }
    fs::remove(path);
}

TEST_CASE("in-memory store never reloads", "[config]") {
    ConfigStore store{EngineConfig{}};
    CHECK_FALSE(store.reload_if_changed());
    CHECK(store.current()->scanner.workers == 4);
}
