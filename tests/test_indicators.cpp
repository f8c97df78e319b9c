#include <catch2/catch.hpp>
#include "indicators/atr.hpp"
#include "indicators/bollinger.hpp"
#include "indicators/macd.hpp"
#include "indicators/rsi.hpp"
#include "indicators/sma_ema.hpp"
#include "indicators/snapshot.hpp"
#include <cmath>
#include "test_helpers.hpp"

using namespace ind;

TEST_CASE("sma and ema", "[indicators]") {
    const std::vector<double> v{1, 2, 3, 4, 5};
    REQUIRE(compute_sma(v, 3));
    CHECK(*compute_sma(v, 3) == Approx(4.0));
    CHECK(*compute_sma(v, 5) == Approx(3.0));
    CHECK_FALSE(compute_sma(v, 10));
    CHECK_FALSE(compute_sma(v, 0));

    const std::vector<double> flat(30, 42.0);
    CHECK(compute_ema(flat, 10) == Approx(42.0));
    CHECK(ema_series(flat, 10).size() == 21);
    CHECK(ema_series(v, 10).empty());

    // seed = SMA(1,2,3) = 2, majd 4*0.5 + 2*0.5 = 3, 5*0.5 + 3*0.5 = 4
    CHECK(compute_ema(v, 3) == Approx(4.0));
}

TEST_CASE("rsi", "[indicators]") {
    std::vector<double> up;
    for (int i = 0; i < 30; ++i) up.push_back(100.0 + i);
    CHECK(compute_rsi(up, 14) == Approx(100.0));

    std::vector<double> down;
    for (int i = 0; i < 30; ++i) down.push_back(100.0 - i);
    CHECK(compute_rsi(down, 14) == Approx(0.0));

    CHECK(compute_rsi(std::vector<double>(30, 100.0), 14) == Approx(50.0));
    CHECK(compute_rsi({1.0, 2.0}, 14) == Approx(50.0));

    std::vector<double> zig;
    for (int i = 0; i < 40; ++i) zig.push_back(i % 2 ? 101.0 : 100.0);
    CHECK(compute_rsi(zig, 14) == Approx(50.0).margin(5.0));
}

TEST_CASE("macd", "[indicators]") {
    std::vector<double> up;
    for (int i = 0; i < 60; ++i) up.push_back(100.0 + i);
    const auto m = compute_macd(up, 12, 26, 9);
    CHECK(m.macd > 0.0);
    CHECK(m.histogram == Approx(m.macd - m.signal));

    const auto none = compute_macd(std::vector<double>(10, 1.0), 12, 26, 9);
    CHECK(none.macd == 0.0);
}

TEST_CASE("bollinger and atr", "[indicators]") {
    const auto flat = compute_bb(std::vector<double>(25, 50.0), 20, 2.0);
    REQUIRE(flat);
    CHECK(flat->mid == Approx(50.0));
    CHECK(flat->upper == Approx(50.0));
    CHECK(flat->lower == Approx(50.0));

    // 1..5: átlag 3, populációs szórás sqrt(2)
    const auto bb = compute_bb({9.0, 1.0, 2.0, 3.0, 4.0, 5.0}, 5, 2.0);
    REQUIRE(bb);
    CHECK(bb->mid == Approx(3.0));
    CHECK(bb->upper == Approx(3.0 + 2.0 * std::sqrt(2.0)));
    CHECK(bb->lower == Approx(3.0 - 2.0 * std::sqrt(2.0)));
    CHECK_FALSE(compute_bb({1.0, 2.0}, 5, 2.0));

    std::vector<core::Candle> bars;
    for (int i = 0; i < 20; ++i) bars.push_back(testutil::bar(100, 101, 99, 100));
    CHECK(compute_atr(bars, 14) == Approx(2.0));
    CHECK(compute_atr({testutil::bar(100, 103, 99, 100)}, 14) == Approx(4.0));
}

TEST_CASE("history indicator provider", "[indicators]") {
    core::IndicatorConfig cfg;
    HistoryIndicatorProvider p(cfg, {20, 50, 100});
    CHECK(p.warmup_bars() == 100);

    std::vector<core::Candle> bars;
    for (int i = 0; i < 120; ++i)
        bars.push_back(testutil::bar(100 + i, 101.5 + i, 99.5 + i, 101 + i, 1000.0 + i,
                                     testutil::kBase + i * 300'000));

    const std::vector<core::Candle> short_window(bars.begin(), bars.begin() + 50);
    CHECK_FALSE(p.snapshot("T", core::Timeframe::M5, short_window));

    const auto s = p.snapshot("T", core::Timeframe::M5, bars);
    REQUIRE(s);
    REQUIRE(s->ema_at(20));
    REQUIRE(s->ema_at(100));
    CHECK(*s->ema_at(20) > *s->ema_at(50));
    CHECK(*s->ema_at(50) > *s->ema_at(100));
    CHECK(s->rsi > 70.0);
    CHECK(s->macd.macd > 0.0);
    REQUIRE(s->volume_sma);
    CHECK(*s->volume_sma < bars.back().vol());
    CHECK(s->atr > 0.0);
    REQUIRE(s->bb);
    CHECK(s->bb->upper > s->bb->lower);

    SECTION("no volume in the feed") {
        for (auto& b : bars) b.volume.reset();
        const auto nv = p.snapshot("T", core::Timeframe::M5, bars);
        REQUIRE(nv);
        CHECK_FALSE(nv->volume_sma);
    }
    SECTION("reload changes the EMA ladder") {
        core::EngineConfig ec;
        ec.confluence.ema_periods = {10, 30};
        p.reconfigure(ec);
        CHECK(p.warmup_bars() == ec.indicators.macd_slow + ec.indicators.macd_signal);
        const auto r = p.snapshot("T", core::Timeframe::M5, bars);
        REQUIRE(r);
        CHECK(r->ema_at(10));
        CHECK(r->ema_at(30));
        CHECK_FALSE(r->ema_at(100));
    }
}
