#include <catch2/catch.hpp>
#include "strategy/strat_pattern.hpp"
#include "test_helpers.hpp"

using namespace strat;
using core::Direction;

TEST_CASE("pattern table", "[strat]") {
    const BarType all[] = {BarType::Inside, BarType::Up, BarType::Down, BarType::Outside};
    int matched = 0;
    for (auto a : all)
        for (auto b : all)
            if (match_pattern(a, b)) ++matched;
    CHECK(matched == 6);

    auto p = match_pattern(BarType::Down, BarType::Up);
    REQUIRE(p);
    CHECK(p->label == "2D->2U");
    CHECK(p->dir == Direction::Bullish);

    p = match_pattern(BarType::Up, BarType::Down);
    REQUIRE(p);
    CHECK(p->dir == Direction::Bearish);

    CHECK(match_pattern(BarType::Inside, BarType::Up)->label == "1->2U");
    CHECK(match_pattern(BarType::Outside, BarType::Down)->label == "3->2D");
    CHECK_FALSE(match_pattern(BarType::Up, BarType::Up));
    CHECK_FALSE(match_pattern(BarType::Down, BarType::Inside));
}

TEST_CASE("2D->2U reversal strength and confidence", "[strat]") {
    const auto bars = testutil::two_down_two_up();
    const auto& b1 = bars[2];
    const auto& b2 = bars[3];
    const auto& b3 = bars[4];
    core::StratConfig cfg;

    const auto p = recognize(b1, b2, b3, cfg);
    REQUIRE(p);
    CHECK(p->label == "2D->2U");
    CHECK(p->dir == Direction::Bullish);
    // 50 + 10 (volume) + 8 (range) + 5 (close) + 12 (beyond bar2 high)
    CHECK(p->strength == Approx(85.0));
    CHECK(strat_confidence(b1, b2, b3, *p) == Approx(100.0));

    SECTION("recognition is idempotent") {
        const auto again = recognize(b1, b2, b3, cfg);
        REQUIRE(again);
        CHECK(again->label == p->label);
        CHECK(again->strength == p->strength);
    }
    SECTION("weak patterns are discarded") {
        cfg.min_strength = 90.0;
        CHECK_FALSE(recognize(b1, b2, b3, cfg));
    }
}

TEST_CASE("strength without volume", "[strat]") {
    auto bars = testutil::two_down_two_up();
    for (auto& b : bars) b.volume.reset();
    const auto p = recognize(bars[2], bars[3], bars[4], core::StratConfig{});
    REQUIRE(p);
    CHECK(p->strength == Approx(75.0));
}

TEST_CASE("unmatched sequence gives no pattern", "[strat]") {
    using testutil::bar;
    const auto b1 = bar(100, 101, 99, 100.5);
    const auto b2 = bar(100.5, 102, 100, 101.5);   // 2U
    const auto b3 = bar(101.5, 103, 101, 102.5);   // 2U
    CHECK_FALSE(recognize(b1, b2, b3, core::StratConfig{}));
}

TEST_CASE("fib retracement levels", "[strat]") {
    using testutil::bar;
    const std::vector<core::Candle> bars{bar(100, 110, 100, 105), bar(105, 108, 102, 103)};
    const auto lv = fib_retracements(bars, 20);
    REQUIRE(lv.size() == 5);
    CHECK(lv[0] == Approx(110 - 10 * 0.236));
    CHECK(lv[2] == Approx(105.0));
    CHECK(lv[4] == Approx(110 - 10 * 0.786));
}

TEST_CASE("strat detector builds a candidate", "[strat]") {
    const auto bars = testutil::two_down_two_up();
    StratDetector det{core::StratConfig{}};
    core::EngineConfig ec;
    sess::SessionInfo intraday = sess::classify_minutes(10 * 60, ec.session);

    const auto cands = det.detect(bars, intraday);
    REQUIRE(cands.size() == 1);
    const auto& c = cands.front();
    CHECK(c.family == core::PatternFamily::Strat);
    CHECK(c.entry == Approx(107.5));
    CHECK(c.anchor == Approx(97.0));
    CHECK(c.ref_index == 4);
    CHECK(c.fib_targets.size() == 5);

    SECTION("family disabled by the session") {
        sess::SessionInfo closed = sess::classify_minutes(2 * 60, ec.session);
        CHECK(det.detect(bars, closed).empty());
    }
}
