#include <algorithm>
#include <catch2/catch.hpp>
#include "strategy/tech_patterns.hpp"
#include "test_helpers.hpp"

using namespace strat;
using testutil::bar;

static bool has(const std::vector<TechPattern>& v, TechPattern p){
    return std::find(v.begin(), v.end(), p) != v.end();
}

TEST_CASE("single candle patterns", "[tech]") {
    CHECK(has(detect_technical({bar(100, 101, 99, 100.05)}), TechPattern::Doji));
    CHECK(has(detect_technical({bar(100, 100.6, 98, 100.5)}), TechPattern::Hammer));
    CHECK(has(detect_technical({bar(100.5, 102.5, 99.9, 100)}), TechPattern::ShootingStar));
    CHECK(detect_technical({bar(99.5, 100.3, 99.2, 100)}).empty());
}

TEST_CASE("engulfing", "[tech]") {
    const auto bull = detect_technical({bar(102, 102.5, 99.5, 100), bar(99.5, 103.5, 99, 103)});
    CHECK(has(bull, TechPattern::BullishEngulfing));
    CHECK_FALSE(has(bull, TechPattern::BearishEngulfing));

    const auto bear = detect_technical({bar(100, 102.5, 99.5, 102), bar(102.5, 103, 98.5, 99.5)});
    CHECK(has(bear, TechPattern::BearishEngulfing));
}

TEST_CASE("head and shoulders", "[tech]") {
    std::vector<core::Candle> w;
    for (double h : {100.0, 103.0, 101.0, 106.0, 101.0, 103.5, 100.0})
        w.push_back(bar(h - 1.0, h, h - 2.0, h - 0.5));
    CHECK(has(detect_technical(w), TechPattern::HeadAndShoulders));

    std::vector<core::Candle> inv;
    for (double l : {100.0, 97.0, 99.0, 94.0, 99.0, 96.5, 100.0})
        inv.push_back(bar(l + 1.0, l + 2.0, l, l + 0.5));
    CHECK(has(detect_technical(inv), TechPattern::InverseHeadAndShoulders));
}

TEST_CASE("double top and bottom", "[tech]") {
    std::vector<core::Candle> top;
    for (double h : {100.0, 104.0, 101.0, 104.2, 101.0, 99.0})
        top.push_back(bar(h - 1.0, h, h - 2.0, h - 1.5));
    CHECK(has(detect_technical(top), TechPattern::DoubleTop));

    std::vector<core::Candle> bottom;
    for (double l : {100.0, 96.0, 99.0, 96.1, 99.0, 101.0})
        bottom.push_back(bar(l + 1.0, l + 2.0, l, l + 1.5));
    CHECK(has(detect_technical(bottom), TechPattern::DoubleBottom));
}

TEST_CASE("triangles", "[tech]") {
    std::vector<core::Candle> asc;
    for (int i = 0; i < 10; ++i){
        const double lo = 100.0 + 0.5 * i;
        asc.push_back(bar(lo + 1.0, 110.0, lo, lo + 2.0));
    }
    CHECK(has(detect_technical(asc), TechPattern::AscendingTriangle));

    std::vector<core::Candle> desc;
    for (int i = 0; i < 10; ++i){
        const double hi = 110.0 - 0.5 * i;
        desc.push_back(bar(hi - 1.0, hi, 100.0, hi - 2.0));
    }
    CHECK(has(detect_technical(desc), TechPattern::DescendingTriangle));
}

TEST_CASE("direction matching", "[tech]") {
    CHECK(matches(TechPattern::Doji, core::Direction::Bullish));
    CHECK(matches(TechPattern::Doji, core::Direction::Bearish));
    CHECK(matches(TechPattern::Hammer, core::Direction::Bullish));
    CHECK_FALSE(matches(TechPattern::Hammer, core::Direction::Bearish));
    CHECK_FALSE(direction_of(TechPattern::Doji));
    CHECK(std::string(to_string(TechPattern::ShootingStar)) == "shooting_star");
}

TEST_CASE("technical agreement looks back a few bars", "[tech]") {
    const std::vector<core::Candle> w{
        bar(99.5, 100.3, 99.2, 100),     // semleges
        bar(100, 100.6, 98, 100.5),      // hammer
        bar(101, 101.2, 99.8, 100),      // bearish engulfing
    };
    CHECK(technical_agreement(w, core::Direction::Bullish, 3));
    CHECK_FALSE(technical_agreement(w, core::Direction::Bullish, 1));
    CHECK(technical_agreement(w, core::Direction::Bearish, 1));
}
