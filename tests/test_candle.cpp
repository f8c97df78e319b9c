#include <catch2/catch.hpp>
#include "core/candle.hpp"

using namespace core;

static RawCandle make_raw(std::string o, std::string h, std::string l, std::string c, std::string v = "1000"){
    RawCandle r;
    r.symbol = "AAPL";
    r.interval = "5m";
    r.ts_ms = 1'700'000'000'000;
    r.open = std::move(o); r.high = std::move(h); r.low = std::move(l); r.close = std::move(c);
    r.volume = std::move(v);
    return r;
}

TEST_CASE("valid candle is normalized", "[candle]") {
    const auto res = validate_candle(make_raw("100", "102", "99.5", "101.25"), 0.01);
    REQUIRE(res.ok());
    CHECK(res.reason == RejectReason::None);
    CHECK(res.candle->symbol == "AAPL");
    CHECK(res.candle->interval == Timeframe::M5);
    CHECK(res.candle->range == Approx(2.5));
    REQUIRE(res.candle->volume);
    CHECK(*res.candle->volume == Approx(1000.0));
}

TEST_CASE("empty volume means no volume", "[candle]") {
    const auto res = validate_candle(make_raw("100", "102", "99", "101", ""), 0.01);
    REQUIRE(res.ok());
    CHECK_FALSE(res.candle->volume.has_value());
    CHECK(res.candle->vol() == 0.0);
}

TEST_CASE("non-numeric fields are rejected", "[candle]") {
    SECTION("garbage") {
        CHECK(validate_candle(make_raw("abc", "102", "99", "101"), 0.01).reason == RejectReason::NonNumeric);
    }
    SECTION("trailing junk") {
        CHECK(validate_candle(make_raw("100", "102x", "99", "101"), 0.01).reason == RejectReason::NonNumeric);
    }
    SECTION("nan and inf") {
        CHECK(validate_candle(make_raw("nan", "102", "99", "101"), 0.01).reason == RejectReason::NonNumeric);
        CHECK(validate_candle(make_raw("100", "inf", "99", "101"), 0.01).reason == RejectReason::NonNumeric);
    }
    SECTION("bad volume") {
        CHECK(validate_candle(make_raw("100", "102", "99", "101", "lots"), 0.01).reason == RejectReason::NonNumeric);
        CHECK(validate_candle(make_raw("100", "102", "99", "101", "-5"), 0.01).reason == RejectReason::NonNumeric);
    }
    SECTION("unknown interval") {
        auto r = make_raw("100", "102", "99", "101");
        r.interval = "7m";
        CHECK(validate_candle(r, 0.01).reason == RejectReason::NonNumeric);
    }
}

TEST_CASE("OHLC invariants", "[candle]") {
    CHECK(validate_candle(make_raw("100", "100.5", "99", "101"), 0.01).reason == RejectReason::InvalidOhlc);
    CHECK(validate_candle(make_raw("100", "102", "100.5", "101"), 0.01).reason == RejectReason::InvalidOhlc);
    CHECK(validate_candle(make_raw("100", "100", "100", "100"), 0.0).reason == RejectReason::InvalidOhlc);
}

TEST_CASE("sub-minimum range is rejected", "[candle]") {
    const auto res = validate_candle(make_raw("100", "100.004", "100", "100.002"), 0.01);
    CHECK_FALSE(res.ok());
    CHECK(res.reason == RejectReason::SubMinimumRange);
    CHECK(std::string(to_string(res.reason)) == "sub-minimum-range");
}

TEST_CASE("parse_number accepts whole finite fields only", "[candle]") {
    CHECK(parse_number("1.5") == 1.5);
    CHECK(parse_number("-2e3") == -2000.0);
    CHECK(parse_number("42 ") == 42.0);
    CHECK_FALSE(parse_number(""));
    CHECK_FALSE(parse_number("1,5"));
    CHECK_FALSE(parse_number("1e999"));
}
