#include <catch2/catch.hpp>
#include "core/history.hpp"
#include "test_helpers.hpp"

using testutil::bar;

TEST_CASE("history appends in timestamp order", "[history]") {
    core::SymbolHistory h(10);
    REQUIRE(h.append(bar(100, 101, 99, 100, 1000.0, 1000)));
    REQUIRE(h.append(bar(100, 101, 99, 100, 1000.0, 2000)));

    SECTION("duplicate timestamp is rejected") {
        CHECK_FALSE(h.append(bar(100, 101, 99, 100, 1000.0, 2000)));
        CHECK(h.size() == 2);
    }
    SECTION("older timestamp is rejected") {
        CHECK_FALSE(h.append(bar(100, 101, 99, 100, 1000.0, 1500)));
        CHECK(h.back().ts_ms == 2000);
    }
}

TEST_CASE("history evicts the oldest bars", "[history]") {
    core::SymbolHistory h(3);
    for (int i = 1; i <= 5; ++i) h.append(bar(100, 101, 99, 100, 1000.0, i * 1000));
    REQUIRE(h.size() == 3);
    CHECK(h[0].ts_ms == 3000);
    CHECK(h.back().ts_ms == 5000);

    h.set_max_len(2);
    CHECK(h.size() == 2);
    CHECK(h[0].ts_ms == 4000);
}

TEST_CASE("history window", "[history]") {
    core::SymbolHistory h(10);
    for (int i = 1; i <= 6; ++i) h.append(bar(100, 101, 99, 100, 1000.0, i * 1000));

    const auto w = h.window(3, 2);
    REQUIRE(w.size() == 2);
    CHECK(w.front().ts_ms == 3000);
    CHECK(w.back().ts_ms == 4000);

    CHECK(h.window(1, 10).size() == 2);
    CHECK(h.window(100, 3).back().ts_ms == 6000);
    CHECK(h.snapshot().size() == 6);
}
