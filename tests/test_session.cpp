#include <catch2/catch.hpp>
#include "session/eastern_time.hpp"
#include "session/session.hpp"
#include "test_helpers.hpp"

using namespace sess;
using testutil::utc_ms;

static int hm(int h, int m){ return h * 60 + m; }

TEST_CASE("session boundaries", "[session]") {
    core::SessionConfig cfg;
    CHECK(classify_minutes(hm(3, 59), cfg).session == Session::Closed);
    CHECK(classify_minutes(hm(4, 0), cfg).session == Session::Premarket);
    CHECK(classify_minutes(hm(9, 29), cfg).session == Session::Premarket);
    CHECK(classify_minutes(hm(9, 30), cfg).session == Session::Intraday);
    CHECK(classify_minutes(hm(15, 59), cfg).session == Session::Intraday);
    CHECK(classify_minutes(hm(16, 0), cfg).session == Session::Afterhours);
    CHECK(classify_minutes(hm(19, 59), cfg).session == Session::Afterhours);
    CHECK(classify_minutes(hm(20, 1), cfg).session == Session::Closed);
}

TEST_CASE("session parameters", "[session]") {
    core::SessionConfig cfg;
    const auto pre = classify_minutes(hm(8, 0), cfg);
    CHECK(pre.scan_interval == std::chrono::minutes(2));
    CHECK(pre.risk_multiplier == Approx(0.7));
    CHECK(pre.api_budget_per_minute == 30);
    CHECK(pre.allows(core::PatternFamily::Gap));
    CHECK(pre.allows(core::PatternFamily::VolumeSpike));
    CHECK_FALSE(pre.allows(core::PatternFamily::Momentum));

    const auto in = classify_minutes(hm(11, 0), cfg);
    CHECK(in.scan_interval == std::chrono::minutes(1));
    CHECK(in.risk_multiplier == Approx(1.0));
    CHECK(in.allows(core::PatternFamily::Momentum));

    const auto after = classify_minutes(hm(17, 0), cfg);
    CHECK(after.risk_multiplier == Approx(0.5));
    CHECK(after.allows(core::PatternFamily::Reversal));

    const auto closed = classify_minutes(hm(23, 0), cfg);
    CHECK(closed.scan_interval == std::chrono::minutes(10));
    CHECK(closed.risk_multiplier == Approx(0.3));
    CHECK(closed.api_budget_per_minute == 5);
    CHECK(closed.families.empty());
}

TEST_CASE("session scheduling can be disabled", "[session]") {
    core::SessionConfig cfg;
    cfg.session_based = false;
    CHECK(classify_minutes(hm(2, 0), cfg).session == Session::Intraday);
}

TEST_CASE("civil date arithmetic", "[session]") {
    CHECK(days_from_civil(1970, 1, 1) == 0);
    CHECK(days_from_civil(2000, 3, 1) == 11017);
    CHECK(days_from_civil(1969, 12, 31) == -1);
}

TEST_CASE("US daylight saving", "[session]") {
    // 2024: március 10. 07:00 UTC - november 3. 06:00 UTC
    CHECK_FALSE(us_dst_active(utc_ms(2024, 3, 10, 6, 59)));
    CHECK(us_dst_active(utc_ms(2024, 3, 10, 7, 0)));
    CHECK(us_dst_active(utc_ms(2024, 11, 3, 5, 59)));
    CHECK_FALSE(us_dst_active(utc_ms(2024, 11, 3, 6, 0)));

    core::SessionConfig cfg;
    // télen 14:30 UTC = 09:30 EST, nyáron 13:30 UTC = 09:30 EDT
    CHECK(classify(utc_ms(2024, 1, 10, 14, 30), cfg).session == Session::Intraday);
    CHECK(classify(utc_ms(2024, 1, 10, 14, 29), cfg).session == Session::Premarket);
    CHECK(classify(utc_ms(2024, 7, 1, 13, 30), cfg).session == Session::Intraday);
    CHECK(classify(utc_ms(2024, 7, 1, 20, 0), cfg).session == Session::Afterhours);

    const auto et = to_eastern(utc_ms(2024, 7, 1, 13, 30));
    CHECK(et.dst);
    CHECK(et.minute_of_day == hm(9, 30));
    CHECK(et.weekday == 1);
}

TEST_CASE("eastern day key", "[session]") {
    CHECK(eastern_day_key(utc_ms(2024, 1, 11, 3, 0)) == 20240110);
    CHECK(eastern_day_key(utc_ms(2024, 1, 11, 5, 0)) == 20240111);
    CHECK(eastern_day_key(utc_ms(2024, 7, 1, 3, 59)) == 20240630);
    CHECK(eastern_day_key(utc_ms(2024, 7, 1, 4, 0)) == 20240701);
}
