#include "session/eastern_time.hpp"

namespace sess {

namespace {

constexpr std::int64_t kMsPerDay  = 86'400'000;
constexpr std::int64_t kMsPerHour = 3'600'000;

struct Civil { int y, m, d; };

Civil civil_from_days(std::int64_t z){
    z += 719468;
    const std::int64_t era = (z >= 0 ? z : z - 146096) / 146097;
    const auto doe = static_cast<unsigned>(z - era * 146097);
    const unsigned yoe = (doe - doe/1460 + doe/36524 - doe/146096) / 365;
    const std::int64_t y = static_cast<std::int64_t>(yoe) + era * 400;
    const unsigned doy = doe - (365*yoe + yoe/4 - yoe/100);
    const unsigned mp = (5*doy + 2)/153;
    const unsigned d = doy - (153*mp + 2)/5 + 1;
    const unsigned m = mp < 10 ? mp + 3 : mp - 9;
    return {static_cast<int>(y + (m <= 2)), static_cast<int>(m), static_cast<int>(d)};
}

int weekday_from_days(std::int64_t z){
    return static_cast<int>(z >= -4 ? (z + 4) % 7 : (z + 5) % 7 + 6);
}

std::int64_t floor_div(std::int64_t a, std::int64_t b){
    return a / b - ((a % b != 0) && ((a < 0) != (b < 0)));
}

// n-edik `wd` hétköznap az adott hónapban, napok 1970 óta
std::int64_t nth_weekday(int y, int m, int wd, int n){
    const std::int64_t first = days_from_civil(y, m, 1);
    const int fwd = weekday_from_days(first);
    return first + (wd - fwd + 7) % 7 + 7 * (n - 1);
}

} // namespace

std::int64_t days_from_civil(int y, int m, int d){
    y -= m <= 2;
    const std::int64_t era = (y >= 0 ? y : y - 399) / 400;
    const auto yoe = static_cast<unsigned>(y - era * 400);
    const unsigned doy = (153*(m > 2 ? m - 3 : m + 9) + 2)/5 + d - 1;
    const unsigned doe = yoe * 365 + yoe/4 - yoe/100 + doy;
    return era * 146097 + static_cast<std::int64_t>(doe) - 719468;
}

bool us_dst_active(std::int64_t utc_ms){
    const int y = civil_from_days(floor_div(utc_ms, kMsPerDay)).y;
    const std::int64_t start = nth_weekday(y, 3, 0, 2) * kMsPerDay + 7 * kMsPerHour;
    const std::int64_t end   = nth_weekday(y, 11, 0, 1) * kMsPerDay + 6 * kMsPerHour;
    return utc_ms >= start && utc_ms < end;
}

EasternTime to_eastern(std::int64_t utc_ms){
    EasternTime et;
    et.dst = us_dst_active(utc_ms);
    const std::int64_t local = utc_ms + (et.dst ? -4 : -5) * kMsPerHour;
    const std::int64_t days = floor_div(local, kMsPerDay);
    const auto c = civil_from_days(days);
    et.year = c.y; et.month = c.m; et.day = c.d;
    et.weekday = weekday_from_days(days);
    et.minute_of_day = static_cast<int>((local - days * kMsPerDay) / 60'000);
    return et;
}

int eastern_day_key(std::int64_t utc_ms){
    const auto et = to_eastern(utc_ms);
    return et.year * 10000 + et.month * 100 + et.day;
}

} // namespace sess
