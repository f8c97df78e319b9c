#pragma once
#include <cstdint>

namespace sess {

struct EasternTime {
    int year{}, month{}, day{};
    int minute_of_day{};   // 0..1439, helyi idő
    int weekday{};         // 0 = vasárnap
    bool dst{false};
};

// Napok 1970-01-01 óta egy polgári dátumhoz (proleptikus Gergely-naptár)
std::int64_t days_from_civil(int y, int m, int d);

// US szabály: március 2. vasárnap 07:00 UTC-től november 1. vasárnap 06:00 UTC-ig EDT
bool us_dst_active(std::int64_t utc_ms);

EasternTime to_eastern(std::int64_t utc_ms);

// yyyymmdd az Eastern naptári napra
int eastern_day_key(std::int64_t utc_ms);

} // namespace sess
