#pragma once
#include <algorithm>
#include <chrono>
#include <cstdint>
#include <vector>
#include "core/config.hpp"
#include "core/types.hpp"

namespace sess {

enum class Session { Premarket, Intraday, Afterhours, Closed };

inline const char* to_string(Session s) {
    switch (s) {
        case Session::Premarket:  return "premarket";
        case Session::Intraday:   return "intraday";
        case Session::Afterhours: return "afterhours";
        case Session::Closed:     return "closed";
    }
    return "closed";
}

struct SessionInfo {
    Session session{Session::Closed};
    std::chrono::milliseconds scan_interval{600'000};
    double risk_multiplier{0.3};
    int api_budget_per_minute{5};
    std::vector<core::PatternFamily> families;

    bool allows(core::PatternFamily f) const {
        return std::find(families.begin(), families.end(), f) != families.end();
    }
};

// Helyi (Eastern) perc éjfél óta -> session; [start, end) intervallumok
SessionInfo classify_minutes(int minute_of_day, const core::SessionConfig& cfg);

// UTC ms -> session; session_based == false esetén mindig intraday
SessionInfo classify(std::int64_t utc_ms, const core::SessionConfig& cfg);

SessionInfo classify(std::chrono::system_clock::time_point tp, const core::SessionConfig& cfg);

} // namespace sess
