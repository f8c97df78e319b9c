#pragma once
#include <cstdint>
#include <string>
#include <nlohmann/json.hpp>
#include "core/types.hpp"

namespace exec {

// Kiadott jel; kiadás után nem módosul
struct TradeSignal {
    std::string symbol;
    core::Signal direction{core::Signal::Neutral};
    double confidence{};          // 0..1
    double entry_price{};
    double stop_loss{};
    double take_profit{};
    double position_size{};
    std::string pattern_label;
    std::string reasoning;
    double risk_reward{};
    std::int64_t ts_ms{};
    std::string session;
    core::Timeframe interval{core::Timeframe::M5};
    int confluence_count{};
    double confluence_score{};
};

void to_json(nlohmann::json& j, const TradeSignal& s);

} // namespace exec
