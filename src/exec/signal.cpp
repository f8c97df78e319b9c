#include "exec/signal.hpp"

namespace exec {

void to_json(nlohmann::json& j, const TradeSignal& s){
    j = nlohmann::json{
        {"symbol", s.symbol},
        {"direction", core::to_string(s.direction)},
        {"confidence", s.confidence},
        {"entryPrice", s.entry_price},
        {"stopLoss", s.stop_loss},
        {"takeProfit", s.take_profit},
        {"positionSize", s.position_size},
        {"patternLabel", s.pattern_label},
        {"reasoning", s.reasoning},
        {"riskRewardRatio", s.risk_reward},
        {"timestamp", s.ts_ms},
        {"session", s.session},
        {"interval", core::to_string(s.interval)},
        {"confluence", {{"count", s.confluence_count}, {"score", s.confluence_score}}}
    };
}

} // namespace exec
