#pragma once
#include <string>
#include "core/config.hpp"
#include "core/types.hpp"

namespace exec {

// Külső számla kontextus (equity és limitek)
struct AccountContext {
    double equity{};
    double max_risk_per_trade{0.02};
    double max_position_fraction{0.10};
};

struct RiskInput {
    core::Direction dir{core::Direction::Bullish};
    double entry{};
    double anchor{};                 // pattern stop horgony
    double atr{};
    double session_risk_multiplier{1.0};
};

struct TradeLevels {
    double entry{};
    double stop{};
    double target{};
    double position_size{};
    double risk_per_unit{};          // előjeles: entry-stop (long), stop-entry (short)
    double risk_amount{};            // size * risk_per_unit
    double rr{};
};

struct RiskDecision {
    bool accepted{false};
    TradeLevels levels;
    std::string reason;              // elutasítás oka
};

class TradeLevelCalculator {
public:
    explicit TradeLevelCalculator(core::RiskConfig cfg) : cfg_(std::move(cfg)) {}

    // Stop, target és méret; nem pozitív kockázatnál size = 0 és elutasítás
    RiskDecision compute(const RiskInput& in, const AccountContext& acct) const;

    double stop_for(const RiskInput& in) const;

    const core::RiskConfig& config() const { return cfg_; }

private:
    core::RiskConfig cfg_;
};

// weighted_score/100 + bonus ha független minta megerősíti; [0,1]
double signal_confidence(double weighted_score, bool agreement, double bonus);

} // namespace exec
