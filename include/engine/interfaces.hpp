#pragma once
#include <functional>
#include <string>
#include <vector>
#include "core/candle.hpp"
#include "core/config.hpp"
#include "exec/risk.hpp"
#include "exec/signal.hpp"

namespace engine {

// Gyertya feed: növekvő timestamp sorrendben adja az új rekordokat; hibánál dobhat
class ICandleFeed {
public:
    virtual ~ICandleFeed() = default;
    virtual std::vector<core::RawCandle> poll(const std::string& symbol) = 0;
};

class IAccountProvider {
public:
    virtual ~IAccountProvider() = default;
    virtual exec::AccountContext account() = 0;
    virtual void reconfigure(const core::EngineConfig&) {}
};

// Konfigurációból vett fix equity és limitek
class ConfigAccountProvider final : public IAccountProvider {
public:
    ConfigAccountProvider(double equity, const core::RiskConfig& risk)
        : ctx_{equity, risk.max_risk_per_trade, risk.max_position_fraction} {}
    exec::AccountContext account() override { return ctx_; }
    void reconfigure(const core::EngineConfig& c) override {
        ctx_ = {c.scanner.equity, c.risk.max_risk_per_trade, c.risk.max_position_fraction};
    }

private:
    exec::AccountContext ctx_;
};

using SignalSink = std::function<void(const exec::TradeSignal&)>;

} // namespace engine
