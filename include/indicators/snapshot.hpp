#pragma once
#include <map>
#include <optional>
#include <string>
#include <vector>
#include "core/config.hpp"
#include "core/types.hpp"
#include "indicators/bollinger.hpp"
#include "indicators/macd.hpp"

namespace ind {

// Egy ablak utolsó barjára számolt indikátorok
struct IndicatorSnapshot {
    std::map<std::size_t, double> ema;   // periódus -> érték
    double rsi{50.0};
    Macd macd;
    std::optional<double> volume_sma;    // nincs, ha a feed nem ad volument
    std::optional<BB> bb;                // nincs, ha rövid az ablak
    double atr{};

    std::optional<double> ema_at(std::size_t period) const {
        auto it = ema.find(period);
        if (it == ema.end()) return std::nullopt;
        return it->second;
    }
};

// Indikátor collaborator; dobhat, a hívó kezeli
class IIndicatorProvider {
public:
    virtual ~IIndicatorProvider() = default;

    // nullopt: nincs elég adat
    virtual std::optional<IndicatorSnapshot> snapshot(const std::string& symbol, core::Timeframe tf,
                                                      const std::vector<core::Candle>& window) = 0;

    // Hot reload után, tickek között hívódik
    virtual void reconfigure(const core::EngineConfig&) {}
};

// Alapértelmezett provider: mindent az átadott ablakból számol
class HistoryIndicatorProvider final : public IIndicatorProvider {
public:
    HistoryIndicatorProvider(core::IndicatorConfig cfg, std::vector<std::size_t> ema_periods)
        : cfg_(std::move(cfg)), ema_periods_(std::move(ema_periods)) {}

    std::optional<IndicatorSnapshot> snapshot(const std::string& symbol, core::Timeframe tf,
                                              const std::vector<core::Candle>& window) override;
    void reconfigure(const core::EngineConfig& c) override;

    std::size_t warmup_bars() const;

private:
    core::IndicatorConfig cfg_;
    std::vector<std::size_t> ema_periods_;
};

} // namespace ind
