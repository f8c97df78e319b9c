#include "indicators/snapshot.hpp"
#include <algorithm>
#include "indicators/atr.hpp"
#include "indicators/rsi.hpp"
#include "indicators/sma_ema.hpp"

namespace ind {

std::size_t HistoryIndicatorProvider::warmup_bars() const {
    return core::indicator_warmup(cfg_, ema_periods_);
}

void HistoryIndicatorProvider::reconfigure(const core::EngineConfig& c){
    cfg_ = c.indicators;
    ema_periods_ = c.confluence.ema_periods;
}

std::optional<IndicatorSnapshot> HistoryIndicatorProvider::snapshot(const std::string&, core::Timeframe,
                                                                    const std::vector<core::Candle>& window){
    if (window.size() < warmup_bars()) return std::nullopt;

    std::vector<double> closes; closes.reserve(window.size());
    std::vector<double> vols;   vols.reserve(window.size());
    bool has_volume = true;
    for (const auto& c : window){
        closes.push_back(c.close);
        if (c.volume) vols.push_back(*c.volume); else has_volume = false;
    }

    IndicatorSnapshot s;
    for (auto p : ema_periods_) s.ema[p] = compute_ema(closes, p);
    s.rsi  = compute_rsi(closes, cfg_.rsi_period);
    s.macd = compute_macd(closes, cfg_.macd_fast, cfg_.macd_slow, cfg_.macd_signal);
    s.bb   = compute_bb(closes, cfg_.bb_period, cfg_.bb_k);
    s.atr  = compute_atr(window, cfg_.atr_period);

    // a referencia bar volumenét nem számoljuk bele az átlagba
    if (has_volume && vols.size() > cfg_.volume_sma){
        std::vector<double> prior(vols.begin(), vols.end() - 1);
        s.volume_sma = compute_sma(prior, cfg_.volume_sma);
    }
    return s;
}

} // namespace ind
