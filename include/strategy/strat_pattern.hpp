#pragma once
#include <optional>
#include <string>
#include <vector>
#include "core/config.hpp"
#include "strategy/bar_type.hpp"
#include "strategy/detector.hpp"

namespace strat {

struct StratPattern {
    std::string label;          // pl. "2D->2U"
    core::Direction dir{core::Direction::Bullish};
    BarType first{BarType::Inside};
    BarType second{BarType::Inside};
    double strength{};          // 0..100
};

// (1,2) és (2,3) típuspár -> minta; ismeretlen párra nullopt
std::optional<StratPattern> match_pattern(BarType t12, BarType t23);

// Az utolsó három gyertya alapján; erősség < min_strength -> nullopt
std::optional<StratPattern> recognize(const core::Candle& b1, const core::Candle& b2,
                                      const core::Candle& b3, const core::StratConfig& cfg);

// Második, megerősítő pontozás a minta erősségéből indulva, max 100
double strat_confidence(const core::Candle& b1, const core::Candle& b2,
                        const core::Candle& b3, const StratPattern& p);

// 23.6/38.2/50/61.8/78.6% retracement szintek az utolsó `lookback` bar high/low tartományán
std::vector<double> fib_retracements(const std::vector<core::Candle>& bars, std::size_t lookback);

class StratDetector final : public IDetector {
public:
    explicit StratDetector(core::StratConfig cfg) : cfg_(std::move(cfg)) {}

    std::string id() const override { return "STRAT"; }
    std::size_t warmup_bars() const override { return 3; }
    std::vector<Candidate> detect(const std::vector<core::Candle>& bars,
                                  const sess::SessionInfo& session) const override;

private:
    core::StratConfig cfg_;
};

} // namespace strat
