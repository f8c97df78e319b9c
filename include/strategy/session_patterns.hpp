#pragma once
#include <optional>
#include "core/config.hpp"
#include "strategy/detector.hpp"

namespace strat {

// Session-specifikus családok: gap, volume spike (premarket), momentum (intraday),
// reversal (afterhours). Erősség = min(100, alap * session risk szorzó).
class SessionPatternDetector final : public IDetector {
public:
    static constexpr double kGapBase      = 125.0;
    static constexpr double kVolumeBase   = 130.0;
    static constexpr double kMomentumBase = 120.0;
    static constexpr double kReversalBase = 115.0;

    SessionPatternDetector(core::SessionConfig cfg, std::size_t fib_lookback)
        : cfg_(std::move(cfg)), fib_lookback_(fib_lookback) {}

    std::string id() const override { return "SESSION"; }
    std::size_t warmup_bars() const override { return 2; }
    std::vector<Candidate> detect(const std::vector<core::Candle>& bars,
                                  const sess::SessionInfo& session) const override;

private:
    std::optional<Candidate> gap(const std::vector<core::Candle>& bars) const;
    std::optional<Candidate> volume_spike(const std::vector<core::Candle>& bars) const;
    std::optional<Candidate> momentum(const std::vector<core::Candle>& bars) const;
    std::optional<Candidate> reversal(const std::vector<core::Candle>& bars) const;

    Candidate make(const std::vector<core::Candle>& bars, core::PatternFamily f,
                   std::string label, core::Direction dir, double base) const;

    core::SessionConfig cfg_;
    std::size_t fib_lookback_;
};

} // namespace strat
