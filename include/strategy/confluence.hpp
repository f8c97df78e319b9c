#pragma once
#include <array>
#include <string>
#include <vector>
#include "core/config.hpp"
#include "indicators/snapshot.hpp"
#include "strategy/candidate.hpp"

namespace strat {

struct FactorResult {
    core::Factor factor{core::Factor::Fibonacci};
    bool passed{false};
    double weight{};
};

struct ConfluenceResult {
    int satisfied{0};
    double weighted_score{0.0};   // min(100, Σ súly * 10)
    std::array<FactorResult, core::kFactorCount> breakdown{};
    bool eligible{false};

    bool passed(core::Factor f) const { return breakdown[static_cast<std::size_t>(f)].passed; }

    // "fibonacci,trend,..." a reasoning szöveghez
    std::string passed_list() const;
};

// Súlyozott, többfaktoros megerősítés (a régi decide() helyén)
class ConfluenceScorer {
public:
    explicit ConfluenceScorer(core::ConfluenceConfig cfg) : cfg_(std::move(cfg)) {}

    // window: gyertyák a referencia barig bezárólag
    ConfluenceResult score(const Candidate& c, const ind::IndicatorSnapshot& snap,
                           const std::vector<core::Candle>& window) const;

    const core::ConfluenceConfig& config() const { return cfg_; }

private:
    bool fibonacci(const Candidate& c) const;
    bool trend(const Candidate& c, const ind::IndicatorSnapshot& s, double price) const;
    bool volume(const ind::IndicatorSnapshot& s, const core::Candle& ref) const;
    bool technical(const Candidate& c, const std::vector<core::Candle>& window) const;
    bool rsi(const Candidate& c, double v) const;
    bool macd(const Candidate& c, const ind::Macd& m) const;

    core::ConfluenceConfig cfg_;
};

} // namespace strat
