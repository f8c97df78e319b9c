#pragma once
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include "core/config.hpp"
#include "core/history.hpp"
#include "engine/interfaces.hpp"
#include "exec/risk.hpp"
#include "exec/signal.hpp"
#include "exec/throttle.hpp"
#include "indicators/snapshot.hpp"
#include "session/session.hpp"
#include "strategy/abcd.hpp"
#include "strategy/confluence.hpp"
#include "strategy/detector.hpp"
#include "util/rate_limiter.hpp"

namespace engine {

// Kiadott detekció: ugyanaz a minta ugyanazon a referencia baron nem ad új jelet
struct EmittedKey {
    core::PatternFamily family{core::PatternFamily::Strat};
    std::string label;
    core::Direction dir{core::Direction::Bullish};
    std::int64_t ts_ms{};

    bool operator==(const EmittedKey& o) const {
        return family == o.family && dir == o.dir && ts_ms == o.ts_ms && label == o.label;
    }
};

// Egy szimbólum teljes állapota; a scan loop birtokolja, egyszerre egy worker írja
struct SymbolState {
    std::string symbol;
    core::SymbolHistory history;
    exec::ThrottleState throttle;
    std::optional<strat::AbcdPattern> active_abcd;
    std::vector<EmittedKey> emitted;     // a history-ból kiesett barokhoz tartozók törlődnek
    std::size_t rejected{0};
    std::size_t signals{0};

    explicit SymbolState(std::string sym, std::size_t max_len = 200)
        : symbol(std::move(sym)), history(max_len) {}
};

// Pontozott jelölt, rangsoroláshoz
struct ScoredCandidate {
    strat::Candidate candidate;
    strat::ConfluenceResult confluence;
    ind::IndicatorSnapshot snapshot;
    double confidence{};
    const strat::IDetector* detector{nullptr};
};

// Szimbólumonkénti pipeline: validálás -> history -> detektorok -> confluence
// -> throttle -> risk -> TradeSignal. Az állapot a SymbolState-ben van.
class Scanner {
public:
    Scanner(std::shared_ptr<const core::EngineConfig> cfg,
            ind::IIndicatorProvider& indicators, IAccountProvider& account);

    // Csak tickek között hívható (a workerek nem futnak)
    void set_config(std::shared_ptr<const core::EngineConfig> cfg);
    const core::EngineConfig& config() const { return *cfg_; }

    // Validál és hozzáfűz; None ha bekerült
    core::RejectReason on_candle(SymbolState& st, const core::RawCandle& raw) const;

    // Pontozott jelöltek, confidence szerint csökkenő sorrendben
    std::vector<ScoredCandidate> evaluate(SymbolState& st, const sess::SessionInfo& session,
                                          util::RateLimiter* limiter = nullptr) const;

    // Egy scan menet; legfeljebb egy jelet ad
    std::optional<exec::TradeSignal> scan(SymbolState& st, const sess::SessionInfo& session,
                                          std::int64_t now_ms, util::RateLimiter* limiter = nullptr) const;

private:
    void rebuild();
    std::optional<ind::IndicatorSnapshot> snapshot_for(const std::string& symbol,
                                                       const std::vector<core::Candle>& window,
                                                       util::RateLimiter* limiter) const;
    exec::TradeSignal make_signal(const SymbolState& st, const ScoredCandidate& sc,
                                  const exec::TradeLevels& lv, const sess::SessionInfo& session,
                                  std::int64_t now_ms) const;

    std::shared_ptr<const core::EngineConfig> cfg_;
    ind::IIndicatorProvider& indicators_;
    IAccountProvider& account_;
    std::vector<std::unique_ptr<strat::IDetector>> detectors_;
    std::unique_ptr<strat::ConfluenceScorer> scorer_;
    std::unique_ptr<exec::TradeLevelCalculator> risk_;
    std::unique_ptr<exec::SignalThrottle> throttle_;
};

} // namespace engine
