#include "engine/scanner.hpp"
#include <algorithm>
#include <fmt/format.h>
#include <spdlog/spdlog.h>
#include "strategy/harmonic.hpp"
#include "strategy/session_patterns.hpp"
#include "strategy/strat_pattern.hpp"
#include "strategy/tech_patterns.hpp"

namespace engine {

namespace {

EmittedKey key_of(const strat::Candidate& c){
    return {c.family, c.label, c.dir, c.ts_ms};
}

bool same_pattern(const strat::AbcdPattern& a, const strat::AbcdPattern& b){
    return a.a.ts_ms == b.a.ts_ms && a.d.ts_ms == b.d.ts_ms && a.dir == b.dir;
}

} // namespace

Scanner::Scanner(std::shared_ptr<const core::EngineConfig> cfg,
                 ind::IIndicatorProvider& indicators, IAccountProvider& account)
    : cfg_(std::move(cfg)), indicators_(indicators), account_(account) {
    rebuild();
}

void Scanner::set_config(std::shared_ptr<const core::EngineConfig> cfg){
    cfg_ = std::move(cfg);
    rebuild();
}

void Scanner::rebuild(){
    const auto& c = *cfg_;
    detectors_.clear();
    detectors_.push_back(std::make_unique<strat::StratDetector>(c.strat));
    detectors_.push_back(std::make_unique<strat::HarmonicDetector>(c.abcd, c.abcd.fib_tolerance));
    detectors_.push_back(std::make_unique<strat::SessionPatternDetector>(c.session, c.strat.fib_lookback));
    scorer_   = std::make_unique<strat::ConfluenceScorer>(c.confluence);
    risk_     = std::make_unique<exec::TradeLevelCalculator>(c.risk);
    throttle_ = std::make_unique<exec::SignalThrottle>(c.throttle);
}

core::RejectReason Scanner::on_candle(SymbolState& st, const core::RawCandle& raw) const {
    auto res = core::validate_candle(raw, cfg_->validator.min_bar_range);
    if (!res.ok()){
        ++st.rejected;
        spdlog::debug("{} candle @{} rejected: {}", st.symbol, raw.ts_ms, core::to_string(res.reason));
        return res.reason;
    }
    if (res.candle->symbol.empty()) res.candle->symbol = st.symbol;
    if (!st.history.append(std::move(*res.candle))){
        ++st.rejected;
        spdlog::debug("{} candle @{} rejected: {}", st.symbol, raw.ts_ms, core::to_string(core::RejectReason::OutOfOrder));
        return core::RejectReason::OutOfOrder;
    }
    return core::RejectReason::None;
}

std::optional<ind::IndicatorSnapshot> Scanner::snapshot_for(const std::string& symbol,
                                                            const std::vector<core::Candle>& window,
                                                            util::RateLimiter* limiter) const {
    if (limiter) limiter->acquire();
    try {
        return indicators_.snapshot(symbol, window.back().interval, window);
    } catch (const std::exception& e){
        spdlog::error("{} indicator provider failed: {}", symbol, e.what());
        return std::nullopt;
    }
}

std::vector<ScoredCandidate> Scanner::evaluate(SymbolState& st, const sess::SessionInfo& session,
                                               util::RateLimiter* limiter) const {
    std::vector<ScoredCandidate> out;
    if (st.history.empty()) return out;
    const auto bars = st.history.snapshot();
    const auto& c = *cfg_;

    if (st.active_abcd && !strat::is_fresh(*st.active_abcd, bars.back().ts_ms, c.abcd.pattern_ttl_ms))
        st.active_abcd.reset();

    const auto oldest = bars.front().ts_ms;
    st.emitted.erase(std::remove_if(st.emitted.begin(), st.emitted.end(),
                                    [oldest](const EmittedKey& k){ return k.ts_ms < oldest; }),
                     st.emitted.end());

    // az utolsó bar körüli ablak a független megerősítéshez
    const std::size_t tail = std::min(bars.size(), c.confluence.technical_window + c.risk.agreement_window);
    const std::vector<core::Candle> recent(bars.end() - static_cast<std::ptrdiff_t>(tail), bars.end());

    for (const auto& det : detectors_){
        if (bars.size() < det->warmup_bars()) continue;
        for (auto& cand : det->detect(bars, session)){
            if (cand.abcd && st.active_abcd && same_pattern(*cand.abcd, *st.active_abcd)) continue;
            if (std::find(st.emitted.begin(), st.emitted.end(), key_of(cand)) != st.emitted.end()){
                spdlog::debug("{} {} @{} already emitted", st.symbol, cand.label, cand.ts_ms);
                continue;
            }

            const std::size_t end = std::min(cand.ref_index, bars.size() - 1);
            const std::size_t first = end + 1 > c.indicators.lookback ? end + 1 - c.indicators.lookback : 0;
            const std::vector<core::Candle> window(bars.begin() + static_cast<std::ptrdiff_t>(first),
                                                   bars.begin() + static_cast<std::ptrdiff_t>(end + 1));

            auto snap = snapshot_for(st.symbol, window, limiter);
            if (!snap){
                spdlog::debug("{} {}: no indicator snapshot", st.symbol, cand.label);
                continue;
            }
            const auto r = scorer_->score(cand, *snap, window);
            if (!det->finalize(cand, r)){
                spdlog::debug("{} {} {}: confluence {}/{} score {:.0f} below threshold", st.symbol, det->id(),
                              cand.label, r.satisfied, core::kFactorCount, r.weighted_score);
                continue;
            }
            const bool agree = strat::technical_agreement(recent, cand.dir, c.risk.agreement_window);

            ScoredCandidate sc;
            sc.confidence = exec::signal_confidence(r.weighted_score, agree, c.risk.agreement_bonus);
            sc.candidate = std::move(cand);
            sc.confluence = r;
            sc.snapshot = std::move(*snap);
            sc.detector = det.get();
            out.push_back(std::move(sc));
        }
    }
    std::stable_sort(out.begin(), out.end(), [](const ScoredCandidate& a, const ScoredCandidate& b){
        if (a.confidence != b.confidence) return a.confidence > b.confidence;
        return a.candidate.strength > b.candidate.strength;
    });
    return out;
}

exec::TradeSignal Scanner::make_signal(const SymbolState& st, const ScoredCandidate& sc,
                                       const exec::TradeLevels& lv, const sess::SessionInfo& session,
                                       std::int64_t now_ms) const {
    const auto& cand = sc.candidate;
    exec::TradeSignal s;
    s.symbol = st.symbol;
    s.direction = core::to_signal(cand.dir);
    s.confidence = sc.confidence;
    s.entry_price = lv.entry;
    s.stop_loss = lv.stop;
    s.take_profit = lv.target;
    s.position_size = lv.position_size;
    s.pattern_label = cand.label;
    s.risk_reward = lv.rr;
    s.ts_ms = now_ms;
    s.session = sess::to_string(session.session);
    s.interval = st.history.back().interval;
    s.confluence_count = sc.confluence.satisfied;
    s.confluence_score = sc.confluence.weighted_score;
    s.reasoning = fmt::format("{} {} ({}) strength {:.0f}; confluence {}/{} score {:.0f} [{}]; {} session",
                              cand.label, core::to_string(cand.dir), core::to_string(cand.family),
                              cand.strength, sc.confluence.satisfied, core::kFactorCount,
                              sc.confluence.weighted_score, sc.confluence.passed_list(), s.session);
    return s;
}

std::optional<exec::TradeSignal> Scanner::scan(SymbolState& st, const sess::SessionInfo& session,
                                               std::int64_t now_ms, util::RateLimiter* limiter) const {
    const auto scored = evaluate(st, session, limiter);
    if (scored.empty()) return std::nullopt;

    if (!throttle_->allows(st.throttle, now_ms)){
        spdlog::debug("{} throttled ({} signals today)", st.symbol, st.throttle.count_today);
        return std::nullopt;
    }

    exec::AccountContext acct;
    try {
        acct = account_.account();
    } catch (const std::exception& e){
        spdlog::error("{} account provider failed: {}", st.symbol, e.what());
        return std::nullopt;
    }

    for (const auto& sc : scored){
        const auto& cand = sc.candidate;
        const exec::RiskInput in{cand.dir, cand.entry, cand.anchor, sc.snapshot.atr, session.risk_multiplier};
        const auto d = risk_->compute(in, acct);
        if (!d.accepted){
            spdlog::debug("{} {} dropped: {}", st.symbol, cand.label, d.reason);
            continue;
        }
        auto sig = make_signal(st, sc, d.levels, session, now_ms);
        throttle_->record(st.throttle, now_ms);
        if (cand.abcd) st.active_abcd = cand.abcd;
        st.emitted.push_back(key_of(cand));
        ++st.signals;
        spdlog::info("SIGNAL {} {} {} @ {:.4f} sl {:.4f} tp {:.4f} size {:.4f} conf {:.2f}",
                     sig.symbol, core::to_string(sig.direction), sig.pattern_label,
                     sig.entry_price, sig.stop_loss, sig.take_profit, sig.position_size, sig.confidence);
        return sig;
    }
    return std::nullopt;
}

} // namespace engine
