#pragma once
#include "core/config.hpp"
#include "strategy/abcd.hpp"
#include "strategy/detector.hpp"

namespace strat {

// ABCD detektor: swingek -> csoport validálás -> friss és D közeli minták
class HarmonicDetector final : public IDetector {
public:
    HarmonicDetector(core::AbcdConfig cfg, double fib_tolerance)
        : cfg_(std::move(cfg)), fib_tolerance_(fib_tolerance) {}

    std::string id() const override { return "ABCD"; }
    std::size_t warmup_bars() const override { return cfg_.min_history; }
    std::vector<Candidate> detect(const std::vector<core::Candle>& bars,
                                  const sess::SessionInfo& session) const override;

    // Fibonacci faktor + kompozit küszöb; erősség = min(cap, score), alsó korlát min_strength
    bool finalize(Candidate& c, const ConfluenceResult& r) const override;

private:
    core::AbcdConfig cfg_;
    double fib_tolerance_;
};

} // namespace strat
