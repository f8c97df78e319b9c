#pragma once
#include <string>
#include <vector>
#include "core/types.hpp"
#include "session/session.hpp"
#include "strategy/candidate.hpp"
#include "strategy/confluence.hpp"

namespace strat {

// Detektor interfész: minden mintacsalád ezt valósítja meg.
class IDetector {
public:
    virtual ~IDetector() = default;

    // Egyedi azonosító (pl. "STRAT", "ABCD", "SESSION")
    virtual std::string id() const = 0;

    // Hány bar kell, mire értelmes jelet tud adni
    virtual std::size_t warmup_bars() const = 0;

    // Jelöltek a snapshot alapján; a session dönti el, mely családok futnak
    virtual std::vector<Candidate> detect(const std::vector<core::Candle>& bars,
                                          const sess::SessionInfo& session) const = 0;

    // Confluence után: végső szűrés, az erősség itt még módosulhat
    virtual bool finalize(Candidate& c, const ConfluenceResult& r) const {
        (void)c;
        return r.eligible;
    }
};

} // namespace strat
