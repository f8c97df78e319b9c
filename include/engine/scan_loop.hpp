#pragma once
#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include "core/config.hpp"
#include "engine/interfaces.hpp"
#include "engine/scanner.hpp"
#include "engine/signal_dispatcher.hpp"
#include "util/rate_limiter.hpp"
#include "util/retry.hpp"

namespace engine {

// Fix ütemű scan ciklus a watchlistre; a tick hosszát az aktuális session adja
class ScanLoop {
public:
    ScanLoop(core::ConfigStore& store, ICandleFeed& feed, ind::IIndicatorProvider& indicators,
             IAccountProvider& account, SignalDispatcher& dispatcher);
    ~ScanLoop();

    ScanLoop(const ScanLoop&) = delete;
    ScanLoop& operator=(const ScanLoop&) = delete;

    void start();
    void stop();
    bool running() const { return running_.load(); }

    // Egy teljes menet; a kiadott jelek száma
    std::size_t tick_once(std::int64_t now_ms);

    void set_retry_policy(util::RetryPolicy p) { retry_ = p; }

    // Tesztekhez / diagnosztikához; tickek között olvasható
    const SymbolState* state(const std::string& symbol) const;

private:
    void run();
    void sync_watchlist();
    std::size_t scan_symbol(SymbolState& st, const sess::SessionInfo& session, std::int64_t now_ms);

    core::ConfigStore& store_;
    ICandleFeed& feed_;
    ind::IIndicatorProvider& indicators_;
    IAccountProvider& account_;
    SignalDispatcher& dispatcher_;
    std::shared_ptr<const core::EngineConfig> cfg_;
    Scanner scanner_;
    util::RateLimiter limiter_;
    util::RetryPolicy retry_;

    std::map<std::string, std::unique_ptr<SymbolState>> states_;

    std::thread thread_;
    std::atomic<bool> running_{false};
    std::mutex wake_mtx_;
    std::condition_variable wake_cv_;
};

} // namespace engine
