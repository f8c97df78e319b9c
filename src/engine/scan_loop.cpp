#include "engine/scan_loop.hpp"
#include <algorithm>
#include <chrono>
#include <spdlog/spdlog.h>
#include "session/session.hpp"

namespace engine {

static std::int64_t now_ms(){
    using namespace std::chrono;
    return duration_cast<milliseconds>(system_clock::now().time_since_epoch()).count();
}

ScanLoop::ScanLoop(core::ConfigStore& store, ICandleFeed& feed, ind::IIndicatorProvider& indicators,
                   IAccountProvider& account, SignalDispatcher& dispatcher)
    : store_(store), feed_(feed), indicators_(indicators), account_(account),
      dispatcher_(dispatcher), cfg_(store.current()),
      scanner_(cfg_, indicators, account),
      limiter_(cfg_->session.intraday.api_budget_per_minute) {
    sync_watchlist();
}

ScanLoop::~ScanLoop(){ stop(); }

void ScanLoop::sync_watchlist(){
    const auto max_len = cfg_->validator.max_history;
    for (const auto& sym : cfg_->scanner.watchlist){
        auto it = states_.find(sym);
        if (it == states_.end()) states_.emplace(sym, std::make_unique<SymbolState>(sym, max_len));
        else it->second->history.set_max_len(max_len);
    }
    // a listáról lekerült szimbólumok állapota törlődik
    for (auto it = states_.begin(); it != states_.end();){
        const auto& wl = cfg_->scanner.watchlist;
        if (std::find(wl.begin(), wl.end(), it->first) == wl.end()) it = states_.erase(it);
        else ++it;
    }
}

const SymbolState* ScanLoop::state(const std::string& symbol) const {
    auto it = states_.find(symbol);
    return it == states_.end() ? nullptr : it->second.get();
}

std::size_t ScanLoop::scan_symbol(SymbolState& st, const sess::SessionInfo& session, std::int64_t now){
    try {
        const auto raws = util::with_retry([&]{ return feed_.poll(st.symbol); }, retry_, "candle feed poll");
        for (const auto& r : raws) scanner_.on_candle(st, r);
    } catch (const std::exception& e){
        spdlog::error("{} feed unavailable, skipping this tick: {}", st.symbol, e.what());
        return 0;
    }
    if (session.families.empty()) return 0;

    auto sig = scanner_.scan(st, session, now, &limiter_);
    if (!sig) return 0;
    dispatcher_.submit(std::move(*sig));
    return 1;
}

std::size_t ScanLoop::tick_once(std::int64_t now){
    if (store_.reload_if_changed()){
        cfg_ = store_.current();
        scanner_.set_config(cfg_);
        indicators_.reconfigure(*cfg_);
        account_.reconfigure(*cfg_);
        sync_watchlist();
    }
    const auto session = sess::classify(now, cfg_->session);
    limiter_.set_rate(session.api_budget_per_minute);

    std::vector<SymbolState*> work;
    for (auto& [sym, st] : states_) work.push_back(st.get());
    if (work.empty()) return 0;

    // korlátos számú worker, mindegyik a következő szabad szimbólumot veszi
    const std::size_t n_workers = std::min<std::size_t>(std::max<std::size_t>(1, cfg_->scanner.workers), work.size());
    std::atomic<std::size_t> next{0}, emitted{0};
    auto worker = [&]{
        for (std::size_t i = next++; i < work.size(); i = next++)
            emitted += scan_symbol(*work[i], session, now);
    };
    std::vector<std::thread> pool;
    for (std::size_t i = 1; i < n_workers; ++i) pool.emplace_back(worker);
    worker();
    for (auto& t : pool) t.join();

    spdlog::debug("tick {} session={} symbols={} signals={}", now, sess::to_string(session.session),
                  work.size(), emitted.load());
    return emitted.load();
}

void ScanLoop::start(){
    if (running_.exchange(true)) return;
    thread_ = std::thread([this]{ run(); });
}

void ScanLoop::stop(){
    if (!running_.exchange(false)) return;
    wake_cv_.notify_all();
    if (thread_.joinable()) thread_.join();
}

void ScanLoop::run(){
    spdlog::info("scan loop started, {} symbols", states_.size());
    while (running_.load()){
        const auto t = now_ms();
        tick_once(t);
        const auto interval = sess::classify(t, cfg_->session).scan_interval;
        std::unique_lock<std::mutex> lk(wake_mtx_);
        wake_cv_.wait_for(lk, interval, [this]{ return !running_.load(); });
    }
    spdlog::info("scan loop stopped");
}

} // namespace engine
