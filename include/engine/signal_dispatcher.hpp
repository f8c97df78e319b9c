#pragma once
#include <atomic>
#include <mutex>
#include <thread>
#include <vector>
#include "engine/interfaces.hpp"
#include "exec/signal.hpp"
#include "util/concurrent_queue.hpp"

namespace engine {

// Aszinkron kézbesítés: a scan csak sorba tesz, egy külön szál hívja a sinkeket.
// Sink hiba logolódik, a scant nem állítja meg.
class SignalDispatcher {
public:
    SignalDispatcher() = default;
    ~SignalDispatcher();

    SignalDispatcher(const SignalDispatcher&) = delete;
    SignalDispatcher& operator=(const SignalDispatcher&) = delete;

    void add_sink(SignalSink sink);

    void start();
    // A sorban maradt jeleket még kézbesíti
    void stop();

    void submit(exec::TradeSignal s);

    std::size_t delivered() const { return delivered_.load(); }
    std::size_t failed() const { return failed_.load(); }

private:
    void run();
    void deliver(const exec::TradeSignal& s);

    util::ConcurrentQueue<exec::TradeSignal> q_;
    std::mutex sinks_mtx_;
    std::vector<SignalSink> sinks_;
    std::thread worker_;
    std::atomic<bool> running_{false};
    std::atomic<std::size_t> delivered_{0};
    std::atomic<std::size_t> failed_{0};
};

} // namespace engine
