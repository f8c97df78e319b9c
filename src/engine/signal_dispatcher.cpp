#include "engine/signal_dispatcher.hpp"
#include <spdlog/spdlog.h>

namespace engine {

SignalDispatcher::~SignalDispatcher(){ stop(); }

void SignalDispatcher::add_sink(SignalSink sink){
    std::lock_guard<std::mutex> lk(sinks_mtx_);
    sinks_.push_back(std::move(sink));
}

void SignalDispatcher::start(){
    if (running_.exchange(true)) return;
    q_.reopen();
    worker_ = std::thread([this]{ run(); });
}

void SignalDispatcher::stop(){
    if (!running_.exchange(false)) return;
    q_.close();
    if (worker_.joinable()) worker_.join();
}

void SignalDispatcher::submit(exec::TradeSignal s){
    q_.push(std::move(s));
}

void SignalDispatcher::deliver(const exec::TradeSignal& s){
    std::vector<SignalSink> sinks;
    {
        std::lock_guard<std::mutex> lk(sinks_mtx_);
        sinks = sinks_;
    }
    for (const auto& sink : sinks){
        try {
            sink(s);
            ++delivered_;
        } catch (const std::exception& e){
            ++failed_;
            spdlog::error("signal sink failed for {}: {}", s.symbol, e.what());
        }
    }
}

void SignalDispatcher::run(){
    while (running_.load()){
        if (auto s = q_.wait_pop(std::chrono::milliseconds(200))) deliver(*s);
    }
    // leállításkor a maradékot még kiküldjük
    while (auto s = q_.try_pop()) deliver(*s);
}

} // namespace engine
