#pragma once
#include <chrono>
#include <condition_variable>
#include <deque>
#include <mutex>
#include <optional>

namespace util {

// Egyszerű MPMC sor mutex + condvar alapon; close() után a pop üres sornál nullopt
template <typename T>
class ConcurrentQueue {
public:
    void push(T v){
        {
            std::lock_guard<std::mutex> lk(m_);
            q_.push_back(std::move(v));
        }
        cv_.notify_one();
    }

    std::optional<T> try_pop(){
        std::lock_guard<std::mutex> lk(m_);
        if (q_.empty()) return std::nullopt;
        T v = std::move(q_.front());
        q_.pop_front();
        return v;
    }

    template <typename Rep, typename Period>
    std::optional<T> wait_pop(std::chrono::duration<Rep, Period> timeout){
        std::unique_lock<std::mutex> lk(m_);
        cv_.wait_for(lk, timeout, [this]{ return !q_.empty() || closed_; });
        if (q_.empty()) return std::nullopt;
        T v = std::move(q_.front());
        q_.pop_front();
        return v;
    }

    void close(){
        {
            std::lock_guard<std::mutex> lk(m_);
            closed_ = true;
        }
        cv_.notify_all();
    }

    // Újraindításhoz; a bent maradt elemek megmaradnak
    void reopen(){
        std::lock_guard<std::mutex> lk(m_);
        closed_ = false;
    }

    bool closed() const { std::lock_guard<std::mutex> lk(m_); return closed_; }
    std::size_t size() const { std::lock_guard<std::mutex> lk(m_); return q_.size(); }

private:
    mutable std::mutex m_;
    std::condition_variable cv_;
    std::deque<T> q_;
    bool closed_{false};
};

} // namespace util
