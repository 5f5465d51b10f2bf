#pragma once
#include "core_model.hpp"
#include "events.hpp"
#include "policy.hpp"
#include "task.hpp"
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <mutex>
#include <optional>
#include <vector>

namespace rtsim {

// What the engine emits after each tick for a live consumer.
struct TickRecord {
    Tick time{0};
    PolicyKind policy{PolicyKind::FCFS};
    std::vector<ExecutionInterval> slices;   // one [time, time+1) slice per core
    std::vector<CoreStatus> cores;
    std::vector<Event> events;
};

// Bounded one-way channel from the engine to a consumer thread. push()
// never blocks: when full the oldest record is dropped, so a slow consumer
// cannot stall the simulation.
class TickFeed {
public:
    explicit TickFeed(std::size_t capacity = 256) : capacity_(capacity ? capacity : 1) {}

    void push(TickRecord record) {
        {
            std::lock_guard<std::mutex> lk(mu_);
            if (closed_) return;
            if (queue_.size() >= capacity_) {
                queue_.pop_front();
                ++dropped_;
            }
            queue_.push_back(std::move(record));
        }
        cv_.notify_one();
    }

    std::optional<TickRecord> try_pop() {
        std::lock_guard<std::mutex> lk(mu_);
        if (queue_.empty()) return std::nullopt;
        auto r = std::move(queue_.front());
        queue_.pop_front();
        return r;
    }

    // Blocks until a record is available; nullopt once closed and drained.
    std::optional<TickRecord> pop_blocking() {
        std::unique_lock<std::mutex> lk(mu_);
        cv_.wait(lk, [&]{ return closed_ || !queue_.empty(); });
        if (queue_.empty()) return std::nullopt;
        auto r = std::move(queue_.front());
        queue_.pop_front();
        return r;
    }

    void close() { { std::lock_guard<std::mutex> lk(mu_); closed_ = true; } cv_.notify_all(); }

    bool closed() const { std::lock_guard<std::mutex> lk(mu_); return closed_; }
    std::size_t size() const { std::lock_guard<std::mutex> lk(mu_); return queue_.size(); }
    uint64_t dropped() const { std::lock_guard<std::mutex> lk(mu_); return dropped_; }
    std::size_t capacity() const { return capacity_; }

private:
    std::size_t capacity_;
    mutable std::mutex mu_;
    std::condition_variable cv_;
    std::deque<TickRecord> queue_;
    uint64_t dropped_{0};
    bool closed_{false};
};

} // namespace rtsim
