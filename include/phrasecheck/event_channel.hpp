#pragma once

#include <chrono>
#include <condition_variable>
#include <deque>
#include <mutex>
#include <optional>
#include <vector>

namespace phrasecheck {

// Unbounded multi-producer / multi-consumer queue. push() never blocks on
// consumers; after close() pushes are rejected and waiting consumers wake.
template <typename T>
class EventChannel {
public:
    bool push(T value) {
        {
            std::lock_guard<std::mutex> lock(mtx_);
            if (closed_) return false;
            queue_.push_back(std::move(value));
        }
        cv_.notify_one();
        return true;
    }

    std::optional<T> try_pop() {
        std::lock_guard<std::mutex> lock(mtx_);
        return pop_front_locked();
    }

    // Waits up to timeout for an item. nullopt on timeout or when closed and empty.
    std::optional<T> pop_for(std::chrono::milliseconds timeout) {
        std::unique_lock<std::mutex> lock(mtx_);
        cv_.wait_for(lock, timeout, [&] { return closed_ || !queue_.empty(); });
        return pop_front_locked();
    }

    // Blocks until an item arrives or the channel is closed.
    std::optional<T> pop() {
        std::unique_lock<std::mutex> lock(mtx_);
        cv_.wait(lock, [&] { return closed_ || !queue_.empty(); });
        return pop_front_locked();
    }

    std::vector<T> drain() {
        std::lock_guard<std::mutex> lock(mtx_);
        std::vector<T> out;
        out.reserve(queue_.size());
        for (auto& v : queue_) out.push_back(std::move(v));
        queue_.clear();
        return out;
    }

    void close() {
        {
            std::lock_guard<std::mutex> lock(mtx_);
            closed_ = true;
        }
        cv_.notify_all();
    }

    size_t size() const {
        std::lock_guard<std::mutex> lock(mtx_);
        return queue_.size();
    }

private:
    mutable std::mutex mtx_;
    std::condition_variable cv_;
    std::deque<T> queue_;
    bool closed_ = false;

    std::optional<T> pop_front_locked() {
        if (queue_.empty()) return std::nullopt;
        T v = std::move(queue_.front());
        queue_.pop_front();
        return v;
    }
};

} // namespace phrasecheck
