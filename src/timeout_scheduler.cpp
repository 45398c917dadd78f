#include "phrasecheck/timeout_scheduler.hpp"

#include <exception>
#include <iostream>

namespace phrasecheck {

TimeoutScheduler::TimeoutScheduler() {
    worker_ = std::thread([this] { run(); });
}

TimeoutScheduler::~TimeoutScheduler() {
    stop();
}

TimeoutScheduler::Ticket TimeoutScheduler::schedule(std::chrono::milliseconds delay,
                                                    std::function<void()> fn) {
    Ticket ticket = 0;
    {
        std::lock_guard<std::mutex> lock(mtx_);
        if (stopping_) return 0;

        ticket = next_ticket_++;
        auto due = clock::now() + delay;
        queue_.emplace(Key{due, ticket}, std::move(fn));
        due_.emplace(ticket, due);
    }
    cv_.notify_all();
    return ticket;
}

bool TimeoutScheduler::cancel(Ticket ticket) {
    std::lock_guard<std::mutex> lock(mtx_);
    auto it = due_.find(ticket);
    if (it == due_.end()) return false;

    queue_.erase(Key{it->second, ticket});
    due_.erase(it);
    return true;
}

void TimeoutScheduler::stop() {
    {
        std::lock_guard<std::mutex> lock(mtx_);
        if (stopping_ && !worker_.joinable()) return;
        stopping_ = true;
        queue_.clear();
        due_.clear();
    }
    cv_.notify_all();
    if (worker_.joinable() && worker_.get_id() != std::this_thread::get_id()) worker_.join();
}

size_t TimeoutScheduler::pending() const {
    std::lock_guard<std::mutex> lock(mtx_);
    return queue_.size();
}

void TimeoutScheduler::run() {
    std::unique_lock<std::mutex> lock(mtx_);
    while (!stopping_) {
        if (queue_.empty()) {
            cv_.wait(lock);
            continue;
        }

        auto first = queue_.begin();
        auto due = first->first.first;
        if (clock::now() < due) {
            cv_.wait_until(lock, due);
            continue;
        }

        std::function<void()> fn = std::move(first->second);
        due_.erase(first->first.second);
        queue_.erase(first);

        lock.unlock();
        try {
            fn();
        } catch (const std::exception& e) {
            std::cerr << "[timeout] callback failed: " << e.what() << "\n";
        }
        lock.lock();
    }
}

} // namespace phrasecheck
