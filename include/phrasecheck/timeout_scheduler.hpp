#pragma once

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <map>
#include <mutex>
#include <thread>
#include <utility>

namespace phrasecheck {

// Runs callbacks after a delay on one background thread.
// Callbacks run without the scheduler lock held; cancel() never waits for a
// callback that is already running. stop() (also run by the destructor)
// discards what is still queued and joins the thread.
class TimeoutScheduler {
public:
    using Ticket = uint64_t;
    using clock = std::chrono::steady_clock;

    TimeoutScheduler();
    ~TimeoutScheduler();

    TimeoutScheduler(const TimeoutScheduler&) = delete;
    TimeoutScheduler& operator=(const TimeoutScheduler&) = delete;

    // Returns 0 when the scheduler is stopped.
    Ticket schedule(std::chrono::milliseconds delay, std::function<void()> fn);

    // True if the callback was still queued and is now dropped.
    bool cancel(Ticket ticket);

    void stop();

    size_t pending() const;

private:
    using Key = std::pair<clock::time_point, Ticket>;

    mutable std::mutex mtx_;
    std::condition_variable cv_;
    std::map<Key, std::function<void()>> queue_;
    std::map<Ticket, clock::time_point> due_;
    Ticket next_ticket_ = 1;
    bool stopping_ = false;
    std::thread worker_;

    void run();
};

} // namespace phrasecheck
