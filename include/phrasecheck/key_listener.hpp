#pragma once

#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <mutex>
#include <thread>

#include "event_channel.hpp"
#include "input_assembler.hpp"
#include "types.hpp"

namespace phrasecheck {

// Decouples key capture from scoring: post() only enqueues, a single worker
// thread feeds the InputAssembler in arrival order.
class KeyListener {
public:
    explicit KeyListener(InputAssembler& assembler);
    ~KeyListener();

    KeyListener(const KeyListener&) = delete;
    KeyListener& operator=(const KeyListener&) = delete;

    // False when already running, or once stopped: a stopped listener
    // has closed its queue and cannot be restarted.
    bool start();
    void stop();
    bool running() const { return running_.load(); }

    // False once stopped.
    bool post(KeyEvent e);

    // Blocks until every posted key has been handled.
    void wait_idle();

    uint64_t processed() const;

private:
    InputAssembler& assembler_;
    EventChannel<KeyEvent> keys_;
    std::thread worker_;
    std::atomic<bool> running_{false};
    std::atomic<bool> stopped_{false};

    mutable std::mutex count_mtx_;
    std::condition_variable idle_cv_;
    uint64_t posted_ = 0;
    uint64_t processed_ = 0;

    void run();
};

} // namespace phrasecheck
