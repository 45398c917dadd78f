#include "phrasecheck/key_listener.hpp"

#include <exception>
#include <iostream>

namespace phrasecheck {

KeyListener::KeyListener(InputAssembler& assembler) : assembler_(assembler) {}

KeyListener::~KeyListener() {
    stop();
}

bool KeyListener::start() {
    if (stopped_.load()) {
        std::cerr << "[listener] cannot restart a stopped listener\n";
        return false;
    }
    bool expected = false;
    if (!running_.compare_exchange_strong(expected, true)) return false;
    worker_ = std::thread([this] { run(); });
    std::cout << "[listener] started\n";
    return true;
}

void KeyListener::stop() {
    stopped_ = true;
    keys_.close();
    if (worker_.joinable()) worker_.join();
    if (running_.exchange(false)) std::cout << "[listener] stopped\n";

    // Nothing is left to process; release anyone waiting for idle
    std::lock_guard<std::mutex> lock(count_mtx_);
    processed_ = posted_;
    idle_cv_.notify_all();
}

bool KeyListener::post(KeyEvent e) {
    {
        std::lock_guard<std::mutex> lock(count_mtx_);
        posted_++;
    }
    if (!keys_.push(std::move(e))) {
        std::lock_guard<std::mutex> lock(count_mtx_);
        posted_--;
        return false;
    }
    return true;
}

void KeyListener::wait_idle() {
    std::unique_lock<std::mutex> lock(count_mtx_);
    idle_cv_.wait(lock, [&] { return processed_ >= posted_; });
}

uint64_t KeyListener::processed() const {
    std::lock_guard<std::mutex> lock(count_mtx_);
    return processed_;
}

void KeyListener::run() {
    while (auto key = keys_.pop()) {
        try {
            assembler_.on_key(*key);
        } catch (const std::exception& e) {
            std::cerr << "[listener] key '" << key->name << "' failed: " << e.what() << "\n";
        }

        std::lock_guard<std::mutex> lock(count_mtx_);
        processed_++;
        if (processed_ >= posted_) idle_cv_.notify_all();
    }
}

} // namespace phrasecheck
