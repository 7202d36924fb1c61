#include "request_counter.hpp"
#include <spdlog/spdlog.h>

SlidingWindowCounter::SlidingWindowCounter(const std::string& state_path)
    : file_(state_path) {}

void SlidingWindowCounter::increment() {
    std::lock_guard<std::mutex> lock(mutex_);
    current_++;
}

void SlidingWindowCounter::rotate() {
    std::lock_guard<std::mutex> lock(mutex_);

    // Total = (total - evicted bucket) + closed bucket
    window_total_ -= buckets_[cursor_];
    window_total_ += current_;

    buckets_[cursor_] = current_;
    current_ = 0;

    cursor_ = (cursor_ + 1) % WINDOW_BUCKETS;
}

uint64_t SlidingWindowCounter::window_total() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return window_total_ + current_;
}

bool SlidingWindowCounter::load() {
    auto state = file_.read();

    std::lock_guard<std::mutex> lock(mutex_);
    current_ = 0;

    if (!state) {
        buckets_.fill(0);
        cursor_ = 0;
        window_total_ = 0;
        spdlog::info("No request state at {}, starting cold", file_.path());
        return false;
    }

    buckets_ = state->buckets;
    cursor_ = state->cursor;
    window_total_ = state->window_total;

    spdlog::info("Loaded request state from {}: {} requests in window, cursor {}",
                 file_.path(), window_total_, cursor_);
    return true;
}

void SlidingWindowCounter::flush() {
    std::lock_guard<std::mutex> lock(mutex_);
    file_.write(snapshot_locked());
}

PersistedState SlidingWindowCounter::snapshot() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return snapshot_locked();
}

PersistedState SlidingWindowCounter::snapshot_locked() const {
    PersistedState state;
    state.cursor = cursor_;
    state.buckets = buckets_;
    state.window_total = window_total_;
    return state;
}

uint64_t SlidingWindowCounter::pending() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return current_;
}
