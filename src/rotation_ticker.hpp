#pragma once

#include "request_counter.hpp"
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <mutex>
#include <string>
#include <thread>

// Closes one bucket per interval and persists the window after each rotation.
// A persistence failure stops the ticker and is reported through failed().
class RotationTicker {
public:
    explicit RotationTicker(SlidingWindowCounter& counter,
                            std::chrono::milliseconds interval = std::chrono::seconds(1));
    ~RotationTicker();

    void start();
    void stop();
    bool is_running() const { return running_; }

    bool failed() const { return failed_; }
    std::string failure_reason() const;

private:
    void run();

    SlidingWindowCounter& counter_;
    std::chrono::milliseconds interval_;

    std::atomic<bool> running_{false};
    std::atomic<bool> failed_{false};
    std::thread thread_;

    mutable std::mutex mutex_;
    std::condition_variable wake_;
    std::string failure_reason_;
};
