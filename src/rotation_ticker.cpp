#include "rotation_ticker.hpp"
#include <spdlog/spdlog.h>

RotationTicker::RotationTicker(SlidingWindowCounter& counter,
                               std::chrono::milliseconds interval)
    : counter_(counter)
    , interval_(interval)
{}

RotationTicker::~RotationTicker() {
    stop();
}

void RotationTicker::start() {
    if (running_) return;

    running_ = true;
    thread_ = std::thread([this]() { run(); });

    spdlog::info("Rotation ticker started ({}ms)", interval_.count());
}

void RotationTicker::stop() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        running_ = false;
    }
    wake_.notify_all();

    if (thread_.joinable()) {
        thread_.join();
        spdlog::info("Rotation ticker stopped");
    }
}

std::string RotationTicker::failure_reason() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return failure_reason_;
}

void RotationTicker::run() {
    auto next_tick = std::chrono::steady_clock::now() + interval_;

    while (true) {
        {
            std::unique_lock<std::mutex> lock(mutex_);
            wake_.wait_until(lock, next_tick, [this]() { return !running_; });
            if (!running_) break;
        }

        try {
            counter_.rotate();
            counter_.flush();
        } catch (const std::exception& e) {
            spdlog::critical("Could not update the request state file: {}", e.what());
            std::lock_guard<std::mutex> lock(mutex_);
            failure_reason_ = e.what();
            failed_ = true;
            running_ = false;
            break;
        }

        next_tick += interval_;
    }
}
