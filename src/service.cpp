#include "service.hpp"
#include "request_counter.hpp"
#include "request_server.hpp"
#include "rotation_ticker.hpp"
#include "state_file.hpp"
#include <spdlog/spdlog.h>
#include <chrono>
#include <thread>

int run_service(const Config& config, std::atomic<int>& shutdown_signal) {
    SlidingWindowCounter counter(config.state_file);
    try {
        counter.load();
    } catch (const StateCorruptionError& e) {
        spdlog::critical("Could not load the request state file: {}", e.what());
        return 1;
    }

    RotationTicker ticker(counter);
    ticker.start();

    RequestServer server(config, counter);
    server.start();

    while (shutdown_signal == 0 && !ticker.failed()) {
        std::this_thread::sleep_for(std::chrono::milliseconds(200));
    }

    server.stop();
    ticker.stop();

    if (ticker.failed()) {
        spdlog::critical("Persistence failed, stopping: {}", ticker.failure_reason());
        return 1;
    }

    spdlog::info("Received signal {}, stopping server...", shutdown_signal.load());

    try {
        counter.flush();
    } catch (const PersistenceWriteError& e) {
        spdlog::critical("Final flush failed: {}", e.what());
        return 1;
    }

    spdlog::info("Shutdown complete");
    return 0;
}
