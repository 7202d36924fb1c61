#pragma once

#include "config.hpp"
#include "request_counter.hpp"
#include <httplib.h>
#include <atomic>
#include <chrono>
#include <memory>
#include <string>
#include <thread>

class RequestServer {
public:
    static constexpr std::chrono::seconds WINDOW{WINDOW_BUCKETS};

    RequestServer(const Config& config, SlidingWindowCounter& counter);
    ~RequestServer();

    // Binds synchronously (LISTEN_PORT 0 picks a free port) and serves on a
    // background thread. Throws std::runtime_error if the address is unavailable.
    void start();
    void stop();
    bool is_running() const { return running_; }
    int port() const { return bound_port_; }

    static std::string render_report(uint64_t served);

private:
    const Config& config_;
    SlidingWindowCounter& counter_;

    std::unique_ptr<httplib::Server> server_;
    std::atomic<bool> running_{false};
    std::thread server_thread_;
    int bound_port_ = -1;

    void setup_routes();
    void handle_report(const httplib::Request& req, httplib::Response& res);
    void handle_method_not_allowed(const httplib::Request& req, httplib::Response& res);
    void handle_not_found(const httplib::Request& req, httplib::Response& res);
};
