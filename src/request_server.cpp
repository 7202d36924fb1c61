#include "request_server.hpp"
#include "util.hpp"
#include <spdlog/spdlog.h>
#include <stdexcept>

RequestServer::RequestServer(const Config& config, SlidingWindowCounter& counter)
    : config_(config)
    , counter_(counter)
    , server_(std::make_unique<httplib::Server>())
{}

RequestServer::~RequestServer() {
    stop();
}

void RequestServer::start() {
    if (running_) return;

    setup_routes();
    server_->set_read_timeout(config_.read_timeout_sec, 0);
    server_->set_write_timeout(config_.write_timeout_sec, 0);
    server_->set_payload_max_length(static_cast<size_t>(config_.max_request_bytes));

    if (config_.listen_port == 0) {
        bound_port_ = server_->bind_to_any_port(config_.listen_addr);
    } else if (server_->bind_to_port(config_.listen_addr, config_.listen_port)) {
        bound_port_ = config_.listen_port;
    } else {
        bound_port_ = -1;
    }

    if (bound_port_ < 0) {
        throw std::runtime_error("Could not bind " + config_.listen_addr + ":" +
                                 std::to_string(config_.listen_port));
    }

    running_ = true;
    server_thread_ = std::thread([this]() {
        spdlog::info("Listening on {}:{}", config_.listen_addr, bound_port_);
        if (!server_->listen_after_bind()) {
            spdlog::error("Request server accept loop exited with an error");
        }
    });

    // stop() is a no-op until the accept loop is running
    auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(5);
    while (!server_->is_running() && std::chrono::steady_clock::now() < deadline) {
        std::this_thread::sleep_for(std::chrono::milliseconds(1));
    }
}

void RequestServer::stop() {
    if (!running_) return;

    running_ = false;
    server_->stop();

    if (server_thread_.joinable()) {
        server_thread_.join();
    }

    spdlog::info("Request server stopped");
}

std::string RequestServer::render_report(uint64_t served) {
    return "Served " + std::to_string(served) + " requests in the last " +
           util::format_duration(WINDOW) + "\n" +
           "The time is: " + util::current_rfc1123() + "\n";
}

void RequestServer::setup_routes() {
    // Runs before method dispatch, so methods httplib has no route table for
    // (TRACE, CONNECT) get the same answers as the others.
    server_->set_pre_routing_handler(
        [this](const httplib::Request& req, httplib::Response& res) {
            if (req.path != "/") {
                handle_not_found(req, res);
                return httplib::Server::HandlerResponse::Handled;
            }
            if (req.method != "GET") {
                handle_method_not_allowed(req, res);
                return httplib::Server::HandlerResponse::Handled;
            }
            return httplib::Server::HandlerResponse::Unhandled;
        });

    server_->Get("/",
        [this](const httplib::Request& req, httplib::Response& res) {
            handle_report(req, res);
        });
}

void RequestServer::handle_report(const httplib::Request&, httplib::Response& res) {
    counter_.increment();
    res.status = 200;
    res.set_content(render_report(counter_.window_total()), "text/plain; charset=utf-8");
}

void RequestServer::handle_method_not_allowed(const httplib::Request& req,
                                              httplib::Response& res) {
    spdlog::debug("{} {} not allowed", req.method, req.path);
    res.status = 405;
}

void RequestServer::handle_not_found(const httplib::Request& req, httplib::Response& res) {
    spdlog::debug("{} {} not found", req.method, req.path);
    res.status = 404;
    res.set_content("Requested resource '" + util::html_escape(req.path) + "' does not exist\n",
                    "text/plain; charset=utf-8");
}
