#include "config.hpp"
#include "service.hpp"
#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <signal.h>
#include <atomic>

std::atomic<int> shutdown_signal{0};

void signal_handler(int signal) {
    shutdown_signal = signal;
}

void setup_logging(const std::string& log_level) {
    auto console_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
    auto logger = std::make_shared<spdlog::logger>("reqwindow", console_sink);

    if (log_level == "debug") {
        logger->set_level(spdlog::level::debug);
    } else if (log_level == "warn") {
        logger->set_level(spdlog::level::warn);
    } else if (log_level == "error") {
        logger->set_level(spdlog::level::err);
    } else {
        logger->set_level(spdlog::level::info);
    }

    spdlog::set_default_logger(logger);
    spdlog::set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] %v");
}

int main() {
    try {
        auto config = Config::from_env();
        setup_logging(config.log_level);

        spdlog::info("==============================================");
        spdlog::info("Launching {}", config.service_name);
        spdlog::info("==============================================");

        config.validate();

        signal(SIGINT, signal_handler);
        signal(SIGTERM, signal_handler);

        spdlog::info("Type CTRL-C to stop the server");
        return run_service(config, shutdown_signal);

    } catch (const std::exception& e) {
        spdlog::error("Fatal error: {}", e.what());
        return 1;
    }
}
