#include "config.hpp"
#include <spdlog/spdlog.h>
#include <stdexcept>

std::string Config::get_env(const char* name, const std::string& default_val) {
    const char* val = std::getenv(name);
    return val ? std::string(val) : default_val;
}

int Config::get_env_int(const char* name, int default_val) {
    const char* val = std::getenv(name);
    if (!val) return default_val;
    try {
        return std::stoi(val);
    } catch (const std::exception&) {
        spdlog::warn("Invalid integer for {}, using default {}", name, default_val);
        return default_val;
    }
}

Config Config::from_env() {
    Config cfg;

    cfg.listen_addr = get_env("LISTEN_ADDR", "0.0.0.0");
    cfg.listen_port = get_env_int("LISTEN_PORT", 8080);
    cfg.read_timeout_sec = get_env_int("READ_TIMEOUT_SEC", 10);
    cfg.write_timeout_sec = get_env_int("WRITE_TIMEOUT_SEC", 10);
    cfg.max_request_bytes = get_env_int("MAX_REQUEST_BYTES", 1 << 20);

    cfg.state_file = get_env("STATE_FILE", "request-file.txt");

    cfg.service_name = get_env("SERVICE_NAME", "reqwindow");
    cfg.log_level = get_env("LOG_LEVEL", "info");

    return cfg;
}

void Config::validate() const {
    if (listen_port <= 0 || listen_port > 65535) {
        throw std::runtime_error("LISTEN_PORT must be between 1 and 65535");
    }
    if (read_timeout_sec <= 0 || write_timeout_sec <= 0) {
        throw std::runtime_error("READ_TIMEOUT_SEC and WRITE_TIMEOUT_SEC must be positive");
    }
    if (max_request_bytes <= 0) {
        throw std::runtime_error("MAX_REQUEST_BYTES must be positive");
    }
    if (state_file.empty()) {
        throw std::runtime_error("STATE_FILE is required");
    }

    spdlog::info("Configuration validated successfully");
    spdlog::info("  Listen: {}:{}", listen_addr, listen_port);
    spdlog::info("  State file: {}", state_file);
    spdlog::info("  Timeouts: read={}s, write={}s", read_timeout_sec, write_timeout_sec);
}
