#pragma once

#include <string>
#include <cstdlib>

struct Config {
    // HTTP
    std::string listen_addr;
    int listen_port;
    int read_timeout_sec;
    int write_timeout_sec;
    int max_request_bytes;

    // Durable request window
    std::string state_file;

    // Service
    std::string service_name;
    std::string log_level;

    static Config from_env();
    void validate() const;

private:
    static std::string get_env(const char* name, const std::string& default_val = "");
    static int get_env_int(const char* name, int default_val);
};
