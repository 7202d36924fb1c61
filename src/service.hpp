#pragma once

#include "config.hpp"
#include <atomic>

// Loads the request window, serves until shutdown_signal becomes non-zero or
// persistence fails, then flushes once more. Returns the process exit status.
int run_service(const Config& config, std::atomic<int>& shutdown_signal);
