#pragma once

#include <array>
#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include <nlohmann/json.hpp>

constexpr std::size_t WINDOW_BUCKETS = 60;

// Counter fields that survive a restart. The open (current) bucket is never persisted.
struct PersistedState {
    std::size_t cursor = 0;
    std::array<uint64_t, WINDOW_BUCKETS> buckets{};
    uint64_t window_total = 0;
};

void to_json(nlohmann::json& j, const PersistedState& state);
void from_json(const nlohmann::json& j, PersistedState& state);

class StateCorruptionError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

class PersistenceWriteError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

class StateFile {
public:
    explicit StateFile(std::string path);

    // Empty when the file does not exist. Throws StateCorruptionError otherwise.
    std::optional<PersistedState> read() const;

    // Replaces the file contents. Throws PersistenceWriteError.
    void write(const PersistedState& state) const;

    const std::string& path() const { return path_; }

private:
    std::string path_;
};
