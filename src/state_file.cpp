#include "state_file.hpp"
#include <spdlog/spdlog.h>
#include <filesystem>
#include <fstream>
#include <numeric>
#include <system_error>

namespace fs = std::filesystem;

void to_json(nlohmann::json& j, const PersistedState& state) {
    j = nlohmann::json{
        {"DeltaIdx", state.cursor},
        {"Deltas", state.buckets},
        {"TimeWindowReqNo", state.window_total}
    };
}

void from_json(const nlohmann::json& j, PersistedState& state) {
    if (!j.is_object()) {
        throw StateCorruptionError("state document is not a JSON object");
    }
    for (const char* field : {"DeltaIdx", "Deltas", "TimeWindowReqNo"}) {
        if (!j.contains(field)) {
            throw StateCorruptionError(std::string("missing field ") + field);
        }
    }

    const auto& idx = j.at("DeltaIdx");
    const auto& deltas = j.at("Deltas");
    const auto& total = j.at("TimeWindowReqNo");

    if (!idx.is_number_unsigned()) {
        throw StateCorruptionError("DeltaIdx is not an unsigned integer");
    }
    if (!total.is_number_unsigned()) {
        throw StateCorruptionError("TimeWindowReqNo is not an unsigned integer");
    }
    if (!deltas.is_array() || deltas.size() != WINDOW_BUCKETS) {
        throw StateCorruptionError("Deltas must be an array of " +
                                   std::to_string(WINDOW_BUCKETS) + " integers");
    }

    // A cursor equal to the window size was written before wrapping; it means slot 0.
    auto cursor = idx.get<uint64_t>();
    if (cursor > WINDOW_BUCKETS) {
        throw StateCorruptionError("DeltaIdx out of range: " + std::to_string(cursor));
    }
    state.cursor = static_cast<std::size_t>(cursor % WINDOW_BUCKETS);

    for (std::size_t i = 0; i < WINDOW_BUCKETS; i++) {
        if (!deltas[i].is_number_unsigned()) {
            throw StateCorruptionError("Deltas[" + std::to_string(i) +
                                       "] is not an unsigned integer");
        }
        state.buckets[i] = deltas[i].get<uint64_t>();
    }

    state.window_total = total.get<uint64_t>();
    uint64_t sum = std::accumulate(state.buckets.begin(), state.buckets.end(), uint64_t{0});
    if (sum != state.window_total) {
        throw StateCorruptionError("TimeWindowReqNo " + std::to_string(state.window_total) +
                                   " does not match sum of Deltas " + std::to_string(sum));
    }
}

StateFile::StateFile(std::string path) : path_(std::move(path)) {}

std::optional<PersistedState> StateFile::read() const {
    std::error_code ec;
    if (!fs::exists(path_, ec)) {
        if (ec) {
            throw StateCorruptionError("could not stat " + path_ + ": " + ec.message());
        }
        return std::nullopt;
    }

    std::ifstream in(path_);
    if (!in) {
        throw StateCorruptionError("could not open " + path_);
    }

    try {
        auto doc = nlohmann::json::parse(in);
        return doc.get<PersistedState>();
    } catch (const nlohmann::json::exception& e) {
        throw StateCorruptionError("could not decode " + path_ + ": " + e.what());
    }
}

void StateFile::write(const PersistedState& state) const {
    std::string tmp = path_ + ".tmp";
    {
        std::ofstream out(tmp, std::ios::trunc);
        if (!out) {
            throw PersistenceWriteError("could not open " + tmp + " for writing");
        }
        out << nlohmann::json(state).dump();
        out.flush();
        if (!out) {
            throw PersistenceWriteError("could not write " + tmp);
        }
    }

    std::error_code ec;
    fs::rename(tmp, path_, ec);
    if (ec) {
        std::string reason = ec.message();
        fs::remove(tmp, ec);
        throw PersistenceWriteError("could not replace " + path_ + ": " + reason);
    }

    spdlog::debug("Flushed request window to {}", path_);
}
