#pragma once

#include "state_file.hpp"
#include <array>
#include <cstdint>
#include <mutex>
#include <string>

// Requests seen in the trailing WINDOW_BUCKETS seconds, kept as one bucket per
// second in a ring. rotate() closes the open bucket once per second.
//
// Every operation takes the same mutex, including flush(), so a snapshot on
// disk always matches some complete in-memory state.
class SlidingWindowCounter {
public:
    explicit SlidingWindowCounter(const std::string& state_path);

    void increment();

    // Folds the open bucket into the ring, evicting the oldest bucket.
    void rotate();

    // Settled total plus the requests counted since the last rotation.
    uint64_t window_total() const;

    // Restores cursor, buckets and total from disk. Missing file is a cold start.
    // Returns true when state was restored. Throws StateCorruptionError.
    bool load();

    // Throws PersistenceWriteError.
    void flush();

    PersistedState snapshot() const;
    uint64_t pending() const;

private:
    PersistedState snapshot_locked() const;

    StateFile file_;

    mutable std::mutex mutex_;
    uint64_t current_ = 0;
    std::array<uint64_t, WINDOW_BUCKETS> buckets_{};
    std::size_t cursor_ = 0;
    uint64_t window_total_ = 0;
};
