#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <deque>
#include <mutex>
#include <string>
#include <utility>

#include "session/session_state.h"

/**
 * Byte and chunk counters for one transfer, safe to read from a reporter
 * thread while the session thread updates them.
 */
class ProgressTracker {
public:
    using Clock = std::chrono::steady_clock;

    struct Snapshot {
        SessionState state = SessionState::init;
        uint64_t bytes = 0;
        uint64_t total_bytes = 0;
        uint64_t chunks = 0;
        uint64_t total_chunks = 0;
        double percent = 0.0;
        /// Bytes per second over the trailing window.
        double throughput = 0.0;
    };

    explicit ProgressTracker(std::chrono::milliseconds window = std::chrono::seconds(5));

    void begin(uint64_t total_bytes, uint64_t total_chunks, Clock::time_point now = Clock::now());

    /// Account one chunk of `bytes` queued (sender) or received (receiver).
    void record(uint64_t bytes, Clock::time_point now = Clock::now());

    void set_state(SessionState state) { state_.store(state); }
    [[nodiscard]] SessionState state() const { return state_.load(); }

    [[nodiscard]] uint64_t bytes() const { return bytes_.load(); }
    [[nodiscard]] uint64_t chunks() const { return chunks_.load(); }

    [[nodiscard]] Snapshot snapshot(Clock::time_point now = Clock::now()) const;

private:
    std::chrono::milliseconds window_;
    std::atomic<SessionState> state_{SessionState::init};
    std::atomic<uint64_t> bytes_{0};
    std::atomic<uint64_t> total_bytes_{0};
    std::atomic<uint64_t> chunks_{0};
    std::atomic<uint64_t> total_chunks_{0};

    mutable std::mutex samples_mutex_;
    Clock::time_point started_at_{};
    std::deque<std::pair<Clock::time_point, uint64_t>> samples_;
};

/// "1.500 KB": divides by 1024 through B, KB, MB, GB, TB, PB.
std::string human_readable_size(uint64_t bytes);

/// One log line describing a snapshot.
std::string describe(const ProgressTracker::Snapshot& snapshot);
