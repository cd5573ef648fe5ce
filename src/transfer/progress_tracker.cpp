/**
 * ProgressTracker: counters, percentage and trailing-window throughput.
 */

#include "transfer/progress_tracker.h"

#include <algorithm>
#include <array>
#include <cstdio>

ProgressTracker::ProgressTracker(std::chrono::milliseconds window)
    : window_(window) {}

void ProgressTracker::begin(uint64_t total_bytes, uint64_t total_chunks, Clock::time_point now) {
    total_bytes_.store(total_bytes);
    total_chunks_.store(total_chunks);
    bytes_.store(0);
    chunks_.store(0);

    std::lock_guard<std::mutex> lock(samples_mutex_);
    started_at_ = now;
    samples_.clear();
}

void ProgressTracker::record(uint64_t bytes, Clock::time_point now) {
    bytes_.fetch_add(bytes);
    chunks_.fetch_add(1);

    std::lock_guard<std::mutex> lock(samples_mutex_);
    samples_.emplace_back(now, bytes);
    while (!samples_.empty() && now - samples_.front().first > window_) {
        samples_.pop_front();
    }
}

ProgressTracker::Snapshot ProgressTracker::snapshot(Clock::time_point now) const {
    Snapshot snap;
    snap.state = state_.load();
    snap.bytes = bytes_.load();
    snap.total_bytes = total_bytes_.load();
    snap.chunks = chunks_.load();
    snap.total_chunks = total_chunks_.load();

    if (snap.total_bytes > 0) {
        snap.percent = 100.0 * static_cast<double>(snap.bytes) / static_cast<double>(snap.total_bytes);
    } else if (snap.state == SessionState::verifying || snap.state == SessionState::done) {
        snap.percent = 100.0;
    }

    std::lock_guard<std::mutex> lock(samples_mutex_);
    uint64_t in_window = 0;
    for (const auto& [at, bytes] : samples_) {
        if (now - at <= window_) {
            in_window += bytes;
        }
    }
    // Early in a transfer the window is only as long as the transfer itself.
    auto span = std::min<Clock::duration>(window_, now - started_at_);
    double seconds = std::chrono::duration<double>(span).count();
    if (seconds > 0.0) {
        snap.throughput = static_cast<double>(in_window) / seconds;
    }
    return snap;
}

std::string human_readable_size(uint64_t bytes) {
    static const std::array<const char*, 6> units = {"B", "KB", "MB", "GB", "TB", "PB"};

    double size = static_cast<double>(bytes);
    std::size_t unit = 0;
    while (size >= 1024.0 && unit < units.size() - 1) {
        size /= 1024.0;
        ++unit;
    }

    char buffer[32];
    std::snprintf(buffer, sizeof(buffer), "%.3f %s", size, units[unit]);
    return buffer;
}

std::string describe(const ProgressTracker::Snapshot& snapshot) {
    char buffer[160];
    std::snprintf(buffer, sizeof(buffer), "%s: %.3f%% (%s of %s, %s/s)",
                  to_string(snapshot.state), snapshot.percent,
                  human_readable_size(snapshot.bytes).c_str(),
                  human_readable_size(snapshot.total_bytes).c_str(),
                  human_readable_size(static_cast<uint64_t>(snapshot.throughput)).c_str());
    return buffer;
}
