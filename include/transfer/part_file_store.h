#pragma once

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <string>
#include <vector>

#include "transfer/byte_stream.h"

/**
 * On-disk overflow segments "<base>.part<N>" written when the receiver's
 * memory budget fills up.
 */
class PartFileStore {
public:
    PartFileStore(std::filesystem::path directory, std::string base_name, int write_retries);
    virtual ~PartFileStore() = default;

    PartFileStore(const PartFileStore&) = delete;
    PartFileStore& operator=(const PartFileStore&) = delete;

    /// Persist one segment. Transient failures are retried `write_retries`
    /// times before TransferException(insufficient_local_storage).
    void write_segment(const uint8_t* data, std::size_t size);

    /// Append every segment to `sink` in order, deleting each once copied.
    void drain_into(ByteSink& sink);

    /// Copy at most `max_bytes` more of the segments into `sink`, resuming
    /// where the previous call stopped. True once every segment is copied.
    bool drain_some(ByteSink& sink, std::size_t max_bytes);

    [[nodiscard]] std::size_t segment_count() const { return segments_.size(); }
    [[nodiscard]] uint64_t bytes_written() const { return bytes_written_; }
    [[nodiscard]] uint64_t bytes_drained() const { return bytes_drained_; }
    [[nodiscard]] const std::vector<std::filesystem::path>& segments() const { return segments_; }

protected:
    /// One write attempt; returns false on failure.
    virtual bool write_file(const std::filesystem::path& path, const uint8_t* data, std::size_t size);

private:
    std::filesystem::path directory_;
    std::string base_name_;
    int write_retries_;
    std::vector<std::filesystem::path> segments_;
    uint64_t bytes_written_ = 0;
    std::size_t next_index_ = 0;

    std::ifstream reading_;
    std::size_t drain_index_ = 0;
    uint64_t bytes_drained_ = 0;
};
