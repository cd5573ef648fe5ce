#pragma once

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <memory>
#include <optional>
#include <string>

#include "common/framing.h"
#include "crypto/checksum.h"
#include "transfer/byte_stream.h"
#include "transfer/part_file_store.h"
#include "transfer/progress_tracker.h"
#include "transfer/transfer_header.h"

/**
 * Reassembles an in-order chunk stream under a memory budget.
 *
 * Staged bytes never exceed the budget: before a chunk would overflow the
 * staging buffer, the buffer is spilled to a new part file. On completion
 * the part files and the staged tail are concatenated into the sink and
 * the digest is compared with the sender's.
 *
 * Every violation throws TransferException; the pipeline is then unusable.
 */
class ReceiverPipeline {
public:
    using SinkFactory      = std::function<std::unique_ptr<ByteSink>(const TransferHeader&)>;
    using PartStoreFactory = std::function<std::unique_ptr<PartFileStore>(const TransferHeader&)>;

    ReceiverPipeline(std::size_t memory_budget,
                     PartStoreFactory part_store_factory,
                     SinkFactory sink_factory,
                     ProgressTracker* progress = nullptr);

    /// Parts and output both land in `directory`, named after the header.
    /// `sink_factory` replaces the output file when given.
    static ReceiverPipeline to_directory(std::size_t memory_budget,
                                         const std::filesystem::path& directory,
                                         int part_write_retries,
                                         ProgressTracker* progress = nullptr,
                                         SinkFactory sink_factory = {});

    void accept_header(const TransferHeader& header);
    void accept_chunk(const Chunk& chunk);

    /// Assemble the output and verify it against `sender_checksum`.
    /// The output stays on disk even when verification throws.
    void complete(const std::string& sender_checksum);

    /// complete() in steps: finish() ends the chunk stream and opens the
    /// sink, then each assemble_step() copies at most `max_bytes` of the
    /// part files. The step that writes the staged tail verifies and
    /// returns true.
    void finish(const std::string& sender_checksum);
    bool assemble_step(std::size_t max_bytes);

    [[nodiscard]] bool has_header() const { return header_.has_value(); }
    [[nodiscard]] const TransferHeader& header() const { return *header_; }

    [[nodiscard]] std::size_t memory_budget() const { return budget_; }
    [[nodiscard]] std::size_t staged_bytes() const { return staged_.size(); }
    [[nodiscard]] std::size_t peak_staged_bytes() const { return peak_staged_; }
    [[nodiscard]] uint64_t bytes_received() const { return received_; }
    [[nodiscard]] uint64_t next_sequence() const { return next_sequence_; }
    [[nodiscard]] std::size_t flush_count() const { return flushes_; }
    [[nodiscard]] uint64_t assembled_bytes() const { return assembled_; }
    [[nodiscard]] const std::string& computed_checksum() const { return computed_; }
    [[nodiscard]] bool verified() const { return verified_; }

private:
    void flush();
    void verify();

    std::size_t budget_;
    PartStoreFactory part_store_factory_;
    SinkFactory sink_factory_;
    ProgressTracker* progress_;

    std::optional<TransferHeader> header_;
    std::unique_ptr<PartFileStore> parts_;
    std::unique_ptr<ByteSink> sink_;
    ChecksumAccumulator checksum_;
    Bytes staged_;
    std::size_t peak_staged_ = 0;
    std::size_t flushes_ = 0;
    uint64_t received_ = 0;
    uint64_t next_sequence_ = 0;
    uint64_t assembled_ = 0;
    std::string computed_;
    std::string sender_checksum_;
    bool completed_ = false;
    bool verified_ = false;
};
