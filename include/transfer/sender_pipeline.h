#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <string>

#include "common/framing.h"
#include "crypto/checksum.h"
#include "network/peer_connection.h"
#include "transfer/byte_stream.h"
#include "transfer/progress_tracker.h"
#include "transfer/transfer_header.h"

/**
 * Streams a ByteSource as header, sequenced chunks and completion marker.
 *
 * Sending suspends while the channel's buffered amount is above the high
 * water mark; resume() is wired to the channel's buffered-amount-low event,
 * which fires once it drains to the low water mark.
 */
class SenderPipeline {
public:
    using CompletionHandler = std::function<void(const std::string& checksum)>;

    SenderPipeline(ByteSource& source,
                   std::shared_ptr<DataChannel> channel,
                   std::size_t chunk_size,
                   std::size_t high_water,
                   std::size_t low_water,
                   ProgressTracker* progress = nullptr,
                   const std::string& header_checksum = "");

    [[nodiscard]] const TransferHeader& header() const { return header_; }

    /// First message on the channel; must precede start().
    void send_header();

    /// Send as many chunks as the high water mark allows; the completion
    /// marker follows the last one.
    /// Throws TransferException(source_read_failure) if the source runs dry.
    void start(CompletionHandler on_complete);

    /// Continue after the channel drained.
    void resume();

    [[nodiscard]] bool suspended() const { return suspended_; }
    [[nodiscard]] bool completed() const { return completed_; }
    [[nodiscard]] uint64_t next_sequence() const { return next_sequence_; }
    [[nodiscard]] std::size_t suspend_count() const { return suspends_; }

private:
    void pump();

    ByteSource& source_;
    std::shared_ptr<DataChannel> channel_;
    std::size_t high_water_;
    ProgressTracker* progress_;
    TransferHeader header_;
    ChecksumAccumulator checksum_;
    Bytes buffer_;
    CompletionHandler on_complete_;
    uint64_t next_sequence_ = 0;
    std::size_t suspends_ = 0;
    bool header_sent_ = false;
    bool started_ = false;
    bool suspended_ = false;
    bool completed_ = false;
};
