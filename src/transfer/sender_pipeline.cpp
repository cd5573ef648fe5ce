/**
 * SenderPipeline: read, hash, send, one chunk per channel message.
 */

#include "transfer/sender_pipeline.h"

#include <stdexcept>
#include <utility>

#include <spdlog/spdlog.h>

#include "common/errors.h"

SenderPipeline::SenderPipeline(ByteSource& source,
                               std::shared_ptr<DataChannel> channel,
                               std::size_t chunk_size,
                               std::size_t high_water,
                               std::size_t low_water,
                               ProgressTracker* progress,
                               const std::string& header_checksum)
    : source_(source),
      channel_(std::move(channel)),
      high_water_(high_water),
      progress_(progress),
      header_(TransferHeader::describe(source.name(), source.size(), chunk_size, header_checksum)) {
    channel_->set_buffered_amount_low_threshold(low_water);
}

void SenderPipeline::send_header() {
    if (header_sent_) {
        throw std::logic_error("transfer header already sent");
    }
    header_sent_ = true;
    channel_->send(MessageCodec::encode_header(header_));
}

void SenderPipeline::start(CompletionHandler on_complete) {
    if (!header_sent_ || started_) {
        throw std::logic_error("sender pipeline started out of order");
    }
    started_ = true;
    on_complete_ = std::move(on_complete);

    if (progress_) {
        progress_->begin(header_.length, header_.chunk_count);
    }
    pump();
}

void SenderPipeline::resume() {
    if (!started_ || !suspended_) {
        return;
    }
    pump();
}

void SenderPipeline::pump() {
    if (completed_ || !channel_->is_open()) {
        return;
    }
    suspended_ = false;

    while (next_sequence_ < header_.chunk_count) {
        if (!channel_->is_open()) {
            return;
        }
        if (channel_->buffered_amount() > high_water_) {
            suspended_ = true;
            ++suspends_;
            return;
        }

        auto want = static_cast<std::size_t>(header_.chunk_length(next_sequence_));
        buffer_.resize(want);
        std::size_t got = 0;
        while (got < want) {
            std::size_t n = source_.read(buffer_.data() + got, want - got);
            if (n == 0) {
                throw TransferException(TransferError::source_read_failure,
                    "source ended at byte " +
                    std::to_string(next_sequence_ * header_.chunk_size + got) + " of " +
                    std::to_string(header_.length));
            }
            got += n;
        }

        checksum_.update(buffer_.data(), want);
        channel_->send(MessageCodec::encode_chunk(next_sequence_, buffer_.data(), want));
        ++next_sequence_;
        if (progress_) {
            progress_->record(want);
        }
    }

    completed_ = true;
    std::string checksum = checksum_.finalize();
    channel_->send(MessageCodec::encode_complete(checksum));
    spdlog::debug("all {} chunks queued, checksum {}", header_.chunk_count, checksum);

    if (on_complete_) {
        on_complete_(checksum);
    }
}
