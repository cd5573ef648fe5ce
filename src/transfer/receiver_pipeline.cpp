/**
 * ReceiverPipeline: contiguity checks, budgeted staging, spill and verify.
 */

#include "transfer/receiver_pipeline.h"

#include <algorithm>
#include <limits>
#include <stdexcept>
#include <utility>

#include <spdlog/spdlog.h>

#include "common/errors.h"

namespace fs = std::filesystem;

ReceiverPipeline::ReceiverPipeline(std::size_t memory_budget,
                                   PartStoreFactory part_store_factory,
                                   SinkFactory sink_factory,
                                   ProgressTracker* progress)
    : budget_(memory_budget),
      part_store_factory_(std::move(part_store_factory)),
      sink_factory_(std::move(sink_factory)),
      progress_(progress) {}

ReceiverPipeline ReceiverPipeline::to_directory(std::size_t memory_budget,
                                                const fs::path& directory,
                                                int part_write_retries,
                                                ProgressTracker* progress,
                                                SinkFactory sink_factory) {
    if (!sink_factory) {
        sink_factory = [directory](const TransferHeader& header) -> std::unique_ptr<ByteSink> {
            return std::make_unique<FileByteSink>((directory / header.filename).string());
        };
    }
    return ReceiverPipeline(
        memory_budget,
        [directory, part_write_retries](const TransferHeader& header) {
            return std::make_unique<PartFileStore>(directory, header.filename, part_write_retries);
        },
        std::move(sink_factory),
        progress);
}

void ReceiverPipeline::accept_header(const TransferHeader& header) {
    if (header_) {
        throw TransferException(TransferError::protocol_violation, "second transfer header");
    }
    header.validate();

    header_ = header;
    parts_ = part_store_factory_(header);
    staged_.reserve(static_cast<std::size_t>(
        std::min<uint64_t>(budget_, header.length)));

    if (progress_) {
        progress_->begin(header.length, header.chunk_count);
    }
    spdlog::debug("header accepted: {} ({} bytes, {} chunks of {})", header.filename,
                  header.length, header.chunk_count, header.chunk_size);
}

void ReceiverPipeline::accept_chunk(const Chunk& chunk) {
    if (!header_) {
        throw TransferException(TransferError::protocol_violation, "chunk before transfer header");
    }
    if (completed_) {
        throw TransferException(TransferError::protocol_violation, "chunk after completion marker");
    }
    if (chunk.sequence != next_sequence_) {
        throw TransferException(TransferError::protocol_violation,
            "expected chunk " + std::to_string(next_sequence_) + ", got " +
            std::to_string(chunk.sequence));
    }
    if (next_sequence_ >= header_->chunk_count) {
        throw TransferException(TransferError::protocol_violation,
            "chunk " + std::to_string(chunk.sequence) + " beyond declared count");
    }
    if (chunk.payload.size() > header_->chunk_size) {
        throw TransferException(TransferError::protocol_violation,
            "chunk " + std::to_string(chunk.sequence) + " exceeds the declared chunk size");
    }

    const uint8_t* data = chunk.payload.data();
    std::size_t size = chunk.payload.size();
    checksum_.update(data, size);

    if (size > budget_) {
        // Larger than the whole budget: never staged.
        flush();
        parts_->write_segment(data, size);
        ++flushes_;
    } else {
        if (staged_.size() + size > budget_) {
            flush();
        }
        staged_.insert(staged_.end(), data, data + size);
        peak_staged_ = std::max(peak_staged_, staged_.size());
    }

    received_ += size;
    ++next_sequence_;
    if (progress_) {
        progress_->record(size);
    }
}

void ReceiverPipeline::complete(const std::string& sender_checksum) {
    finish(sender_checksum);
    while (!assemble_step(std::numeric_limits<std::size_t>::max())) {
    }
}

void ReceiverPipeline::finish(const std::string& sender_checksum) {
    if (!header_) {
        throw TransferException(TransferError::protocol_violation, "completion marker before header");
    }
    if (completed_) {
        throw TransferException(TransferError::protocol_violation, "second completion marker");
    }
    completed_ = true;
    computed_ = checksum_.finalize();
    sender_checksum_ = sender_checksum;
    sink_ = sink_factory_(*header_);
}

bool ReceiverPipeline::assemble_step(std::size_t max_bytes) {
    if (!sink_) {
        throw std::logic_error("assemble_step() without a finished chunk stream");
    }
    bool drained = parts_->drain_some(*sink_, max_bytes);
    assembled_ = parts_->bytes_drained();
    if (!drained) {
        return false;
    }

    sink_->write(staged_.data(), staged_.size());
    assembled_ += staged_.size();
    staged_.clear();
    sink_->close();
    sink_.reset();

    verify();
    return true;
}

void ReceiverPipeline::verify() {
    if (received_ != header_->length || next_sequence_ != header_->chunk_count) {
        throw TransferException(TransferError::length_mismatch,
            "declared " + std::to_string(header_->length) + " bytes in " +
            std::to_string(header_->chunk_count) + " chunks, received " +
            std::to_string(received_) + " bytes in " + std::to_string(next_sequence_));
    }
    if (computed_ != sender_checksum_ ||
        (!header_->checksum.empty() && header_->checksum != computed_)) {
        throw TransferException(TransferError::checksum_mismatch,
            "received content hashes to " + computed_ + ", sender declared " + sender_checksum_ +
            "; output kept but unverified");
    }

    verified_ = true;
}

void ReceiverPipeline::flush() {
    if (staged_.empty()) {
        return;
    }
    parts_->write_segment(staged_.data(), staged_.size());
    staged_.clear();
    ++flushes_;
}
