/**
 * PartFileStore: numbered spill segments plus their in-order concatenation.
 */

#include "transfer/part_file_store.h"

#include <algorithm>
#include <array>
#include <fstream>
#include <limits>
#include <utility>

#include <spdlog/spdlog.h>

#include "common/errors.h"

namespace fs = std::filesystem;

PartFileStore::PartFileStore(fs::path directory, std::string base_name, int write_retries)
    : directory_(std::move(directory)),
      base_name_(std::move(base_name)),
      write_retries_(write_retries) {}

void PartFileStore::write_segment(const uint8_t* data, std::size_t size) {
    fs::path path = directory_ / (base_name_ + ".part" + std::to_string(next_index_));

    for (int attempt = 0; attempt <= write_retries_; ++attempt) {
        if (write_file(path, data, size)) {
            segments_.push_back(path);
            bytes_written_ += size;
            ++next_index_;
            spdlog::debug("wrote part file {} ({} bytes)", path.string(), size);
            return;
        }
        spdlog::warn("write of {} failed (attempt {}/{})", path.string(), attempt + 1,
                     write_retries_ + 1);
    }

    throw TransferException(TransferError::insufficient_local_storage,
                            "cannot write part file " + path.string());
}

bool PartFileStore::write_file(const fs::path& path, const uint8_t* data, std::size_t size) {
    std::ofstream file(path, std::ios::binary | std::ios::trunc);
    if (!file.is_open()) {
        return false;
    }
    file.write(reinterpret_cast<const char*>(data), static_cast<std::streamsize>(size));
    file.flush();
    return static_cast<bool>(file);
}

void PartFileStore::drain_into(ByteSink& sink) {
    while (!drain_some(sink, std::numeric_limits<std::size_t>::max())) {
    }
}

bool PartFileStore::drain_some(ByteSink& sink, std::size_t max_bytes) {
    std::array<char, 64 * 1024> block{};
    std::size_t copied = 0;

    while (drain_index_ < segments_.size()) {
        const fs::path& path = segments_[drain_index_];
        if (!reading_.is_open()) {
            reading_.clear();
            reading_.open(path, std::ios::binary);
            if (!reading_.is_open()) {
                throw TransferException(TransferError::insufficient_local_storage,
                                        "part file vanished: " + path.string());
            }
        }

        while (copied < max_bytes) {
            std::size_t want = std::min(block.size(), max_bytes - copied);
            reading_.read(block.data(), static_cast<std::streamsize>(want));
            std::size_t got = static_cast<std::size_t>(reading_.gcount());
            if (got == 0) {
                break;
            }
            sink.write(reinterpret_cast<const uint8_t*>(block.data()), got);
            copied += got;
            bytes_drained_ += got;
        }
        if (reading_.bad()) {
            throw TransferException(TransferError::insufficient_local_storage,
                                    "cannot read back " + path.string());
        }
        if (!reading_.eof()) {
            return false;
        }
        reading_.close();

        std::error_code ec;
        fs::remove(path, ec);
        if (ec) {
            spdlog::warn("cannot remove {}: {}", path.string(), ec.message());
        }
        ++drain_index_;
    }

    segments_.clear();
    drain_index_ = 0;
    return true;
}
