/**
 * File- and memory-backed byte sources and sinks.
 */

#include "transfer/byte_stream.h"

#include <algorithm>
#include <cstring>
#include <filesystem>
#include <utility>

#include "common/errors.h"

namespace fs = std::filesystem;

// ── FileByteSource ──────────────────────────────────────────────────────────

FileByteSource::FileByteSource(const std::string& path)
    : path_(path), name_(fs::path(path).filename().string()) {
    std::error_code ec;
    if (!fs::is_regular_file(path, ec)) {
        throw TransferException(TransferError::source_read_failure, path + " is not a regular file");
    }
    size_ = fs::file_size(path, ec);
    if (ec) {
        throw TransferException(TransferError::source_read_failure,
                                "cannot stat " + path + ": " + ec.message());
    }
    file_.open(path, std::ios::binary);
    if (!file_.is_open()) {
        throw TransferException(TransferError::source_read_failure, "cannot open " + path);
    }
}

std::size_t FileByteSource::read(uint8_t* out, std::size_t size) {
    file_.read(reinterpret_cast<char*>(out), static_cast<std::streamsize>(size));
    if (file_.bad()) {
        throw TransferException(TransferError::source_read_failure, "read error on " + path_);
    }
    return static_cast<std::size_t>(file_.gcount());
}

// ── MemoryByteSource ────────────────────────────────────────────────────────

MemoryByteSource::MemoryByteSource(std::string name, Bytes content)
    : name_(std::move(name)), content_(std::move(content)) {}

std::size_t MemoryByteSource::read(uint8_t* out, std::size_t size) {
    std::size_t n = std::min(size, content_.size() - offset_);
    if (n > 0) {
        std::memcpy(out, content_.data() + offset_, n);
        offset_ += n;
    }
    return n;
}

// ── FileByteSink ────────────────────────────────────────────────────────────

FileByteSink::FileByteSink(const std::string& path)
    : path_(path), file_(path, std::ios::binary | std::ios::trunc) {
    if (!file_.is_open()) {
        throw TransferException(TransferError::insufficient_local_storage, "cannot create " + path);
    }
}

void FileByteSink::write(const uint8_t* data, std::size_t size) {
    file_.write(reinterpret_cast<const char*>(data), static_cast<std::streamsize>(size));
    if (!file_) {
        throw TransferException(TransferError::insufficient_local_storage, "write failed on " + path_);
    }
}

void FileByteSink::close() {
    if (!file_.is_open()) {
        return;
    }
    file_.flush();
    bool ok = static_cast<bool>(file_);
    file_.close();
    if (!ok) {
        throw TransferException(TransferError::insufficient_local_storage, "flush failed on " + path_);
    }
}

// ── MemoryByteSink ──────────────────────────────────────────────────────────

MemoryByteSink::MemoryByteSink(std::shared_ptr<Bytes> target)
    : target_(std::move(target)) {}

void MemoryByteSink::write(const uint8_t* data, std::size_t size) {
    target_->insert(target_->end(), data, data + size);
}
