#pragma once

#include <cstddef>
#include <cstdint>
#include <fstream>
#include <memory>
#include <string>

#include "common/framing.h"

/**
 * Readable byte source of known length (sender side).
 */
class ByteSource {
public:
    virtual ~ByteSource() = default;

    /// Read up to `size` bytes; returns 0 only at end of content.
    /// Throws TransferException(source_read_failure) on I/O errors.
    virtual std::size_t read(uint8_t* out, std::size_t size) = 0;

    [[nodiscard]] virtual uint64_t size() const = 0;

    /// File name announced to the receiver.
    [[nodiscard]] virtual std::string name() const = 0;
};

/**
 * Writable byte sink (receiver side).
 */
class ByteSink {
public:
    virtual ~ByteSink() = default;

    /// Throws TransferException(insufficient_local_storage) on failure.
    virtual void write(const uint8_t* data, std::size_t size) = 0;

    /// Flush and release; throws like write().
    virtual void close() = 0;
};

class FileByteSource : public ByteSource {
public:
    /// Throws TransferException(source_read_failure) if unreadable.
    explicit FileByteSource(const std::string& path);

    std::size_t read(uint8_t* out, std::size_t size) override;
    [[nodiscard]] uint64_t size() const override { return size_; }
    [[nodiscard]] std::string name() const override { return name_; }

private:
    std::string path_;
    std::string name_;
    std::ifstream file_;
    uint64_t size_ = 0;
};

class MemoryByteSource : public ByteSource {
public:
    MemoryByteSource(std::string name, Bytes content);

    std::size_t read(uint8_t* out, std::size_t size) override;
    [[nodiscard]] uint64_t size() const override { return content_.size(); }
    [[nodiscard]] std::string name() const override { return name_; }

private:
    std::string name_;
    Bytes content_;
    std::size_t offset_ = 0;
};

class FileByteSink : public ByteSink {
public:
    /// Truncates or creates `path`.
    explicit FileByteSink(const std::string& path);

    void write(const uint8_t* data, std::size_t size) override;
    void close() override;

    [[nodiscard]] const std::string& path() const { return path_; }

private:
    std::string path_;
    std::ofstream file_;
};

/// Collects everything in memory; used when the caller wants the bytes back.
class MemoryByteSink : public ByteSink {
public:
    explicit MemoryByteSink(std::shared_ptr<Bytes> target);

    void write(const uint8_t* data, std::size_t size) override;
    void close() override {}

private:
    std::shared_ptr<Bytes> target_;
};
