#pragma once

#include <algorithm>
#include <cstdint>
#include <deque>
#include <filesystem>
#include <fstream>
#include <functional>
#include <iterator>
#include <limits>
#include <random>
#include <string>
#include <utility>

#include <gtest/gtest.h>

#include "common/errors.h"
#include "common/framing.h"
#include "crypto/random.h"
#include "network/peer_connection.h"

/// Fresh directory under the system temp dir, removed on destruction.
class TempDir {
public:
    TempDir() {
        path_ = std::filesystem::temp_directory_path() / ("tunnel-test-" + CryptoRandom::token(8));
        std::filesystem::create_directories(path_);
    }
    ~TempDir() {
        std::error_code ec;
        std::filesystem::remove_all(path_, ec);
    }

    const std::filesystem::path& path() const { return path_; }

    std::size_t count_with(const std::string& fragment) const {
        std::size_t count = 0;
        for (const auto& entry : std::filesystem::directory_iterator(path_)) {
            if (entry.path().filename().string().find(fragment) != std::string::npos) {
                ++count;
            }
        }
        return count;
    }

private:
    std::filesystem::path path_;
};

inline Bytes random_bytes(std::size_t size, uint32_t seed = 7) {
    std::mt19937 rng(seed);
    std::uniform_int_distribution<int> dist(0, 255);
    Bytes out(size);
    for (auto& b : out) {
        b = static_cast<uint8_t>(dist(rng));
    }
    return out;
}

inline Bytes read_file(const std::filesystem::path& path) {
    std::ifstream file(path, std::ios::binary);
    return Bytes(std::istreambuf_iterator<char>(file), std::istreambuf_iterator<char>());
}

/// Run `fn`, expecting a TransferException with `cause`.
template <typename Fn>
void expect_cause(TransferError cause, Fn&& fn) {
    try {
        fn();
        ADD_FAILURE() << "expected " << to_string(cause) << ", nothing was thrown";
    } catch (const TransferException& e) {
        EXPECT_EQ(e.cause(), cause) << e.what();
    }
}

/**
 * In-process DataChannel: send() queues, the test decides when the queue
 * drains, which is when buffered-amount-low can fire.
 */
class LoopbackChannel : public DataChannel {
public:
    void send(Bytes message) override {
        if (!open_) {
            return;
        }
        buffered_ += message.size();
        if (buffered_ > low_threshold_) {
            above_threshold_ = true;
        }
        peak_buffered_ = std::max(peak_buffered_, buffered_);
        queue_.push_back(std::move(message));
    }

    std::size_t buffered_amount() const override { return buffered_; }
    void set_buffered_amount_low_threshold(std::size_t threshold) override { low_threshold_ = threshold; }

    void set_on_open(OpenCallback cb) override { on_open_ = std::move(cb); }
    void set_on_message(MessageCallback cb) override { on_message_ = std::move(cb); }
    void set_on_close(CloseCallback cb) override { on_close_ = std::move(cb); }
    void set_on_buffered_amount_low(LowCallback cb) override { on_low_ = std::move(cb); }

    bool is_open() const override { return open_; }
    std::string label() const override { return "loopback"; }

    void close() override {
        if (!open_) {
            return;
        }
        open_ = false;
        if (on_close_) {
            on_close_();
        }
    }

    /// Hand up to `limit` queued messages to `sink` in order.
    std::size_t drain(const std::function<void(Bytes)>& sink,
                      std::size_t limit = std::numeric_limits<std::size_t>::max()) {
        std::size_t delivered = 0;
        while (!queue_.empty() && delivered < limit) {
            Bytes message = std::move(queue_.front());
            queue_.pop_front();
            buffered_ -= message.size();
            ++delivered;
            sink(std::move(message));
        }
        if (above_threshold_ && buffered_ <= low_threshold_) {
            above_threshold_ = false;
            if (on_low_) {
                on_low_();
            }
        }
        return delivered;
    }

    /// Fire on_open, as a transport does once connected.
    void fire_open() {
        if (on_open_) {
            on_open_();
        }
    }

    /// Hand `message` to the local on_message callback, as if the peer sent it.
    void deliver(Bytes message) {
        if (open_ && on_message_) {
            on_message_(std::move(message));
        }
    }

    std::size_t queued() const { return queue_.size(); }
    std::size_t peak_buffered() const { return peak_buffered_; }

private:
    std::deque<Bytes> queue_;
    std::size_t buffered_ = 0;
    std::size_t peak_buffered_ = 0;
    std::size_t low_threshold_ = 0;
    bool above_threshold_ = false;
    bool open_ = true;

    OpenCallback on_open_;
    MessageCallback on_message_;
    CloseCallback on_close_;
    LowCallback on_low_;
};
