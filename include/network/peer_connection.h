#pragma once

#include <cstddef>
#include <functional>
#include <memory>
#include <string>

#include "common/framing.h"

/**
 * Reliable, ordered, message-oriented channel between two peers.
 *
 * Callbacks fire on the io_context that owns the channel.
 */
class DataChannel {
public:
    using OpenCallback    = std::function<void()>;
    using MessageCallback = std::function<void(Bytes message)>;
    using CloseCallback   = std::function<void()>;
    using LowCallback     = std::function<void()>;

    /// Largest message a channel accepts; the receiving end drops larger ones.
    static constexpr std::size_t kMaxMessageSize = 16 * 1024 * 1024 + 64;

    virtual ~DataChannel() = default;

    virtual void send(Bytes message) = 0;

    /// Bytes queued locally and not yet handed to the transport.
    [[nodiscard]] virtual std::size_t buffered_amount() const = 0;

    /// on_buffered_amount_low fires when buffered_amount() drops to or below this.
    virtual void set_buffered_amount_low_threshold(std::size_t threshold) = 0;

    virtual void set_on_open(OpenCallback cb) = 0;
    virtual void set_on_message(MessageCallback cb) = 0;
    virtual void set_on_close(CloseCallback cb) = 0;
    virtual void set_on_buffered_amount_low(LowCallback cb) = 0;

    [[nodiscard]] virtual bool is_open() const = 0;
    [[nodiscard]] virtual std::string label() const = 0;

    /// Flushes queued messages, then closes. on_close fires on both ends.
    virtual void close() = 0;
};

/**
 * Connectivity establishment between two peers, driven by descriptors and
 * candidates that the caller carries over the relay.
 */
class PeerConnection {
public:
    enum class State { fresh, connecting, connected, failed, closed };

    /// An empty candidate string marks the end of local candidates.
    using CandidateCallback   = std::function<void(const std::string& candidate)>;
    using DataChannelCallback = std::function<void(std::shared_ptr<DataChannel> channel)>;
    using StateCallback       = std::function<void(State state)>;

    virtual ~PeerConnection() = default;

    /// Offerer side: the channel opens once the answerer has connected.
    virtual std::shared_ptr<DataChannel> create_data_channel(const std::string& label) = 0;

    virtual std::string create_offer() = 0;
    virtual std::string create_answer() = 0;

    /// Throws std::invalid_argument on an unusable descriptor.
    virtual void set_remote_description(const std::string& description) = 0;
    virtual void add_remote_candidate(const std::string& candidate) = 0;

    virtual void set_on_local_candidate(CandidateCallback cb) = 0;
    /// Answerer side: the channel created by the offerer.
    virtual void set_on_data_channel(DataChannelCallback cb) = 0;
    virtual void set_on_state_change(StateCallback cb) = 0;

    virtual void close() = 0;
};

const char* to_string(PeerConnection::State state);
