#include <gtest/gtest.h>

#include <asio.hpp>
#include <chrono>
#include <memory>
#include <string>
#include <thread>
#include <vector>

#include "crypto/checksum.h"
#include "network/tcp_peer_connection.h"
#include "rendezvous/relay_server.h"
#include "session/receiver_session.h"
#include "session/sender_session.h"
#include "test_support.h"

using namespace std::chrono_literals;

namespace {

/// What a faulty channel does once `limit` chunks went through.
enum class Fault { close, stall };

/// Passes everything through until `limit` chunks, then closes or goes quiet.
class FaultyChannel : public DataChannel {
public:
    FaultyChannel(std::shared_ptr<DataChannel> inner, int limit, Fault fault)
        : inner_(std::move(inner)), limit_(limit), fault_(fault) {}

    void send(Bytes message) override {
        bool chunk = !message.empty() && message.front() == static_cast<uint8_t>(MessageType::chunk);
        if (fault_ == Fault::stall && chunks_ >= limit_) {
            return;
        }
        inner_->send(std::move(message));
        if (chunk && ++chunks_ == limit_ && fault_ == Fault::close) {
            inner_->close();
        }
    }

    std::size_t buffered_amount() const override { return inner_->buffered_amount(); }
    void set_buffered_amount_low_threshold(std::size_t t) override { inner_->set_buffered_amount_low_threshold(t); }
    void set_on_open(OpenCallback cb) override { inner_->set_on_open(std::move(cb)); }
    void set_on_message(MessageCallback cb) override { inner_->set_on_message(std::move(cb)); }
    void set_on_close(CloseCallback cb) override { inner_->set_on_close(std::move(cb)); }
    void set_on_buffered_amount_low(LowCallback cb) override { inner_->set_on_buffered_amount_low(std::move(cb)); }
    bool is_open() const override { return inner_->is_open(); }
    std::string label() const override { return inner_->label(); }
    void close() override { inner_->close(); }

private:
    std::shared_ptr<DataChannel> inner_;
    int limit_;
    Fault fault_;
    int chunks_ = 0;
};

class FaultyPeerConnection : public PeerConnection {
public:
    FaultyPeerConnection(std::shared_ptr<PeerConnection> inner, int limit, Fault fault)
        : inner_(std::move(inner)), limit_(limit), fault_(fault) {}

    std::shared_ptr<DataChannel> create_data_channel(const std::string& label) override {
        return std::make_shared<FaultyChannel>(inner_->create_data_channel(label), limit_, fault_);
    }
    std::string create_offer() override { return inner_->create_offer(); }
    std::string create_answer() override { return inner_->create_answer(); }
    void set_remote_description(const std::string& d) override { inner_->set_remote_description(d); }
    void add_remote_candidate(const std::string& c) override { inner_->add_remote_candidate(c); }
    void set_on_local_candidate(CandidateCallback cb) override { inner_->set_on_local_candidate(std::move(cb)); }
    void set_on_data_channel(DataChannelCallback cb) override { inner_->set_on_data_channel(std::move(cb)); }
    void set_on_state_change(StateCallback cb) override { inner_->set_on_state_change(std::move(cb)); }
    void close() override { inner_->close(); }

private:
    std::shared_ptr<PeerConnection> inner_;
    int limit_;
    Fault fault_;
};

/// Negotiates on paper but never produces a channel.
class SilentPeerConnection : public PeerConnection {
public:
    std::shared_ptr<DataChannel> create_data_channel(const std::string&) override {
        return std::make_shared<LoopbackChannel>();
    }
    std::string create_offer() override { return "silent-offer"; }
    std::string create_answer() override { return "silent-answer"; }
    void set_remote_description(const std::string&) override {}
    void add_remote_candidate(const std::string&) override {}
    void set_on_local_candidate(CandidateCallback) override {}
    void set_on_data_channel(DataChannelCallback) override {}
    void set_on_state_change(StateCallback) override {}
    void close() override {}
};

/**
 * Sender-side connection over a LoopbackChannel that lets one message out
 * per `interval`, standing in for a slow link. Answers the completion
 * marker with a success verdict.
 */
class TricklePeerConnection : public PeerConnection {
public:
    TricklePeerConnection(asio::io_context& io, std::chrono::milliseconds interval)
        : io_(io), timer_(io), interval_(interval) {}

    std::shared_ptr<DataChannel> create_data_channel(const std::string&) override { return channel_; }
    std::string create_offer() override { return "trickle-offer"; }
    std::string create_answer() override { return "trickle-answer"; }
    void set_remote_description(const std::string&) override {
        asio::post(io_, [this] {
            channel_->fire_open();
            tick();
        });
    }
    void add_remote_candidate(const std::string&) override {}
    void set_on_local_candidate(CandidateCallback) override {}
    void set_on_data_channel(DataChannelCallback) override {}
    void set_on_state_change(StateCallback) override {}
    void close() override {
        closed_ = true;
        timer_.cancel();
    }

    std::size_t delivered = 0;

private:
    void tick() {
        timer_.expires_after(interval_);
        timer_.async_wait([this](const asio::error_code& ec) {
            if (ec || closed_) {
                return;
            }
            channel_->drain([this](Bytes message) {
                ++delivered;
                if (message.front() == static_cast<uint8_t>(MessageType::complete)) {
                    asio::post(io_, [this] {
                        channel_->deliver(MessageCodec::encode_verdict(TransferError::none));
                    });
                }
            }, 1);
            tick();
        });
    }

    asio::io_context& io_;
    asio::steady_timer timer_;
    std::chrono::milliseconds interval_;
    std::shared_ptr<LoopbackChannel> channel_ = std::make_shared<LoopbackChannel>();
    bool closed_ = false;
};

/// Output file that takes `delay` for every write, counted in `writes`.
class SlowFileSink : public ByteSink {
public:
    SlowFileSink(const std::string& path, std::chrono::milliseconds delay, std::size_t& writes)
        : inner_(path), delay_(delay), writes_(writes) {}

    void write(const uint8_t* data, std::size_t size) override {
        std::this_thread::sleep_for(delay_);
        ++writes_;
        inner_.write(data, size);
    }
    void close() override { inner_.close(); }

private:
    FileByteSink inner_;
    std::chrono::milliseconds delay_;
    std::size_t& writes_;
};

struct Outcome {
    bool finished = false;
    SessionState state = SessionState::init;
    TransferError cause = TransferError::none;
};

class SessionTest : public ::testing::Test {
protected:
    void SetUp() override {
        server_ = std::make_unique<RelayServer>(
            io_, asio::ip::tcp::endpoint(asio::ip::make_address("127.0.0.1"), 0), 600s);
        server_->start();

        config_.relay.host = "127.0.0.1";
        config_.relay.port = server_->port();
        config_.peer.bind_address = "127.0.0.1";
        config_.peer.advertise_addresses = {"127.0.0.1"};
        config_.receiver.output_directory = dir_.path().string();
        config_.transfer.chunk_size = 65536;
        config_.transfer.memory_budget = 262144;
    }

    std::shared_ptr<SenderSession> make_sender(Bytes content,
                                               Session::PeerConnectionFactory factory = {},
                                               const std::string& name = "payload.bin") {
        auto source = std::make_unique<MemoryByteSource>(name, std::move(content));
        auto sender = SenderSession::create(io_, config_, std::move(source), std::move(factory));
        sender->set_on_finished(record(sender_outcome_));
        sender->set_on_code([this](const std::string& code) { join(code); });
        return sender;
    }

    void join(const std::string& code) {
        receiver_ = ReceiverSession::create(io_, config_, code, receiver_factory_, receiver_sink_);
        if (accept_) {
            receiver_->set_accept_callback(accept_);
        }
        receiver_->set_on_finished(record(receiver_outcome_));
        receiver_->start();
    }

    Session::FinishedCallback record(Outcome& outcome) {
        return [this, &outcome](SessionState state, TransferError cause) {
            outcome = {true, state, cause};
            if (sender_outcome_.finished && receiver_outcome_.finished) {
                io_.stop();
            }
        };
    }

    void run(std::chrono::seconds limit = 30s) {
        io_.run_for(limit);
    }

    asio::io_context io_;
    std::unique_ptr<RelayServer> server_;
    TempDir dir_;
    SessionConfig config_;
    Session::PeerConnectionFactory receiver_factory_;
    ReceiverPipeline::SinkFactory receiver_sink_;
    ReceiverSession::AcceptCallback accept_;
    std::shared_ptr<ReceiverSession> receiver_;
    Outcome sender_outcome_;
    Outcome receiver_outcome_;
};

} // namespace

TEST_F(SessionTest, TransfersFileEndToEnd) {
    Bytes content = random_bytes(10000000, 42);
    auto sender = make_sender(content);
    sender->start();
    run();

    ASSERT_TRUE(sender_outcome_.finished);
    ASSERT_TRUE(receiver_outcome_.finished);
    EXPECT_EQ(sender_outcome_.state, SessionState::done) << to_string(sender_outcome_.cause);
    EXPECT_EQ(receiver_outcome_.state, SessionState::done) << to_string(receiver_outcome_.cause);

    ASSERT_NE(receiver_, nullptr);
    EXPECT_TRUE(receiver_->pipeline().verified());
    EXPECT_LE(receiver_->pipeline().peak_staged_bytes(), config_.transfer.memory_budget);
    EXPECT_EQ(receiver_->pipeline().flush_count(), 38u);

    Bytes written = read_file(receiver_->output_path());
    EXPECT_EQ(written.size(), content.size());
    EXPECT_TRUE(written == content);
    EXPECT_EQ(dir_.count_with(".part"), 0u);
}

TEST_F(SessionTest, EmptyFileTransfers) {
    auto sender = make_sender(Bytes{});
    sender->start();
    run();

    EXPECT_EQ(sender_outcome_.state, SessionState::done);
    EXPECT_EQ(receiver_outcome_.state, SessionState::done);
    ASSERT_NE(receiver_, nullptr);
    EXPECT_TRUE(std::filesystem::exists(receiver_->output_path()));
    EXPECT_EQ(std::filesystem::file_size(receiver_->output_path()), 0u);
}

TEST_F(SessionTest, UnknownCodeFailsWithoutAChannel) {
    sender_outcome_.finished = true;
    join("tiger-zebra-panda");
    run();

    ASSERT_TRUE(receiver_outcome_.finished);
    EXPECT_EQ(receiver_outcome_.state, SessionState::failed);
    EXPECT_EQ(receiver_outcome_.cause, TransferError::code_not_found);
    EXPECT_EQ(receiver_->last_active_state(), SessionState::signaling);
    EXPECT_FALSE(receiver_->channel_opened());
}

TEST_F(SessionTest, ChannelClosedMidTransfer) {
    Bytes content = random_bytes(10000000, 43);
    PeerConfig peer_config = config_.peer;
    auto sender = make_sender(content, [this, peer_config] {
        return std::make_shared<FaultyPeerConnection>(make_tcp_peer_connection(io_, peer_config),
                                                      100, Fault::close);
    });
    sender->start();
    run();

    ASSERT_TRUE(receiver_outcome_.finished);
    EXPECT_EQ(receiver_outcome_.state, SessionState::failed);
    EXPECT_EQ(receiver_outcome_.cause, TransferError::channel_closed_early);
    EXPECT_EQ(receiver_->last_active_state(), SessionState::transferring);
    EXPECT_EQ(receiver_->pipeline().next_sequence(), 100u);

    ASSERT_TRUE(sender_outcome_.finished);
    EXPECT_EQ(sender_outcome_.state, SessionState::failed);
}

TEST_F(SessionTest, StalledSenderTimesOutReceiver) {
    Bytes content = random_bytes(1000000, 44);
    PeerConfig peer_config = config_.peer;
    auto sender = make_sender(content, [this, peer_config] {
        return std::make_shared<FaultyPeerConnection>(make_tcp_peer_connection(io_, peer_config),
                                                      5, Fault::stall);
    });
    config_.transfer.chunk_inactivity_timeout = 1s;
    sender->start();
    run(10s);

    ASSERT_TRUE(receiver_outcome_.finished);
    EXPECT_EQ(receiver_outcome_.cause, TransferError::chunk_inactivity_timeout);
    EXPECT_EQ(receiver_->pipeline().next_sequence(), 5u);
    EXPECT_FALSE(receiver_->pipeline().verified());

    // The sender loses its channel when the receiver gives up.
    EXPECT_EQ(sender_outcome_.cause, TransferError::channel_closed_early);
}

TEST_F(SessionTest, ReceiverDeclines) {
    accept_ = [](const TransferHeader& preview, ReceiverSession::Decision decide) {
        EXPECT_EQ(preview.filename, "payload.bin");
        EXPECT_EQ(preview.length, 1000u);
        decide(false);
    };
    auto sender = make_sender(random_bytes(1000));
    sender->start();
    run();

    EXPECT_EQ(receiver_outcome_.cause, TransferError::transfer_declined);
    EXPECT_EQ(sender_outcome_.cause, TransferError::transfer_declined);
    EXPECT_FALSE(sender->channel_opened());
}

TEST_F(SessionTest, NegotiationTimesOut) {
    config_.transfer.negotiation_timeout = 1s;
    receiver_factory_ = [] { return std::make_shared<SilentPeerConnection>(); };
    auto sender = make_sender(random_bytes(1000),
                              [] { return std::make_shared<SilentPeerConnection>(); });
    // The receiver waits longer, so it sees the sender give up.
    config_.transfer.negotiation_timeout = 5s;
    sender->start();
    run(10s);

    EXPECT_EQ(sender_outcome_.state, SessionState::failed);
    EXPECT_EQ(sender_outcome_.cause, TransferError::negotiation_timeout);
    EXPECT_EQ(sender->last_active_state(), SessionState::connecting);
    EXPECT_FALSE(sender->channel_opened());
    EXPECT_EQ(receiver_outcome_.cause, TransferError::transfer_cancelled);
}

TEST_F(SessionTest, LocalCancelStopsBothSides) {
    receiver_factory_ = [] { return std::make_shared<SilentPeerConnection>(); };
    auto sender = make_sender(random_bytes(1000),
                              [] { return std::make_shared<SilentPeerConnection>(); });
    sender->start();

    asio::steady_timer timer(io_, 200ms);
    timer.async_wait([sender](const asio::error_code& ec) {
        if (!ec) {
            sender->cancel();
        }
    });
    run(10s);

    EXPECT_EQ(sender_outcome_.cause, TransferError::transfer_cancelled);
    EXPECT_EQ(receiver_outcome_.cause, TransferError::transfer_cancelled);
}

TEST_F(SessionTest, BusyCodesExhaustRegistration) {
    sender_outcome_.finished = receiver_outcome_.finished = true;
    const std::vector<std::string> one_word = {"otter"};

    auto first = std::make_shared<RendezvousClient>(io_, "127.0.0.1", server_->port(), 5,
                                                    CodeGenerator(one_word, 1));
    auto second = std::make_shared<RendezvousClient>(io_, "127.0.0.1", server_->port(), 3,
                                                     CodeGenerator(one_word, 1));
    TransferError first_error = TransferError::protocol_violation;
    TransferError second_error = TransferError::none;
    std::string first_code;

    first->register_sender({{"filename", "a"}}, [&](TransferError error, const std::string& code) {
        first_error = error;
        first_code = code;
        second->register_sender({{"filename", "b"}}, [&](TransferError retry_error, const std::string&) {
            second_error = retry_error;
            io_.stop();
        });
    });
    run(10s);

    EXPECT_EQ(first_error, TransferError::none);
    EXPECT_EQ(first_code, "otter");
    EXPECT_EQ(second_error, TransferError::code_exhausted);
    first->close();
    second->close();
}

TEST_F(SessionTest, MissingRelayIsUnreachable) {
    sender_outcome_.finished = true;
    asio::ip::tcp::acceptor unused(io_, asio::ip::tcp::endpoint(asio::ip::make_address("127.0.0.1"), 0));
    config_.relay.port = unused.local_endpoint().port();
    unused.close();

    join("otter-lynx-robin");
    run(10s);

    ASSERT_TRUE(receiver_outcome_.finished);
    EXPECT_EQ(receiver_outcome_.cause, TransferError::relay_unreachable);
    EXPECT_EQ(receiver_->last_active_state(), SessionState::signaling);
}

TEST_F(SessionTest, SlowDecisionOutlastsNegotiationTimeout) {
    config_.transfer.negotiation_timeout = 1s;
    asio::steady_timer later(io_);
    accept_ = [&later](const TransferHeader&, ReceiverSession::Decision decide) {
        later.expires_after(1500ms);
        later.async_wait([decide](const asio::error_code& ec) {
            if (!ec) {
                decide(true);
            }
        });
    };
    Bytes content = random_bytes(300000, 45);
    auto sender = make_sender(content);
    sender->start();
    run(10s);

    EXPECT_EQ(sender_outcome_.state, SessionState::done) << to_string(sender_outcome_.cause);
    EXPECT_EQ(receiver_outcome_.state, SessionState::done) << to_string(receiver_outcome_.cause);
    ASSERT_NE(receiver_, nullptr);
    EXPECT_TRUE(read_file(receiver_->output_path()) == content);
}

TEST_F(SessionTest, DecisionFromAnotherThread) {
    std::thread answering;
    accept_ = [&answering](const TransferHeader&, ReceiverSession::Decision decide) {
        answering = std::thread([decide] {
            std::this_thread::sleep_for(100ms);
            decide(true);
        });
    };
    auto sender = make_sender(random_bytes(5000, 46));
    sender->start();
    run(10s);
    if (answering.joinable()) {
        answering.join();
    }

    EXPECT_EQ(sender_outcome_.state, SessionState::done) << to_string(sender_outcome_.cause);
    EXPECT_EQ(receiver_outcome_.state, SessionState::done) << to_string(receiver_outcome_.cause);
}

TEST_F(SessionTest, CancelWhileAwaitingDecision) {
    asio::steady_timer later(io_);
    accept_ = [this, &later](const TransferHeader&, ReceiverSession::Decision decide) {
        later.expires_after(300ms);
        later.async_wait([this, decide](const asio::error_code& ec) {
            if (!ec) {
                receiver_->cancel();
                // An answer arriving after the cancel changes nothing.
                decide(true);
            }
        });
    };
    auto sender = make_sender(random_bytes(1000));
    sender->start();
    run(10s);

    EXPECT_EQ(receiver_outcome_.cause, TransferError::transfer_cancelled);
    EXPECT_EQ(receiver_->last_active_state(), SessionState::signaling);
    EXPECT_EQ(sender_outcome_.cause, TransferError::transfer_cancelled);
    EXPECT_FALSE(sender->channel_opened());
}

TEST_F(SessionTest, SlowFinalizationKeepsSenderWaiting) {
    config_.transfer.chunk_inactivity_timeout = 1s;
    std::size_t sinks = 0;
    std::size_t writes = 0;
    std::filesystem::path directory = dir_.path();
    receiver_sink_ = [&sinks, &writes, directory](const TransferHeader& header)
        -> std::unique_ptr<ByteSink> {
        ++sinks;
        return std::make_unique<SlowFileSink>((directory / header.filename).string(), 30ms, writes);
    };
    // 60 part-file blocks of 64 KiB at 30 ms each: assembly outlasts the timeout.
    Bytes content = random_bytes(4 * 1024 * 1024, 47);
    auto sender = make_sender(content);
    sender->start();
    run(20s);

    EXPECT_EQ(sender_outcome_.state, SessionState::done) << to_string(sender_outcome_.cause);
    EXPECT_EQ(receiver_outcome_.state, SessionState::done) << to_string(receiver_outcome_.cause);
    EXPECT_EQ(sinks, 1u);
    EXPECT_GE(writes, 60u);
    EXPECT_TRUE(read_file(receiver_->output_path()) == content);
}

TEST_F(SessionTest, SlowLinkIsNotInactivity) {
    config_.transfer.chunk_inactivity_timeout = 1s;
    config_.transfer.high_water = 512 * 1024;
    config_.transfer.low_water = 64 * 1024;
    receiver_factory_ = [] { return std::make_shared<SilentPeerConnection>(); };
    auto trickle = std::make_shared<TricklePeerConnection>(io_, 200ms);

    // Draining from the high to the low water mark takes well over the timeout.
    auto sender = make_sender(random_bytes(1024 * 1024, 48), [trickle] { return trickle; });
    sender->start();
    run(20s);

    EXPECT_EQ(sender_outcome_.state, SessionState::done) << to_string(sender_outcome_.cause);
    EXPECT_EQ(trickle->delivered, 18u);
    // The receiver never saw a channel and is left behind when the sender hangs up.
    EXPECT_EQ(receiver_outcome_.cause, TransferError::transfer_cancelled);
}

TEST_F(SessionTest, UnencodableFileNameFailsBeforeRegistering) {
    receiver_outcome_.finished = true;
    auto sender = make_sender(random_bytes(100), {}, "bad\xff.bin");
    sender->start();
    run(10s);

    ASSERT_TRUE(sender_outcome_.finished);
    EXPECT_EQ(sender_outcome_.cause, TransferError::source_read_failure);
    EXPECT_TRUE(sender->code().empty());
    EXPECT_EQ(server_->registry().size(), 0u);
}

TEST_F(SessionTest, RelayCarriesMetadataThatIsNotUtf8) {
    sender_outcome_.finished = receiver_outcome_.finished = true;
    auto client = std::make_shared<RendezvousClient>(io_, "127.0.0.1", server_->port(), 3);
    TransferError error = TransferError::protocol_violation;
    client->register_sender({{"filename", "bad\xff.bin"}}, [&](TransferError result, const std::string&) {
        error = result;
        io_.stop();
    });
    run(10s);

    EXPECT_EQ(error, TransferError::none);
    client->close();
}
