#pragma once

#include <functional>
#include <memory>
#include <string>

#include "session/session.h"
#include "transfer/byte_stream.h"
#include "transfer/sender_pipeline.h"

/**
 * Sender role: registers a code, offers a data channel, streams the source
 * and waits for the receiver's verdict.
 */
class SenderSession : public Session {
public:
    using CodeCallback = std::function<void(const std::string& code)>;

    static std::shared_ptr<SenderSession> create(asio::io_context& io,
                                                 SessionConfig config,
                                                 std::unique_ptr<ByteSource> source,
                                                 PeerConnectionFactory factory = {});

    /// Fired once the relay has accepted the code.
    void set_on_code(CodeCallback cb) { on_code_ = std::move(cb); }

    void start() override;

    [[nodiscard]] const SenderPipeline* pipeline() const { return pipeline_.get(); }

private:
    SenderSession(asio::io_context& io,
                  SessionConfig config,
                  std::unique_ptr<ByteSource> source,
                  PeerConnectionFactory factory);

    void on_registered(TransferError error, const std::string& code);
    void offer_channel();

    void on_relay_message(const nlohmann::json& message) override;
    void on_channel_open() override;
    void on_channel_message(DecodedMessage decoded) override;
    void on_channel_drained() override;

    std::shared_ptr<SenderSession> self();

    std::unique_ptr<ByteSource> source_;
    std::unique_ptr<SenderPipeline> pipeline_;
    CodeCallback on_code_;
};
