#pragma once

#include <filesystem>
#include <chrono>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "session/session.h"
#include "transfer/receiver_pipeline.h"

/**
 * Receiver role: joins by code, answers the offer, reassembles and
 * verifies the content, then reports the verdict to the sender.
 */
class ReceiverSession : public Session {
public:
    /// Answer to an AcceptCallback. May be called from any thread, once.
    using Decision = std::function<void(bool accept)>;

    /// Decide whether to take the announced transfer. Absent means accept.
    /// No deadline runs while the decision is pending.
    using AcceptCallback = std::function<void(const TransferHeader& preview, Decision decide)>;

    static std::shared_ptr<ReceiverSession> create(asio::io_context& io,
                                                   SessionConfig config,
                                                   std::string code,
                                                   PeerConnectionFactory factory = {},
                                                   ReceiverPipeline::SinkFactory sink_factory = {});

    void set_accept_callback(AcceptCallback cb) { accept_ = std::move(cb); }

    void start() override;

    [[nodiscard]] const ReceiverPipeline& pipeline() const { return pipeline_; }

    /// Where the output lands once the header is known.
    [[nodiscard]] std::filesystem::path output_path() const;

private:
    ReceiverSession(asio::io_context& io,
                    SessionConfig config,
                    std::string code,
                    PeerConnectionFactory factory,
                    ReceiverPipeline::SinkFactory sink_factory);

    void on_joined(TransferError error, const nlohmann::json& metadata);
    void on_decision(bool accept);
    void take_offer(const std::string& offer);
    void answer_offer(const std::string& offer);
    void on_data_channel(std::shared_ptr<DataChannel> channel);

    void on_relay_message(const nlohmann::json& message) override;
    void on_channel_open() override;
    void on_channel_message(DecodedMessage decoded) override;

    void handle_transfer_message(DecodedMessage& decoded);
    void send_verdict(TransferError result, const std::string& detail);

    /// Output assembly runs in posted steps so the channel keeps moving
    /// and the sender gets keepalives while a large file is written out.
    void schedule_assembly();
    void assemble();

    std::shared_ptr<ReceiverSession> self();

    ReceiverPipeline pipeline_;
    AcceptCallback accept_;
    bool awaiting_decision_ = false;
    bool accepted_ = false;
    std::optional<std::string> pending_offer_;
    std::vector<std::string> early_candidates_;
    std::chrono::steady_clock::time_point last_keepalive_;
};
