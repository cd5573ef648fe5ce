/**
 * RendezvousClient: register / join / relay over the relay's JSON frames.
 *
 * Resolves the relay address, opens one TCP connection per session and
 * writes length-prefixed JSON payloads.
 */

#include "rendezvous/rendezvous_client.h"

#include <utility>

#include <spdlog/spdlog.h>

#include "rendezvous/relay_protocol.h"

using json = nlohmann::json;

RendezvousClient::RendezvousClient(asio::io_context& io,
                                   std::string host,
                                   uint16_t port,
                                   int max_code_attempts,
                                   CodeGenerator generator)
    : resolver_(io),
      socket_(io),
      host_(std::move(host)),
      port_(port),
      max_code_attempts_(max_code_attempts),
      generator_(std::move(generator)) {}

void RendezvousClient::register_sender(const json& metadata, RegisterHandler handler) {
    metadata_ = metadata;
    register_handler_ = std::move(handler);
    pending_ = Pending::register_sender;

    auto self = shared_from_this();
    connect([self](const asio::error_code& ec) {
        if (ec) {
            spdlog::error("Cannot reach relay {}:{}: {}", self->host_, self->port_, ec.message());
            self->fail_pending(TransferError::relay_unreachable);
            return;
        }
        self->send_register();
    });
}

void RendezvousClient::join(const std::string& code, JoinHandler handler) {
    code_ = code;
    join_handler_ = std::move(handler);
    pending_ = Pending::join_response;

    auto self = shared_from_this();
    connect([self](const asio::error_code& ec) {
        if (ec) {
            spdlog::error("Cannot reach relay {}:{}: {}", self->host_, self->port_, ec.message());
            self->fail_pending(TransferError::relay_unreachable);
            return;
        }
        self->send({{"action", RelayAction::kRegister},
                    {"role", "receiver"},
                    {"session", self->code_}});
    });
}

void RendezvousClient::relay(json message) {
    if (!is_open()) {
        spdlog::debug("[{}] relay link closed, dropping outgoing {}", code_,
                      message.value("action", "?"));
        return;
    }
    message["session"] = code_;
    send(message);
}

void RendezvousClient::set_on_message(MessageCallback cb) {
    on_message_ = std::move(cb);
}

void RendezvousClient::set_on_closed(ClosedCallback cb) {
    on_closed_ = std::move(cb);
}

void RendezvousClient::close() {
    if (closed_ || closing_) {
        return;
    }
    pending_ = Pending::none;
    on_message_ = nullptr;
    on_closed_ = nullptr;

    if (connected_ && !outbox_.empty()) {
        closing_ = true;
        return;
    }
    shutdown();
}

void RendezvousClient::shutdown() {
    closed_ = true;

    asio::error_code ignored;
    resolver_.cancel();
    socket_.shutdown(asio::ip::tcp::socket::shutdown_both, ignored);
    socket_.close(ignored);
}

void RendezvousClient::connect(std::function<void(const asio::error_code&)> handler) {
    auto self = shared_from_this();
    resolver_.async_resolve(host_, std::to_string(port_),
        [self, handler = std::move(handler)](const asio::error_code& ec,
                                             asio::ip::tcp::resolver::results_type results) {
            if (self->closed_) {
                return;
            }
            if (ec) {
                handler(ec);
                return;
            }
            asio::async_connect(self->socket_, results,
                [self, handler](const asio::error_code& ec, const asio::ip::tcp::endpoint&) {
                    if (self->closed_) {
                        return;
                    }
                    if (!ec) {
                        self->connected_ = true;
                        self->read_header();
                    }
                    handler(ec);
                });
        });
}

void RendezvousClient::send_register() {
    ++attempts_;
    code_ = generator_.generate();
    send({{"action", RelayAction::kRegister},
          {"role", "sender"},
          {"session", code_},
          {"metadata", metadata_}});
}

void RendezvousClient::read_header() {
    auto self = shared_from_this();
    asio::async_read(socket_, asio::buffer(header_),
        [self](const asio::error_code& ec, std::size_t) {
            if (self->closed_) {
                return;
            }
            if (ec) {
                self->on_link_lost();
                return;
            }
            uint32_t length = decode_frame_length(self->header_);
            if (length > kMaxRelayFrameSize) {
                spdlog::error("[{}] relay sent an oversized frame ({} bytes)", self->code_, length);
                self->on_link_lost();
                return;
            }
            self->read_body(length);
        });
}

void RendezvousClient::read_body(uint32_t length) {
    auto self = shared_from_this();
    body_.resize(length);
    asio::async_read(socket_, asio::buffer(body_),
        [self](const asio::error_code& ec, std::size_t) {
            if (self->closed_) {
                return;
            }
            if (ec) {
                self->on_link_lost();
                return;
            }

            json frame = json::parse(self->body_.begin(), self->body_.end(), nullptr, false);
            if (frame.is_discarded() || !frame.is_object()) {
                spdlog::warn("[{}] ignoring malformed relay frame", self->code_);
            } else {
                self->handle_frame(frame);
            }

            if (!self->closed_) {
                self->read_header();
            }
        });
}

void RendezvousClient::handle_frame(const json& frame) {
    if (frame.contains("status")) {
        handle_response(frame);
        return;
    }

    if (pending_ == Pending::join_metadata && frame.value("action", "") == RelayAction::kMetadata) {
        pending_ = Pending::none;
        auto handler = std::move(join_handler_);
        handler(TransferError::none, frame.value("metadata", json::object()));
        return;
    }

    if (on_message_) {
        on_message_(frame);
    }
}

void RendezvousClient::handle_response(const json& frame) {
    std::string status = frame.value("status", "");
    std::string error_code = frame.value("code", "");
    std::string message = frame.value("message", "");

    switch (pending_) {
        case Pending::register_sender:
            if (status == "registered") {
                pending_ = Pending::none;
                spdlog::info("[{}] registered with relay", code_);
                auto handler = std::move(register_handler_);
                handler(TransferError::none, code_);
            } else if (error_code == "code_busy") {
                if (attempts_ >= max_code_attempts_) {
                    spdlog::error("No free rendezvous code after {} attempts", attempts_);
                    fail_pending(TransferError::code_exhausted);
                } else {
                    spdlog::debug("Code {} taken, minting another", code_);
                    send_register();
                }
            } else {
                spdlog::error("Register error: {}", message);
                fail_pending(transfer_error_for_status(error_code));
            }
            break;

        case Pending::join_response:
            if (status == "registered") {
                pending_ = Pending::join_metadata;
            } else {
                spdlog::error("[{}] join refused: {}", code_, message);
                fail_pending(transfer_error_for_status(error_code));
            }
            break;

        default:
            if (status == "error") {
                spdlog::warn("[{}] relay error: {}", code_, message);
            }
            break;
    }
}

void RendezvousClient::send(const json& message) {
    bool idle = outbox_.empty();
    outbox_.push_back(encode_frame(dump_relay_message(message)));
    if (idle) {
        write_next();
    }
}

void RendezvousClient::write_next() {
    auto self = shared_from_this();
    asio::async_write(socket_, asio::buffer(outbox_.front()),
        [self](const asio::error_code& ec, std::size_t) {
            if (self->closed_) {
                return;
            }
            if (ec) {
                self->on_link_lost();
                return;
            }
            self->outbox_.pop_front();
            if (!self->outbox_.empty()) {
                self->write_next();
            } else if (self->closing_) {
                self->shutdown();
            }
        });
}

void RendezvousClient::fail_pending(TransferError error) {
    Pending pending = pending_;
    pending_ = Pending::none;

    if (pending == Pending::register_sender && register_handler_) {
        auto handler = std::move(register_handler_);
        handler(error, code_);
    } else if ((pending == Pending::join_response || pending == Pending::join_metadata) &&
               join_handler_) {
        auto handler = std::move(join_handler_);
        handler(error, json::object());
    }
}

void RendezvousClient::on_link_lost() {
    if (closed_) {
        return;
    }
    bool quiet = closing_;
    shutdown();
    if (quiet) {
        return;
    }

    if (pending_ != Pending::none) {
        fail_pending(TransferError::relay_unreachable);
        return;
    }
    spdlog::debug("[{}] relay link closed", code_);
    if (on_closed_) {
        on_closed_();
    }
}
