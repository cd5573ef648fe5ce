/**
 * RelayServer: accepts relay clients, one RelayConnection each.
 *
 * Uses standalone ASIO for async I/O. Each connection reads
 * length-prefixed JSON messages off the wire and routes them through the
 * shared RelayRegistry.
 */

#include "rendezvous/relay_server.h"

#include <algorithm>

#include <spdlog/spdlog.h>

#include "rendezvous/relay_protocol.h"

using json = nlohmann::json;

// ── RelayConnection ─────────────────────────────────────────────────────────

RelayConnection::RelayConnection(asio::ip::tcp::socket socket, RelayRegistry& registry)
    : socket_(std::move(socket)), registry_(registry) {}

void RelayConnection::start() {
    read_header();
}

void RelayConnection::close() {
    auto self = shared_from_this();
    asio::post(socket_.get_executor(), [self] { self->shutdown(); });
}

void RelayConnection::deliver(const json& message) {
    auto self = shared_from_this();
    Bytes frame = encode_frame(dump_relay_message(message));
    asio::post(socket_.get_executor(), [self, frame = std::move(frame)]() mutable {
        if (self->closed_) {
            return;
        }
        bool idle = self->outbox_.empty();
        self->outbox_.push_back(std::move(frame));
        if (idle) {
            self->write_next();
        }
    });
}

void RelayConnection::read_header() {
    auto self = shared_from_this();
    asio::async_read(socket_, asio::buffer(header_),
        [self](const asio::error_code& ec, std::size_t) {
            if (ec) {
                self->shutdown();
                return;
            }
            uint32_t length = decode_frame_length(self->header_);
            if (length > kMaxRelayFrameSize) {
                spdlog::warn("relay: dropping client that sent a {} byte frame", length);
                self->shutdown();
                return;
            }
            self->read_body(length);
        });
}

void RelayConnection::read_body(uint32_t length) {
    auto self = shared_from_this();
    body_.resize(length);
    asio::async_read(socket_, asio::buffer(body_),
        [self](const asio::error_code& ec, std::size_t) {
            if (ec) {
                self->shutdown();
                return;
            }

            json message = json::parse(self->body_.begin(), self->body_.end(), nullptr, false);
            if (message.is_discarded() || !message.is_object()) {
                self->deliver(make_error_response(RelayStatus::bad_request, "Invalid message"));
            } else {
                self->handle_message(message);
            }

            if (!self->closed_) {
                self->read_header();
            }
        });
}

void RelayConnection::handle_message(const json& message) {
    std::string action = message.value("action", "");
    spdlog::info("[{}] received action: {}", message.value("session", ""), action);

    if (action == RelayAction::kRegister) {
        handle_register(message);
        return;
    }

    RelayStatus status = registry_.forward(this, message);
    if (status != RelayStatus::ok) {
        deliver(make_error_response(status, "cannot handle action '" + action + "'"));
    }
}

void RelayConnection::handle_register(const json& message) {
    RelayRole role;
    if (!message.contains("session") || !message.at("session").is_string() ||
        !relay_role_from_string(message.value("role", ""), role)) {
        deliver(make_error_response(RelayStatus::bad_request, "register needs a session and a role"));
        return;
    }
    std::string code = message.at("session").get<std::string>();

    if (role == RelayRole::sender) {
        json metadata = message.contains("metadata") ? message.at("metadata") : json::object();
        registry_.register_sender(code, shared_from_this(), metadata);
        return;
    }

    RelayStatus status = registry_.join(code, shared_from_this());
    if (status == RelayStatus::code_not_found) {
        close_after_write_ = true;
    }
}

void RelayConnection::write_next() {
    auto self = shared_from_this();
    asio::async_write(socket_, asio::buffer(outbox_.front()),
        [self](const asio::error_code& ec, std::size_t) {
            if (ec) {
                self->shutdown();
                return;
            }
            self->outbox_.pop_front();
            if (!self->outbox_.empty()) {
                self->write_next();
            } else if (self->close_after_write_) {
                self->shutdown();
            }
        });
}

void RelayConnection::shutdown() {
    if (closed_) {
        return;
    }
    closed_ = true;
    registry_.disconnect(this);

    asio::error_code ignored;
    socket_.shutdown(asio::ip::tcp::socket::shutdown_both, ignored);
    socket_.close(ignored);
}

// ── RelayServer ─────────────────────────────────────────────────────────────

RelayServer::RelayServer(asio::io_context& io,
                         const asio::ip::tcp::endpoint& endpoint,
                         std::chrono::seconds registration_ttl)
    : acceptor_(io, endpoint),
      expiry_timer_(io),
      registry_(registration_ttl) {}

void RelayServer::start() {
    running_ = true;
    spdlog::info("Signaling relay listening on {}:{}",
                 acceptor_.local_endpoint().address().to_string(), port());
    do_accept();
    schedule_expiry();
}

void RelayServer::stop() {
    running_ = false;
    asio::error_code ignored;
    acceptor_.close(ignored);
    expiry_timer_.cancel();

    for (auto& weak : connections_) {
        if (auto connection = weak.lock()) {
            connection->close();
        }
    }
    connections_.clear();
}

uint16_t RelayServer::port() const {
    return acceptor_.local_endpoint().port();
}

void RelayServer::do_accept() {
    acceptor_.async_accept([this](const asio::error_code& ec, asio::ip::tcp::socket socket) {
        if (ec) {
            if (running_) {
                spdlog::warn("relay: accept failed: {}", ec.message());
                do_accept();
            }
            return;
        }

        auto connection = std::make_shared<RelayConnection>(std::move(socket), registry_);
        connections_.erase(
            std::remove_if(connections_.begin(), connections_.end(),
                           [](const std::weak_ptr<RelayConnection>& w) { return w.expired(); }),
            connections_.end());
        connections_.push_back(connection);
        connection->start();
        do_accept();
    });
}

void RelayServer::schedule_expiry() {
    expiry_timer_.expires_after(std::chrono::seconds(1));
    expiry_timer_.async_wait([this](const asio::error_code& ec) {
        if (ec || !running_) {
            return;
        }
        registry_.expire();
        schedule_expiry();
    });
}
