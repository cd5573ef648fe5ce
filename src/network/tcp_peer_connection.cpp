/**
 * TcpPeerConnection / TcpDataChannel: the peer-connection contract over a
 * single direct TCP stream.
 *
 * Descriptors and candidates are small JSON documents:
 *   offer     {"type":"offer","transport":"tcp","token":"<hex>","label":"..."}
 *   answer    {"type":"answer","transport":"tcp"}
 *   candidate {"address":"192.0.2.7","port":40123}
 */

#include "network/tcp_peer_connection.h"

#include <algorithm>
#include <stdexcept>
#include <utility>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include "crypto/random.h"

using json = nlohmann::json;
using asio::ip::tcp;

namespace {

constexpr std::size_t kMaxHelloSize = 256;

} // namespace

const char* to_string(PeerConnection::State state) {
    switch (state) {
        case PeerConnection::State::fresh:      return "new";
        case PeerConnection::State::connecting: return "connecting";
        case PeerConnection::State::connected:  return "connected";
        case PeerConnection::State::failed:     return "failed";
        case PeerConnection::State::closed:     return "closed";
    }
    return "unknown";
}

// ── TcpDataChannel ──────────────────────────────────────────────────────────

TcpDataChannel::TcpDataChannel(asio::io_context& io, std::string label)
    : socket_(io), label_(std::move(label)) {}

void TcpDataChannel::attach(tcp::socket socket) {
    if (closed_) {
        asio::error_code ignored;
        socket.close(ignored);
        return;
    }
    socket_ = std::move(socket);
    asio::error_code ignored;
    socket_.set_option(tcp::no_delay(true), ignored);
    open_ = true;

    read_header();

    auto self = shared_from_this();
    asio::post(socket_.get_executor(), [self] {
        if (self->open_ && self->on_open_) {
            self->on_open_();
        }
    });
}

void TcpDataChannel::send(Bytes message) {
    if (!open_ || closing_) {
        spdlog::debug("data channel '{}' not open, dropping {} bytes", label_, message.size());
        return;
    }

    buffered_ += message.size();
    if (buffered_ > low_threshold_) {
        above_threshold_ = true;
    }

    bool idle = outbox_.empty();
    outbox_.push_back(encode_frame(message.data(), message.size()));
    if (idle) {
        write_next();
    }
}

void TcpDataChannel::close() {
    if (closed_ || closing_) {
        return;
    }
    if (!open_) {
        closed_ = true;
        return;
    }
    closing_ = true;
    if (outbox_.empty()) {
        shutdown();
    }
}

void TcpDataChannel::read_header() {
    auto self = shared_from_this();
    asio::async_read(socket_, asio::buffer(header_),
        [self](const asio::error_code& ec, std::size_t) {
            if (ec) {
                self->shutdown();
                return;
            }
            uint32_t length = decode_frame_length(self->header_);
            if (length > kMaxMessageSize) {
                spdlog::error("data channel '{}': oversized message ({} bytes)", self->label_, length);
                self->shutdown();
                return;
            }
            self->read_body(length);
        });
}

void TcpDataChannel::read_body(uint32_t length) {
    auto self = shared_from_this();
    body_.resize(length);
    asio::async_read(socket_, asio::buffer(body_),
        [self](const asio::error_code& ec, std::size_t) {
            if (ec) {
                self->shutdown();
                return;
            }
            if (self->on_message_) {
                self->on_message_(std::move(self->body_));
            }
            self->body_ = Bytes();
            if (!self->closed_) {
                self->read_header();
            }
        });
}

void TcpDataChannel::write_next() {
    auto self = shared_from_this();
    asio::async_write(socket_, asio::buffer(outbox_.front()),
        [self](const asio::error_code& ec, std::size_t) {
            if (ec) {
                self->shutdown();
                return;
            }

            self->buffered_ -= self->outbox_.front().size() - kFrameHeaderSize;
            self->outbox_.pop_front();

            if (self->above_threshold_ && self->buffered_ <= self->low_threshold_) {
                self->above_threshold_ = false;
                if (self->on_low_) {
                    self->on_low_();
                }
            }

            if (!self->outbox_.empty()) {
                self->write_next();
            } else if (self->closing_) {
                self->shutdown();
            }
        });
}

void TcpDataChannel::shutdown() {
    if (closed_) {
        return;
    }
    closed_ = true;
    bool was_open = open_;
    open_ = false;

    asio::error_code ignored;
    socket_.shutdown(tcp::socket::shutdown_both, ignored);
    socket_.close(ignored);

    if (was_open && on_close_) {
        on_close_();
    }
}

// ── TcpPeerConnection ───────────────────────────────────────────────────────

TcpPeerConnection::TcpPeerConnection(asio::io_context& io, PeerConfig config)
    : io_(io), config_(std::move(config)), acceptor_(io) {}

TcpPeerConnection::~TcpPeerConnection() {
    asio::error_code ignored;
    acceptor_.close(ignored);
}

std::shared_ptr<DataChannel> TcpPeerConnection::create_data_channel(const std::string& label) {
    offerer_ = true;
    label_ = label;
    channel_ = std::make_shared<TcpDataChannel>(io_, label);
    return channel_;
}

std::string TcpPeerConnection::create_offer() {
    if (!offerer_) {
        throw std::logic_error("create_data_channel() must precede create_offer()");
    }

    token_ = CryptoRandom::token();

    tcp::endpoint endpoint(asio::ip::make_address(config_.bind_address), 0);
    acceptor_.open(endpoint.protocol());
    acceptor_.set_option(tcp::acceptor::reuse_address(true));
    acceptor_.bind(endpoint);
    acceptor_.listen();

    set_state(State::connecting);
    do_accept();

    auto self = shared_from_this();
    asio::post(io_, [self] { self->gather_candidates(); });

    return json{{"type", "offer"}, {"transport", "tcp"}, {"token", token_}, {"label", label_}}.dump();
}

std::string TcpPeerConnection::create_answer() {
    if (offerer_ || !remote_set_) {
        throw std::logic_error("create_answer() needs a remote offer");
    }
    set_state(State::connecting);
    return json{{"type", "answer"}, {"transport", "tcp"}}.dump();
}

void TcpPeerConnection::set_remote_description(const std::string& description) {
    json parsed = json::parse(description, nullptr, false);
    if (parsed.is_discarded() || !parsed.is_object() || parsed.value("transport", "") != "tcp") {
        throw std::invalid_argument("not a tcp session description");
    }

    std::string expected = offerer_ ? "answer" : "offer";
    if (parsed.value("type", "") != expected) {
        throw std::invalid_argument("expected an " + expected + " description");
    }

    remote_set_ = true;

    if (offerer_) {
        if (pending_socket_) {
            tcp::socket socket = std::move(*pending_socket_);
            pending_socket_.reset();
            channel_->attach(std::move(socket));
            set_state(State::connected);
        }
        return;
    }

    token_ = parsed.value("token", "");
    label_ = parsed.value("label", "data");
    if (token_.empty()) {
        throw std::invalid_argument("offer carries no token");
    }

    std::vector<std::string> buffered;
    buffered.swap(pending_candidates_);
    for (const auto& candidate : buffered) {
        add_remote_candidate(candidate);
    }
}

void TcpPeerConnection::add_remote_candidate(const std::string& candidate) {
    if (closed_ || offerer_) {
        return;
    }
    if (candidate.empty()) {
        end_of_candidates_ = true;
        check_failed();
        return;
    }
    if (!remote_set_) {
        pending_candidates_.push_back(candidate);
        return;
    }

    json parsed = json::parse(candidate, nullptr, false);
    asio::error_code ec;
    asio::ip::address address;
    if (!parsed.is_discarded() && parsed.is_object() && parsed.contains("address") &&
        parsed.contains("port") && parsed.at("address").is_string() &&
        parsed.at("port").is_number_unsigned()) {
        address = asio::ip::make_address(parsed.at("address").get<std::string>(), ec);
    } else {
        ec = asio::error::invalid_argument;
    }
    if (ec) {
        spdlog::warn("ignoring malformed candidate {}", candidate);
        return;
    }

    try_connect(tcp::endpoint(address, parsed.at("port").get<uint16_t>()));
}

void TcpPeerConnection::close() {
    if (closed_) {
        return;
    }
    closed_ = true;

    asio::error_code ignored;
    acceptor_.close(ignored);
    for (auto& attempt : attempts_) {
        attempt->close(ignored);
    }
    if (pending_socket_) {
        pending_socket_->close(ignored);
    }
    if (channel_) {
        channel_->close();
    }
    set_state(State::closed);
}

void TcpPeerConnection::gather_candidates() {
    if (closed_ || !acceptor_.is_open()) {
        return;
    }
    uint16_t port = acceptor_.local_endpoint().port();

    for (const auto& address : local_addresses()) {
        if (on_candidate_) {
            on_candidate_(json{{"address", address}, {"port", port}}.dump());
        }
    }
    if (on_candidate_) {
        on_candidate_("");
    }
}

std::vector<std::string> TcpPeerConnection::local_addresses() {
    std::vector<std::string> addresses = config_.advertise_addresses;
    if (!addresses.empty()) {
        return addresses;
    }

    asio::error_code ec;
    auto bind = asio::ip::make_address(config_.bind_address, ec);
    if (!ec && !bind.is_unspecified()) {
        return {bind.to_string()};
    }

    std::string host = asio::ip::host_name(ec);
    tcp::resolver resolver(io_);
    tcp::resolver::results_type results;
    if (!ec) {
        results = resolver.resolve(tcp::v4(), host, "", ec);
    }
    if (!ec) {
        for (const auto& entry : results) {
            std::string address = entry.endpoint().address().to_string();
            if (std::find(addresses.begin(), addresses.end(), address) == addresses.end()) {
                addresses.push_back(address);
            }
        }
    }
    if (std::find(addresses.begin(), addresses.end(), "127.0.0.1") == addresses.end()) {
        addresses.emplace_back("127.0.0.1");
    }
    return addresses;
}

void TcpPeerConnection::do_accept() {
    auto handshake = std::make_shared<Handshake>(io_);
    auto self = shared_from_this();
    acceptor_.async_accept(handshake->socket, [self, handshake](const asio::error_code& ec) {
        if (self->closed_ || self->connected_) {
            return;
        }
        if (ec) {
            if (ec != asio::error::operation_aborted) {
                spdlog::warn("peer accept failed: {}", ec.message());
                self->do_accept();
            }
            return;
        }
        self->read_hello(handshake);
        self->do_accept();
    });
}

void TcpPeerConnection::read_hello(std::shared_ptr<Handshake> handshake) {
    auto self = shared_from_this();
    asio::async_read(handshake->socket, asio::buffer(handshake->header),
        [self, handshake](const asio::error_code& ec, std::size_t) {
            if (ec || self->closed_) {
                return;
            }
            uint32_t length = decode_frame_length(handshake->header);
            if (length > kMaxHelloSize) {
                spdlog::warn("peer sent an oversized hello, dropping it");
                return;
            }
            handshake->body.resize(length);
            asio::async_read(handshake->socket, asio::buffer(handshake->body),
                [self, handshake](const asio::error_code& ec, std::size_t) {
                    if (ec || self->closed_) {
                        return;
                    }
                    std::string token(handshake->body.begin(), handshake->body.end());
                    if (token != self->token_) {
                        spdlog::warn("peer presented a wrong token, dropping it");
                        return;
                    }
                    self->on_authenticated(std::move(handshake->socket));
                });
        });
}

void TcpPeerConnection::on_authenticated(tcp::socket socket) {
    if (connected_) {
        asio::error_code ignored;
        socket.close(ignored);
        return;
    }
    connected_ = true;

    asio::error_code ignored;
    acceptor_.close(ignored);

    // The channel opens only once the answer has been applied.
    if (remote_set_) {
        channel_->attach(std::move(socket));
        set_state(State::connected);
    } else {
        pending_socket_.emplace(std::move(socket));
    }
}

void TcpPeerConnection::try_connect(const tcp::endpoint& endpoint) {
    if (connected_) {
        return;
    }

    auto socket = std::make_shared<tcp::socket>(io_);
    attempts_.push_back(socket);
    ++attempts_in_flight_;

    auto self = shared_from_this();
    socket->async_connect(endpoint, [self, socket, endpoint](const asio::error_code& ec) {
        --self->attempts_in_flight_;
        if (self->closed_) {
            return;
        }
        if (ec || self->connected_) {
            if (ec) {
                spdlog::debug("candidate {}:{} unreachable: {}",
                              endpoint.address().to_string(), endpoint.port(), ec.message());
            }
            self->check_failed();
            return;
        }

        self->connected_ = true;
        asio::error_code ignored;
        for (auto& other : self->attempts_) {
            if (other != socket) {
                other->close(ignored);
            }
        }

        auto hello = std::make_shared<Bytes>(encode_frame(self->token_));
        asio::async_write(*socket, asio::buffer(*hello),
            [self, socket, hello](const asio::error_code& ec, std::size_t) {
                if (self->closed_) {
                    return;
                }
                if (ec) {
                    spdlog::warn("peer hello failed: {}", ec.message());
                    self->set_state(State::failed);
                    return;
                }
                self->channel_ = std::make_shared<TcpDataChannel>(self->io_, self->label_);
                self->channel_->attach(std::move(*socket));
                self->attempts_.clear();
                self->set_state(State::connected);
                if (self->on_data_channel_) {
                    self->on_data_channel_(self->channel_);
                }
            });
    });
}

void TcpPeerConnection::check_failed() {
    if (!connected_ && end_of_candidates_ && remote_set_ && attempts_in_flight_ == 0 &&
        pending_candidates_.empty()) {
        spdlog::warn("no candidate reachable");
        set_state(State::failed);
    }
}

void TcpPeerConnection::set_state(State state) {
    if (state_ == state) {
        return;
    }
    state_ = state;
    if (on_state_) {
        on_state_(state);
    }
}

std::shared_ptr<PeerConnection> make_tcp_peer_connection(asio::io_context& io,
                                                         const PeerConfig& config) {
    return std::make_shared<TcpPeerConnection>(io, config);
}
