/**
 * Config loading: a nested JSON document mapped onto SessionConfig.
 */

#include "common/config.h"

#include <fstream>
#include <stdexcept>
#include <string>

#include "network/peer_connection.h"
#include "transfer/transfer_header.h"

using json = nlohmann::json;

namespace {

template <typename T>
void read_value(const json& section, const char* key, T& out) {
    if (section.contains(key)) {
        out = section.at(key).get<T>();
    }
}

void read_seconds(const json& section, const char* key, std::chrono::seconds& out) {
    if (section.contains(key)) {
        out = std::chrono::seconds(section.at(key).get<int64_t>());
    }
}

const json& section_of(const json& root, const char* name) {
    static const json empty = json::object();
    if (root.contains(name) && root.at(name).is_object()) {
        return root.at(name);
    }
    return empty;
}

} // namespace

void SessionConfig::validate() const {
    if (transfer.chunk_size == 0) {
        throw std::invalid_argument("transfer.chunk_size must be positive");
    }
    if (transfer.chunk_size > DataChannel::kMaxMessageSize - MessageCodec::kChunkOverhead) {
        throw std::invalid_argument("transfer.chunk_size must be at most " +
            std::to_string(DataChannel::kMaxMessageSize - MessageCodec::kChunkOverhead) +
            " bytes to fit one channel message");
    }
    if (transfer.memory_budget < transfer.chunk_size) {
        throw std::invalid_argument("transfer.memory_budget must hold at least one chunk");
    }
    if (transfer.low_water >= transfer.high_water) {
        throw std::invalid_argument("transfer.low_water must be below transfer.high_water");
    }
    if (transfer.negotiation_timeout.count() <= 0 ||
        transfer.chunk_inactivity_timeout.count() <= 0) {
        throw std::invalid_argument("transfer timeouts must be positive");
    }
    if (transfer.part_write_retries < 0) {
        throw std::invalid_argument("transfer.part_write_retries cannot be negative");
    }
    if (relay.max_code_attempts <= 0) {
        throw std::invalid_argument("relay.max_code_attempts must be positive");
    }
    if (relay.registration_ttl.count() <= 0) {
        throw std::invalid_argument("relay.registration_ttl_seconds must be positive");
    }
}

SessionConfig config_from_json(const json& root) {
    SessionConfig config;

    try {
        const json& relay = section_of(root, "relay");
        read_value(relay, "host", config.relay.host);
        read_value(relay, "port", config.relay.port);
        read_seconds(relay, "registration_ttl_seconds", config.relay.registration_ttl);
        read_value(relay, "max_code_attempts", config.relay.max_code_attempts);

        const json& transfer = section_of(root, "transfer");
        read_value(transfer, "chunk_size", config.transfer.chunk_size);
        read_value(transfer, "memory_budget", config.transfer.memory_budget);
        read_value(transfer, "high_water", config.transfer.high_water);
        read_value(transfer, "low_water", config.transfer.low_water);
        read_seconds(transfer, "negotiation_timeout_seconds", config.transfer.negotiation_timeout);
        read_seconds(transfer, "chunk_inactivity_timeout_seconds",
                     config.transfer.chunk_inactivity_timeout);
        read_value(transfer, "part_write_retries", config.transfer.part_write_retries);

        const json& peer = section_of(root, "peer");
        read_value(peer, "bind_address", config.peer.bind_address);
        read_value(peer, "advertise_addresses", config.peer.advertise_addresses);

        const json& receiver = section_of(root, "receiver");
        read_value(receiver, "output_directory", config.receiver.output_directory);
        read_value(receiver, "auto_accept", config.receiver.auto_accept);

        const json& log = section_of(root, "log");
        read_value(log, "level", config.log.level);
        if (log.contains("progress_interval_ms")) {
            config.log.progress_interval =
                std::chrono::milliseconds(log.at("progress_interval_ms").get<int64_t>());
        }
    } catch (const json::exception& e) {
        throw std::invalid_argument(std::string("bad config value: ") + e.what());
    }

    config.validate();
    return config;
}

SessionConfig load_config(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        throw std::invalid_argument("cannot open config file: " + path);
    }

    json root;
    try {
        root = json::parse(file);
    } catch (const json::parse_error& e) {
        throw std::invalid_argument("cannot parse config file " + path + ": " + e.what());
    }
    return config_from_json(root);
}
