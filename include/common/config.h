#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

/// Where the signaling relay lives and how it mints codes.
struct RelayConfig {
    std::string host = "127.0.0.1";
    uint16_t port = 25565;
    std::chrono::seconds registration_ttl{600};
    int max_code_attempts = 5;
};

/// Chunking, flow control and deadlines for one transfer.
struct TransferConfig {
    std::size_t chunk_size = 64 * 1024;
    std::size_t memory_budget = 64 * 1024 * 1024;
    std::size_t high_water = 1024 * 1024;
    std::size_t low_water = 256 * 1024;
    std::chrono::seconds negotiation_timeout{60};
    std::chrono::seconds chunk_inactivity_timeout{30};
    int part_write_retries = 3;
};

/// Options for the direct TCP peer connection.
struct PeerConfig {
    std::string bind_address = "0.0.0.0";
    /// Empty means "resolve the host name and add loopback".
    std::vector<std::string> advertise_addresses;
};

struct ReceiverConfig {
    std::string output_directory = ".";
    bool auto_accept = false;
};

struct LogConfig {
    std::string level = "info";
    std::chrono::milliseconds progress_interval{1000};
};

/**
 * The single configuration object consumed at session construction.
 */
struct SessionConfig {
    RelayConfig relay;
    TransferConfig transfer;
    PeerConfig peer;
    ReceiverConfig receiver;
    LogConfig log;

    /// Throws std::invalid_argument when the values cannot run a transfer.
    void validate() const;
};

/// Build a config from JSON; missing keys keep their defaults.
SessionConfig config_from_json(const nlohmann::json& json);

/// Read and parse a JSON config file. Throws std::invalid_argument on failure.
SessionConfig load_config(const std::string& path);
