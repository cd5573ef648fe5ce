#include <gtest/gtest.h>

#include <fstream>

#include <nlohmann/json.hpp>

#include "common/config.h"
#include "network/peer_connection.h"
#include "transfer/transfer_header.h"
#include "test_support.h"

using json = nlohmann::json;

TEST(Config, EmptyDocumentKeepsDefaults) {
    SessionConfig config = config_from_json(json::object());
    EXPECT_EQ(config.relay.port, 25565);
    EXPECT_EQ(config.transfer.chunk_size, 65536u);
    EXPECT_EQ(config.transfer.part_write_retries, 3);
    EXPECT_EQ(config.receiver.output_directory, ".");
    EXPECT_FALSE(config.receiver.auto_accept);
}

TEST(Config, ReadsNestedSections) {
    json doc = {
        {"relay", {{"host", "relay.example"}, {"port", 4000}, {"registration_ttl_seconds", 30}}},
        {"transfer", {{"chunk_size", 1024}, {"memory_budget", 4096},
                      {"negotiation_timeout_seconds", 5}}},
        {"peer", {{"advertise_addresses", json::array({"10.0.0.2"})}}},
        {"receiver", {{"auto_accept", true}}},
        {"log", {{"level", "debug"}, {"progress_interval_ms", 250}}},
    };
    SessionConfig config = config_from_json(doc);

    EXPECT_EQ(config.relay.host, "relay.example");
    EXPECT_EQ(config.relay.port, 4000);
    EXPECT_EQ(config.relay.registration_ttl, std::chrono::seconds(30));
    EXPECT_EQ(config.transfer.chunk_size, 1024u);
    EXPECT_EQ(config.transfer.memory_budget, 4096u);
    EXPECT_EQ(config.transfer.negotiation_timeout, std::chrono::seconds(5));
    EXPECT_EQ(config.peer.advertise_addresses, std::vector<std::string>{"10.0.0.2"});
    EXPECT_TRUE(config.receiver.auto_accept);
    EXPECT_EQ(config.log.level, "debug");
    EXPECT_EQ(config.log.progress_interval, std::chrono::milliseconds(250));
}

TEST(Config, RejectsBudgetSmallerThanAChunk) {
    json doc = {{"transfer", {{"chunk_size", 4096}, {"memory_budget", 1024}}}};
    EXPECT_THROW(config_from_json(doc), std::invalid_argument);
}

TEST(Config, ChunkMustFitOneChannelMessage) {
    const std::size_t largest = DataChannel::kMaxMessageSize - MessageCodec::kChunkOverhead;
    json fits = {{"transfer", {{"chunk_size", largest}, {"memory_budget", 64 * 1024 * 1024}}}};
    EXPECT_EQ(config_from_json(fits).transfer.chunk_size, largest);

    json too_big = {{"transfer", {{"chunk_size", largest + 1}, {"memory_budget", 64 * 1024 * 1024}}}};
    EXPECT_THROW(config_from_json(too_big), std::invalid_argument);
}

TEST(Config, RejectsInvertedWaterMarks) {
    json doc = {{"transfer", {{"high_water", 100}, {"low_water", 100}}}};
    EXPECT_THROW(config_from_json(doc), std::invalid_argument);
}

TEST(Config, RejectsMistypedValue) {
    json doc = {{"relay", {{"port", "not-a-port"}}}};
    EXPECT_THROW(config_from_json(doc), std::invalid_argument);
}

TEST(Config, LoadsFromFile) {
    TempDir dir;
    auto path = dir.path() / "config.json";
    {
        std::ofstream out(path);
        out << R"({"transfer": {"chunk_size": 2048}})";
    }
    EXPECT_EQ(load_config(path.string()).transfer.chunk_size, 2048u);
    EXPECT_THROW(load_config((dir.path() / "missing.json").string()), std::invalid_argument);
}
