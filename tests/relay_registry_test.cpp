#include <gtest/gtest.h>

#include <memory>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "rendezvous/relay_registry.h"

using json = nlohmann::json;
using namespace std::chrono_literals;

namespace {

class FakePeer : public RelayPeer {
public:
    void deliver(const json& message) override { inbox.push_back(message); }

    std::vector<std::string> actions() const {
        std::vector<std::string> out;
        for (const auto& m : inbox) {
            out.push_back(m.contains("action") ? m.at("action").get<std::string>()
                                               : m.value("status", "") + ":" + m.value("code", ""));
        }
        return out;
    }

    std::vector<json> inbox;
};

class RelayRegistryTest : public ::testing::Test {
protected:
    RelayRegistry registry{60s};
    RelayRegistry::Clock::time_point t0 = RelayRegistry::Clock::now();
    std::shared_ptr<FakePeer> sender = std::make_shared<FakePeer>();
    std::shared_ptr<FakePeer> receiver = std::make_shared<FakePeer>();
    json metadata = {{"filename", "a.txt"}, {"filesize", 3}};
};

} // namespace

TEST_F(RelayRegistryTest, JoinReplaysMetadataOfferAndCandidates) {
    ASSERT_EQ(registry.register_sender("fox-owl-cat", sender, metadata, t0), RelayStatus::ok);
    ASSERT_EQ(registry.forward(sender.get(), {{"action", "offer"}, {"sdp", "OFFER"}}), RelayStatus::ok);
    ASSERT_EQ(registry.forward(sender.get(), {{"action", "candidate"}, {"candidate", "c1"}}),
              RelayStatus::ok);

    ASSERT_EQ(registry.join("fox-owl-cat", receiver, t0 + 1s), RelayStatus::ok);

    EXPECT_EQ(receiver->actions(),
              (std::vector<std::string>{"registered:", "metadata", "offer", "candidate"}));
    EXPECT_EQ(receiver->inbox[1].at("metadata"), metadata);
    EXPECT_EQ(receiver->inbox[2].at("sdp"), "OFFER");
    EXPECT_EQ(receiver->inbox[3].at("candidate"), "c1");
    EXPECT_EQ(sender->actions().back(), "peer_joined");
}

TEST_F(RelayRegistryTest, ForwardsBetweenPairedPeers) {
    registry.register_sender("a-b-c", sender, metadata, t0);
    registry.join("a-b-c", receiver, t0);
    receiver->inbox.clear();
    sender->inbox.clear();

    EXPECT_EQ(registry.forward(receiver.get(), {{"action", "answer"}, {"sdp", "ANSWER"}}), RelayStatus::ok);
    EXPECT_EQ(registry.forward(receiver.get(), {{"action", "candidate"}, {"candidate", "c2"}}),
              RelayStatus::ok);
    EXPECT_EQ(sender->actions(), (std::vector<std::string>{"answer", "candidate"}));

    EXPECT_EQ(registry.forward(sender.get(), {{"action", "cancel"}}), RelayStatus::ok);
    EXPECT_EQ(receiver->actions(), (std::vector<std::string>{"cancel"}));
}

TEST_F(RelayRegistryTest, OnlySenderCandidatesAreReplayed) {
    registry.register_sender("a-b-c", sender, metadata, t0);
    registry.forward(sender.get(), {{"action", "candidate"}, {"candidate", "early"}});
    registry.join("a-b-c", receiver, t0);
    registry.forward(sender.get(), {{"action", "candidate"}, {"candidate", "late"}});
    registry.forward(receiver.get(), {{"action", "candidate"}, {"candidate", "mine"}});

    std::vector<json> to_receiver;
    for (const auto& m : receiver->inbox) {
        if (m.value("action", "") == "candidate") to_receiver.push_back(m.at("candidate"));
    }
    EXPECT_EQ(to_receiver, (std::vector<json>{"early", "late"}));

    std::vector<json> to_sender;
    for (const auto& m : sender->inbox) {
        if (m.value("action", "") == "candidate") to_sender.push_back(m.at("candidate"));
    }
    EXPECT_EQ(to_sender, (std::vector<json>{"mine"}));
}

TEST_F(RelayRegistryTest, RejectsMisdirectedOrMalformedMessages) {
    registry.register_sender("a-b-c", sender, metadata, t0);
    registry.join("a-b-c", receiver, t0);

    EXPECT_EQ(registry.forward(receiver.get(), {{"action", "offer"}, {"sdp", "x"}}), RelayStatus::bad_request);
    EXPECT_EQ(registry.forward(sender.get(), {{"action", "answer"}, {"sdp", "x"}}), RelayStatus::bad_request);
    EXPECT_EQ(registry.forward(sender.get(), {{"action", "offer"}}), RelayStatus::bad_request);

    FakePeer stranger;
    EXPECT_EQ(registry.forward(&stranger, {{"action", "cancel"}}), RelayStatus::bad_request);
}

TEST_F(RelayRegistryTest, UnknownCodeIsNotFound) {
    EXPECT_EQ(registry.join("no-such-code", receiver, t0), RelayStatus::code_not_found);
    EXPECT_EQ(receiver->actions(), (std::vector<std::string>{"error:code_not_found"}));
}

TEST_F(RelayRegistryTest, LiveCodeIsBusy) {
    registry.register_sender("a-b-c", sender, metadata, t0);
    auto other = std::make_shared<FakePeer>();
    EXPECT_EQ(registry.register_sender("a-b-c", other, metadata, t0), RelayStatus::code_busy);
    EXPECT_EQ(registry.size(), 1u);
}

TEST_F(RelayRegistryTest, SecondReceiverIsBusy) {
    registry.register_sender("a-b-c", sender, metadata, t0);
    registry.join("a-b-c", receiver, t0);
    auto late = std::make_shared<FakePeer>();
    EXPECT_EQ(registry.join("a-b-c", late, t0), RelayStatus::code_busy);
}

TEST_F(RelayRegistryTest, RegistrationExpiresAfterTtl) {
    registry.register_sender("a-b-c", sender, metadata, t0);
    EXPECT_EQ(registry.expire(t0 + 59s), 0u);
    EXPECT_EQ(registry.expire(t0 + 60s), 1u);
    EXPECT_EQ(sender->actions().back(), "expired");
    EXPECT_EQ(registry.expire(t0 + 120s), 0u);

    EXPECT_EQ(registry.join("a-b-c", receiver, t0 + 61s), RelayStatus::code_expired);
}

TEST_F(RelayRegistryTest, JoinChecksExpiryWithoutSweep) {
    registry.register_sender("a-b-c", sender, metadata, t0);
    EXPECT_EQ(registry.join("a-b-c", receiver, t0 + 90s), RelayStatus::code_expired);
    EXPECT_EQ(sender->actions().back(), "expired");
}

TEST_F(RelayRegistryTest, JoinedCodeIsClaimedAfterReceiverLeaves) {
    registry.register_sender("a-b-c", sender, metadata, t0);
    registry.join("a-b-c", receiver, t0);
    registry.disconnect(receiver.get());
    EXPECT_EQ(sender->actions().back(), "peer_left");

    auto again = std::make_shared<FakePeer>();
    EXPECT_EQ(registry.join("a-b-c", again, t0), RelayStatus::code_expired);
    // A claimed code never expires: the sender is already paired.
    EXPECT_EQ(registry.expire(t0 + 600s), 0u);
}

TEST_F(RelayRegistryTest, SenderLeavingRemovesTheCode) {
    registry.register_sender("a-b-c", sender, metadata, t0);
    registry.join("a-b-c", receiver, t0);
    registry.disconnect(sender.get());

    EXPECT_EQ(receiver->actions().back(), "peer_left");
    EXPECT_FALSE(registry.contains("a-b-c"));
    EXPECT_EQ(registry.join("a-b-c", std::make_shared<FakePeer>(), t0), RelayStatus::code_not_found);
    // The code is free for a new sender.
    EXPECT_EQ(registry.register_sender("a-b-c", std::make_shared<FakePeer>(), metadata, t0),
              RelayStatus::ok);
}

TEST_F(RelayRegistryTest, PeerCannotRegisterTwice) {
    registry.register_sender("a-b-c", sender, metadata, t0);
    EXPECT_EQ(registry.register_sender("d-e-f", sender, metadata, t0), RelayStatus::bad_request);
}
