// test/unit/test_peer_discovery.cpp
// -----------------------------------------------------------
// Peer table, aging and announcement codec of PeerDiscovery. Nothing here
// opens a socket; see test/integration/test_discovery_network.cpp for that.

#include <gtest/gtest.h>
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

#include "config/messenger_config.hpp"
#include "discovery/external_ip.hpp"
#include "discovery/peer_discovery.hpp"
#include "network/errors.hpp"
#include "protocol/protocol_messages.hpp"

namespace {

using namespace veilchat::discovery;
using veilchat::network::DecodeError;
using veilchat::protocol::nowSeconds;

veilchat::config::MessengerConfig discoveryConfig() {
    veilchat::config::MessengerConfig cfg;
    cfg.nodeName = "alice";
    cfg.announceIntervalSeconds = 30;
    return cfg;
}

DiscoveredPeer makePeer(const std::string& id, const std::string& name, uint64_t lastSeen,
                        std::vector<std::string> capabilities = {"chat"}) {
    DiscoveredPeer peer;
    peer.id = id;
    peer.name = name;
    peer.address = "192.168.1.20";
    peer.port = 8080;
    peer.lastSeen = lastSeen;
    peer.protocolVersion = 1;
    peer.capabilities = std::move(capabilities);
    return peer;
}

AnnouncementMessage makeAnnouncement(const std::string& id, const std::string& name) {
    AnnouncementMessage ann;
    ann.peerId = id;
    ann.peerName = name;
    ann.port = 9090;
    ann.publicKey = {0xde, 0xad, 0xbe, 0xef};
    ann.protocolVersion = 1;
    ann.capabilities = {"chat", "file_transfer"};
    ann.timestamp = nowSeconds();
    return ann;
}

std::vector<uint8_t> toBytes(const std::string& text) {
    return std::vector<uint8_t>(text.begin(), text.end());
}

TEST(PeerDiscoveryTest, CleanupRemovesOnlyPeersOlderThanMaxAge) {
    PeerDiscovery discovery(discoveryConfig(), "alice-id", {}, 8080);
    uint64_t now = nowSeconds();
    discovery.recordPeer(makePeer("old", "olga", now - 400));
    discovery.recordPeer(makePeer("fresh", "fred", now));

    EXPECT_EQ(discovery.cleanupOldPeers(500), 0u);
    EXPECT_EQ(discovery.getPeerCount(), 2u);

    EXPECT_EQ(discovery.cleanupOldPeers(300), 1u);
    EXPECT_EQ(discovery.getPeerCount(), 1u);
    EXPECT_FALSE(discovery.findPeerById("old").has_value());
    EXPECT_TRUE(discovery.findPeerById("fresh").has_value());
}

TEST(PeerDiscoveryTest, ProcessAnnouncementUpsertsPeer) {
    PeerDiscovery discovery(discoveryConfig(), "alice-id", {}, 8080);

    EXPECT_TRUE(discovery.processAnnouncement(makeAnnouncement("bob-id", "bob"), "192.168.1.7"));
    auto bob = discovery.findPeerByName("bob");
    ASSERT_TRUE(bob.has_value());
    EXPECT_EQ(bob->id, "bob-id");
    EXPECT_EQ(bob->address, "192.168.1.7");
    EXPECT_EQ(bob->port, 9090);
    EXPECT_EQ(bob->publicKey, (std::vector<uint8_t>{0xde, 0xad, 0xbe, 0xef}));
    EXPECT_GE(bob->lastSeen + 1, nowSeconds());

    // Same id again from a new address replaces the entry.
    EXPECT_TRUE(discovery.processAnnouncement(makeAnnouncement("bob-id", "bob"), "192.168.1.8"));
    EXPECT_EQ(discovery.getPeerCount(), 1u);
    EXPECT_EQ(discovery.findPeerById("bob-id")->address, "192.168.1.8");
}

TEST(PeerDiscoveryTest, OwnAnnouncementIgnored) {
    PeerDiscovery discovery(discoveryConfig(), "alice-id", {}, 8080);
    EXPECT_FALSE(discovery.processAnnouncement(makeAnnouncement("alice-id", "alice"), "127.0.0.1"));
    EXPECT_EQ(discovery.getPeerCount(), 0u);
    EXPECT_EQ(discovery.getDiscoveryStatistics().announcementsReceived, 0u);
}

TEST(PeerDiscoveryTest, QueriesAndStatistics) {
    PeerDiscovery discovery(discoveryConfig(), "alice-id", {}, 8080);
    uint64_t now = nowSeconds();
    discovery.recordPeer(makePeer("p1", "bob", now, {"chat"}));
    discovery.recordPeer(makePeer("p2", "carol", now, {"chat", "file_transfer"}));
    // Silent for longer than two announce intervals.
    discovery.recordPeer(makePeer("p3", "dave", now - 120, {"file_transfer"}));

    EXPECT_EQ(discovery.getDiscoveredPeers().size(), 3u);
    EXPECT_EQ(discovery.getPeersByCapability("chat").size(), 2u);
    EXPECT_EQ(discovery.getPeersByCapability("file_transfer").size(), 2u);
    EXPECT_TRUE(discovery.getPeersByCapability("voice").empty());
    EXPECT_FALSE(discovery.findPeerByName("eve").has_value());
    EXPECT_EQ(discovery.findPeerByName("carol")->id, "p2");

    DiscoveryStatistics stats = discovery.getDiscoveryStatistics();
    EXPECT_EQ(stats.totalPeers, 3u);
    EXPECT_EQ(stats.activePeers, 2u);
    EXPECT_FALSE(stats.running);
}

TEST(PeerDiscoveryTest, StopWithoutStartIsHarmless) {
    PeerDiscovery discovery(discoveryConfig(), "alice-id", {}, 8080);
    discovery.recordPeer(makePeer("p1", "bob", nowSeconds()));
    discovery.stopDiscovery();
    EXPECT_FALSE(discovery.isRunning());
    // Only a running discovery clears its table on stop.
    EXPECT_EQ(discovery.getPeerCount(), 1u);
}

TEST(AnnouncementCodecTest, EncodeDecode) {
    AnnouncementMessage ann = makeAnnouncement("bob-id", "bob");
    AnnouncementMessage decoded = decodeAnnouncement(encodeAnnouncement(ann));
    EXPECT_EQ(decoded.peerId, ann.peerId);
    EXPECT_EQ(decoded.peerName, ann.peerName);
    EXPECT_EQ(decoded.port, ann.port);
    EXPECT_EQ(decoded.publicKey, ann.publicKey);
    EXPECT_EQ(decoded.protocolVersion, ann.protocolVersion);
    EXPECT_EQ(decoded.capabilities, ann.capabilities);
    EXPECT_EQ(decoded.timestamp, ann.timestamp);
}

TEST(AnnouncementCodecTest, CapabilitiesAreOptional) {
    nlohmann::json j = nlohmann::json::parse(encodeAnnouncement(makeAnnouncement("b", "bob")));
    j.erase("capabilities");
    AnnouncementMessage decoded = decodeAnnouncement(toBytes(j.dump()));
    EXPECT_TRUE(decoded.capabilities.empty());
}

TEST(AnnouncementCodecTest, RejectsGarbage) {
    EXPECT_THROW(decodeAnnouncement(toBytes("hello")), DecodeError);
    EXPECT_THROW(decodeAnnouncement(toBytes("{}")), DecodeError);

    nlohmann::json valid = nlohmann::json::parse(encodeAnnouncement(makeAnnouncement("b", "bob")));

    nlohmann::json noId = valid;
    noId["peer_id"] = "";
    EXPECT_THROW(decodeAnnouncement(toBytes(noId.dump())), DecodeError);

    nlohmann::json zeroPort = valid;
    zeroPort["port"] = 0;
    EXPECT_THROW(decodeAnnouncement(toBytes(zeroPort.dump())), DecodeError);

    nlohmann::json hugePort = valid;
    hugePort["port"] = 70000;
    EXPECT_THROW(decodeAnnouncement(toBytes(hugePort.dump())), DecodeError);

    nlohmann::json badKey = valid;
    badKey["public_key"] = "%%%";
    EXPECT_THROW(decodeAnnouncement(toBytes(badKey.dump())), DecodeError);
}

TEST(ExternalIpTest, ParsesPlainAndJsonBodies) {
    EXPECT_EQ(ExternalIpResolver::parseResponse("203.0.113.7\n").value_or(""), "203.0.113.7");
    EXPECT_EQ(ExternalIpResolver::parseResponse("2001:db8::1").value_or(""), "2001:db8::1");
    EXPECT_EQ(ExternalIpResolver::parseResponse(R"({"ip": "198.51.100.4"})").value_or(""),
              "198.51.100.4");
    EXPECT_EQ(ExternalIpResolver::parseResponse(R"({"origin": "198.51.100.4, 10.0.0.1"})")
                  .value_or(""),
              "198.51.100.4");
}

TEST(ExternalIpTest, RejectsNonAddresses) {
    EXPECT_FALSE(ExternalIpResolver::parseResponse("").has_value());
    EXPECT_FALSE(ExternalIpResolver::parseResponse("<html>rate limited</html>").has_value());
    EXPECT_FALSE(ExternalIpResolver::parseResponse("999.1.1.1").has_value());
    EXPECT_FALSE(ExternalIpResolver::parseResponse(R"({"address": "1.2.3.4"})").has_value());
    EXPECT_FALSE(ExternalIpResolver::parseResponse("{not json").has_value());
}

}  // namespace
