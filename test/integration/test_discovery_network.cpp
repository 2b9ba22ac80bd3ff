// test/integration/test_discovery_network.cpp
// -----------------------------------------------------------
// PeerDiscovery over real UDP sockets on loopback, and the external IP
// resolver against a local HTTP stub.

#include <chrono>
#include <gtest/gtest.h>
#include <string>
#include <thread>
#include <vector>

#include "discovery/external_ip.hpp"
#include "discovery/peer_discovery.hpp"
#include "network/errors.hpp"
#include "network/socket.hpp"
#include "protocol/protocol_messages.hpp"
#include "test_helpers.hpp"

namespace {

using veilchat::discovery::AnnouncementMessage;
using veilchat::discovery::ExternalIpResolver;
using veilchat::discovery::PeerDiscovery;
using veilchat::network::MessengerError;
using veilchat::network::TcpSocket;
using veilchat::network::UdpSocket;
using veilchat::test::waitFor;

AnnouncementMessage announcementFrom(const std::string& id, const std::string& name) {
    AnnouncementMessage ann;
    ann.peerId = id;
    ann.peerName = name;
    ann.port = 9191;
    ann.protocolVersion = 1;
    ann.capabilities = {"chat"};
    ann.timestamp = veilchat::protocol::nowSeconds();
    return ann;
}

void sendDatagram(uint16_t port, const std::vector<uint8_t>& data) {
    UdpSocket socket;
    socket.open(false);
    ASSERT_TRUE(socket.sendTo("127.0.0.1", port, data));
}

TEST(DiscoveryNetworkTest, ReceivesAnnouncementsAndIgnoresItself) {
    PeerDiscovery discovery(veilchat::test::loopbackConfig("alice"), "alice-id", {0x01, 0x02}, 8080);
    discovery.startDiscovery();
    ASSERT_TRUE(discovery.isRunning());
    ASSERT_NE(discovery.listeningPort(), 0);

    sendDatagram(discovery.listeningPort(),
                 veilchat::discovery::encodeAnnouncement(announcementFrom("bob-id", "bob")));
    ASSERT_TRUE(waitFor([&]() { return discovery.findPeerById("bob-id").has_value(); }));

    auto bob = discovery.findPeerById("bob-id");
    EXPECT_EQ(bob->name, "bob");
    EXPECT_EQ(bob->address, "127.0.0.1");
    EXPECT_EQ(bob->port, 9191);

    // Our own announcement loops back to us over 127.0.0.1 and must be skipped.
    ASSERT_TRUE(
        waitFor([&]() { return discovery.getDiscoveryStatistics().announcementsSent >= 1; }));
    std::this_thread::sleep_for(std::chrono::milliseconds(200));
    EXPECT_FALSE(discovery.findPeerById("alice-id").has_value());
    EXPECT_EQ(discovery.getPeerCount(), 1u);
    EXPECT_TRUE(discovery.getDiscoveryStatistics().running);

    discovery.stopDiscovery();
    EXPECT_FALSE(discovery.isRunning());
    EXPECT_EQ(discovery.getPeerCount(), 0u);
    discovery.stopDiscovery();
}

TEST(DiscoveryNetworkTest, CountsInvalidDatagrams) {
    PeerDiscovery discovery(veilchat::test::loopbackConfig("alice"), "alice-id", {}, 8080);
    discovery.startDiscovery();

    const std::string junk = "not an announcement";
    sendDatagram(discovery.listeningPort(), std::vector<uint8_t>(junk.begin(), junk.end()));
    ASSERT_TRUE(
        waitFor([&]() { return discovery.getDiscoveryStatistics().invalidDatagrams == 1; }));
    EXPECT_EQ(discovery.getPeerCount(), 0u);
}

TEST(DiscoveryNetworkTest, StartTwiceIsNoOp) {
    PeerDiscovery discovery(veilchat::test::loopbackConfig("alice"), "alice-id", {}, 8080);
    discovery.startDiscovery();
    uint16_t port = discovery.listeningPort();
    discovery.startDiscovery();
    EXPECT_EQ(discovery.listeningPort(), port);
}

// Answers one HTTP request per connection with a fixed body.
void serveBody(TcpSocket socket, const std::string& body) {
    std::string request;
    while (request.find("\r\n\r\n") == std::string::npos) {
        std::vector<uint8_t> byte = socket.readExact(1, std::chrono::milliseconds(2000));
        request.push_back(static_cast<char>(byte[0]));
    }
    const std::string response = "HTTP/1.1 200 OK\r\nContent-Length: " +
                                 std::to_string(body.size()) +
                                 "\r\nConnection: close\r\n\r\n" + body;
    socket.sendAll(std::vector<uint8_t>(response.begin(), response.end()),
                   std::chrono::milliseconds(2000));
}

TEST(ExternalIpNetworkTest, FirstWorkingServiceWins) {
    veilchat::test::RawPeer echo([](TcpSocket socket) { serveBody(std::move(socket), "203.0.113.7"); });
    ExternalIpResolver resolver(
        {"http://127.0.0.1:" + std::to_string(veilchat::test::closedPort()) + "/",
         "http://127.0.0.1:" + std::to_string(echo.Port()) + "/"},
        2);
    EXPECT_EQ(resolver.resolve(), "203.0.113.7");
}

TEST(ExternalIpNetworkTest, ResolversOnSeveralThreads) {
    veilchat::test::RawPeer echo([](TcpSocket socket) { serveBody(std::move(socket), "198.51.100.4"); });
    const std::string url = "http://127.0.0.1:" + std::to_string(echo.Port()) + "/";

    std::vector<std::string> answers(4);
    std::vector<std::thread> threads;
    for (size_t i = 0; i < answers.size(); ++i) {
        threads.emplace_back([&, i]() {
            try {
                answers[i] = ExternalIpResolver({url}, 5).resolve();
            } catch (const MessengerError& ex) {
                answers[i] = ex.what();
            }
        });
    }
    for (auto& t : threads) {
        t.join();
    }
    for (const auto& answer : answers) {
        EXPECT_EQ(answer, "198.51.100.4");
    }
}

TEST(ExternalIpNetworkTest, UnparseableAnswersFail) {
    veilchat::test::RawPeer html(
        [](TcpSocket socket) { serveBody(std::move(socket), "<html>busy</html>"); });
    ExternalIpResolver resolver(
        {"http://127.0.0.1:" + std::to_string(veilchat::test::closedPort()) + "/",
         "http://127.0.0.1:" + std::to_string(html.Port()) + "/"},
        2);
    try {
        resolver.resolve();
        FAIL() << "resolved an address from a non-address body";
    } catch (const MessengerError& ex) {
        EXPECT_EQ(ex.kind(), veilchat::network::ErrorKind::ConnectionFailed);
    }
}

}  // namespace
