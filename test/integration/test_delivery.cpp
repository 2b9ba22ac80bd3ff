// test/integration/test_delivery.cpp
// -----------------------------------------------------------
// Two or more DeliveryManager nodes on 127.0.0.1 exchanging messages:
// synchronous and late acknowledgments, fallback ports, timeouts,
// blocking, handshakes, signatures and the server lifecycle.

#include <atomic>
#include <chrono>
#include <future>
#include <gtest/gtest.h>
#include <memory>
#include <mutex>
#include <optional>
#include <sys/socket.h>
#include <string>
#include <thread>
#include <variant>
#include <vector>

#include "core/address_book.hpp"
#include "crypto/identity_provider.hpp"
#include "network/delivery_manager.hpp"
#include "network/message_channel.hpp"
#include "protocol/protocol_messages.hpp"
#include "test_helpers.hpp"

namespace {

using veilchat::core::ChatMessage;
using veilchat::core::Contact;
using veilchat::core::DeliveryStatus;
using veilchat::network::DeliveryManager;
using veilchat::network::ErrorKind;
using veilchat::network::MessengerError;
using veilchat::network::TcpSocket;
using veilchat::test::loopbackAddress;
using veilchat::test::loopbackConfig;
using veilchat::test::waitFor;
namespace network = veilchat::network;
namespace protocol = veilchat::protocol;

// Records every event a manager emits.
class EventLog {
  public:
    explicit EventLog(DeliveryManager& manager) : m_manager(manager) {
        m_subscription = manager.subscribe([this](const network::Event& event) {
            std::lock_guard<std::mutex> lock(m_mutex);
            m_events.push_back(event);
        });
    }

    ~EventLog() { m_manager.unsubscribe(m_subscription); }

    EventLog(const EventLog&) = delete;
    EventLog& operator=(const EventLog&) = delete;

    template <typename T>
    std::vector<T> Of() const {
        std::lock_guard<std::mutex> lock(m_mutex);
        std::vector<T> out;
        for (const auto& event : m_events) {
            if (const T* e = std::get_if<T>(&event)) {
                out.push_back(*e);
            }
        }
        return out;
    }

  private:
    DeliveryManager& m_manager;
    size_t m_subscription = 0;
    mutable std::mutex m_mutex;
    std::vector<network::Event> m_events;
};

Contact contactAt(const std::string& name, uint16_t port) {
    Contact contact;
    contact.id = name;
    contact.name = name;
    contact.address = loopbackAddress(port);
    return contact;
}

std::optional<ChatMessage> findMessage(const DeliveryManager& manager, const std::string& contactName,
                                       const std::string& id) {
    for (const auto& msg : manager.getChatMessages(contactName)) {
        if (msg.id == id) {
            return msg;
        }
    }
    return std::nullopt;
}

DeliveryStatus statusOf(const DeliveryManager& manager, const std::string& contactName,
                        const std::string& id) {
    auto msg = findMessage(manager, contactName, id);
    return msg ? msg->status : DeliveryStatus::Pending;
}

// Reads one plain frame and hangs up without acknowledging.
void readAndHangUp(TcpSocket socket) {
    network::PlainChannel channel(std::move(socket), std::chrono::milliseconds(2000));
    channel.receiveMessage(std::chrono::milliseconds(2000));
}

std::unique_ptr<network::MessageChannel> plainChannelTo(uint16_t port) {
    network::ChannelOptions options;
    options.connectTimeout = std::chrono::milliseconds(2000);
    options.writeTimeout = std::chrono::milliseconds(2000);
    return network::openChannel("127.0.0.1", port, options);
}

TEST(DeliveryTest, SynchronousAcknowledgmentMarksDelivered) {
    DeliveryManager alice(loopbackConfig("alice"));
    DeliveryManager bob(loopbackConfig("bob"));
    EventLog bobEvents(bob);
    uint16_t bobPort = bob.startServer(0);
    ASSERT_NE(bobPort, 0);

    ChatMessage sent = alice.sendChatMessage(contactAt("bob", bobPort), "hello bob");
    EXPECT_EQ(sent.status, DeliveryStatus::Delivered);
    EXPECT_EQ(sent.from, "alice");
    EXPECT_EQ(sent.to, "bob");
    EXPECT_EQ(statusOf(alice, "bob", sent.id), DeliveryStatus::Delivered);
    EXPECT_EQ(alice.pendingAcknowledgments(), 0u);

    auto received = findMessage(bob, "alice", sent.id);
    ASSERT_TRUE(received.has_value());
    EXPECT_EQ(received->content, "hello bob");
    EXPECT_EQ(received->from, "alice");
    EXPECT_EQ(received->status, DeliveryStatus::Delivered);

    ASSERT_TRUE(waitFor([&]() { return bobEvents.Of<network::MessageReceived>().size() == 1; }));
    EXPECT_EQ(bobEvents.Of<network::MessageReceived>()[0].message.content, "hello bob");
}

TEST(DeliveryTest, SilentPeerGoesSentThenFailed) {
    auto cfg = loopbackConfig("alice");
    cfg.ackReadTimeoutMs = 300;
    cfg.ackTimeoutSeconds = 1;
    DeliveryManager alice(cfg);
    EventLog events(alice);
    veilchat::test::RawPeer silent(readAndHangUp);

    ChatMessage sent = alice.sendChatMessage(contactAt("bob", silent.Port()), "anyone there?");
    EXPECT_EQ(sent.status, DeliveryStatus::Sent);
    EXPECT_EQ(statusOf(alice, "bob", sent.id), DeliveryStatus::Sent);
    EXPECT_EQ(alice.pendingAcknowledgments(), 1u);

    ASSERT_TRUE(waitFor([&]() { return statusOf(alice, "bob", sent.id) == DeliveryStatus::Failed; }));
    EXPECT_EQ(alice.pendingAcknowledgments(), 0u);

    auto errors = events.Of<network::ErrorEvent>();
    ASSERT_EQ(errors.size(), 1u);
    EXPECT_EQ(errors[0].context, "ack-timeout:" + sent.id);
}

TEST(DeliveryTest, LateAcknowledgmentBeatsTimeout) {
    auto cfg = loopbackConfig("alice");
    cfg.ackReadTimeoutMs = 300;
    cfg.ackTimeoutSeconds = 2;
    DeliveryManager alice(cfg);
    uint16_t alicePort = alice.startServer(0);
    veilchat::test::RawPeer silent(readAndHangUp);

    ChatMessage sent = alice.sendChatMessage(contactAt("bob", silent.Port()), "ack me later");
    ASSERT_EQ(sent.status, DeliveryStatus::Sent);

    auto channel = plainChannelTo(alicePort);
    channel->sendMessage(protocol::encode(protocol::createAcknowledgment("bob", "alice", sent.id)));

    ASSERT_TRUE(
        waitFor([&]() { return statusOf(alice, "bob", sent.id) == DeliveryStatus::Delivered; }));
    EXPECT_EQ(alice.pendingAcknowledgments(), 0u);

    // The cancelled timeout must not flip it to Failed afterwards.
    std::this_thread::sleep_for(std::chrono::milliseconds(2500));
    EXPECT_EQ(statusOf(alice, "bob", sent.id), DeliveryStatus::Delivered);
}

TEST(DeliveryTest, ErrorAcknowledgmentMarksFailed) {
    auto cfg = loopbackConfig("alice");
    DeliveryManager alice(cfg);
    veilchat::test::RawPeer rejecting([](TcpSocket socket) {
        network::PlainChannel channel(std::move(socket), std::chrono::milliseconds(2000));
        protocol::ProtocolMessage msg =
            protocol::decode(channel.receiveMessage(std::chrono::milliseconds(2000)));
        channel.sendMessage(
            protocol::encode(protocol::createErrorResponse(msg.messageId, "recipient unknown")));
    });

    ChatMessage sent = alice.sendChatMessage(contactAt("bob", rejecting.Port()), "hi");
    EXPECT_EQ(sent.status, DeliveryStatus::Failed);
    EXPECT_EQ(alice.pendingAcknowledgments(), 0u);
}

TEST(DeliveryTest, FallbackExhaustionReportsFirstCause) {
    auto cfg = loopbackConfig("alice");
    cfg.fallbackPorts = {veilchat::test::closedPort(), veilchat::test::closedPort()};
    DeliveryManager alice(cfg);
    EventLog events(alice);

    Contact carol = contactAt("carol", veilchat::test::closedPort());
    try {
        alice.sendChatMessage(carol, "hello?");
        FAIL() << "send to closed ports succeeded";
    } catch (const MessengerError& ex) {
        EXPECT_EQ(ex.kind(), ErrorKind::ConnectionFailed);
        EXPECT_EQ(ex.cause(), network::ConnectCause::Refused);
        EXPECT_NE(std::string(ex.what()).find("connection refused"), std::string::npos);
    }

    auto messages = alice.getChatMessages("carol");
    ASSERT_EQ(messages.size(), 1u);
    EXPECT_EQ(messages[0].status, DeliveryStatus::Failed);
    EXPECT_EQ(alice.pendingAcknowledgments(), 0u);

    auto errors = events.Of<network::ErrorEvent>();
    ASSERT_EQ(errors.size(), 1u);
    EXPECT_EQ(errors[0].context, "send:refused");
}

TEST(DeliveryTest, FallbackPortReachesPeer) {
    DeliveryManager bob(loopbackConfig("bob"));
    uint16_t bobPort = bob.startServer(0);

    auto cfg = loopbackConfig("alice");
    cfg.fallbackPorts = {veilchat::test::closedPort(), bobPort};
    DeliveryManager alice(cfg);

    ChatMessage sent = alice.sendChatMessage(contactAt("bob", veilchat::test::closedPort()), "via fallback");
    EXPECT_EQ(sent.status, DeliveryStatus::Delivered);
    EXPECT_TRUE(findMessage(bob, "alice", sent.id).has_value());
}

TEST(DeliveryTest, NoUsableAddressIsNotFound) {
    DeliveryManager alice(loopbackConfig("alice"));
    Contact nowhere;
    nowhere.id = "dave";
    nowhere.name = "dave";

    try {
        alice.sendChatMessage(nowhere, "hi");
        FAIL() << "send without an address succeeded";
    } catch (const MessengerError& ex) {
        EXPECT_EQ(ex.kind(), ErrorKind::NotFound);
    }
    auto messages = alice.getChatMessages("dave");
    ASSERT_EQ(messages.size(), 1u);
    EXPECT_EQ(messages[0].status, DeliveryStatus::Failed);
}

TEST(DeliveryTest, ConcurrentSendsAreAllRecorded) {
    DeliveryManager alice(loopbackConfig("alice"));
    DeliveryManager bob(loopbackConfig("bob"));
    Contact bobContact = contactAt("bob", bob.startServer(0));

    std::vector<std::thread> senders;
    std::atomic<int> delivered(0);
    for (int i = 0; i < 4; ++i) {
        senders.emplace_back([&, i]() {
            ChatMessage sent = alice.sendChatMessage(bobContact, "message " + std::to_string(i));
            if (sent.status == DeliveryStatus::Delivered) {
                ++delivered;
            }
        });
    }
    for (auto& t : senders) {
        t.join();
    }

    EXPECT_EQ(delivered.load(), 4);
    EXPECT_EQ(alice.getChatMessages("bob").size(), 4u);
    EXPECT_EQ(bob.getChatMessages("alice").size(), 4u);
}

TEST(DeliveryTest, BlockedPeerIsDropped) {
    auto aliceCfg = loopbackConfig("alice");
    aliceCfg.ackReadTimeoutMs = 500;
    DeliveryManager alice(aliceCfg);
    DeliveryManager bob(loopbackConfig("bob"));
    Contact bobContact = contactAt("bob", bob.startServer(0));

    bob.blockPeer("alice");
    EXPECT_TRUE(bob.isBlocked("alice"));

    ChatMessage dropped = alice.sendChatMessage(bobContact, "let me in");
    EXPECT_EQ(dropped.status, DeliveryStatus::Sent);
    EXPECT_TRUE(bob.getChatMessages("alice").empty());

    EXPECT_TRUE(bob.unblockPeer("alice"));
    EXPECT_FALSE(bob.unblockPeer("alice"));
    ChatMessage accepted = alice.sendChatMessage(bobContact, "thanks");
    EXPECT_EQ(accepted.status, DeliveryStatus::Delivered);
    EXPECT_EQ(bob.getChatMessages("alice").size(), 1u);
}

TEST(DeliveryTest, CheckContactOnline) {
    DeliveryManager alice(loopbackConfig("alice"));
    DeliveryManager bob(loopbackConfig("bob"));
    Contact bobContact = contactAt("bob", bob.startServer(0));
    alice.addContact(bobContact);

    EXPECT_TRUE(alice.checkContactOnline(bobContact));
    EXPECT_EQ(alice.getContacts()[0].status, veilchat::core::ContactStatus::Online);

    bob.shutdown();
    EXPECT_FALSE(alice.checkContactOnline(bobContact));
    EXPECT_EQ(alice.getContacts()[0].status, veilchat::core::ContactStatus::Offline);
}

TEST(DeliveryTest, HandshakeRegistersBothSides) {
    auto aliceCfg = loopbackConfig("alice");
    aliceCfg.bindAddress = "0.0.0.0";
    DeliveryManager alice(aliceCfg);
    DeliveryManager bob(loopbackConfig("bob"));
    EventLog bobEvents(bob);
    uint16_t alicePort = alice.startServer(0);
    uint16_t bobPort = bob.startServer(0);

    auto contact = alice.sendHandshake(loopbackAddress(bobPort));
    ASSERT_TRUE(contact.has_value());
    EXPECT_EQ(contact->id, "bob");
    EXPECT_EQ(contact->name, "bob");
    EXPECT_EQ(contact->address, loopbackAddress(bobPort));
    EXPECT_EQ(alice.getContacts().size(), 1u);

    auto bobContacts = bob.getContacts();
    ASSERT_EQ(bobContacts.size(), 1u);
    EXPECT_EQ(bobContacts[0].id, "alice");
    // alice advertised 0.0.0.0; bob substitutes the address it saw.
    EXPECT_EQ(bobContacts[0].address, loopbackAddress(alicePort));
    ASSERT_EQ(bobEvents.Of<network::ContactAdded>().size(), 1u);

    EXPECT_THROW(alice.sendHandshake("no-port-here"), MessengerError);
}

TEST(DeliveryTest, ServerLifecycle) {
    DeliveryManager bob(loopbackConfig("bob"));
    EventLog events(bob);
    EXPECT_FALSE(bob.isRunning());

    uint16_t port = bob.startServer(0);
    EXPECT_TRUE(bob.isRunning());
    EXPECT_EQ(bob.listeningPort(), port);
    EXPECT_THROW(bob.startServer(0), MessengerError);

    auto started = events.Of<network::ServerStarted>();
    ASSERT_EQ(started.size(), 1u);
    EXPECT_EQ(started[0].port, port);

    auto begin = std::chrono::steady_clock::now();
    bob.shutdown();
    EXPECT_LT(std::chrono::steady_clock::now() - begin, std::chrono::milliseconds(2000));
    bob.shutdown();
    EXPECT_FALSE(bob.isRunning());
    EXPECT_EQ(bob.listeningPort(), 0);
    EXPECT_EQ(events.Of<network::ServerStopped>().size(), 1u);

    // The listener is gone.
    EXPECT_THROW(TcpSocket::connectTo("127.0.0.1", port, std::chrono::milliseconds(1000)),
                 MessengerError);

    // And can be started again.
    EXPECT_NE(bob.startServer(0), 0);
    EXPECT_TRUE(bob.isRunning());
}

TEST(DeliveryTest, ReadTrackingAndUnreadCount) {
    DeliveryManager alice(loopbackConfig("alice"));
    DeliveryManager bob(loopbackConfig("bob"));
    Contact bobContact = contactAt("bob", bob.startServer(0));

    ChatMessage first = alice.sendChatMessage(bobContact, "one");
    alice.sendChatMessage(bobContact, "two");

    EXPECT_EQ(bob.getUnreadCount("alice"), 2u);
    EXPECT_EQ(alice.getUnreadCount("bob"), 0u);
    EXPECT_EQ(bob.getChats(), (std::vector<std::string>{"alice_bob"}));

    EXPECT_TRUE(bob.markAsRead("alice", first.id));
    EXPECT_FALSE(bob.markAsRead("alice", first.id));
    EXPECT_FALSE(bob.markAsRead("alice", "no-such-id"));
    EXPECT_EQ(bob.getUnreadCount("alice"), 1u);
    EXPECT_EQ(statusOf(bob, "alice", first.id), DeliveryStatus::Read);
}

TEST(DeliveryTest, StatisticsTrackTraffic) {
    DeliveryManager alice(loopbackConfig("alice"));
    DeliveryManager bob(loopbackConfig("bob"));
    Contact bobContact = contactAt("bob", bob.startServer(0));

    alice.sendChatMessage(bobContact, "counting");

    auto sent = alice.getStats();
    EXPECT_EQ(sent.messagesSent, 1u);
    EXPECT_GT(sent.bytesSent, 0u);
    EXPECT_GT(sent.bytesReceived, 0u);
    EXPECT_EQ(sent.totalConnections, 1u);
    EXPECT_EQ(sent.activeConnections, 0u);

    ASSERT_TRUE(waitFor([&]() { return bob.getStats().activeConnections == 0; }));
    auto received = bob.getStats();
    EXPECT_EQ(received.messagesReceived, 1u);
    EXPECT_EQ(received.messagesSent, 1u);  // the acknowledgment
    EXPECT_EQ(received.totalConnections, 1u);

    alice.resetStats();
    EXPECT_EQ(alice.getStats().messagesSent, 0u);
    EXPECT_EQ(alice.getStats().totalConnections, 0u);
}

TEST(DeliveryTest, SendByNameUsesAddressBook) {
    DeliveryManager bob(loopbackConfig("bob"));
    uint16_t bobPort = bob.startServer(0);

    auto book = std::make_shared<veilchat::core::StaticAddressBook>();
    book->setAddress("bob", loopbackAddress(bobPort));
    DeliveryManager alice(loopbackConfig("alice"), nullptr, book);

    ChatMessage sent = alice.sendChatMessageByName("bob", "found you");
    EXPECT_EQ(sent.status, DeliveryStatus::Delivered);

    try {
        alice.sendChatMessageByName("carol", "where are you");
        FAIL() << "unknown name resolved";
    } catch (const MessengerError& ex) {
        EXPECT_EQ(ex.kind(), ErrorKind::NotFound);
    }

    DeliveryManager noBook(loopbackConfig("eve"));
    EXPECT_THROW(noBook.sendChatMessageByName("bob", "hi"), MessengerError);
}

TEST(DeliveryTest, SignaturesCheckedForKnownKeys) {
    std::shared_ptr<veilchat::crypto::Ed25519Identity> aliceId =
        veilchat::crypto::Ed25519Identity::generate();
    std::shared_ptr<veilchat::crypto::Ed25519Identity> bobId =
        veilchat::crypto::Ed25519Identity::generate();
    auto mallory = veilchat::crypto::Ed25519Identity::generate();

    DeliveryManager alice(loopbackConfig("alice"), aliceId);
    DeliveryManager bob(loopbackConfig("bob"), bobId);
    EXPECT_EQ(alice.localId(), aliceId->peerId());
    alice.startServer(0);
    uint16_t bobPort = bob.startServer(0);

    auto bobContact = alice.sendHandshake(loopbackAddress(bobPort));
    ASSERT_TRUE(bobContact.has_value());
    EXPECT_EQ(bobContact->id, bob.localId());
    EXPECT_EQ(bobContact->publicKey, bobId->publicKey());

    ChatMessage sent = alice.sendChatMessage(*bobContact, "signed hello");
    EXPECT_EQ(sent.status, DeliveryStatus::Delivered);
    ASSERT_EQ(bob.getChatMessages("alice").size(), 1u);

    // Unsigned message claiming to be alice.
    {
        auto channel = plainChannelTo(bobPort);
        channel->sendMessage(protocol::encode(
            protocol::createTextMessage(alice.localId(), bob.localId(), "unsigned", "forged-1")));
        EXPECT_THROW(channel->receiveMessage(std::chrono::milliseconds(1000)), MessengerError);
    }
    // Signed, but by someone else's key.
    {
        protocol::ProtocolMessage forged =
            protocol::createTextMessage(alice.localId(), bob.localId(), "wrong key", "forged-2");
        forged.signature = mallory->sign(protocol::encodeForSigning(forged));
        auto channel = plainChannelTo(bobPort);
        channel->sendMessage(protocol::encode(forged));
        EXPECT_THROW(channel->receiveMessage(std::chrono::milliseconds(1000)), MessengerError);
    }

    EXPECT_EQ(bob.getChatMessages("alice").size(), 1u);
}

TEST(DeliveryTest, InvalidInboundMessagesAreDropped) {
    DeliveryManager bob(loopbackConfig("bob"));
    uint16_t bobPort = bob.startServer(0);

    {
        auto channel = plainChannelTo(bobPort);
        const std::string junk = "{\"hello\": \"world\"}";
        channel->sendMessage(std::vector<uint8_t>(junk.begin(), junk.end()));
        EXPECT_THROW(channel->receiveMessage(std::chrono::milliseconds(1000)), MessengerError);
    }
    {
        protocol::ProtocolMessage noSender = protocol::createTextMessage("", "bob", "who am i", "x-1");
        auto channel = plainChannelTo(bobPort);
        channel->sendMessage(protocol::encode(noSender));
        EXPECT_THROW(channel->receiveMessage(std::chrono::milliseconds(1000)), MessengerError);
    }
    EXPECT_TRUE(bob.getChats().empty());

    // The server keeps serving after bad input.
    DeliveryManager alice(loopbackConfig("alice"));
    EXPECT_EQ(alice.sendChatMessage(contactAt("bob", bobPort), "still there?").status,
              DeliveryStatus::Delivered);
}

TEST(DeliveryTest, ConcurrentSilentPeersEachGetAPendingEntry) {
    auto cfg = loopbackConfig("alice");
    cfg.ackReadTimeoutMs = 300;
    cfg.ackTimeoutSeconds = 2;
    DeliveryManager alice(cfg);
    EventLog events(alice);
    veilchat::test::RawPeer bob(readAndHangUp);
    veilchat::test::RawPeer carol(readAndHangUp);

    ChatMessage toBob;
    ChatMessage toCarol;
    std::thread first([&]() { toBob = alice.sendChatMessage(contactAt("bob", bob.Port()), "hi bob"); });
    std::thread second(
        [&]() { toCarol = alice.sendChatMessage(contactAt("carol", carol.Port()), "hi carol"); });
    first.join();
    second.join();

    EXPECT_EQ(toBob.status, DeliveryStatus::Sent);
    EXPECT_EQ(toCarol.status, DeliveryStatus::Sent);
    EXPECT_EQ(alice.pendingAcknowledgments(), 2u);

    ASSERT_TRUE(waitFor([&]() {
        return statusOf(alice, "bob", toBob.id) == DeliveryStatus::Failed &&
               statusOf(alice, "carol", toCarol.id) == DeliveryStatus::Failed;
    }));
    EXPECT_EQ(alice.pendingAcknowledgments(), 0u);
    ASSERT_TRUE(waitFor([&]() { return events.Of<network::ErrorEvent>().size() == 2; }));
}

TEST(DeliveryTest, HandlerMayShutDownFromServerStarted) {
    DeliveryManager bob(loopbackConfig("bob"));
    EventLog events(bob);
    bob.subscribe([&bob](const network::Event& event) {
        if (std::holds_alternative<network::ServerStarted>(event)) {
            bob.shutdown();
        }
    });

    auto started = std::async(std::launch::async, [&bob]() { return bob.startServer(0); });
    ASSERT_EQ(started.wait_for(std::chrono::seconds(3)), std::future_status::ready);
    EXPECT_NE(started.get(), 0);
    EXPECT_FALSE(bob.isRunning());
    EXPECT_EQ(events.Of<network::ServerStopped>().size(), 1u);
}

TEST(DeliveryTest, HandlerMayRestartFromServerStopped) {
    std::atomic<bool> restarted(false);
    DeliveryManager bob(loopbackConfig("bob"));
    bob.subscribe([&](const network::Event& event) {
        if (std::holds_alternative<network::ServerStopped>(event) && !restarted.exchange(true)) {
            bob.startServer(0);
        }
    });
    bob.startServer(0);

    auto stopped = std::async(std::launch::async, [&bob]() { bob.shutdown(); });
    ASSERT_EQ(stopped.wait_for(std::chrono::seconds(3)), std::future_status::ready);
    EXPECT_TRUE(bob.isRunning());
}

TEST(DeliveryTest, ResetAfterSendingStillRecordsMessage) {
    DeliveryManager bob(loopbackConfig("bob"));
    EventLog events(bob);
    uint16_t bobPort = bob.startServer(0);

    {
        TcpSocket socket = TcpSocket::connectTo("127.0.0.1", bobPort, std::chrono::milliseconds(2000));
        const int fd = socket.fd();
        network::PlainChannel channel(std::move(socket), std::chrono::milliseconds(2000));
        channel.sendMessage(
            protocol::encode(protocol::createTextMessage("alice", "bob", "gone already", "reset-1")));
        // Close with RST so the acknowledgment write fails.
        linger hardClose{1, 0};
        ASSERT_EQ(::setsockopt(fd, SOL_SOCKET, SO_LINGER, &hardClose, sizeof(hardClose)), 0);
    }

    ASSERT_TRUE(waitFor([&]() {
        auto stats = bob.getStats();
        return stats.totalConnections == 1 && stats.activeConnections == 0;
    }));
    // Whatever was stored was also announced.
    ASSERT_TRUE(waitFor([&]() {
        return events.Of<network::MessageReceived>().size() == bob.getChatMessages("alice").size();
    }));
    if (!bob.getChatMessages("alice").empty()) {
        EXPECT_EQ(events.Of<network::MessageReceived>()[0].message.id, "reset-1");
    }
}

TEST(DeliveryTest, IdleConnectionsDoNotDelayOtherPeers) {
    auto bobCfg = loopbackConfig("bob");
    bobCfg.inboundReadTimeoutMs = 4000;
    DeliveryManager alice(loopbackConfig("alice"));
    DeliveryManager bob(bobCfg);
    uint16_t bobPort = bob.startServer(0);

    // Closed before the managers so their handlers see EOF.
    std::vector<TcpSocket> idle;
    for (int i = 0; i < 8; ++i) {
        idle.push_back(TcpSocket::connectTo("127.0.0.1", bobPort, std::chrono::milliseconds(2000)));
    }
    ASSERT_TRUE(waitFor([&]() { return bob.getStats().activeConnections == 8; }));

    auto begin = std::chrono::steady_clock::now();
    ChatMessage sent = alice.sendChatMessage(contactAt("bob", bobPort), "not stuck behind them");
    EXPECT_EQ(sent.status, DeliveryStatus::Delivered);
    EXPECT_LT(std::chrono::steady_clock::now() - begin, std::chrono::milliseconds(1500));
    idle.clear();
}

TEST(DeliveryTest, ConnectionsBeyondCapAreClosed) {
    auto bobCfg = loopbackConfig("bob");
    bobCfg.inboundReadTimeoutMs = 4000;
    bobCfg.maxInboundConnections = 2;
    DeliveryManager bob(bobCfg);
    uint16_t bobPort = bob.startServer(0);

    std::vector<TcpSocket> idle;
    for (int i = 0; i < 2; ++i) {
        idle.push_back(TcpSocket::connectTo("127.0.0.1", bobPort, std::chrono::milliseconds(2000)));
    }
    ASSERT_TRUE(waitFor([&]() { return bob.getStats().activeConnections == 2; }));

    TcpSocket extra = TcpSocket::connectTo("127.0.0.1", bobPort, std::chrono::milliseconds(2000));
    try {
        extra.readExact(1, std::chrono::milliseconds(2000));
        FAIL() << "connection beyond the cap was served";
    } catch (const MessengerError& ex) {
        EXPECT_NE(ex.kind(), ErrorKind::Timeout);
    }
    EXPECT_EQ(bob.getStats().activeConnections, 2u);

    // Freed slots are reused.
    idle.clear();
    ASSERT_TRUE(waitFor([&]() { return bob.getStats().activeConnections == 0; }));
    DeliveryManager alice(loopbackConfig("alice"));
    EXPECT_EQ(alice.sendChatMessage(contactAt("bob", bobPort), "room now").status,
              DeliveryStatus::Delivered);
}

}  // namespace
