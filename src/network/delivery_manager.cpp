#include "network/delivery_manager.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <mutex>
#include <system_error>
#include <thread>
#include <utility>

#include "core/chat_log.hpp"
#include "core/contact_registry.hpp"
#include "core/pending_acks.hpp"
#include "masking/tls_masking.hpp"
#include "network/message_channel.hpp"
#include "protocol/protocol_messages.hpp"
#include "util/deferred_scheduler.hpp"
#include "util/hashing.hpp"
#include "util/logger.hpp"

namespace veilchat {
namespace network {

using protocol::MessageType;
using protocol::ProtocolMessage;
using util::logger::Logger;

struct DeliveryManager::State
{
    config::MessengerConfig config;
    std::string localId;
    std::string localName;
    std::shared_ptr<crypto::IdentityProvider> identity;
    std::shared_ptr<core::AddressBook> addressBook;

    core::ChatLog chats;
    core::PendingAckTable pending;
    core::ContactRegistry contacts;
    EventBus events;
    std::shared_ptr<util::DeferredScheduler> ackTimers;

    std::atomic<bool> running{false};
    std::atomic<uint16_t> port{0};
    std::atomic<int64_t> startedAt{0};

    std::atomic<uint64_t> messagesSent{0};
    std::atomic<uint64_t> messagesReceived{0};
    std::atomic<uint64_t> bytesSent{0};
    std::atomic<uint64_t> bytesReceived{0};
    std::atomic<uint64_t> totalConnections{0};
    std::atomic<uint64_t> activeConnections{0};
    std::atomic<uint32_t> inboundHandlers{0};
    std::mutex inboundMutex;
    std::condition_variable inboundIdle;

    ChannelOptions outboundOptions() const
    {
        ChannelOptions options;
        options.useMasking = config.useMasking;
        options.maskDomain = config.maskDomain;
        options.connectTimeout = std::chrono::milliseconds(config.connectTimeoutMs);
        options.writeTimeout = std::chrono::milliseconds(config.writeTimeoutMs);
        options.handshakeTimeout = std::chrono::milliseconds(config.connectTimeoutMs);
        return options;
    }

    ChannelOptions inboundOptions() const
    {
        ChannelOptions options = outboundOptions();
        options.handshakeTimeout = std::chrono::milliseconds(config.inboundReadTimeoutMs);
        return options;
    }
};

namespace {

using StatePtr = std::shared_ptr<DeliveryManager::State>;

using Endpoint = HostPort;

/// Tracks one live connection in the statistics.
class ConnectionCounter
{
public:
    explicit ConnectionCounter(DeliveryManager::State &state)
        : state_(state)
    {
        ++state_.totalConnections;
        ++state_.activeConnections;
    }
    ~ConnectionCounter() { --state_.activeConnections; }

    ConnectionCounter(const ConnectionCounter &) = delete;
    ConnectionCounter &operator=(const ConnectionCounter &) = delete;

private:
    DeliveryManager::State &state_;
};

int64_t steadySeconds()
{
    return std::chrono::duration_cast<std::chrono::seconds>(
               std::chrono::steady_clock::now().time_since_epoch())
        .count();
}

/// Configured address first, then every fallback port on the same host.
std::vector<Endpoint> deliveryEndpoints(const config::MessengerConfig &config,
                                        const std::string &address)
{
    std::vector<Endpoint> endpoints;
    Endpoint primary = splitHostPort(address);
    if (primary.host.empty()) {
        return endpoints;
    }
    if (primary.port != 0) {
        endpoints.push_back(primary);
    }
    for (uint16_t port : config.fallbackPorts) {
        if (port != primary.port) {
            endpoints.push_back(Endpoint{primary.host, port});
        }
    }
    return endpoints;
}

void signMessage(const DeliveryManager::State &state, ProtocolMessage &msg)
{
    if (state.identity) {
        msg.signature = state.identity->sign(protocol::encodeForSigning(msg));
    }
}

/**
 * A message from a contact whose key we learned must carry a valid
 * signature. Handshakes are checked against the key they carry.
 */
bool signatureAcceptable(const DeliveryManager::State &state, const ProtocolMessage &msg)
{
    if (!state.identity) {
        return true;
    }
    std::vector<uint8_t> key;
    if (const auto *hs = msg.handshake()) {
        if (!msg.signature) {
            return true;
        }
        key = hs->publicKey;
    }
    else {
        auto contact = state.contacts.FindById(msg.senderId);
        if (!contact || contact->publicKey.empty()) {
            return true;
        }
        key = contact->publicKey;
    }
    if (!msg.signature) {
        return false;
    }
    return state.identity->verify(protocol::encodeForSigning(msg), *msg.signature, key);
}

void sendOnChannel(DeliveryManager::State &state, MessageChannel &channel, ProtocolMessage msg)
{
    signMessage(state, msg);
    std::vector<uint8_t> bytes = protocol::encode(msg);
    channel.sendMessage(bytes);
    ++state.messagesSent;
    state.bytesSent += bytes.size();
}

std::string advertisedAddress(const DeliveryManager::State &state)
{
    uint16_t port = state.port.load();
    if (port == 0) {
        port = state.config.listenPort;
    }
    return joinHostPort(state.config.bindAddress, port);
}

ProtocolMessage ownHandshake(const DeliveryManager::State &state)
{
    std::vector<uint8_t> publicKey;
    if (state.identity) {
        publicKey = state.identity->publicKey();
    }
    return protocol::createHandshake(state.localId, state.localName, advertisedAddress(state),
                                     publicKey);
}

/// Contact described by a handshake; a wildcard host is replaced by the connection's.
core::Contact contactFromHandshake(const protocol::HandshakePayload &hs,
                                   const std::string &connectionPeer)
{
    core::Contact contact;
    contact.id = hs.peerId;
    contact.name = hs.peerName.empty() ? hs.peerId : hs.peerName;
    contact.publicKey = hs.publicKey;
    contact.status = core::ContactStatus::Online;
    contact.lastSeen = protocol::nowSeconds();

    Endpoint advertised = splitHostPort(hs.address);
    if (advertised.host.empty() || advertised.host == "0.0.0.0") {
        advertised.host = splitHostPort(connectionPeer).host;
    }
    contact.address = joinHostPort(advertised.host, advertised.port);
    return contact;
}

void registerContact(DeliveryManager::State &state, const core::Contact &contact)
{
    bool added = state.contacts.Upsert(contact);
    Logger::getInstance().info(std::string("[DeliveryManager] ") + (added ? "added" : "updated") +
                               " contact " + contact.name + " (" + contact.id + ") at " +
                               contact.address);
    state.events.emit(ContactAdded{contact});
}

std::string friendlyFailure(ErrorKind kind, ConnectCause cause, const std::string &detail)
{
    if (kind == ErrorKind::Timeout) {
        return "connection timeout";
    }
    if (kind == ErrorKind::MaskingError) {
        return "masking handshake failed: " + detail;
    }
    switch (cause) {
    case ConnectCause::Refused:
        return "connection refused - recipient may not be online";
    case ConnectCause::Unreachable:
        return "host unreachable";
    case ConnectCause::Resolve:
        return "could not resolve recipient address";
    default:
        return "connection failed: " + detail;
    }
}

std::string failureClass(ErrorKind kind, ConnectCause cause)
{
    if (kind == ErrorKind::Timeout) {
        return "timeout";
    }
    if (kind == ErrorKind::MaskingError) {
        return "masking";
    }
    switch (cause) {
    case ConnectCause::Refused:
        return "refused";
    case ConnectCause::Unreachable:
        return "unreachable";
    case ConnectCause::Resolve:
        return "resolve";
    default:
        return "other";
    }
}

// ---------------------------------------------------------------------------
// Inbound
// ---------------------------------------------------------------------------

void handleChat(DeliveryManager::State &state, const ProtocolMessage &msg, MessageChannel &channel)
{
    const protocol::TextPayload *text = msg.text();

    core::ChatMessage chat;
    chat.id = msg.messageId;
    chat.from = state.contacts.DisplayName(msg.senderId);
    chat.to = state.localName;
    chat.content = text->content;
    chat.type = core::ChatMessageType::Text;
    chat.timestamp = msg.timestamp;
    chat.status = core::DeliveryStatus::Delivered;
    state.chats.Append(core::chatKey(state.localName, chat.from), chat);

    if (!msg.messageId.empty()) {
        try {
            sendOnChannel(state, channel,
                          protocol::createAcknowledgment(state.localId, msg.senderId,
                                                         msg.messageId));
        }
        catch (const MessengerError &ex) {
            // Stored already; the sender will see Sent and may retry.
            Logger::getInstance().warn("[DeliveryManager] acknowledgment for " + chat.id +
                                       " not sent: " + ex.what());
        }
    }

    Logger::getInstance().info("[DeliveryManager] message " + chat.id + " from " + chat.from);
    state.events.emit(MessageReceived{chat});
}

void handleAcknowledgment(DeliveryManager::State &state, const ProtocolMessage &msg)
{
    const protocol::AckPayload *ack = msg.ack();
    auto key = state.pending.Take(ack->originalMessageId);
    if (!key) {
        util::logger::debug("[DeliveryManager] acknowledgment for unknown message " +
                            ack->originalMessageId);
        return;
    }
    state.ackTimers->Cancel(ack->originalMessageId);

    bool rejected = ack->status.compare(0, 5, "error") == 0;
    state.chats.UpdateStatus(*key, ack->originalMessageId,
                             rejected ? core::DeliveryStatus::Failed
                                      : core::DeliveryStatus::Delivered);
    Logger::getInstance().info("[DeliveryManager] late acknowledgment for " +
                               ack->originalMessageId + ": " + ack->status);
}

void dispatch(DeliveryManager::State &state, const ProtocolMessage &msg, MessageChannel &channel)
{
    switch (msg.type) {
    case MessageType::Chat:
        handleChat(state, msg, channel);
        break;
    case MessageType::Acknowledgment:
        handleAcknowledgment(state, msg);
        break;
    case MessageType::Ping: {
        const protocol::PingPayload *ping = msg.ping();
        sendOnChannel(state, channel,
                      protocol::createPong(state.localId, msg.senderId, ping->timestamp,
                                           ping->sequence));
        break;
    }
    case MessageType::Handshake: {
        const protocol::HandshakePayload *hs = msg.handshake();
        if (!protocol::isProtocolCompatible(hs->protocolVersion)) {
            Logger::getInstance().warn("[DeliveryManager] incompatible protocol version " +
                                       std::to_string(hs->protocolVersion) + " from " +
                                       msg.senderId);
            return;
        }
        registerContact(state, contactFromHandshake(*hs, channel.peerAddress()));
        sendOnChannel(state, channel, ownHandshake(state));
        break;
    }
    default:
        Logger::getInstance().info(std::string("[DeliveryManager] unsupported message type ") +
                                   protocol::messageTypeName(msg.type) + " from " +
                                   msg.senderId + " dropped");
        break;
    }
}

/// Counts a running inbound handler thread.
class InboundSlot
{
public:
    explicit InboundSlot(DeliveryManager::State &state)
        : state_(state)
    {
    }
    ~InboundSlot()
    {
        std::lock_guard<std::mutex> lock(state_.inboundMutex);
        --state_.inboundHandlers;
        state_.inboundIdle.notify_all();
    }

    InboundSlot(const InboundSlot &) = delete;
    InboundSlot &operator=(const InboundSlot &) = delete;

private:
    DeliveryManager::State &state_;
};

void handleConnection(const StatePtr &state, TcpSocket socket)
{
    InboundSlot slot(*state);
    ConnectionCounter counter(*state);
    const std::string peer = socket.peerAddress();
    try {
        auto channel = acceptChannel(std::move(socket), state->inboundOptions());
        std::vector<uint8_t> bytes =
            channel->receiveMessage(std::chrono::milliseconds(state->config.inboundReadTimeoutMs));
        state->bytesReceived += bytes.size();

        ProtocolMessage msg = protocol::decode(bytes);
        if (!protocol::isValid(msg)) {
            Logger::getInstance().warn("[DeliveryManager] invalid message from " + peer + " rejected");
            return;
        }
        if (state->contacts.IsBlocked(msg.senderId)) {
            util::logger::debug("[DeliveryManager] dropping message from blocked peer " +
                                msg.senderId);
            return;
        }
        if (!signatureAcceptable(*state, msg)) {
            Logger::getInstance().warn("[DeliveryManager] bad signature on " + msg.messageId +
                                       " from " + msg.senderId + ", dropped");
            return;
        }
        ++state->messagesReceived;
        dispatch(*state, msg, *channel);
    }
    catch (const MessengerError &ex) {
        Logger::getInstance().warn("[DeliveryManager] inbound connection from " + peer +
                                   " dropped: " + ex.what());
    }
}

void acceptLoop(StatePtr state, std::shared_ptr<TcpListener> listener,
                std::shared_ptr<WakePipe> wake, std::promise<void> done)
{
    while (state->running) {
        std::optional<TcpSocket> socket;
        try {
            socket = listener->accept(*wake);
        }
        catch (const MessengerError &ex) {
            Logger::getInstance().warn(std::string("[DeliveryManager] accept failed: ") + ex.what());
            std::this_thread::sleep_for(std::chrono::milliseconds(100));
            continue;
        }
        if (!socket || !state->running) {
            break;
        }

        const std::string peer = socket->peerAddress();
        if (state->inboundHandlers.load() >= state->config.maxInboundConnections) {
            Logger::getInstance().warn("[DeliveryManager] " +
                                       std::to_string(state->config.maxInboundConnections) +
                                       " inbound connections busy, refusing " + peer);
            continue;
        }

        // One thread per connection: a peer that never sends cannot hold up the others.
        util::logger::debug("[DeliveryManager] accepted connection from " + peer);
        ++state->inboundHandlers;
        try {
            std::thread(handleConnection, state, std::move(*socket)).detach();
        }
        catch (const std::system_error &ex) {
            --state->inboundHandlers;
            Logger::getInstance().error("[DeliveryManager] cannot start handler for " + peer +
                                        ": " + ex.what());
        }
    }
    done.set_value();
}

void expireAcknowledgment(DeliveryManager::State &state, const std::string &messageId)
{
    auto key = state.pending.Take(messageId);
    if (!key) {
        return;
    }
    state.chats.TransitionStatus(*key, messageId, core::DeliveryStatus::Sent,
                                 core::DeliveryStatus::Failed);
    Logger::getInstance().warn("[DeliveryManager] no acknowledgment for " + messageId +
                               ", marked failed");
    state.events.emit(ErrorEvent{"acknowledgment timeout for " + messageId,
                                 "ack-timeout:" + messageId});
}

/// The scheduler thread only hands the expiry to the pool; subscribers run there.
void scheduleAckTimeout(const StatePtr &state, const std::shared_ptr<util::ThreadPool> &pool,
                        const std::string &messageId)
{
    std::weak_ptr<DeliveryManager::State> weak = state;
    std::weak_ptr<util::ThreadPool> weakPool = pool;
    state->ackTimers->Schedule(
        messageId, std::chrono::seconds(state->config.ackTimeoutSeconds),
        [weak, weakPool, messageId]() {
            auto workers = weakPool.lock();
            if (!workers) {
                return;
            }
            workers->post([weak, messageId]() {
                if (StatePtr s = weak.lock()) {
                    expireAcknowledgment(*s, messageId);
                }
            });
        });
}

} // namespace

// ---------------------------------------------------------------------------
// DeliveryManager
// ---------------------------------------------------------------------------

DeliveryManager::DeliveryManager(const config::MessengerConfig &config,
                                 std::shared_ptr<crypto::IdentityProvider> identity,
                                 std::shared_ptr<core::AddressBook> addressBook)
    : state_(std::make_shared<State>())
    , pool_(std::make_shared<util::ThreadPool>(config.workerThreads))
{
    state_->config = config;
    state_->identity = std::move(identity);
    state_->addressBook = std::move(addressBook);
    state_->localName = config.nodeName;
    if (!config.peerId.empty()) {
        state_->localId = config.peerId;
    }
    else if (state_->identity) {
        state_->localId = util::hashing::sha256(state_->identity->publicKey()).substr(0, 32);
    }
    else {
        state_->localId = config.nodeName;
    }
    state_->ackTimers = std::make_shared<util::DeferredScheduler>();
    state_->ackTimers->Start();

    Logger::getInstance().info("[DeliveryManager] node " + state_->localName + " (" +
                               state_->localId + ") ready, masking " +
                               (config.useMasking ? "on" : "off"));
}

DeliveryManager::~DeliveryManager()
{
    shutdown();
    // Stop timers before the pool so no timeout task outlives the manager.
    state_->ackTimers->Stop();
    pool_.reset();
}

uint16_t DeliveryManager::startServer(uint16_t port)
{
    uint16_t bound = 0;
    {
        std::lock_guard<std::mutex> lock(lifecycleMutex_);
        if (state_->running) {
            throw MessengerError(ErrorKind::ConnectionFailed,
                                 "server already running on port " + std::to_string(state_->port.load()));
        }

        auto listener = std::make_shared<TcpListener>();
        listener->bindAndListen(state_->config.bindAddress, port);
        auto wake = std::make_shared<WakePipe>();

        listener_ = listener;
        wake_ = wake;
        bound = listener->port();
        state_->port = bound;
        state_->startedAt = steadySeconds();
        state_->running = true;

        std::promise<void> done;
        acceptDone_ = done.get_future();
        acceptThread_ = std::thread(acceptLoop, state_, listener, wake, std::move(done));
    }

    // Handlers may call shutdown() or startServer(), so the lifecycle lock is released first.
    Logger::getInstance().info("[DeliveryManager] listening on " + state_->config.bindAddress +
                               ":" + std::to_string(bound));
    state_->events.emit(ServerStarted{bound});
    return bound;
}

void DeliveryManager::shutdown()
{
    {
        std::lock_guard<std::mutex> lock(lifecycleMutex_);
        if (!state_->running) {
            return;
        }
        state_->running = false;
        wake_->notify();

        auto timeout = std::chrono::milliseconds(state_->config.shutdownTimeoutMs);
        if (acceptDone_.wait_for(timeout) == std::future_status::ready) {
            acceptThread_.join();
            listener_->close();
        }
        else {
            Logger::getInstance().warn("[DeliveryManager] accept loop did not stop within " +
                                       std::to_string(state_->config.shutdownTimeoutMs) +
                                       " ms, detaching");
            acceptThread_.detach();
        }
        listener_.reset();
        wake_.reset();
        state_->port = 0;

        std::unique_lock<std::mutex> idle(state_->inboundMutex);
        if (!state_->inboundIdle.wait_for(idle, timeout,
                                          [this] { return state_->inboundHandlers == 0; })) {
            Logger::getInstance().warn("[DeliveryManager] " +
                                       std::to_string(state_->inboundHandlers.load()) +
                                       " inbound handlers still running after shutdown");
        }
    }

    Logger::getInstance().info("[DeliveryManager] server stopped");
    state_->events.emit(ServerStopped{});
}

bool DeliveryManager::isRunning() const
{
    return state_->running;
}

uint16_t DeliveryManager::listeningPort() const
{
    return state_->port;
}

core::ChatMessage DeliveryManager::sendChatMessage(const core::Contact &contact,
                                                   const std::string &content)
{
    State &state = *state_;

    core::ChatMessage chat;
    chat.id = util::hashing::uuidV4();
    chat.from = state.localName;
    chat.to = contact.name;
    chat.content = content;
    chat.type = core::ChatMessageType::Text;
    chat.timestamp = protocol::nowSeconds();
    chat.status = core::DeliveryStatus::Pending;
    const std::string key = core::chatKey(state.localName, contact.name);
    state.chats.Append(key, chat);

    const std::string recipientId = contact.id.empty() ? contact.name : contact.id;
    ProtocolMessage msg = protocol::createTextMessage(state.localId, recipientId, content, chat.id);
    signMessage(state, msg);
    const std::vector<uint8_t> bytes = protocol::encode(msg);

    const ChannelOptions options = state.outboundOptions();
    const auto ackWindow = std::chrono::milliseconds(state.config.ackReadTimeoutMs);

    bool written = false;
    bool acknowledged = false;
    bool rejected = false;
    std::optional<ErrorKind> firstKind;
    ConnectCause firstCause = ConnectCause::None;
    std::string firstDetail;

    std::vector<Endpoint> endpoints = deliveryEndpoints(state.config, contact.address);
    for (const auto &ep : endpoints) {
        try {
            auto channel = openChannel(ep.host, ep.port, options);
            ConnectionCounter counter(state);
            channel->sendMessage(bytes);
            written = true;
            ++state.messagesSent;
            state.bytesSent += bytes.size();

            try {
                std::vector<uint8_t> reply = channel->receiveMessage(ackWindow);
                state.bytesReceived += reply.size();
                ProtocolMessage ack = protocol::decode(reply);
                if (ack.ack() != nullptr && ack.ack()->originalMessageId == chat.id) {
                    acknowledged = true;
                    rejected = ack.ack()->status.compare(0, 5, "error") == 0;
                }
            }
            catch (const MessengerError &ex) {
                util::logger::debug("[DeliveryManager] no synchronous acknowledgment for " +
                                    chat.id + ": " + ex.what());
            }
            if (ep.port != endpoints.front().port) {
                Logger::getInstance().info("[DeliveryManager] delivered " + chat.id +
                                           " via fallback port " + std::to_string(ep.port));
            }
            break;
        }
        catch (const MessengerError &ex) {
            util::logger::debug("[DeliveryManager] attempt " + ep.host + ":" +
                                std::to_string(ep.port) + " failed: " + ex.what());
            if (!firstKind) {
                firstKind = ex.kind();
                firstCause = ex.cause();
                firstDetail = ex.what();
            }
        }
    }

    if (acknowledged) {
        chat.status = rejected ? core::DeliveryStatus::Failed : core::DeliveryStatus::Delivered;
        state.chats.UpdateStatus(key, chat.id, chat.status);
        return chat;
    }

    if (written) {
        chat.status = core::DeliveryStatus::Sent;
        state.chats.UpdateStatus(key, chat.id, chat.status);
        state.pending.Insert(chat.id, key);
        scheduleAckTimeout(state_, pool_, chat.id);
        return chat;
    }

    chat.status = core::DeliveryStatus::Failed;
    state.chats.UpdateStatus(key, chat.id, chat.status);

    if (!firstKind) {
        const std::string reason = "no usable address for " + contact.name;
        state.events.emit(ErrorEvent{reason, "send:address"});
        throw MessengerError(ErrorKind::NotFound, reason);
    }

    const std::string reason = friendlyFailure(*firstKind, firstCause, firstDetail);
    Logger::getInstance().warn("[DeliveryManager] sending " + chat.id + " to " + contact.name +
                               " failed: " + reason);
    state.events.emit(ErrorEvent{reason, "send:" + failureClass(*firstKind, firstCause)});
    throw MessengerError(*firstKind, reason, firstCause);
}

core::ChatMessage DeliveryManager::sendChatMessageByName(const std::string &name,
                                                         const std::string &content)
{
    if (!state_->addressBook) {
        throw MessengerError(ErrorKind::NotFound, "no address book configured");
    }
    auto address = state_->addressBook->resolveAddress(name);
    if (!address) {
        throw MessengerError(ErrorKind::NotFound, "no address for contact " + name);
    }

    core::Contact contact;
    if (auto known = state_->contacts.FindByName(name)) {
        contact = *known;
    }
    else {
        contact.id = name;
        contact.name = name;
    }
    contact.address = *address;
    return sendChatMessage(contact, content);
}

bool DeliveryManager::checkContactOnline(const core::Contact &contact)
{
    State &state = *state_;
    const ChannelOptions options = state.outboundOptions();
    const auto window = std::chrono::milliseconds(state.config.ackReadTimeoutMs);
    const std::string recipientId = contact.id.empty() ? contact.name : contact.id;

    for (const auto &ep : deliveryEndpoints(state.config, contact.address)) {
        try {
            auto channel = openChannel(ep.host, ep.port, options);
            ConnectionCounter counter(state);
            sendOnChannel(state, *channel, protocol::createPing(state.localId, recipientId));
            std::vector<uint8_t> reply = channel->receiveMessage(window);
            state.bytesReceived += reply.size();
            if (protocol::decode(reply).pong() != nullptr) {
                state.contacts.SetStatus(recipientId, core::ContactStatus::Online,
                                         protocol::nowSeconds());
                return true;
            }
        }
        catch (const MessengerError &ex) {
            util::logger::debug("[DeliveryManager] ping " + ep.host + ":" +
                                std::to_string(ep.port) + " failed: " + ex.what());
        }
    }
    state.contacts.SetStatus(recipientId, core::ContactStatus::Offline, protocol::nowSeconds());
    return false;
}

std::optional<core::Contact> DeliveryManager::sendHandshake(const std::string &address)
{
    State &state = *state_;
    Endpoint ep = splitHostPort(address);
    if (ep.host.empty() || ep.port == 0) {
        throw MessengerError(ErrorKind::NotFound, "invalid peer address '" + address + "'");
    }

    auto channel = openChannel(ep.host, ep.port, state.outboundOptions());
    ConnectionCounter counter(state);
    sendOnChannel(state, *channel, ownHandshake(state));

    try {
        std::vector<uint8_t> reply =
            channel->receiveMessage(std::chrono::milliseconds(state.config.ackReadTimeoutMs));
        state.bytesReceived += reply.size();
        ProtocolMessage msg = protocol::decode(reply);
        const protocol::HandshakePayload *hs = msg.handshake();
        if (hs == nullptr || !protocol::isProtocolCompatible(hs->protocolVersion) ||
            !signatureAcceptable(state, msg)) {
            return std::nullopt;
        }
        core::Contact contact = contactFromHandshake(*hs, channel->peerAddress());
        registerContact(state, contact);
        return contact;
    }
    catch (const MessengerError &ex) {
        util::logger::debug("[DeliveryManager] no handshake reply from " + address + ": " +
                            ex.what());
        return std::nullopt;
    }
}

void DeliveryManager::addContact(const core::Contact &contact)
{
    registerContact(*state_, contact);
}

std::vector<core::Contact> DeliveryManager::getContacts() const
{
    return state_->contacts.All();
}

void DeliveryManager::blockPeer(const std::string &peerId)
{
    state_->contacts.Block(peerId);
    Logger::getInstance().info("[DeliveryManager] blocked " + peerId);
}

bool DeliveryManager::unblockPeer(const std::string &peerId)
{
    return state_->contacts.Unblock(peerId);
}

bool DeliveryManager::isBlocked(const std::string &peerId) const
{
    return state_->contacts.IsBlocked(peerId);
}

std::vector<core::ChatMessage> DeliveryManager::getChatMessages(const std::string &contactName) const
{
    return state_->chats.Messages(core::chatKey(state_->localName, contactName));
}

std::vector<std::string> DeliveryManager::getChats() const
{
    return state_->chats.Keys();
}

bool DeliveryManager::markAsRead(const std::string &contactName, const std::string &messageId)
{
    return state_->chats.TransitionStatus(core::chatKey(state_->localName, contactName), messageId,
                                          core::DeliveryStatus::Delivered,
                                          core::DeliveryStatus::Read);
}

size_t DeliveryManager::getUnreadCount(const std::string &contactName) const
{
    return state_->chats.UnreadCount(core::chatKey(state_->localName, contactName),
                                     state_->localName);
}

size_t DeliveryManager::pendingAcknowledgments() const
{
    return state_->pending.Size();
}

core::NetworkStats DeliveryManager::getStats() const
{
    core::NetworkStats stats;
    stats.messagesSent = state_->messagesSent;
    stats.messagesReceived = state_->messagesReceived;
    stats.bytesSent = state_->bytesSent;
    stats.bytesReceived = state_->bytesReceived;
    stats.totalConnections = state_->totalConnections;
    stats.activeConnections = state_->activeConnections;
    if (state_->running) {
        stats.uptimeSeconds = static_cast<uint64_t>(steadySeconds() - state_->startedAt.load());
    }
    return stats;
}

void DeliveryManager::resetStats()
{
    state_->messagesSent = 0;
    state_->messagesReceived = 0;
    state_->bytesSent = 0;
    state_->bytesReceived = 0;
    state_->totalConnections = 0;
}

size_t DeliveryManager::subscribe(EventBus::Handler handler)
{
    return state_->events.subscribe(std::move(handler));
}

bool DeliveryManager::unsubscribe(size_t id)
{
    return state_->events.unsubscribe(id);
}

const std::string &DeliveryManager::localId() const
{
    return state_->localId;
}

const std::string &DeliveryManager::localName() const
{
    return state_->localName;
}

} // namespace network
} // namespace veilchat
