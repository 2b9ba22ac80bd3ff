#ifndef VEILCHAT_NETWORK_DELIVERY_MANAGER_HPP
#define VEILCHAT_NETWORK_DELIVERY_MANAGER_HPP

#include <cstdint>
#include <future>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

#include "config/messenger_config.hpp"
#include "core/address_book.hpp"
#include "core/chat_types.hpp"
#include "crypto/identity_provider.hpp"
#include "network/events.hpp"
#include "network/socket.hpp"
#include "util/thread_pool.hpp"

/**
 * @file delivery_manager.hpp
 * @brief Owns the listening socket, dispatches inbound protocol messages and
 *        delivers outbound chat messages with acknowledgment tracking.
 *
 * DESIGN GOALS:
 *   - Every accepted connection is handled on its own thread, up to
 *     maxInboundConnections at once, so a slow or silent peer stalls neither
 *     the accept loop nor other peers. The ThreadPool runs acknowledgment
 *     timeout expiry.
 *   - The accept loop polls the listener together with a wake-up pipe;
 *     shutdown() interrupts it immediately and waits a bounded time.
 *   - Chat log, pending acknowledgments, contacts and the blocked set live
 *     in one shared state object captured by every task. Their locks are
 *     never held across socket I/O.
 *   - A message written without a synchronous acknowledgment is Sent and
 *     gets a cancellable timeout keyed by its id; whichever of the late
 *     acknowledgment or the timeout removes the pending entry first decides
 *     Delivered or Failed.
 *
 * SAMPLE USAGE:
 *   @code
 *   veilchat::config::MessengerConfig cfg;
 *   cfg.nodeName = "alice";
 *   veilchat::network::DeliveryManager mgr(cfg);
 *   mgr.startServer(8080);
 *
 *   veilchat::core::Contact bob;
 *   bob.id = "bob"; bob.name = "bob"; bob.address = "10.0.0.7:8080";
 *   auto sent = mgr.sendChatMessage(bob, "hello");   // Delivered or Sent
 *
 *   mgr.shutdown();
 *   @endcode
 */

namespace veilchat {
namespace network {

class DeliveryManager
{
public:
    /**
     * @param identity    optional; when set, outbound messages are signed and
     *                    inbound messages from contacts with a known key are
     *                    verified.
     * @param addressBook optional; needed by sendChatMessageByName().
     */
    explicit DeliveryManager(const config::MessengerConfig &config,
                             std::shared_ptr<crypto::IdentityProvider> identity = nullptr,
                             std::shared_ptr<core::AddressBook> addressBook = nullptr);
    ~DeliveryManager();

    DeliveryManager(const DeliveryManager &) = delete;
    DeliveryManager &operator=(const DeliveryManager &) = delete;

    /**
     * @brief Bind bindAddress:port and start accepting. Port 0 binds an
     *        ephemeral port.
     * @return the bound port.
     * @throw MessengerError ConnectionFailed if already running or the
     *        address cannot be bound.
     */
    uint16_t startServer(uint16_t port);

    /// Idempotent. Stops the accept loop (bounded wait) and emits ServerStopped.
    void shutdown();

    bool isRunning() const;
    uint16_t listeningPort() const;

    /**
     * @brief Deliver content to contact, trying contact.address first and
     *        then every configured fallback port on the same host.
     * @return the recorded message: Delivered on a synchronous
     *         acknowledgment, Sent when the write succeeded without one.
     * @throw MessengerError when every attempt failed; the message is
     *        recorded as Failed and an ErrorEvent is emitted first.
     */
    core::ChatMessage sendChatMessage(const core::Contact &contact, const std::string &content);

    /**
     * @brief Resolve name through the AddressBook and send.
     * @throw MessengerError NotFound if no address book is configured or
     *        the name cannot be resolved.
     */
    core::ChatMessage sendChatMessageByName(const std::string &name, const std::string &content);

    /// Ping the contact through the fallback sequence; true on a Pong.
    bool checkContactOnline(const core::Contact &contact);

    /**
     * @brief Introduce this node to the peer at address ("host:port").
     * @return the peer's contact entry if it answered with its own handshake.
     * @throw MessengerError if the connection or the write fails.
     */
    std::optional<core::Contact> sendHandshake(const std::string &address);

    void addContact(const core::Contact &contact);
    std::vector<core::Contact> getContacts() const;

    void blockPeer(const std::string &peerId);
    bool unblockPeer(const std::string &peerId);
    bool isBlocked(const std::string &peerId) const;

    std::vector<core::ChatMessage> getChatMessages(const std::string &contactName) const;
    std::vector<std::string> getChats() const;
    /// Delivered -> Read for one inbound message; false otherwise.
    bool markAsRead(const std::string &contactName, const std::string &messageId);
    size_t getUnreadCount(const std::string &contactName) const;

    size_t pendingAcknowledgments() const;

    core::NetworkStats getStats() const;
    void resetStats();

    size_t subscribe(EventBus::Handler handler);
    bool unsubscribe(size_t id);

    const std::string &localId() const;
    const std::string &localName() const;

    struct State;

private:
    std::shared_ptr<State> state_;
    std::shared_ptr<util::ThreadPool> pool_;

    mutable std::mutex lifecycleMutex_;
    std::shared_ptr<TcpListener> listener_;
    std::shared_ptr<WakePipe> wake_;
    std::thread acceptThread_;
    std::future<void> acceptDone_;
};

} // namespace network
} // namespace veilchat

#endif // VEILCHAT_NETWORK_DELIVERY_MANAGER_HPP
