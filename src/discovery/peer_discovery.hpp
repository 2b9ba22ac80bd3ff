#ifndef VEILCHAT_DISCOVERY_PEER_DISCOVERY_HPP
#define VEILCHAT_DISCOVERY_PEER_DISCOVERY_HPP

#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <map>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <string>
#include <thread>
#include <vector>

#include "config/messenger_config.hpp"
#include "network/socket.hpp"

/**
 * @file peer_discovery.hpp
 * @brief LAN presence protocol over UDP broadcast.
 *
 * DESIGN GOALS:
 *   - Stopped -> Running -> Stopped. Two worker threads while running: a
 *     listener polling the discovery socket with a 1 s timeout, and an
 *     announcer broadcasting this node's AnnouncementMessage every
 *     announce interval.
 *   - The peer table is keyed by peer id and guarded by a reader/writer
 *     lock; queries are snapshots and never touch the network.
 *   - Entries expire only through cleanupOldPeers(), which the caller runs.
 *   - Discovery never calls the delivery manager.
 */

namespace veilchat {
namespace discovery {

struct DiscoveredPeer
{
    std::string id;
    std::string address;   ///< source IP of the announcement
    uint16_t port = 0;     ///< chat port the peer listens on
    std::string name;
    uint64_t lastSeen = 0; ///< seconds since the Unix epoch
    std::vector<uint8_t> publicKey;
    uint8_t protocolVersion = 0;
    std::vector<std::string> capabilities;
};

struct AnnouncementMessage
{
    std::string peerId;
    std::string peerName;
    uint16_t port = 0;
    std::vector<uint8_t> publicKey;
    uint8_t protocolVersion = 0;
    std::vector<std::string> capabilities;
    uint64_t timestamp = 0;
};

/// JSON datagram; public_key is base64.
std::vector<uint8_t> encodeAnnouncement(const AnnouncementMessage &announcement);

/// @throw network::DecodeError for anything that is not an announcement.
AnnouncementMessage decodeAnnouncement(const std::vector<uint8_t> &bytes);

struct DiscoveryStatistics
{
    size_t totalPeers = 0;
    /// Peers heard from within the last two announce intervals.
    size_t activePeers = 0;
    uint64_t announcementsSent = 0;
    uint64_t announcementsReceived = 0;
    uint64_t invalidDatagrams = 0;
    bool running = false;
};

class PeerDiscovery
{
public:
    /**
     * @param servicePort chat port placed in our announcements.
     */
    PeerDiscovery(const config::MessengerConfig &config,
                  std::string localId,
                  std::vector<uint8_t> publicKey,
                  uint16_t servicePort);
    ~PeerDiscovery();

    PeerDiscovery(const PeerDiscovery &) = delete;
    PeerDiscovery &operator=(const PeerDiscovery &) = delete;

    /**
     * @brief Bind the discovery port and start listener and announcer.
     *        No-op if already running.
     * @throw network::MessengerError if the sockets cannot be set up.
     */
    void startDiscovery();

    /// Stop both workers and clear the peer table. Safe to call twice.
    void stopDiscovery();

    bool isRunning() const { return running_; }

    /// Port the listener is bound to (meaningful while running).
    uint16_t listeningPort() const { return listenPort_; }

    /// Send one announcement to every broadcast target now.
    bool announcePresence();

    /**
     * @brief Upsert the announcing peer.
     * @return false if the announcement is our own and was ignored.
     */
    bool processAnnouncement(const AnnouncementMessage &announcement, const std::string &fromIp);

    /// Insert or replace an entry as-is (lastSeen included).
    void recordPeer(const DiscoveredPeer &peer);

    std::vector<DiscoveredPeer> getDiscoveredPeers() const;
    std::optional<DiscoveredPeer> findPeerByName(const std::string &name) const;
    std::optional<DiscoveredPeer> findPeerById(const std::string &id) const;
    std::vector<DiscoveredPeer> getPeersByCapability(const std::string &capability) const;
    DiscoveryStatistics getDiscoveryStatistics() const;
    size_t getPeerCount() const;

    /// Remove peers with now - lastSeen >= maxAgeSeconds. Returns the number removed.
    size_t cleanupOldPeers(uint64_t maxAgeSeconds);

    /// Public address of this host via the configured IP-echo services.
    std::string getExternalIp() const;

private:
    AnnouncementMessage ownAnnouncement() const;
    void listenerLoop();
    void announcerLoop();

    config::MessengerConfig config_;
    std::string localId_;
    std::vector<uint8_t> publicKey_;
    uint16_t servicePort_;

    mutable std::shared_mutex peersMutex_;
    std::map<std::string, DiscoveredPeer> peers_;

    std::mutex lifecycleMutex_;
    std::atomic<bool> running_;
    std::atomic<uint16_t> listenPort_;
    network::UdpSocket listenSocket_;
    network::UdpSocket sendSocket_;
    std::mutex sendMutex_;
    std::thread listenerThread_;
    std::thread announcerThread_;

    std::mutex stopMutex_;
    std::condition_variable stopCv_;

    std::atomic<uint64_t> announcementsSent_;
    std::atomic<uint64_t> announcementsReceived_;
    std::atomic<uint64_t> invalidDatagrams_;
};

} // namespace discovery
} // namespace veilchat

#endif // VEILCHAT_DISCOVERY_PEER_DISCOVERY_HPP
