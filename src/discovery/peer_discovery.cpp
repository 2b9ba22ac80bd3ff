#include "discovery/peer_discovery.hpp"
#include "discovery/external_ip.hpp"
#include "network/errors.hpp"
#include "protocol/protocol_messages.hpp"
#include "util/hashing.hpp"
#include "util/logger.hpp"

#include <algorithm>
#include <nlohmann/json.hpp>

namespace veilchat {
namespace discovery {

using util::logger::Logger;

std::vector<uint8_t> encodeAnnouncement(const AnnouncementMessage &announcement)
{
    nlohmann::json j;
    j["peer_id"] = announcement.peerId;
    j["peer_name"] = announcement.peerName;
    j["port"] = announcement.port;
    j["public_key"] = util::hashing::base64Encode(announcement.publicKey);
    j["protocol_version"] = announcement.protocolVersion;
    j["capabilities"] = announcement.capabilities;
    j["timestamp"] = announcement.timestamp;
    std::string text = j.dump();
    return std::vector<uint8_t>(text.begin(), text.end());
}

AnnouncementMessage decodeAnnouncement(const std::vector<uint8_t> &bytes)
{
    if (bytes.size() > protocol::MAX_MESSAGE_SIZE)
    {
        throw network::DecodeError("announcement too large");
    }
    try
    {
        nlohmann::json j = nlohmann::json::parse(bytes.begin(), bytes.end());
        AnnouncementMessage ann;
        ann.peerId = j.at("peer_id").get<std::string>();
        ann.peerName = j.at("peer_name").get<std::string>();
        unsigned port = j.at("port").get<unsigned>();
        unsigned version = j.at("protocol_version").get<unsigned>();
        if (port == 0 || port > 65535 || version > 0xFF)
        {
            throw network::DecodeError("announcement port/version out of range");
        }
        ann.port = static_cast<uint16_t>(port);
        ann.protocolVersion = static_cast<uint8_t>(version);
        ann.publicKey = util::hashing::base64Decode(j.at("public_key").get<std::string>());
        ann.capabilities = j.value("capabilities", std::vector<std::string>());
        ann.timestamp = j.at("timestamp").get<uint64_t>();
        if (ann.peerId.empty())
        {
            throw network::DecodeError("announcement without peer_id");
        }
        return ann;
    }
    catch (const nlohmann::json::exception &ex)
    {
        throw network::DecodeError(std::string("announcement: ") + ex.what());
    }
    catch (const network::DecodeError &)
    {
        throw;
    }
    catch (const std::runtime_error &ex)
    {
        // base64 failures
        throw network::DecodeError(std::string("announcement: ") + ex.what());
    }
}

PeerDiscovery::PeerDiscovery(const config::MessengerConfig &config,
                             std::string localId,
                             std::vector<uint8_t> publicKey,
                             uint16_t servicePort)
    : config_(config)
    , localId_(std::move(localId))
    , publicKey_(std::move(publicKey))
    , servicePort_(servicePort)
    , running_(false)
    , listenPort_(0)
    , announcementsSent_(0)
    , announcementsReceived_(0)
    , invalidDatagrams_(0)
{
}

PeerDiscovery::~PeerDiscovery()
{
    stopDiscovery();
}

void PeerDiscovery::startDiscovery()
{
    std::lock_guard<std::mutex> lock(lifecycleMutex_);
    if (running_)
    {
        Logger::getInstance().warn("[PeerDiscovery] startDiscovery called but already running.");
        return;
    }

    network::UdpSocket listenSocket;
    listenSocket.open(true);
    listenSocket.bind(config_.bindAddress, config_.discoveryPort);

    {
        std::lock_guard<std::mutex> sendLock(sendMutex_);
        if (!sendSocket_.isOpen())
        {
            sendSocket_.open(false);
            sendSocket_.enableBroadcast();
        }
    }

    listenSocket_ = std::move(listenSocket);
    listenPort_ = listenSocket_.port();
    running_ = true;
    listenerThread_ = std::thread(&PeerDiscovery::listenerLoop, this);
    announcerThread_ = std::thread(&PeerDiscovery::announcerLoop, this);

    Logger::getInstance().info("[PeerDiscovery] listening on udp port " +
                               std::to_string(listenPort_.load()) + ", announcing every " +
                               std::to_string(config_.announceIntervalSeconds) + " s");
}

void PeerDiscovery::stopDiscovery()
{
    std::lock_guard<std::mutex> lock(lifecycleMutex_);
    if (!running_)
    {
        return;
    }
    {
        std::lock_guard<std::mutex> stopLock(stopMutex_);
        running_ = false;
    }
    stopCv_.notify_all();

    if (listenerThread_.joinable())
    {
        listenerThread_.join();
    }
    if (announcerThread_.joinable())
    {
        announcerThread_.join();
    }
    listenSocket_.close();
    {
        std::lock_guard<std::mutex> sendLock(sendMutex_);
        sendSocket_.close();
    }
    listenPort_ = 0;

    {
        std::unique_lock<std::shared_mutex> peersLock(peersMutex_);
        peers_.clear();
    }
    Logger::getInstance().info("[PeerDiscovery] stopped.");
}

AnnouncementMessage PeerDiscovery::ownAnnouncement() const
{
    AnnouncementMessage ann;
    ann.peerId = localId_;
    ann.peerName = config_.nodeName;
    ann.port = servicePort_;
    ann.publicKey = publicKey_;
    ann.protocolVersion = protocol::PROTOCOL_VERSION;
    ann.capabilities = config_.capabilities;
    ann.timestamp = protocol::nowSeconds();
    return ann;
}

bool PeerDiscovery::announcePresence()
{
    std::vector<uint8_t> datagram = encodeAnnouncement(ownAnnouncement());
    uint16_t port = config_.discoveryPort != 0 ? config_.discoveryPort : listenPort_.load();

    std::lock_guard<std::mutex> lock(sendMutex_);
    if (!sendSocket_.isOpen())
    {
        sendSocket_.open(false);
        sendSocket_.enableBroadcast();
    }

    size_t delivered = 0;
    for (const auto &target : config_.broadcastTargets)
    {
        if (sendSocket_.sendTo(target, port, datagram))
        {
            ++delivered;
        }
        else
        {
            util::logger::debug("[PeerDiscovery] announcement to " + target + " not sent");
        }
    }
    announcementsSent_ += delivered;
    return delivered > 0;
}

bool PeerDiscovery::processAnnouncement(const AnnouncementMessage &announcement,
                                        const std::string &fromIp)
{
    if (announcement.peerId == localId_)
    {
        return false;
    }
    ++announcementsReceived_;

    DiscoveredPeer peer;
    peer.id = announcement.peerId;
    peer.address = fromIp;
    peer.port = announcement.port;
    peer.name = announcement.peerName;
    peer.lastSeen = protocol::nowSeconds();
    peer.publicKey = announcement.publicKey;
    peer.protocolVersion = announcement.protocolVersion;
    peer.capabilities = announcement.capabilities;

    bool isNew;
    {
        std::unique_lock<std::shared_mutex> lock(peersMutex_);
        isNew = peers_.find(peer.id) == peers_.end();
        peers_[peer.id] = peer;
    }
    if (isNew)
    {
        Logger::getInstance().info("[PeerDiscovery] discovered " + peer.name + " (" + peer.id +
                                   ") at " + fromIp + ":" + std::to_string(peer.port));
    }
    return true;
}

void PeerDiscovery::recordPeer(const DiscoveredPeer &peer)
{
    std::unique_lock<std::shared_mutex> lock(peersMutex_);
    peers_[peer.id] = peer;
}

std::vector<DiscoveredPeer> PeerDiscovery::getDiscoveredPeers() const
{
    std::shared_lock<std::shared_mutex> lock(peersMutex_);
    std::vector<DiscoveredPeer> out;
    out.reserve(peers_.size());
    for (const auto &entry : peers_)
    {
        out.push_back(entry.second);
    }
    return out;
}

std::optional<DiscoveredPeer> PeerDiscovery::findPeerByName(const std::string &name) const
{
    std::shared_lock<std::shared_mutex> lock(peersMutex_);
    for (const auto &entry : peers_)
    {
        if (entry.second.name == name)
        {
            return entry.second;
        }
    }
    return std::nullopt;
}

std::optional<DiscoveredPeer> PeerDiscovery::findPeerById(const std::string &id) const
{
    std::shared_lock<std::shared_mutex> lock(peersMutex_);
    auto it = peers_.find(id);
    if (it == peers_.end())
    {
        return std::nullopt;
    }
    return it->second;
}

std::vector<DiscoveredPeer> PeerDiscovery::getPeersByCapability(const std::string &capability) const
{
    std::shared_lock<std::shared_mutex> lock(peersMutex_);
    std::vector<DiscoveredPeer> out;
    for (const auto &entry : peers_)
    {
        const auto &caps = entry.second.capabilities;
        if (std::find(caps.begin(), caps.end(), capability) != caps.end())
        {
            out.push_back(entry.second);
        }
    }
    return out;
}

DiscoveryStatistics PeerDiscovery::getDiscoveryStatistics() const
{
    DiscoveryStatistics stats;
    uint64_t now = protocol::nowSeconds();
    uint64_t window = 2 * static_cast<uint64_t>(config_.announceIntervalSeconds);
    {
        std::shared_lock<std::shared_mutex> lock(peersMutex_);
        stats.totalPeers = peers_.size();
        for (const auto &entry : peers_)
        {
            if (entry.second.lastSeen + window >= now)
            {
                ++stats.activePeers;
            }
        }
    }
    stats.announcementsSent = announcementsSent_;
    stats.announcementsReceived = announcementsReceived_;
    stats.invalidDatagrams = invalidDatagrams_;
    stats.running = running_;
    return stats;
}

size_t PeerDiscovery::getPeerCount() const
{
    std::shared_lock<std::shared_mutex> lock(peersMutex_);
    return peers_.size();
}

size_t PeerDiscovery::cleanupOldPeers(uint64_t maxAgeSeconds)
{
    uint64_t now = protocol::nowSeconds();
    size_t removed = 0;
    std::unique_lock<std::shared_mutex> lock(peersMutex_);
    for (auto it = peers_.begin(); it != peers_.end();)
    {
        const uint64_t lastSeen = it->second.lastSeen;
        if (now >= lastSeen && now - lastSeen >= maxAgeSeconds)
        {
            util::logger::debug("[PeerDiscovery] expiring " + it->second.name + " (" + it->first + ")");
            it = peers_.erase(it);
            ++removed;
        }
        else
        {
            ++it;
        }
    }
    return removed;
}

std::string PeerDiscovery::getExternalIp() const
{
    ExternalIpResolver resolver(config_.externalIpServices, config_.externalIpTimeoutSeconds);
    return resolver.resolve();
}

void PeerDiscovery::listenerLoop()
{
    const auto pollTimeout = std::chrono::milliseconds(1000);
    while (running_)
    {
        std::optional<network::Datagram> datagram;
        try
        {
            datagram = listenSocket_.receive(pollTimeout);
        }
        catch (const network::MessengerError &ex)
        {
            Logger::getInstance().warn(std::string("[PeerDiscovery] receive failed: ") + ex.what());
            std::unique_lock<std::mutex> lock(stopMutex_);
            stopCv_.wait_for(lock, pollTimeout, [this] { return !running_; });
            continue;
        }
        if (!datagram)
        {
            continue;
        }

        try
        {
            processAnnouncement(decodeAnnouncement(datagram->data), datagram->fromIp);
        }
        catch (const network::DecodeError &ex)
        {
            ++invalidDatagrams_;
            util::logger::debug("[PeerDiscovery] ignoring datagram from " + datagram->fromIp +
                                ": " + ex.what());
        }
    }
}

void PeerDiscovery::announcerLoop()
{
    const auto interval = std::chrono::seconds(config_.announceIntervalSeconds);
    while (running_)
    {
        try
        {
            announcePresence();
        }
        catch (const network::MessengerError &ex)
        {
            Logger::getInstance().warn(std::string("[PeerDiscovery] announce failed: ") + ex.what());
        }

        std::unique_lock<std::mutex> lock(stopMutex_);
        stopCv_.wait_for(lock, interval, [this] { return !running_; });
    }
}

} // namespace discovery
} // namespace veilchat
