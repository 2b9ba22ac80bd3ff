#ifndef VEILCHAT_CONFIG_MESSENGER_CONFIG_HPP
#define VEILCHAT_CONFIG_MESSENGER_CONFIG_HPP

#include <cstdint>
#include <string>
#include <vector>

/**
 * @file messenger_config.hpp
 * @brief Configuration parameters for a single VeilChat node.
 *
 * USAGE:
 *   - Populated manually (tests) or through util/config_parser.hpp.
 *   - Timeouts are in milliseconds unless the field name says seconds.
 */

namespace veilchat {
namespace config {

/**
 * @struct MessengerConfig
 * @brief Local identity, listening/masking settings, delivery timeouts and
 *        discovery parameters of one node.
 */
struct MessengerConfig
{
    MessengerConfig()
        : nodeName("veilchat_node"),
          bindAddress("0.0.0.0"),
          listenPort(8080),
          useMasking(false),
          maskDomain("www.cloudflare.com"),
          discoveryPort(9999),
          announceIntervalSeconds(30),
          broadcastTargets({"255.255.255.255", "224.0.0.1", "192.168.1.255",
                            "10.0.0.255", "172.16.255.255"}),
          capabilities({"chat", "file_transfer"}),
          connectTimeoutMs(10000),
          writeTimeoutMs(5000),
          ackReadTimeoutMs(10000),
          inboundReadTimeoutMs(15000),
          ackTimeoutSeconds(30),
          shutdownTimeoutMs(5000),
          fallbackPorts({443, 80, 8080, 8443, 8000, 9000, 3000}),
          workerThreads(8),
          maxInboundConnections(64),
          externalIpServices({"https://api.ipify.org", "https://ipinfo.io/ip",
                              "https://httpbin.org/ip"}),
          externalIpTimeoutSeconds(5),
          logLevel("info")
    {
    }

    /// Display name announced to peers and used as the local side of chat keys.
    std::string nodeName;

    /// Opaque peer identifier; derived from the identity key when left empty.
    std::string peerId;

    std::string bindAddress;
    uint16_t listenPort;

    /// Wrap every connection in the fake TLS + HTTP/2 envelope.
    bool useMasking;
    /// Server name placed in the fake Client Hello SNI extension.
    std::string maskDomain;

    uint16_t discoveryPort;
    uint32_t announceIntervalSeconds;
    std::vector<std::string> broadcastTargets;
    std::vector<std::string> capabilities;

    uint32_t connectTimeoutMs;
    uint32_t writeTimeoutMs;
    /// How long a sender waits on the same connection for a synchronous acknowledgment.
    uint32_t ackReadTimeoutMs;
    /// Read bound for inbound connections handled by the server.
    uint32_t inboundReadTimeoutMs;
    /// Window after which a Sent-but-unacknowledged message becomes Failed.
    uint32_t ackTimeoutSeconds;
    uint32_t shutdownTimeoutMs;

    /// Ports tried against the contact's host when its configured address fails.
    std::vector<uint16_t> fallbackPorts;

    uint16_t workerThreads;
    /// Inbound connections handled at once; further connections are closed on accept.
    uint32_t maxInboundConnections;

    std::vector<std::string> externalIpServices;
    uint32_t externalIpTimeoutSeconds;

    std::string logLevel;
    /// Optional; empty keeps logging on the console only.
    std::string logFile;
};

} // namespace config
} // namespace veilchat

#endif // VEILCHAT_CONFIG_MESSENGER_CONFIG_HPP
