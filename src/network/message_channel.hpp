#ifndef VEILCHAT_NETWORK_MESSAGE_CHANNEL_HPP
#define VEILCHAT_NETWORK_MESSAGE_CHANNEL_HPP

#include <chrono>
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

#include "masking/tls_masking.hpp"
#include "network/socket.hpp"

namespace veilchat {
namespace network {

/**
 * @class MessageChannel
 * @brief One connection carrying encoded protocol documents, either
 *        length-prefixed on plain TCP or inside the masking envelope.
 */
class MessageChannel
{
public:
    virtual ~MessageChannel() = default;

    virtual void sendMessage(const std::vector<uint8_t> &bytes) = 0;

    /**
     * @brief Read one complete document.
     * @throw MessengerError Timeout/ConnectionFailed from the socket,
     *        DecodeError for an oversized length prefix, MaskingError for
     *        broken masked framing.
     */
    virtual std::vector<uint8_t> receiveMessage(std::chrono::milliseconds timeout) = 0;

    virtual std::string peerAddress() const = 0;
};

struct ChannelOptions
{
    bool useMasking = false;
    std::string maskDomain;
    std::chrono::milliseconds connectTimeout{10000};
    std::chrono::milliseconds writeTimeout{5000};
    /// Bound on each step of the masking handshake.
    std::chrono::milliseconds handshakeTimeout{10000};
};

/// 4-byte big-endian length followed by the document.
class PlainChannel : public MessageChannel
{
public:
    PlainChannel(TcpSocket socket, std::chrono::milliseconds writeTimeout);

    void sendMessage(const std::vector<uint8_t> &bytes) override;
    std::vector<uint8_t> receiveMessage(std::chrono::milliseconds timeout) override;
    std::string peerAddress() const override { return socket_.peerAddress(); }

private:
    TcpSocket socket_;
    std::chrono::milliseconds writeTimeout_;
};

class MaskedChannel : public MessageChannel
{
public:
    explicit MaskedChannel(masking::MaskedConnection connection);

    void sendMessage(const std::vector<uint8_t> &bytes) override;
    std::vector<uint8_t> receiveMessage(std::chrono::milliseconds timeout) override;
    std::string peerAddress() const override { return connection_.peerAddress(); }

private:
    masking::MaskedConnection connection_;
};

/// Connect to host:port and complete the masking handshake when enabled.
std::unique_ptr<MessageChannel> openChannel(const std::string &host, uint16_t port,
                                            const ChannelOptions &options);

/// Server side counterpart of openChannel() for an accepted socket.
std::unique_ptr<MessageChannel> acceptChannel(TcpSocket socket, const ChannelOptions &options);

} // namespace network
} // namespace veilchat

#endif // VEILCHAT_NETWORK_MESSAGE_CHANNEL_HPP
