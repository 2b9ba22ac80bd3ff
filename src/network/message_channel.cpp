#include "network/message_channel.hpp"
#include "protocol/protocol_messages.hpp"

namespace veilchat {
namespace network {

PlainChannel::PlainChannel(TcpSocket socket, std::chrono::milliseconds writeTimeout)
    : socket_(std::move(socket))
    , writeTimeout_(writeTimeout)
{
}

void PlainChannel::sendMessage(const std::vector<uint8_t> &bytes)
{
    if (bytes.size() > protocol::MAX_MESSAGE_SIZE) {
        throw DecodeError("outbound message of " + std::to_string(bytes.size()) +
                          " bytes exceeds limit");
    }
    std::vector<uint8_t> frame;
    frame.reserve(4 + bytes.size());
    uint32_t len = static_cast<uint32_t>(bytes.size());
    frame.push_back(static_cast<uint8_t>((len >> 24) & 0xFF));
    frame.push_back(static_cast<uint8_t>((len >> 16) & 0xFF));
    frame.push_back(static_cast<uint8_t>((len >> 8) & 0xFF));
    frame.push_back(static_cast<uint8_t>(len & 0xFF));
    frame.insert(frame.end(), bytes.begin(), bytes.end());
    socket_.sendAll(frame, writeTimeout_);
}

std::vector<uint8_t> PlainChannel::receiveMessage(std::chrono::milliseconds timeout)
{
    uint8_t header[4];
    socket_.readExact(header, sizeof(header), timeout);
    uint32_t len = (static_cast<uint32_t>(header[0]) << 24) |
                   (static_cast<uint32_t>(header[1]) << 16) |
                   (static_cast<uint32_t>(header[2]) << 8) | header[3];
    // Reject before allocating.
    if (len > protocol::MAX_MESSAGE_SIZE) {
        throw DecodeError("length prefix " + std::to_string(len) + " exceeds limit");
    }
    return socket_.readExact(len, timeout);
}

MaskedChannel::MaskedChannel(masking::MaskedConnection connection)
    : connection_(std::move(connection))
{
}

void MaskedChannel::sendMessage(const std::vector<uint8_t> &bytes)
{
    connection_.send(bytes);
}

std::vector<uint8_t> MaskedChannel::receiveMessage(std::chrono::milliseconds timeout)
{
    return connection_.receive(timeout);
}

namespace {

masking::MaskingTimeouts toMaskingTimeouts(const ChannelOptions &options)
{
    masking::MaskingTimeouts timeouts;
    timeouts.connect = options.connectTimeout;
    timeouts.write = options.writeTimeout;
    timeouts.handshake = options.handshakeTimeout;
    return timeouts;
}

} // namespace

std::unique_ptr<MessageChannel> openChannel(const std::string &host, uint16_t port,
                                            const ChannelOptions &options)
{
    if (options.useMasking) {
        return std::make_unique<MaskedChannel>(masking::MaskedConnection::connectAsClient(
            host, port, options.maskDomain, toMaskingTimeouts(options)));
    }
    return std::make_unique<PlainChannel>(TcpSocket::connectTo(host, port, options.connectTimeout),
                                          options.writeTimeout);
}

std::unique_ptr<MessageChannel> acceptChannel(TcpSocket socket, const ChannelOptions &options)
{
    if (options.useMasking) {
        return std::make_unique<MaskedChannel>(
            masking::MaskedConnection::acceptAsServer(std::move(socket), toMaskingTimeouts(options)));
    }
    return std::make_unique<PlainChannel>(std::move(socket), options.writeTimeout);
}

} // namespace network
} // namespace veilchat
