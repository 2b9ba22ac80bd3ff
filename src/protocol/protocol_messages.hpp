#ifndef VEILCHAT_PROTOCOL_PROTOCOL_MESSAGES_HPP
#define VEILCHAT_PROTOCOL_PROTOCOL_MESSAGES_HPP

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace veilchat {
namespace protocol {

/*
  protocol_messages.hpp
  --------------------------------
  The VeilChat wire envelope and its codec.

   - struct ProtocolMessage
       Envelope: type tag, sender/recipient peer ids, message id, timestamp,
       sequence number, raw content bytes, a type-specific payload and an
       optional trailing signature.
   - MessagePayload
       Tagged union with one alternative per message kind. Decoding picks the
       alternative from the explicit "message_type" field, never by trying
       alternatives until one parses.
   - encode()/decode()
       One JSON document per message. Byte fields are base64 strings.
       decode() rejects input larger than MAX_MESSAGE_SIZE before parsing and
       throws network::DecodeError for malformed documents or missing fields.
*/

constexpr uint8_t PROTOCOL_VERSION = 1;
constexpr size_t MAX_MESSAGE_SIZE = 1024 * 1024;
constexpr uint64_t HANDSHAKE_TIMEOUT_SECONDS = 30;
constexpr uint64_t MESSAGE_TIMEOUT_SECONDS = 60;

/// Recipient id used by handshakes addressed to whoever answers the connection.
extern const char *const BROADCAST_RECIPIENT;

enum class MessageType : uint8_t
{
    Handshake,
    Chat,
    Ping,
    Pong,
    Acknowledgment,
    KeyExchange,
    Status,
    File
};

const char *messageTypeName(MessageType type);

/// Inverse of messageTypeName(); std::nullopt for unknown tags.
std::optional<MessageType> parseMessageType(const std::string &name);

struct HandshakePayload
{
    std::string peerId;
    std::string peerName;
    std::string address;   ///< "host:port" the peer listens on
    std::vector<uint8_t> publicKey;
    uint8_t protocolVersion = PROTOCOL_VERSION;
};

struct TextPayload
{
    std::string content;
    std::string messageId;
    std::optional<std::string> replyTo;
};

struct PingPayload
{
    uint64_t timestamp = 0;
    uint64_t sequence = 0;
};

struct PongPayload
{
    uint64_t originalTimestamp = 0;
    uint64_t responseTimestamp = 0;
    uint64_t sequence = 0;
};

struct FilePayload
{
    std::string fileName;
    uint64_t fileSize = 0;
    std::string fileHash;   ///< hex SHA-256 of the whole file
    std::vector<uint8_t> chunkData;
    uint32_t chunkIndex = 0;
    uint32_t totalChunks = 0;
};

struct AckPayload
{
    std::string originalMessageId;
    std::string status;
};

struct KeyExchangePayload
{
    std::vector<uint8_t> publicKey;
};

struct StatusPayload
{
    std::string status;
    std::string detail;
};

using MessagePayload = std::variant<std::monostate,
                                    HandshakePayload,
                                    TextPayload,
                                    PingPayload,
                                    PongPayload,
                                    FilePayload,
                                    AckPayload,
                                    KeyExchangePayload,
                                    StatusPayload>;

struct ProtocolMessage
{
    MessageType type = MessageType::Status;
    std::string senderId;
    std::string recipientId;
    std::string messageId;
    uint64_t timestamp = 0;       ///< seconds since the Unix epoch
    uint64_t sequenceNumber = 0;
    std::vector<uint8_t> content; ///< interpretation depends on type
    MessagePayload payload;
    std::optional<std::vector<uint8_t>> signature;

    const HandshakePayload *handshake() const { return std::get_if<HandshakePayload>(&payload); }
    const TextPayload *text() const { return std::get_if<TextPayload>(&payload); }
    const PingPayload *ping() const { return std::get_if<PingPayload>(&payload); }
    const PongPayload *pong() const { return std::get_if<PongPayload>(&payload); }
    const FilePayload *file() const { return std::get_if<FilePayload>(&payload); }
    const AckPayload *ack() const { return std::get_if<AckPayload>(&payload); }
    const KeyExchangePayload *keyExchange() const { return std::get_if<KeyExchangePayload>(&payload); }
    const StatusPayload *status() const { return std::get_if<StatusPayload>(&payload); }
};

uint64_t nowSeconds();

std::vector<uint8_t> encode(const ProtocolMessage &msg);

/// Encoding with the signature field left out; this is what gets signed.
std::vector<uint8_t> encodeForSigning(const ProtocolMessage &msg);

/**
 * @throw network::DecodeError on oversized input, malformed JSON, an unknown
 *        message_type or a missing/mistyped field.
 */
ProtocolMessage decode(const std::vector<uint8_t> &bytes);

/// Non-empty sender, recipient and message id, and a non-zero timestamp.
bool isValid(const ProtocolMessage &msg);

bool isProtocolCompatible(uint8_t version);

bool validateMessageSize(const std::vector<uint8_t> &bytes);

ProtocolMessage createHandshake(const std::string &peerId,
                                const std::string &peerName,
                                const std::string &address,
                                const std::vector<uint8_t> &publicKey);

ProtocolMessage createTextMessage(const std::string &senderId,
                                  const std::string &recipientId,
                                  const std::string &content,
                                  const std::string &messageId);

/// createTextMessage() with a freshly generated message id.
ProtocolMessage createChatMessage(const std::string &senderId,
                                  const std::string &recipientId,
                                  const std::string &content);

ProtocolMessage createPing(const std::string &senderId,
                           const std::string &recipientId,
                           uint64_t sequence = 0);

/**
 * @brief Pong answering a ping sent at originalTimestamp.
 *        response_timestamp is never earlier than original_timestamp.
 */
ProtocolMessage createPong(const std::string &senderId,
                           const std::string &recipientId,
                           uint64_t originalTimestamp,
                           uint64_t sequence = 0);

ProtocolMessage createAcknowledgment(const std::string &senderId,
                                     const std::string &recipientId,
                                     const std::string &originalMessageId,
                                     const std::string &status = "delivered");

/// Acknowledgment from "system" whose status carries the error text.
ProtocolMessage createErrorResponse(const std::string &originalMessageId,
                                    const std::string &error);

ProtocolMessage createKeyExchange(const std::string &senderId,
                                  const std::string &recipientId,
                                  const std::vector<uint8_t> &publicKey);

ProtocolMessage createStatus(const std::string &senderId,
                             const std::string &recipientId,
                             const std::string &status,
                             const std::string &detail = "");

ProtocolMessage createFileChunk(const std::string &senderId,
                                const std::string &recipientId,
                                const FilePayload &chunk);

} // namespace protocol
} // namespace veilchat

#endif // VEILCHAT_PROTOCOL_PROTOCOL_MESSAGES_HPP
