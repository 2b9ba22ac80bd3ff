#ifndef VEILCHAT_CORE_CHAT_TYPES_HPP
#define VEILCHAT_CORE_CHAT_TYPES_HPP

#include <cstdint>
#include <string>
#include <vector>

namespace veilchat {
namespace core {

/*
  Application-level records kept by the delivery manager. These are distinct
  from the wire envelope (protocol::ProtocolMessage): a ChatMessage is what a
  UI or a persistence collaborator sees.
*/

enum class DeliveryStatus {
    Pending,
    Sent,
    Delivered,
    Read,
    Failed
};

inline const char* deliveryStatusName(DeliveryStatus status) {
    switch (status) {
        case DeliveryStatus::Pending:
            return "Pending";
        case DeliveryStatus::Sent:
            return "Sent";
        case DeliveryStatus::Delivered:
            return "Delivered";
        case DeliveryStatus::Read:
            return "Read";
        case DeliveryStatus::Failed:
            return "Failed";
    }
    return "Unknown";
}

enum class ChatMessageType {
    Text,
    File,
    System
};

struct ChatMessage {
    std::string id;
    std::string from;
    std::string to;
    std::string content;
    ChatMessageType type = ChatMessageType::Text;
    uint64_t timestamp = 0;
    DeliveryStatus status = DeliveryStatus::Pending;
};

enum class ContactStatus {
    Online,
    Offline,
    Away,
    Busy,
    Unknown
};

enum class TrustLevel {
    Unknown,
    Untrusted,
    Trusted,
    Verified
};

struct Contact {
    std::string id;       // peer id used on the wire
    std::string name;     // display name, local side of chat keys
    std::string address;  // "host:port"
    std::vector<uint8_t> publicKey;
    ContactStatus status = ContactStatus::Unknown;
    TrustLevel trustLevel = TrustLevel::Unknown;
    uint64_t lastSeen = 0;
};

struct NetworkStats {
    uint64_t messagesSent = 0;
    uint64_t messagesReceived = 0;
    uint64_t bytesSent = 0;
    uint64_t bytesReceived = 0;
    uint64_t totalConnections = 0;
    uint64_t activeConnections = 0;
    uint64_t uptimeSeconds = 0;
};

// Both peers derive the same key regardless of who starts the conversation.
inline std::string chatKey(const std::string& a, const std::string& b) {
    return a < b ? a + "_" + b : b + "_" + a;
}

}  // namespace core
}  // namespace veilchat

#endif  // VEILCHAT_CORE_CHAT_TYPES_HPP
