#include "protocol/protocol_messages.hpp"
#include "network/errors.hpp"
#include "util/hashing.hpp"

#include <algorithm>
#include <chrono>
#include <nlohmann/json.hpp>

namespace veilchat {
namespace protocol {

using nlohmann::json;
using util::hashing::base64Decode;
using util::hashing::base64Encode;

const char *const BROADCAST_RECIPIENT = "broadcast";

namespace {

struct TypeName {
    MessageType type;
    const char *name;
};

const TypeName kTypeNames[] = {
    {MessageType::Handshake, "Handshake"},
    {MessageType::Chat, "Chat"},
    {MessageType::Ping, "Ping"},
    {MessageType::Pong, "Pong"},
    {MessageType::Acknowledgment, "Acknowledgment"},
    {MessageType::KeyExchange, "KeyExchange"},
    {MessageType::Status, "Status"},
    {MessageType::File, "File"},
};

ProtocolMessage makeEnvelope(MessageType type, const std::string &sender,
                             const std::string &recipient, const std::string &messageId) {
    ProtocolMessage msg;
    msg.type = type;
    msg.senderId = sender;
    msg.recipientId = recipient;
    msg.messageId = messageId.empty() ? util::hashing::uuidV4() : messageId;
    msg.timestamp = nowSeconds();
    return msg;
}

std::vector<uint8_t> bytesField(const json &j, const char *key) {
    const std::string &s = j.at(key).get_ref<const std::string &>();
    try {
        return base64Decode(s);
    } catch (const std::runtime_error &ex) {
        throw network::DecodeError(std::string("field '") + key + "': " + ex.what());
    }
}

json payloadToJson(const MessagePayload &payload) {
    json p = json::object();
    if (auto *h = std::get_if<HandshakePayload>(&payload)) {
        p["peer_id"] = h->peerId;
        p["peer_name"] = h->peerName;
        p["address"] = h->address;
        p["public_key"] = base64Encode(h->publicKey);
        p["protocol_version"] = h->protocolVersion;
    } else if (auto *t = std::get_if<TextPayload>(&payload)) {
        p["content"] = t->content;
        p["message_id"] = t->messageId;
        p["reply_to"] = t->replyTo ? json(*t->replyTo) : json(nullptr);
    } else if (auto *ping = std::get_if<PingPayload>(&payload)) {
        p["timestamp"] = ping->timestamp;
        p["sequence"] = ping->sequence;
    } else if (auto *pong = std::get_if<PongPayload>(&payload)) {
        p["original_timestamp"] = pong->originalTimestamp;
        p["response_timestamp"] = pong->responseTimestamp;
        p["sequence"] = pong->sequence;
    } else if (auto *f = std::get_if<FilePayload>(&payload)) {
        p["file_name"] = f->fileName;
        p["file_size"] = f->fileSize;
        p["file_hash"] = f->fileHash;
        p["chunk_data"] = base64Encode(f->chunkData);
        p["chunk_index"] = f->chunkIndex;
        p["total_chunks"] = f->totalChunks;
    } else if (auto *a = std::get_if<AckPayload>(&payload)) {
        p["original_message_id"] = a->originalMessageId;
        p["status"] = a->status;
    } else if (auto *k = std::get_if<KeyExchangePayload>(&payload)) {
        p["public_key"] = base64Encode(k->publicKey);
    } else if (auto *s = std::get_if<StatusPayload>(&payload)) {
        p["status"] = s->status;
        p["detail"] = s->detail;
    } else {
        return json(nullptr);
    }
    return p;
}

MessagePayload payloadFromJson(MessageType type, const json &p) {
    if (!p.is_object()) {
        throw network::DecodeError(std::string("missing payload for ") + messageTypeName(type));
    }
    switch (type) {
    case MessageType::Handshake: {
        HandshakePayload h;
        h.peerId = p.at("peer_id").get<std::string>();
        h.peerName = p.at("peer_name").get<std::string>();
        h.address = p.at("address").get<std::string>();
        h.publicKey = bytesField(p, "public_key");
        unsigned version = p.at("protocol_version").get<unsigned>();
        if (version > 0xFF) {
            throw network::DecodeError("protocol_version out of range");
        }
        h.protocolVersion = static_cast<uint8_t>(version);
        return h;
    }
    case MessageType::Chat: {
        TextPayload t;
        t.content = p.at("content").get<std::string>();
        t.messageId = p.at("message_id").get<std::string>();
        auto it = p.find("reply_to");
        if (it != p.end() && !it->is_null()) {
            t.replyTo = it->get<std::string>();
        }
        return t;
    }
    case MessageType::Ping: {
        PingPayload ping;
        ping.timestamp = p.at("timestamp").get<uint64_t>();
        ping.sequence = p.at("sequence").get<uint64_t>();
        return ping;
    }
    case MessageType::Pong: {
        PongPayload pong;
        pong.originalTimestamp = p.at("original_timestamp").get<uint64_t>();
        pong.responseTimestamp = p.at("response_timestamp").get<uint64_t>();
        pong.sequence = p.at("sequence").get<uint64_t>();
        return pong;
    }
    case MessageType::File: {
        FilePayload f;
        f.fileName = p.at("file_name").get<std::string>();
        f.fileSize = p.at("file_size").get<uint64_t>();
        f.fileHash = p.at("file_hash").get<std::string>();
        f.chunkData = bytesField(p, "chunk_data");
        f.chunkIndex = p.at("chunk_index").get<uint32_t>();
        f.totalChunks = p.at("total_chunks").get<uint32_t>();
        return f;
    }
    case MessageType::Acknowledgment: {
        AckPayload a;
        a.originalMessageId = p.at("original_message_id").get<std::string>();
        a.status = p.at("status").get<std::string>();
        return a;
    }
    case MessageType::KeyExchange: {
        KeyExchangePayload k;
        k.publicKey = bytesField(p, "public_key");
        return k;
    }
    case MessageType::Status: {
        StatusPayload s;
        s.status = p.at("status").get<std::string>();
        s.detail = p.value("detail", std::string());
        return s;
    }
    }
    throw network::DecodeError("unhandled message type");
}

json envelopeToJson(const ProtocolMessage &msg, bool withSignature) {
    json j;
    j["message_type"] = messageTypeName(msg.type);
    j["sender_id"] = msg.senderId;
    j["recipient_id"] = msg.recipientId;
    j["message_id"] = msg.messageId;
    j["timestamp"] = msg.timestamp;
    j["sequence_number"] = msg.sequenceNumber;
    j["content"] = base64Encode(msg.content);
    j["payload"] = payloadToJson(msg.payload);
    if (withSignature && msg.signature) {
        j["signature"] = base64Encode(*msg.signature);
    }
    return j;
}

std::vector<uint8_t> dump(const json &j) {
    std::string text = j.dump();
    return std::vector<uint8_t>(text.begin(), text.end());
}

} // namespace

const char *messageTypeName(MessageType type) {
    for (const auto &entry : kTypeNames) {
        if (entry.type == type) {
            return entry.name;
        }
    }
    return "Unknown";
}

std::optional<MessageType> parseMessageType(const std::string &name) {
    for (const auto &entry : kTypeNames) {
        if (name == entry.name) {
            return entry.type;
        }
    }
    return std::nullopt;
}

uint64_t nowSeconds() {
    return static_cast<uint64_t>(std::chrono::duration_cast<std::chrono::seconds>(
                                     std::chrono::system_clock::now().time_since_epoch())
                                     .count());
}

std::vector<uint8_t> encode(const ProtocolMessage &msg) {
    return dump(envelopeToJson(msg, true));
}

std::vector<uint8_t> encodeForSigning(const ProtocolMessage &msg) {
    return dump(envelopeToJson(msg, false));
}

ProtocolMessage decode(const std::vector<uint8_t> &bytes) {
    if (!validateMessageSize(bytes)) {
        throw network::DecodeError("message of " + std::to_string(bytes.size()) +
                                   " bytes exceeds limit of " + std::to_string(MAX_MESSAGE_SIZE));
    }
    if (bytes.empty()) {
        throw network::DecodeError("empty input");
    }

    try {
        json j = json::parse(bytes.begin(), bytes.end());
        if (!j.is_object()) {
            throw network::DecodeError("document is not an object");
        }

        const std::string &typeName = j.at("message_type").get_ref<const std::string &>();
        auto type = parseMessageType(typeName);
        if (!type) {
            throw network::DecodeError("unknown message_type '" + typeName + "'");
        }

        ProtocolMessage msg;
        msg.type = *type;
        msg.senderId = j.at("sender_id").get<std::string>();
        msg.recipientId = j.at("recipient_id").get<std::string>();
        msg.messageId = j.at("message_id").get<std::string>();
        msg.timestamp = j.at("timestamp").get<uint64_t>();
        msg.sequenceNumber = j.value("sequence_number", static_cast<uint64_t>(0));
        msg.content = bytesField(j, "content");
        msg.payload = payloadFromJson(*type, j.at("payload"));

        auto sig = j.find("signature");
        if (sig != j.end() && !sig->is_null()) {
            msg.signature = bytesField(j, "signature");
        }
        return msg;
    } catch (const json::exception &ex) {
        throw network::DecodeError(ex.what());
    }
}

bool isValid(const ProtocolMessage &msg) {
    return !msg.senderId.empty() && !msg.recipientId.empty() && !msg.messageId.empty() &&
           msg.timestamp > 0;
}

bool isProtocolCompatible(uint8_t version) {
    return version == PROTOCOL_VERSION;
}

bool validateMessageSize(const std::vector<uint8_t> &bytes) {
    return bytes.size() <= MAX_MESSAGE_SIZE;
}

ProtocolMessage createHandshake(const std::string &peerId, const std::string &peerName,
                                const std::string &address,
                                const std::vector<uint8_t> &publicKey) {
    ProtocolMessage msg = makeEnvelope(MessageType::Handshake, peerId, BROADCAST_RECIPIENT, "");
    msg.content = publicKey;
    HandshakePayload h;
    h.peerId = peerId;
    h.peerName = peerName;
    h.address = address;
    h.publicKey = publicKey;
    h.protocolVersion = PROTOCOL_VERSION;
    msg.payload = h;
    return msg;
}

ProtocolMessage createTextMessage(const std::string &senderId, const std::string &recipientId,
                                  const std::string &content, const std::string &messageId) {
    ProtocolMessage msg = makeEnvelope(MessageType::Chat, senderId, recipientId, messageId);
    msg.content.assign(content.begin(), content.end());
    msg.payload = TextPayload{content, msg.messageId, std::nullopt};
    return msg;
}

ProtocolMessage createChatMessage(const std::string &senderId, const std::string &recipientId,
                                  const std::string &content) {
    return createTextMessage(senderId, recipientId, content, util::hashing::uuidV4());
}

ProtocolMessage createPing(const std::string &senderId, const std::string &recipientId,
                           uint64_t sequence) {
    ProtocolMessage msg = makeEnvelope(MessageType::Ping, senderId, recipientId, "");
    msg.sequenceNumber = sequence;
    msg.payload = PingPayload{msg.timestamp, sequence};
    return msg;
}

ProtocolMessage createPong(const std::string &senderId, const std::string &recipientId,
                           uint64_t originalTimestamp, uint64_t sequence) {
    ProtocolMessage msg = makeEnvelope(MessageType::Pong, senderId, recipientId, "");
    msg.sequenceNumber = sequence;
    // A peer clock ahead of ours must not produce a pong older than its ping.
    msg.payload = PongPayload{originalTimestamp, std::max(msg.timestamp, originalTimestamp), sequence};
    return msg;
}

ProtocolMessage createAcknowledgment(const std::string &senderId, const std::string &recipientId,
                                     const std::string &originalMessageId,
                                     const std::string &status) {
    ProtocolMessage msg = makeEnvelope(MessageType::Acknowledgment, senderId, recipientId, "");
    msg.content.assign(originalMessageId.begin(), originalMessageId.end());
    msg.payload = AckPayload{originalMessageId, status};
    return msg;
}

ProtocolMessage createErrorResponse(const std::string &originalMessageId,
                                    const std::string &error) {
    return createAcknowledgment("system", "error", originalMessageId, "error: " + error);
}

ProtocolMessage createKeyExchange(const std::string &senderId, const std::string &recipientId,
                                  const std::vector<uint8_t> &publicKey) {
    ProtocolMessage msg = makeEnvelope(MessageType::KeyExchange, senderId, recipientId, "");
    msg.content = publicKey;
    msg.payload = KeyExchangePayload{publicKey};
    return msg;
}

ProtocolMessage createStatus(const std::string &senderId, const std::string &recipientId,
                             const std::string &status, const std::string &detail) {
    ProtocolMessage msg = makeEnvelope(MessageType::Status, senderId, recipientId, "");
    msg.payload = StatusPayload{status, detail};
    return msg;
}

ProtocolMessage createFileChunk(const std::string &senderId, const std::string &recipientId,
                                const FilePayload &chunk) {
    ProtocolMessage msg = makeEnvelope(MessageType::File, senderId, recipientId, "");
    msg.sequenceNumber = chunk.chunkIndex;
    msg.payload = chunk;
    return msg;
}

} // namespace protocol
} // namespace veilchat
