#ifndef VEILCHAT_CORE_CHAT_LOG_HPP
#define VEILCHAT_CORE_CHAT_LOG_HPP

#include <map>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <string>
#include <vector>

#include "chat_types.hpp"

namespace veilchat {
namespace core {

/*
  ChatLog
  --------------------------------
  Per-conversation ordered message lists keyed by chatKey(). Readers share
  the lock, every mutation takes it exclusively for the in-memory update
  only.
*/
class ChatLog {
  public:
    void Append(const std::string& key, const ChatMessage& msg) {
        std::unique_lock<std::shared_mutex> lock(m_mutex);
        m_chats[key].push_back(msg);
    }

    // Returns false if no message with that id exists under key.
    bool UpdateStatus(const std::string& key, const std::string& id, DeliveryStatus status) {
        std::unique_lock<std::shared_mutex> lock(m_mutex);
        ChatMessage* msg = findLocked(key, id);
        if (msg == nullptr) {
            return false;
        }
        msg->status = status;
        return true;
    }

    // Compare-and-set on the status; false if absent or not in `from`.
    bool TransitionStatus(const std::string& key, const std::string& id, DeliveryStatus from,
                          DeliveryStatus to) {
        std::unique_lock<std::shared_mutex> lock(m_mutex);
        ChatMessage* msg = findLocked(key, id);
        if (msg == nullptr || msg->status != from) {
            return false;
        }
        msg->status = to;
        return true;
    }

    std::optional<ChatMessage> Find(const std::string& key, const std::string& id) const {
        std::shared_lock<std::shared_mutex> lock(m_mutex);
        auto it = m_chats.find(key);
        if (it == m_chats.end()) {
            return std::nullopt;
        }
        for (const auto& msg : it->second) {
            if (msg.id == id) {
                return msg;
            }
        }
        return std::nullopt;
    }

    std::vector<ChatMessage> Messages(const std::string& key) const {
        std::shared_lock<std::shared_mutex> lock(m_mutex);
        auto it = m_chats.find(key);
        if (it == m_chats.end()) {
            return {};
        }
        return it->second;
    }

    std::vector<std::string> Keys() const {
        std::shared_lock<std::shared_mutex> lock(m_mutex);
        std::vector<std::string> keys;
        keys.reserve(m_chats.size());
        for (const auto& entry : m_chats) {
            keys.push_back(entry.first);
        }
        return keys;
    }

    // Inbound messages (not sent by localName) that are delivered but not yet read.
    size_t UnreadCount(const std::string& key, const std::string& localName) const {
        std::shared_lock<std::shared_mutex> lock(m_mutex);
        auto it = m_chats.find(key);
        if (it == m_chats.end()) {
            return 0;
        }
        size_t count = 0;
        for (const auto& msg : it->second) {
            if (msg.from != localName && msg.status == DeliveryStatus::Delivered) {
                ++count;
            }
        }
        return count;
    }

    size_t TotalMessages() const {
        std::shared_lock<std::shared_mutex> lock(m_mutex);
        size_t total = 0;
        for (const auto& entry : m_chats) {
            total += entry.second.size();
        }
        return total;
    }

  private:
    ChatMessage* findLocked(const std::string& key, const std::string& id) {
        auto it = m_chats.find(key);
        if (it == m_chats.end()) {
            return nullptr;
        }
        for (auto& msg : it->second) {
            if (msg.id == id) {
                return &msg;
            }
        }
        return nullptr;
    }

    mutable std::shared_mutex m_mutex;
    std::map<std::string, std::vector<ChatMessage>> m_chats;
};

}  // namespace core
}  // namespace veilchat

#endif  // VEILCHAT_CORE_CHAT_LOG_HPP
