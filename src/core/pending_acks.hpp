#ifndef VEILCHAT_CORE_PENDING_ACKS_HPP
#define VEILCHAT_CORE_PENDING_ACKS_HPP

#include <mutex>
#include <optional>
#include <shared_mutex>
#include <string>
#include <unordered_map>

namespace veilchat {
namespace core {

/*
  PendingAckTable
  --------------------------------
  message id -> chat key for messages written without a synchronous
  acknowledgment. Take() removes under the writer lock, so of the inbound
  acknowledgment and the timeout task only the first caller gets the entry.
*/
class PendingAckTable {
  public:
    // Returns false if the id was already pending.
    bool Insert(const std::string& messageId, const std::string& chatKey) {
        std::unique_lock<std::shared_mutex> lock(m_mutex);
        return m_entries.emplace(messageId, chatKey).second;
    }

    std::optional<std::string> Take(const std::string& messageId) {
        std::unique_lock<std::shared_mutex> lock(m_mutex);
        auto it = m_entries.find(messageId);
        if (it == m_entries.end()) {
            return std::nullopt;
        }
        std::string key = std::move(it->second);
        m_entries.erase(it);
        return key;
    }

    bool Contains(const std::string& messageId) const {
        std::shared_lock<std::shared_mutex> lock(m_mutex);
        return m_entries.count(messageId) > 0;
    }

    size_t Size() const {
        std::shared_lock<std::shared_mutex> lock(m_mutex);
        return m_entries.size();
    }

  private:
    mutable std::shared_mutex m_mutex;
    std::unordered_map<std::string, std::string> m_entries;
};

}  // namespace core
}  // namespace veilchat

#endif  // VEILCHAT_CORE_PENDING_ACKS_HPP
