#ifndef VEILCHAT_CORE_CONTACT_REGISTRY_HPP
#define VEILCHAT_CORE_CONTACT_REGISTRY_HPP

#include <map>
#include <mutex>
#include <optional>
#include <set>
#include <shared_mutex>
#include <string>
#include <vector>

#include "chat_types.hpp"

namespace veilchat {
namespace core {

/*
  ContactRegistry
  --------------------------------
  Known contacts keyed by peer id, plus the blocked-peer set. The two are
  guarded by separate reader/writer locks; blocking a peer does not require
  it to be a known contact.
*/
class ContactRegistry {
  public:
    // Returns true if the contact was new.
    bool Upsert(const Contact& contact) {
        std::unique_lock<std::shared_mutex> lock(m_contactsMutex);
        auto result = m_contacts.insert_or_assign(contact.id, contact);
        return result.second;
    }

    std::optional<Contact> FindById(const std::string& id) const {
        std::shared_lock<std::shared_mutex> lock(m_contactsMutex);
        auto it = m_contacts.find(id);
        if (it == m_contacts.end()) {
            return std::nullopt;
        }
        return it->second;
    }

    std::optional<Contact> FindByName(const std::string& name) const {
        std::shared_lock<std::shared_mutex> lock(m_contactsMutex);
        for (const auto& entry : m_contacts) {
            if (entry.second.name == name) {
                return entry.second;
            }
        }
        return std::nullopt;
    }

    // Display name for a peer id, or the id itself if unknown.
    std::string DisplayName(const std::string& id) const {
        std::shared_lock<std::shared_mutex> lock(m_contactsMutex);
        auto it = m_contacts.find(id);
        if (it == m_contacts.end() || it->second.name.empty()) {
            return id;
        }
        return it->second.name;
    }

    std::vector<Contact> All() const {
        std::shared_lock<std::shared_mutex> lock(m_contactsMutex);
        std::vector<Contact> out;
        out.reserve(m_contacts.size());
        for (const auto& entry : m_contacts) {
            out.push_back(entry.second);
        }
        return out;
    }

    bool SetStatus(const std::string& id, ContactStatus status, uint64_t lastSeen) {
        std::unique_lock<std::shared_mutex> lock(m_contactsMutex);
        auto it = m_contacts.find(id);
        if (it == m_contacts.end()) {
            return false;
        }
        it->second.status = status;
        it->second.lastSeen = lastSeen;
        return true;
    }

    void Block(const std::string& id) {
        std::unique_lock<std::shared_mutex> lock(m_blockedMutex);
        m_blocked.insert(id);
    }

    // Returns false if the peer was not blocked.
    bool Unblock(const std::string& id) {
        std::unique_lock<std::shared_mutex> lock(m_blockedMutex);
        return m_blocked.erase(id) > 0;
    }

    bool IsBlocked(const std::string& id) const {
        std::shared_lock<std::shared_mutex> lock(m_blockedMutex);
        return m_blocked.count(id) > 0;
    }

  private:
    mutable std::shared_mutex m_contactsMutex;
    std::map<std::string, Contact> m_contacts;

    mutable std::shared_mutex m_blockedMutex;
    std::set<std::string> m_blocked;
};

}  // namespace core
}  // namespace veilchat

#endif  // VEILCHAT_CORE_CONTACT_REGISTRY_HPP
