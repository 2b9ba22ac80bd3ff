#ifndef VEILCHAT_CORE_ADDRESS_BOOK_HPP
#define VEILCHAT_CORE_ADDRESS_BOOK_HPP

#include <map>
#include <mutex>
#include <optional>
#include <string>

namespace veilchat {
namespace core {

/**
 * @class AddressBook
 * @brief Resolves a contact name to the "host:port" it can be reached at.
 *        Owned by the embedding application.
 */
class AddressBook
{
public:
    virtual ~AddressBook() = default;

    /// @return std::nullopt if the name is unknown.
    virtual std::optional<std::string> resolveAddress(const std::string &contactName) = 0;
};

/// In-memory address book used by the demo node and tests.
class StaticAddressBook : public AddressBook
{
public:
    void setAddress(const std::string &contactName, const std::string &address)
    {
        std::lock_guard<std::mutex> lock(mutex_);
        addresses_[contactName] = address;
    }

    std::optional<std::string> resolveAddress(const std::string &contactName) override
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = addresses_.find(contactName);
        if (it == addresses_.end()) {
            return std::nullopt;
        }
        return it->second;
    }

private:
    std::mutex mutex_;
    std::map<std::string, std::string> addresses_;
};

} // namespace core
} // namespace veilchat

#endif // VEILCHAT_CORE_ADDRESS_BOOK_HPP
