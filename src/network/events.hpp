#ifndef VEILCHAT_NETWORK_EVENTS_HPP
#define VEILCHAT_NETWORK_EVENTS_HPP

#include <cstdint>
#include <functional>
#include <map>
#include <mutex>
#include <string>
#include <variant>
#include <vector>

#include "core/chat_types.hpp"
#include "util/logger.hpp"

namespace veilchat {
namespace network {

struct ServerStarted
{
    uint16_t port;
};

struct ServerStopped
{
};

struct MessageReceived
{
    core::ChatMessage message;
};

struct ContactAdded
{
    core::Contact contact;
};

struct ErrorEvent
{
    std::string error;
    std::string context; ///< operation and failure classification, e.g. "send:refused"
};

using Event = std::variant<ServerStarted, ServerStopped, MessageReceived, ContactAdded, ErrorEvent>;

/**
 * @class EventBus
 * @brief Fan-out of delivery manager events to UI/persistence subscribers.
 *
 * Handlers run synchronously on the emitting thread (an accept task, a
 * sender or the timeout scheduler) outside the bus lock. A throwing handler
 * is logged and does not affect the others.
 */
class EventBus
{
public:
    using Handler = std::function<void(const Event &)>;

    size_t subscribe(Handler handler)
    {
        std::lock_guard<std::mutex> lock(mutex_);
        size_t id = nextId_++;
        handlers_.emplace(id, std::move(handler));
        return id;
    }

    bool unsubscribe(size_t id)
    {
        std::lock_guard<std::mutex> lock(mutex_);
        return handlers_.erase(id) > 0;
    }

    void emit(const Event &event) const
    {
        std::vector<Handler> snapshot;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            snapshot.reserve(handlers_.size());
            for (const auto &entry : handlers_) {
                snapshot.push_back(entry.second);
            }
        }
        for (const auto &handler : snapshot) {
            try {
                handler(event);
            }
            catch (const std::exception &ex) {
                util::logger::error(std::string("[EventBus] handler failed: ") + ex.what());
            }
        }
    }

private:
    mutable std::mutex mutex_;
    size_t nextId_ = 1;
    std::map<size_t, Handler> handlers_;
};

} // namespace network
} // namespace veilchat

#endif // VEILCHAT_NETWORK_EVENTS_HPP
