#ifndef VEILCHAT_UTIL_DEFERRED_SCHEDULER_HPP
#define VEILCHAT_UTIL_DEFERRED_SCHEDULER_HPP

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <functional>
#include <mutex>
#include <string>
#include <thread>
#include <unordered_map>
#include "logger.hpp"

namespace veilchat {
namespace util {

/*
  DeferredScheduler
  --------------------------------
  Runs one-shot tasks after a delay, each registered under a string key so
  it can be cancelled before it fires. The delivery manager uses it for the
  acknowledgment-timeout check of every message sent without a synchronous
  acknowledgment: a late acknowledgment cancels the task by message id.

  - A single background thread sleeps until the earliest deadline (or until a
    new task / cancellation / stop wakes it).
  - Scheduling an existing key replaces the previous task.
  - Tasks run on the scheduler thread and must stay short (in-memory updates).
  - stop() discards every task that has not fired yet.
*/
class DeferredScheduler {
  public:
    using Clock = std::chrono::steady_clock;

    DeferredScheduler() : m_isRunning(false) {}

    ~DeferredScheduler() { Stop(); }

    DeferredScheduler(const DeferredScheduler&) = delete;
    DeferredScheduler& operator=(const DeferredScheduler&) = delete;

    bool Start() {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (m_isRunning) {
            return true;
        }
        m_isRunning = true;
        m_thread = std::thread(&DeferredScheduler::schedulerLoop, this);
        logger::debug("[DeferredScheduler] started.");
        return true;
    }

    void Stop() {
        size_t dropped = 0;
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            if (!m_isRunning) {
                return;
            }
            m_isRunning = false;
            dropped = m_tasks.size();
            m_tasks.clear();
            m_cv.notify_all();
        }
        if (m_thread.joinable()) {
            m_thread.join();
        }
        logger::debug("[DeferredScheduler] stopped, " + std::to_string(dropped) +
                      " pending task(s) discarded.");
    }

    /**
     * @return true if a task with the same key was replaced.
     */
    bool Schedule(const std::string& key, std::chrono::milliseconds delay,
                  std::function<void()> task) {
        std::lock_guard<std::mutex> lock(m_mutex);
        bool replaced = m_tasks.erase(key) > 0;
        m_tasks.emplace(key, Entry{Clock::now() + delay, std::move(task)});
        m_cv.notify_all();
        return replaced;
    }

    /**
     * @return true if the task was still pending and is now removed.
     */
    bool Cancel(const std::string& key) {
        std::lock_guard<std::mutex> lock(m_mutex);
        bool removed = m_tasks.erase(key) > 0;
        if (removed) {
            m_cv.notify_all();
        }
        return removed;
    }

    bool IsScheduled(const std::string& key) const {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_tasks.count(key) > 0;
    }

    size_t PendingCount() const {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_tasks.size();
    }

  private:
    struct Entry {
        Clock::time_point due;
        std::function<void()> task;
    };

    void schedulerLoop() {
        std::unique_lock<std::mutex> lock(m_mutex);
        while (m_isRunning) {
            if (m_tasks.empty()) {
                m_cv.wait(lock, [this] { return !m_isRunning || !m_tasks.empty(); });
                continue;
            }

            auto next = m_tasks.begin();
            for (auto it = m_tasks.begin(); it != m_tasks.end(); ++it) {
                if (it->second.due < next->second.due) {
                    next = it;
                }
            }

            if (next->second.due > Clock::now()) {
                // Woken early by schedule/cancel/stop: recompute the earliest deadline.
                m_cv.wait_until(lock, next->second.due);
                continue;
            }

            std::string key = next->first;
            std::function<void()> task = std::move(next->second.task);
            m_tasks.erase(next);

            lock.unlock();
            try {
                task();
            } catch (const std::exception& ex) {
                logger::error("[DeferredScheduler] task '" + key + "' failed: " + ex.what());
            }
            lock.lock();
        }
    }

  private:
    std::atomic<bool> m_isRunning;
    std::thread m_thread;
    mutable std::mutex m_mutex;
    std::condition_variable m_cv;
    std::unordered_map<std::string, Entry> m_tasks;
};

} // namespace util
} // namespace veilchat

#endif // VEILCHAT_UTIL_DEFERRED_SCHEDULER_HPP
