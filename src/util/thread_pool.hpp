#ifndef VEILCHAT_UTIL_THREAD_POOL_HPP
#define VEILCHAT_UTIL_THREAD_POOL_HPP

#include <algorithm>
#include <atomic>
#include <condition_variable>
#include <functional>
#include <future>
#include <mutex>
#include <queue>
#include <stdexcept>
#include <thread>
#include <type_traits>
#include <vector>
#include "logger.hpp"

/**
 * @file thread_pool.hpp
 * @brief Fixed-size worker pool that runs connection handlers and deferred
 *        delivery checks for VeilChat.
 *
 * Usage Example:
 *  @code
 *    veilchat::util::ThreadPool pool(4);
 *    auto result = pool.enqueue([](int x) { return x*x; }, 10);
 *    pool.post([] { handleInbound(); });   // fire-and-forget
 *    std::cout << "Result: " << result.get() << std::endl;
 *  @endcode
 */

namespace veilchat {
namespace util {

/**
 * @class ThreadPool
 * @brief A basic fixed-size thread pool implementation.
 *
 * - Constructor spawns a given number of worker threads.
 * - enqueue(...) schedules a task and returns its future.
 * - post(...) schedules a task whose result nobody waits for; exceptions
 *   escaping it are logged.
 * - Destructor drains the queue and joins the workers.
 */
class ThreadPool
{
public:
    /**
     * @param threadCount Number of worker threads to create. If zero, uses hardware concurrency.
     */
    explicit ThreadPool(size_t threadCount = 0)
        : stop_(false)
        , active_(0)
    {
        if (threadCount == 0) {
            threadCount = std::max<size_t>(1, std::thread::hardware_concurrency());
        }
        workers_.reserve(threadCount);

        for (size_t i = 0; i < threadCount; ++i) {
            workers_.emplace_back([this] {
                while (true) {
                    std::function<void()> task;
                    {
                        std::unique_lock<std::mutex> lock(queueMutex_);
                        condVar_.wait(lock, [this] {
                            return !taskQueue_.empty() || stop_;
                        });

                        if (stop_ && taskQueue_.empty()) {
                            return;
                        }
                        task = std::move(taskQueue_.front());
                        taskQueue_.pop();
                    }
                    ++active_;
                    task();
                    --active_;
                }
            });
        }
    }

    ~ThreadPool()
    {
        {
            std::unique_lock<std::mutex> lock(queueMutex_);
            stop_ = true;
        }
        condVar_.notify_all();

        for (auto &worker : workers_) {
            if (worker.joinable()) {
                worker.join();
            }
        }
    }

    ThreadPool(const ThreadPool&) = delete;
    ThreadPool& operator=(const ThreadPool&) = delete;

    /**
     * @brief Enqueue a task into the thread pool for asynchronous execution.
     * @return A std::future<ReturnType> that can be used to retrieve the result.
     * @throw std::runtime_error if the pool is shutting down.
     */
    template<typename F, typename... Args>
    auto enqueue(F&& f, Args&&... args)
        -> std::future<typename std::invoke_result<F, Args...>::type>
    {
        using return_type = typename std::invoke_result<F, Args...>::type;

        auto taskPtr = std::make_shared<std::packaged_task<return_type()>>(
            std::bind(std::forward<F>(f), std::forward<Args>(args)...)
        );

        std::future<return_type> res = taskPtr->get_future();
        push([taskPtr]() { (*taskPtr)(); });
        return res;
    }

    /**
     * @brief Schedule a task without a future.
     * @throw std::runtime_error if the pool is shutting down.
     */
    void post(std::function<void()> task)
    {
        push([task = std::move(task)]() {
            try {
                task();
            }
            catch (const std::exception &ex) {
                logger::error(std::string("[ThreadPool] task failed: ") + ex.what());
            }
        });
    }

    size_t size() const
    {
        return workers_.size();
    }

    /// Tasks waiting in the queue (not yet picked up by a worker).
    size_t pendingTasks() const
    {
        std::lock_guard<std::mutex> lock(queueMutex_);
        return taskQueue_.size();
    }

    size_t activeTasks() const
    {
        return active_.load();
    }

private:
    void push(std::function<void()> wrapped)
    {
        {
            std::unique_lock<std::mutex> lock(queueMutex_);
            if (stop_) {
                throw std::runtime_error("enqueue on stopped ThreadPool");
            }
            taskQueue_.emplace(std::move(wrapped));
        }
        condVar_.notify_one();
    }

    std::vector<std::thread> workers_;               ///< The pool of worker threads
    std::queue<std::function<void()>> taskQueue_;    ///< Task queue
    mutable std::mutex queueMutex_;                  ///< Mutex to protect the queue
    std::condition_variable condVar_;                ///< Condition variable for task readiness
    bool stop_;                                      ///< Signals the pool to stop accepting new tasks
    std::atomic<size_t> active_;                     ///< Tasks currently executing
};

} // namespace util
} // namespace veilchat

#endif // VEILCHAT_UTIL_THREAD_POOL_HPP
