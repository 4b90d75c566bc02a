//
// Created by the shotport authors on 18/09/25.
//

/**
 * @file thread_pool.hpp
 * @brief Fixed-size worker pool that runs one conversion per task.
 */

#ifndef SHOTPORT_THREAD_POOL_HPP
#define SHOTPORT_THREAD_POOL_HPP

#include <condition_variable>
#include <cstddef>
#include <functional>
#include <mutex>
#include <queue>
#include <stop_token>
#include <thread>
#include <vector>

namespace shotport {

/**
 * @brief Fixed-size pool of std::jthread workers.
 *
 * @details Each task receives the worker's std::stop_token. A task may come
 * with a discard callback: when request_stop() empties the queue, the
 * callback of every task that never started is invoked once, on the
 * thread that called request_stop(), after the queue lock is released.
 */
class ThreadPool {
public:
    using Task = std::function<void(const std::stop_token&)>;
    using DiscardHandler = std::function<void()>;

    /**
     * @param threads Number of worker threads; 0 is treated as 1.
     */
    explicit ThreadPool(unsigned threads = std::thread::hardware_concurrency());

    /// Lets queued tasks finish, then joins the workers.
    ~ThreadPool();

    ThreadPool(const ThreadPool&) = delete;
    ThreadPool& operator=(const ThreadPool&) = delete;

    /**
     * @brief Queues a task.
     * @param task Work to run on a worker thread.
     * @param on_discard Called instead of @p task if the task is dropped by request_stop().
     * @return false if the pool is already stopped; nothing is queued then.
     */
    bool enqueue(Task task, DiscardHandler on_discard = {});

    /// Blocks until every queued task ran or its discard callback returned.
    void wait_idle();

    /**
     * @brief Drops queued tasks and signals running ones through their stop_token.
     * @return Number of tasks dropped.
     */
    std::size_t request_stop();

    [[nodiscard]] std::size_t size() const noexcept { return workers_.size(); }

private:
    struct Entry {
        Task run;
        DiscardHandler discard;
    };

    void worker_loop(const std::stop_token& st);

    std::mutex queue_mutex_;                ///< Protects tasks_, stop_, active_ and draining_
    std::condition_variable_any condition_; ///< Wakes workers on new tasks or stop
    std::condition_variable idle_cv_;       ///< Wakes wait_idle() when the pool drains
    std::queue<Entry> tasks_;
    bool stop_{false};
    std::size_t active_{0};                 ///< Tasks currently running
    bool draining_{false};                  ///< request_stop() is running discard callbacks
    std::vector<std::jthread> workers_;
};

} // namespace shotport

#endif // SHOTPORT_THREAD_POOL_HPP
