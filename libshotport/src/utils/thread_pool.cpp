//
// Created by the shotport authors on 19/09/25.
//

#include "../../include/thread_pool.hpp"
#include "../../include/logger.hpp"
#include <exception>
#include <string>

namespace shotport {

ThreadPool::ThreadPool(unsigned threads) {
    if (threads == 0) threads = 1;
    workers_.reserve(threads);
    for (unsigned i = 0; i < threads; ++i) {
        workers_.emplace_back([this](const std::stop_token& st) { worker_loop(st); });
    }
}

ThreadPool::~ThreadPool() {
    {
        std::lock_guard lock(queue_mutex_);
        stop_ = true;
    }
    condition_.notify_all();
    // jthread destructors request stop and join; queued tasks are drained first
}

void ThreadPool::worker_loop(const std::stop_token& st) {
    for (;;) {
        Entry entry;
        {
            std::unique_lock lock(queue_mutex_);
            condition_.wait(lock, st, [this] { return stop_ || !tasks_.empty(); });
            if (tasks_.empty()) {
                if (stop_ || st.stop_requested()) return;
                continue;
            }
            entry = std::move(tasks_.front());
            tasks_.pop();
            ++active_;
        }

        try {
            entry.run(st);
        } catch (const std::exception& e) {
            Logger::log(LogLevel::Error, std::string("Unhandled exception in worker: ") + e.what(), "thread_pool");
        }

        {
            std::lock_guard lock(queue_mutex_);
            --active_;
        }
        idle_cv_.notify_all();
    }
}

bool ThreadPool::enqueue(Task task, DiscardHandler on_discard) {
    {
        std::lock_guard lock(queue_mutex_);
        if (stop_) return false;
        tasks_.push(Entry{std::move(task), std::move(on_discard)});
    }
    condition_.notify_one();
    return true;
}

void ThreadPool::wait_idle() {
    std::unique_lock lock(queue_mutex_);
    idle_cv_.wait(lock, [this] { return active_ == 0 && tasks_.empty() && !draining_; });
}

std::size_t ThreadPool::request_stop() {
    std::queue<Entry> dropped;
    {
        std::lock_guard lock(queue_mutex_);
        stop_ = true;
        std::swap(dropped, tasks_);
        draining_ = !dropped.empty();
    }
    condition_.notify_all();
    idle_cv_.notify_all();
    for (auto& worker : workers_) {
        worker.request_stop();
    }

    const std::size_t count = dropped.size();
    while (!dropped.empty()) {
        if (dropped.front().discard) dropped.front().discard();
        dropped.pop();
    }
    {
        std::lock_guard lock(queue_mutex_);
        draining_ = false;
    }
    idle_cv_.notify_all();
    if (count > 0) {
        Logger::log(LogLevel::Info, "Dropped " + std::to_string(count) + " queued tasks", "thread_pool");
    }
    return count;
}

} // namespace shotport
