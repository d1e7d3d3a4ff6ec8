/**
 * @file thread_pool.cpp
 * @brief ThreadPool implementation.
 * @author Dimitris Kafetzis
 */

#include "executor/thread_pool.hpp"

#include <pthread.h>

namespace sandbox_runner {

namespace {

// Linux caps thread names at 15 characters plus the terminator.
constexpr size_t kMaxThreadName = 15;

void name_current_thread(const std::string& prefix, size_t index) {
    std::string name = prefix + "-" + std::to_string(index);
    if (name.size() > kMaxThreadName) name.resize(kMaxThreadName);
    ::pthread_setname_np(::pthread_self(), name.c_str());
}

}  // anonymous namespace

ThreadPool::ThreadPool(size_t num_threads, std::string name)
    : name_(std::move(name)) {
    if (num_threads == 0) {
        num_threads = std::thread::hardware_concurrency();
        if (num_threads == 0) num_threads = 4;
    }

    workers_.reserve(num_threads);
    for (size_t i = 0; i < num_threads; ++i) {
        workers_.emplace_back([this, i](std::stop_token stop) {
            name_current_thread(name_, i);
            worker_loop(stop);
        });
    }
}

ThreadPool::~ThreadPool() {
    for (auto& worker : workers_) {
        worker.request_stop();
    }
    queue_cv_.notify_all();
    // Join here: the queue and its mutex die before the jthread members would.
    for (auto& worker : workers_) {
        if (worker.joinable()) worker.join();
    }
}

void ThreadPool::worker_loop(std::stop_token stop) {
    struct Busy {
        std::atomic<size_t>& counter;
        explicit Busy(std::atomic<size_t>& c) : counter(c) { ++counter; }
        ~Busy() { --counter; }
    };

    while (true) {
        Task task;
        {
            std::unique_lock lock(queue_mutex_);
            queue_cv_.wait(lock, stop, [this] { return !task_queue_.empty(); });
            // Stopped: whatever is still queued is dropped and its futures
            // report broken_promise.
            if (stop.stop_requested()) return;
            task = std::move(task_queue_.front());
            task_queue_.pop();
        }

        Busy busy(active_tasks_);
        task(stop);
    }
}

size_t ThreadPool::active_count() const noexcept {
    return active_tasks_.load();
}

size_t ThreadPool::queued_count() const noexcept {
    std::lock_guard lock(queue_mutex_);
    return task_queue_.size();
}

size_t ThreadPool::thread_count() const noexcept {
    return workers_.size();
}

}  // namespace sandbox_runner
