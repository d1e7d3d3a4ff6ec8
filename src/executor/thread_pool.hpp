/**
 * @file thread_pool.hpp
 * @brief std::jthread-based thread pool with cooperative cancellation and
 *        bounded submission.
 * @author Dimitris Kafetzis
 */

#pragma once

#include <atomic>
#include <concepts>
#include <condition_variable>
#include <functional>
#include <future>
#include <mutex>
#include <optional>
#include <queue>
#include <string>
#include <thread>
#include <type_traits>
#include <vector>

namespace sandbox_runner {

/**
 * @brief Thread pool using std::jthread for automatic join and stop_token support.
 *
 * Queued callables must be copy-constructible (std::function); move-only
 * state should be shared through a std::shared_ptr.
 */
class ThreadPool {
public:
    /// @param name Worker thread name prefix, visible in ps and /proc.
    explicit ThreadPool(size_t num_threads = 0, std::string name = "worker");
    ~ThreadPool();

    // Non-copyable, non-movable
    ThreadPool(const ThreadPool&) = delete;
    ThreadPool& operator=(const ThreadPool&) = delete;

    /// Submit a callable for execution.
    template <std::invocable F>
    std::future<std::invoke_result_t<F>> submit(F&& func);

    /// Submit a callable that accepts a stop_token.
    template <std::invocable<std::stop_token> F>
    std::future<std::invoke_result_t<F, std::stop_token>> submit_cancellable(F&& func);

    /**
     * @brief Submit only if fewer than @p max_queued tasks are waiting.
     * @return std::nullopt when the queue is full; the callable is dropped.
     */
    template <std::invocable<std::stop_token> F>
    std::optional<std::future<std::invoke_result_t<F, std::stop_token>>>
    try_submit_cancellable(F&& func, size_t max_queued);

    [[nodiscard]] size_t active_count() const noexcept;
    [[nodiscard]] size_t queued_count() const noexcept;
    [[nodiscard]] size_t thread_count() const noexcept;

private:
    using Task = std::function<void(std::stop_token)>;

    template <typename F, typename ReturnType>
    static Task wrap(std::shared_ptr<std::promise<ReturnType>> promise, F&& func);

    void worker_loop(std::stop_token stop);

    std::string name_;
    std::vector<std::jthread> workers_;
    std::queue<Task> task_queue_;
    mutable std::mutex queue_mutex_;
    std::condition_variable_any queue_cv_;
    std::atomic<size_t> active_tasks_{0};
};

// ── Template implementations ─────────────────

template <typename F, typename ReturnType>
ThreadPool::Task ThreadPool::wrap(std::shared_ptr<std::promise<ReturnType>> promise, F&& func) {
    return [p = std::move(promise), f = std::forward<F>(func)](std::stop_token stop) mutable {
        try {
            if constexpr (std::invocable<F, std::stop_token>) {
                if constexpr (std::is_void_v<ReturnType>) {
                    f(stop);
                    p->set_value();
                } else {
                    p->set_value(f(stop));
                }
            } else {
                if constexpr (std::is_void_v<ReturnType>) {
                    f();
                    p->set_value();
                } else {
                    p->set_value(f());
                }
            }
        } catch (...) {
            p->set_exception(std::current_exception());
        }
    };
}

template <std::invocable F>
std::future<std::invoke_result_t<F>> ThreadPool::submit(F&& func) {
    using ReturnType = std::invoke_result_t<F>;
    auto promise = std::make_shared<std::promise<ReturnType>>();
    auto future = promise->get_future();

    {
        std::lock_guard lock(queue_mutex_);
        task_queue_.push(wrap<F, ReturnType>(std::move(promise), std::forward<F>(func)));
    }
    queue_cv_.notify_one();
    return future;
}

template <std::invocable<std::stop_token> F>
std::future<std::invoke_result_t<F, std::stop_token>> ThreadPool::submit_cancellable(F&& func) {
    using ReturnType = std::invoke_result_t<F, std::stop_token>;
    auto promise = std::make_shared<std::promise<ReturnType>>();
    auto future = promise->get_future();

    {
        std::lock_guard lock(queue_mutex_);
        task_queue_.push(wrap<F, ReturnType>(std::move(promise), std::forward<F>(func)));
    }
    queue_cv_.notify_one();
    return future;
}

template <std::invocable<std::stop_token> F>
std::optional<std::future<std::invoke_result_t<F, std::stop_token>>>
ThreadPool::try_submit_cancellable(F&& func, size_t max_queued) {
    using ReturnType = std::invoke_result_t<F, std::stop_token>;
    auto promise = std::make_shared<std::promise<ReturnType>>();
    auto future = promise->get_future();

    {
        std::lock_guard lock(queue_mutex_);
        if (task_queue_.size() >= max_queued) return std::nullopt;
        task_queue_.push(wrap<F, ReturnType>(std::move(promise), std::forward<F>(func)));
    }
    queue_cv_.notify_one();
    return future;
}

}  // namespace sandbox_runner
