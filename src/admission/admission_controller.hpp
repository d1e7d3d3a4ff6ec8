/**
 * @file admission_controller.hpp
 * @brief Bounded concurrency gate for isolated environments.
 * @author Dimitris Kafetzis
 *
 * At most capacity() CapacityTokens exist at any time. A request that
 * finds no free slot joins a bounded backlog ordered by priority (higher
 * first) then arrival; it is admitted by hand-off when a token is released,
 * or rejected when its maximum queue wait elapses. A full backlog rejects
 * immediately, so overload degrades into fast retryable errors instead of
 * unbounded queues.
 */

#pragma once

#include "core/result.hpp"
#include "core/types.hpp"

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <mutex>
#include <stop_token>
#include <string_view>
#include <vector>

namespace sandbox_runner {

class AdmissionController;

/// Reason sub-codes attached to AdmissionRejected errors.
namespace admission_reason {
inline constexpr std::string_view kCapacityExhausted = "capacity_exhausted";
inline constexpr std::string_view kQueueTimeout = "queue_timeout";
inline constexpr std::string_view kShuttingDown = "shutting_down";
inline constexpr std::string_view kCancelled = "cancelled";
}  // namespace admission_reason

/**
 * @brief Move-only proof of one admitted slot; released on destruction.
 *
 * The issuing AdmissionController must outlive every token.
 */
class CapacityToken {
public:
    CapacityToken() = default;
    ~CapacityToken();

    CapacityToken(CapacityToken&& other) noexcept;
    CapacityToken& operator=(CapacityToken&& other) noexcept;
    CapacityToken(const CapacityToken&) = delete;
    CapacityToken& operator=(const CapacityToken&) = delete;

    /// Return the slot early. Idempotent.
    void release() noexcept;

    [[nodiscard]] bool held() const noexcept { return owner_ != nullptr; }
    [[nodiscard]] Duration queue_wait() const noexcept { return queue_wait_; }

private:
    friend class AdmissionController;
    CapacityToken(AdmissionController* owner, Duration queue_wait) noexcept
        : owner_(owner), queue_wait_(queue_wait) {}

    AdmissionController* owner_{nullptr};
    Duration queue_wait_{0};
};

struct AdmissionOptions {
    uint32_t capacity{1};
    uint32_t backlog{16};
    std::chrono::milliseconds max_queue_wait{10000};
};

struct AdmissionStats {
    uint32_t capacity{0};
    uint32_t active{0};
    uint32_t queued{0};
    uint32_t backlog{0};
    uint32_t peak_active{0};
    uint64_t admitted{0};
    uint64_t rejected_capacity{0};
    uint64_t rejected_timeout{0};
    uint64_t rejected_shutdown{0};
    uint64_t cancelled{0};
    bool shutting_down{false};
};

class AdmissionController {
public:
    explicit AdmissionController(AdmissionOptions options);
    ~AdmissionController();

    AdmissionController(const AdmissionController&) = delete;
    AdmissionController& operator=(const AdmissionController&) = delete;

    /**
     * @brief Obtain a token, waiting in the backlog if necessary.
     *
     * Errors: AdmissionRejected (capacity_exhausted, queue_timeout,
     * shutting_down) or Internal "cancelled" when @p stop fires while queued.
     */
    Result<CapacityToken> acquire(int priority = 0, std::stop_token stop = {});

    /// Obtain a token only if one is free right now.
    Result<CapacityToken> try_acquire();

    /// Reject all queued and future requests. Held tokens stay valid.
    void shutdown();

    /// Block until no tokens are held or @p timeout elapses.
    bool wait_idle(std::chrono::milliseconds timeout);

    [[nodiscard]] AdmissionStats stats() const;
    [[nodiscard]] uint32_t capacity() const noexcept { return options_.capacity; }

private:
    friend class CapacityToken;

    struct Waiter {
        int priority;
        uint64_t sequence;
        bool granted{false};
    };

    void release_slot() noexcept;
    [[nodiscard]] Waiter* best_waiter_locked() const;
    void remove_waiter_locked(Waiter* waiter);

    AdmissionOptions options_;

    mutable std::mutex mutex_;
    std::condition_variable_any cv_;
    std::vector<Waiter*> waiters_;
    uint32_t active_{0};
    uint64_t next_sequence_{0};
    bool shutting_down_{false};
    AdmissionStats counters_;
};

}  // namespace sandbox_runner
