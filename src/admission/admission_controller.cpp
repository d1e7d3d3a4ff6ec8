/**
 * @file admission_controller.cpp
 * @brief AdmissionController and CapacityToken implementation.
 * @author Dimitris Kafetzis
 */

#include "admission/admission_controller.hpp"

#include <algorithm>

namespace sandbox_runner {

// ─────────────────────────────────────────────
// CapacityToken
// ─────────────────────────────────────────────

CapacityToken::~CapacityToken() {
    release();
}

CapacityToken::CapacityToken(CapacityToken&& other) noexcept
    : owner_(other.owner_), queue_wait_(other.queue_wait_) {
    other.owner_ = nullptr;
}

CapacityToken& CapacityToken::operator=(CapacityToken&& other) noexcept {
    if (this != &other) {
        release();
        owner_ = other.owner_;
        queue_wait_ = other.queue_wait_;
        other.owner_ = nullptr;
    }
    return *this;
}

void CapacityToken::release() noexcept {
    if (owner_) {
        owner_->release_slot();
        owner_ = nullptr;
    }
}

// ─────────────────────────────────────────────
// AdmissionController
// ─────────────────────────────────────────────

AdmissionController::AdmissionController(AdmissionOptions options)
    : options_(options) {
    options_.capacity = std::max<uint32_t>(options_.capacity, 1);
}

AdmissionController::~AdmissionController() {
    shutdown();
}

Result<CapacityToken> AdmissionController::acquire(int priority, std::stop_token stop) {
    auto enqueued_at = std::chrono::steady_clock::now();
    std::unique_lock lock(mutex_);

    if (shutting_down_) {
        ++counters_.rejected_shutdown;
        return Error{ErrorKind::AdmissionRejected, "Service is shutting down",
                     std::string(admission_reason::kShuttingDown)};
    }

    // Fast path: a free slot and nobody ahead.
    if (active_ < options_.capacity && waiters_.empty()) {
        ++active_;
        ++counters_.admitted;
        counters_.peak_active = std::max(counters_.peak_active, active_);
        return CapacityToken(this, Duration{0});
    }

    if (waiters_.size() >= options_.backlog) {
        ++counters_.rejected_capacity;
        return Error{ErrorKind::AdmissionRejected,
                     "All " + std::to_string(options_.capacity)
                         + " sandboxes are busy and the queue is full",
                     std::string(admission_reason::kCapacityExhausted)};
    }

    Waiter self{priority, next_sequence_++};
    waiters_.push_back(&self);

    auto deadline = enqueued_at + options_.max_queue_wait;
    cv_.wait_until(lock, stop, deadline, [&] { return self.granted || shutting_down_; });

    // A grant always wins over a concurrent timeout, stop or shutdown:
    // the slot has already been transferred to us.
    if (self.granted) {
        ++counters_.admitted;
        return CapacityToken(this, std::chrono::duration_cast<Duration>(
                                       std::chrono::steady_clock::now() - enqueued_at));
    }

    remove_waiter_locked(&self);

    if (shutting_down_) {
        ++counters_.rejected_shutdown;
        return Error{ErrorKind::AdmissionRejected, "Service is shutting down",
                     std::string(admission_reason::kShuttingDown)};
    }
    if (stop.stop_requested()) {
        ++counters_.cancelled;
        return Error{ErrorKind::Internal, "Request cancelled while queued",
                     std::string(admission_reason::kCancelled)};
    }
    ++counters_.rejected_timeout;
    return Error{ErrorKind::AdmissionRejected,
                 "No sandbox became available within "
                     + std::to_string(options_.max_queue_wait.count()) + " ms",
                 std::string(admission_reason::kQueueTimeout)};
}

Result<CapacityToken> AdmissionController::try_acquire() {
    std::lock_guard lock(mutex_);
    if (shutting_down_) {
        ++counters_.rejected_shutdown;
        return Error{ErrorKind::AdmissionRejected, "Service is shutting down",
                     std::string(admission_reason::kShuttingDown)};
    }
    if (active_ >= options_.capacity || !waiters_.empty()) {
        ++counters_.rejected_capacity;
        return Error{ErrorKind::AdmissionRejected, "All sandboxes are busy",
                     std::string(admission_reason::kCapacityExhausted)};
    }
    ++active_;
    ++counters_.admitted;
    counters_.peak_active = std::max(counters_.peak_active, active_);
    return CapacityToken(this, Duration{0});
}

void AdmissionController::release_slot() noexcept {
    {
        std::lock_guard lock(mutex_);
        Waiter* next = shutting_down_ ? nullptr : best_waiter_locked();
        if (next) {
            // Hand the slot over without letting active_ dip.
            next->granted = true;
            remove_waiter_locked(next);
        } else if (active_ > 0) {
            --active_;
        }
    }
    cv_.notify_all();
}

void AdmissionController::shutdown() {
    {
        std::lock_guard lock(mutex_);
        shutting_down_ = true;
    }
    cv_.notify_all();
}

bool AdmissionController::wait_idle(std::chrono::milliseconds timeout) {
    std::unique_lock lock(mutex_);
    return cv_.wait_for(lock, timeout, [this] { return active_ == 0; });
}

AdmissionStats AdmissionController::stats() const {
    std::lock_guard lock(mutex_);
    AdmissionStats out = counters_;
    out.capacity = options_.capacity;
    out.backlog = options_.backlog;
    out.active = active_;
    out.queued = static_cast<uint32_t>(waiters_.size());
    out.shutting_down = shutting_down_;
    return out;
}

AdmissionController::Waiter* AdmissionController::best_waiter_locked() const {
    Waiter* best = nullptr;
    for (Waiter* w : waiters_) {
        if (!best || w->priority > best->priority
            || (w->priority == best->priority && w->sequence < best->sequence)) {
            best = w;
        }
    }
    return best;
}

void AdmissionController::remove_waiter_locked(Waiter* waiter) {
    std::erase(waiters_, waiter);
}

}  // namespace sandbox_runner
