/**
 * @file session.cpp
 * @brief ExecutionSession implementation.
 * @author Dimitris Kafetzis
 */

#include "executor/session.hpp"

namespace sandbox_runner {

ExecutionSession::ExecutionSession(SessionId id, ExecutionRequest request,
                                   size_t max_output_bytes)
    : id_(std::move(id))
    , request_(std::move(request))
    , output_(max_output_bytes) {
    timeline_.created_wall = std::chrono::system_clock::now();
    timeline_.created = std::chrono::steady_clock::now();
}

bool ExecutionSession::can_transition(SessionState from, SessionState to) noexcept {
    switch (from) {
        case SessionState::Queued:
            return to == SessionState::Provisioning || to == SessionState::Rejected
                || to == SessionState::Failed;
        case SessionState::Provisioning:
            return to == SessionState::Running || to == SessionState::Failed
                || to == SessionState::TimedOut;
        case SessionState::Running:
            return to == SessionState::Completed || to == SessionState::Failed
                || to == SessionState::TimedOut;
        case SessionState::Completed:
        case SessionState::Failed:
        case SessionState::TimedOut:
        case SessionState::Rejected:
            return false;
    }
    return false;
}

Result<void> ExecutionSession::transition(SessionState next) {
    std::lock_guard lock(mutex_);
    if (!can_transition(state_, next)) {
        return Error{ErrorKind::Internal,
                     "Illegal session transition " + std::string(to_string(state_)) + " → "
                         + std::string(to_string(next))};
    }

    auto now = std::chrono::steady_clock::now();
    if (next == SessionState::Provisioning) timeline_.admitted = now;
    if (next == SessionState::Running) timeline_.running = now;
    if (is_terminal(next)) timeline_.finished = now;
    state_ = next;
    return Result<void>{};
}

SessionState ExecutionSession::state() const {
    std::lock_guard lock(mutex_);
    return state_;
}

SessionTimeline ExecutionSession::timeline() const {
    std::lock_guard lock(mutex_);
    return timeline_;
}

void ExecutionSession::attach_environment(EnvironmentHandle handle) {
    std::lock_guard lock(mutex_);
    environment_ = std::move(handle);
}

void ExecutionSession::detach_environment() {
    std::lock_guard lock(mutex_);
    environment_.reset();
}

std::optional<EnvironmentHandle> ExecutionSession::environment() const {
    std::lock_guard lock(mutex_);
    return environment_;
}

Duration ExecutionSession::elapsed() const {
    std::lock_guard lock(mutex_);
    auto end = timeline_.finished.value_or(std::chrono::steady_clock::now());
    return std::chrono::duration_cast<Duration>(end - timeline_.created);
}

}  // namespace sandbox_runner
