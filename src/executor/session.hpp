/**
 * @file session.hpp
 * @brief One execution request's lifecycle, output and environment.
 * @author Dimitris Kafetzis
 *
 * Legal transitions:
 *   Queued       → Provisioning | Rejected | Failed (cancelled while queued)
 *   Provisioning → Running | Failed | TimedOut
 *   Running      → Completed | Failed | TimedOut
 * Terminal states never change.
 */

#pragma once

#include "core/result.hpp"
#include "core/types.hpp"
#include "sandbox/isolation_backend.hpp"
#include "sandbox/output_capture.hpp"

#include <mutex>
#include <optional>

namespace sandbox_runner {

/**
 * @brief Monotonic timestamps of the phases a session went through.
 */
struct SessionTimeline {
    Timestamp created_wall;
    SteadyTime created;
    std::optional<SteadyTime> admitted;
    std::optional<SteadyTime> running;
    std::optional<SteadyTime> finished;
};

class ExecutionSession {
public:
    ExecutionSession(SessionId id, ExecutionRequest request, size_t max_output_bytes);

    ExecutionSession(const ExecutionSession&) = delete;
    ExecutionSession& operator=(const ExecutionSession&) = delete;

    [[nodiscard]] static bool can_transition(SessionState from, SessionState to) noexcept;

    /// Move to @p next; Internal error (state unchanged) if illegal.
    Result<void> transition(SessionState next);

    [[nodiscard]] const SessionId& id() const noexcept { return id_; }
    [[nodiscard]] const ExecutionRequest& request() const noexcept { return request_; }
    [[nodiscard]] SessionState state() const;
    [[nodiscard]] SessionTimeline timeline() const;

    [[nodiscard]] OutputCapture& output() noexcept { return output_; }
    [[nodiscard]] const OutputCapture& output() const noexcept { return output_; }

    void attach_environment(EnvironmentHandle handle);
    void detach_environment();
    [[nodiscard]] std::optional<EnvironmentHandle> environment() const;

    /// Time since creation, or total lifetime once terminal.
    [[nodiscard]] Duration elapsed() const;

private:
    SessionId id_;
    ExecutionRequest request_;
    OutputCapture output_;

    mutable std::mutex mutex_;
    SessionState state_{SessionState::Queued};
    SessionTimeline timeline_;
    std::optional<EnvironmentHandle> environment_;
};

}  // namespace sandbox_runner
