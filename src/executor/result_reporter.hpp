/**
 * @file result_reporter.hpp
 * @brief Normalizes raw outcomes and errors into the caller-facing report.
 * @author Dimitris Kafetzis
 *
 * Mapping rules:
 *   exit 0                         → completed
 *   nonzero exit                   → failed, execution_failure/nonzero_exit
 *   killed by signal               → failed, execution_failure/killed_by_signal
 *   compile step failed            → failed, execution_failure/compile_error
 *   deadline hit                   → timed_out, timeout_error (partial output)
 *   admission denied               → rejected, admission_rejected (retryable)
 *   provision failure              → failed, provision_error (retryable)
 *   cancellation                   → failed, internal_error/cancelled
 *   anything else                  → failed, internal_error (generic message)
 *
 * Infrastructure messages are replaced with generic text for the caller;
 * the full detail goes to the log.
 */

#pragma once

#include "core/logger.hpp"
#include "core/result.hpp"
#include "core/types.hpp"
#include "executor/session.hpp"
#include "sandbox/isolation_backend.hpp"

#include <optional>
#include <string>

namespace sandbox_runner {

struct ExecutionReport {
    SessionId session_id;
    SessionState status{SessionState::Failed};
    Language language{Language::Python};
    std::string stdout_data;
    std::string stderr_data;
    std::optional<int> exit_code;
    double duration_seconds{0.0};
    bool truncated{false};
    std::optional<ErrorKind> error_kind;
    std::string reason;
    std::string message;
    ResourceUsage usage;
    Duration queue_wait{0};

    [[nodiscard]] bool success() const noexcept { return status == SessionState::Completed; }
    [[nodiscard]] bool retryable() const noexcept {
        return error_kind.has_value() && is_retryable(*error_kind);
    }
};

/**
 * @brief Terminal state and error classification for a finished run.
 */
struct OutcomeClass {
    SessionState state{SessionState::Completed};
    std::optional<ErrorKind> kind;
    std::string reason;
    std::string message;
};

[[nodiscard]] OutcomeClass classify_outcome(const RawOutcome& outcome);

/// Terminal state a session takes for an error raised before or during provisioning.
[[nodiscard]] SessionState state_for_error(const Error& error) noexcept;

/// Short signal name ("SIGKILL"), or "signal N".
[[nodiscard]] std::string signal_name(int signal);

class ResultReporter {
public:
    explicit ResultReporter(Logger& logger) : logger_(logger) {}

    /// Report for a run that reached the backend and came back.
    [[nodiscard]] ExecutionReport from_outcome(const ExecutionSession& session,
                                               const RawOutcome& outcome) const;

    /// Report for a session that ended with an error (admission, provision, internal).
    [[nodiscard]] ExecutionReport from_error(const ExecutionSession& session,
                                             const Error& error) const;

    /// Report for a session abandoned at its hard deadline; output is whatever was captured.
    [[nodiscard]] ExecutionReport abandoned(const ExecutionSession& session) const;

private:
    [[nodiscard]] ExecutionReport base(const ExecutionSession& session) const;

    Logger& logger_;
};

}  // namespace sandbox_runner
