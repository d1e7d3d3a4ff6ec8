/**
 * @file result_reporter.cpp
 * @brief ResultReporter implementation.
 * @author Dimitris Kafetzis
 */

#include "executor/result_reporter.hpp"

#include <csignal>

namespace sandbox_runner {

namespace {

double seconds(Duration d) {
    return std::chrono::duration<double>(d).count();
}

}  // anonymous namespace

std::string signal_name(int signal) {
    switch (signal) {
        case SIGKILL: return "SIGKILL";
        case SIGTERM: return "SIGTERM";
        case SIGSEGV: return "SIGSEGV";
        case SIGABRT: return "SIGABRT";
        case SIGBUS:  return "SIGBUS";
        case SIGFPE:  return "SIGFPE";
        case SIGILL:  return "SIGILL";
        case SIGXCPU: return "SIGXCPU";
        case SIGXFSZ: return "SIGXFSZ";
        case SIGPIPE: return "SIGPIPE";
        default:      return "signal " + std::to_string(signal);
    }
}

// ─────────────────────────────────────────────
// Classification
// ─────────────────────────────────────────────

OutcomeClass classify_outcome(const RawOutcome& outcome) {
    if (outcome.timed_out) {
        return {SessionState::TimedOut, ErrorKind::Timeout, "wall_clock",
                outcome.phase == RunPhase::Compile ? "Compilation exceeded the time limit"
                                                   : "Execution exceeded the time limit"};
    }
    if (outcome.cancelled) {
        return {SessionState::Failed, ErrorKind::Internal, "cancelled", "Execution was cancelled"};
    }
    if (outcome.phase == RunPhase::Compile) {
        return {SessionState::Failed, ErrorKind::ExecutionFailure, "compile_error",
                "Compilation failed"};
    }
    if (outcome.term_signal) {
        std::string reason = "killed_by_signal";
        std::string message = "Process killed by " + signal_name(*outcome.term_signal);
        if (*outcome.term_signal == SIGXCPU) message += " (CPU time limit)";
        if (*outcome.term_signal == SIGXFSZ) message += " (file size limit)";
        return {SessionState::Failed, ErrorKind::ExecutionFailure, std::move(reason),
                std::move(message)};
    }
    if (!outcome.exit_code) {
        return {SessionState::Failed, ErrorKind::Internal, "unknown_exit",
                "Process ended without an exit status"};
    }
    if (*outcome.exit_code != 0) {
        return {SessionState::Failed, ErrorKind::ExecutionFailure, "nonzero_exit",
                "Process exited with code " + std::to_string(*outcome.exit_code)};
    }
    return {SessionState::Completed, std::nullopt, {}, {}};
}

SessionState state_for_error(const Error& error) noexcept {
    switch (error.kind) {
        case ErrorKind::AdmissionRejected: return SessionState::Rejected;
        case ErrorKind::Timeout:           return SessionState::TimedOut;
        default:                           return SessionState::Failed;
    }
}

// ─────────────────────────────────────────────
// Reports
// ─────────────────────────────────────────────

ExecutionReport ResultReporter::base(const ExecutionSession& session) const {
    ExecutionReport report;
    report.session_id = session.id();
    report.status = session.state();
    report.language = session.request().language;
    report.duration_seconds = seconds(session.elapsed());

    auto timeline = session.timeline();
    if (timeline.admitted) {
        report.queue_wait = std::chrono::duration_cast<Duration>(*timeline.admitted - timeline.created);
    }
    return report;
}

ExecutionReport ResultReporter::from_outcome(const ExecutionSession& session,
                                             const RawOutcome& outcome) const {
    auto cls = classify_outcome(outcome);
    auto report = base(session);
    report.status = cls.state;
    report.stdout_data = outcome.stdout_data;
    report.stderr_data = outcome.stderr_data;
    report.exit_code = outcome.exit_code;
    report.truncated = outcome.truncated;
    report.error_kind = cls.kind;
    report.reason = std::move(cls.reason);
    report.message = std::move(cls.message);
    report.usage = outcome.usage;
    report.duration_seconds = seconds(outcome.duration);
    return report;
}

ExecutionReport ResultReporter::from_error(const ExecutionSession& session,
                                           const Error& error) const {
    auto report = base(session);
    report.status = state_for_error(error);
    report.error_kind = error.kind;
    report.reason = error.reason;

    auto captured = session.output().snapshot();
    report.stdout_data = std::move(captured.stdout_data);
    report.stderr_data = std::move(captured.stderr_data);
    report.truncated = captured.truncated;

    switch (error.kind) {
        case ErrorKind::Provision:
            logger_.error("Session " + session.id() + " provisioning failed: " + error.message);
            report.message = "Sandbox environment could not be created; retry later";
            break;
        case ErrorKind::Internal:
            if (error.reason == "cancelled") {
                logger_.info("Session " + session.id() + " cancelled: " + error.message);
                report.message = "Execution was cancelled";
            } else {
                logger_.error("Session " + session.id() + " internal error: " + error.message);
                report.message = "Internal error";
            }
            break;
        case ErrorKind::ExecutionFailure:
            // Installer diagnostics are the caller's own problem; pass them through.
            report.message = error.message;
            if (report.stderr_data.empty()) report.stderr_data = error.message;
            break;
        default:
            report.message = error.message;
            break;
    }
    return report;
}

ExecutionReport ResultReporter::abandoned(const ExecutionSession& session) const {
    auto report = base(session);
    report.status = SessionState::TimedOut;
    report.error_kind = ErrorKind::Timeout;
    report.reason = "wall_clock";
    report.message = "Execution exceeded the time limit";

    auto captured = session.output().snapshot();
    report.stdout_data = std::move(captured.stdout_data);
    report.stderr_data = std::move(captured.stderr_data);
    report.truncated = captured.truncated;
    return report;
}

}  // namespace sandbox_runner
