/**
 * @file executor.cpp
 * @brief Executor implementation.
 * @author Dimitris Kafetzis
 */

#include "executor/executor.hpp"

#include "telemetry/metrics_collector.hpp"

#include <cctype>
#include <future>

namespace sandbox_runner {

namespace {

constexpr size_t kMaxPackageNameLength = 214;

/**
 * @brief Destroys an environment exactly once when it goes out of scope.
 */
class EnvironmentGuard {
public:
    EnvironmentGuard(IsolationBackend& backend, EnvironmentHandle handle, Logger& logger)
        : backend_(backend), handle_(std::move(handle)), logger_(logger) {}

    ~EnvironmentGuard() { release(); }

    EnvironmentGuard(const EnvironmentGuard&) = delete;
    EnvironmentGuard& operator=(const EnvironmentGuard&) = delete;

    void release() {
        if (!armed_) return;
        armed_ = false;
        auto result = backend_.destroy(handle_);
        if (!result) {
            logger_.error("Failed to destroy environment " + handle_.id + ": "
                          + result.error().message);
        }
    }

private:
    IsolationBackend& backend_;
    EnvironmentHandle handle_;
    Logger& logger_;
    bool armed_{true};
};

void move_to(ExecutionSession& session, SessionState next, Logger& logger) {
    auto moved = session.transition(next);
    if (!moved) {
        // Expected when the caller already gave up on the session.
        logger.debug("Session " + session.id() + ": " + moved.error().message);
    }
}

}  // anonymous namespace

// ─────────────────────────────────────────────
// Validation
// ─────────────────────────────────────────────

Result<void> validate_package_name(std::string_view name) {
    if (name.empty()) {
        return Error{ErrorKind::Validation, "Package names must not be empty"};
    }
    if (name.size() > kMaxPackageNameLength) {
        return Error{ErrorKind::Validation, "Package name too long: " + std::string(name.substr(0, 32))};
    }
    if (name.front() == '-') {
        return Error{ErrorKind::Validation, "Package names must not start with '-': "
                                                + std::string(name)};
    }
    for (char c : name) {
        auto uc = static_cast<unsigned char>(c);
        if (std::isspace(uc) || std::iscntrl(uc)) {
            return Error{ErrorKind::Validation,
                         "Package names must not contain whitespace or control characters"};
        }
    }
    return Result<void>{};
}

Result<void> validate_request(const ExecutionRequest& request,
                              const ExecutorOptions& options,
                              const LanguageTable& languages) {
    const auto* tmpl = languages.find(request.language);
    if (!tmpl) {
        return Error{ErrorKind::Validation,
                     "Unsupported language: " + std::string(to_string(request.language))};
    }
    if (request.code.empty()) {
        return Error{ErrorKind::Validation, "code must not be empty"};
    }
    if (request.code.size() > options.max_code_bytes) {
        return Error{ErrorKind::Validation,
                     "code exceeds " + std::to_string(options.max_code_bytes) + " bytes"};
    }
    if (request.timeout.count() <= 0) {
        return Error{ErrorKind::Validation, "timeout must be positive"};
    }
    if (request.timeout > options.max_timeout) {
        return Error{ErrorKind::Validation,
                     "timeout exceeds the maximum of "
                         + std::to_string(options.max_timeout.count() / 1000) + " seconds"};
    }
    if (!request.packages.empty()) {
        if (!tmpl->supports_packages()) {
            return Error{ErrorKind::Validation,
                         "Package installation is not supported for "
                             + std::string(to_string(request.language))};
        }
        if (request.packages.size() > options.max_packages) {
            return Error{ErrorKind::Validation,
                         "At most " + std::to_string(options.max_packages) + " packages allowed"};
        }
        for (const auto& package : request.packages) {
            auto valid = validate_package_name(package);
            if (!valid) return valid;
        }
    }
    if (request.use_shared_dataset && !options.dataset_available) {
        return Error{ErrorKind::Validation, "Shared dataset is not available on this server"};
    }
    return Result<void>{};
}

// ─────────────────────────────────────────────
// Executor
// ─────────────────────────────────────────────

struct Executor::Job {
    std::shared_ptr<ExecutionSession> session;
    CapacityToken token;
    std::stop_source stop;
    SteadyTime deadline;
};

Executor::Executor(IsolationBackend& backend,
                   AdmissionController& admission,
                   const LanguageTable& languages,
                   ExecutorOptions options,
                   Logger& logger,
                   MetricsCollector* metrics)
    : backend_(backend)
    , admission_(admission)
    , languages_(languages)
    , options_(options)
    , logger_(logger)
    , metrics_(metrics)
    , reporter_(logger)
    , pool_(admission.capacity(), "sr-exec") {}

Executor::~Executor() {
    shutdown_source_.request_stop();
}

Result<ExecutionReport> Executor::execute(ExecutionRequest request, std::stop_token caller_stop) {
    auto valid = validate_request(request, options_, languages_);
    if (!valid) return valid.error();

    ++in_flight_;
    struct InFlight {
        std::atomic<size_t>& counter;
        ~InFlight() { --counter; }
    } in_flight{in_flight_};

    auto session = std::make_shared<ExecutionSession>(
        generate_session_id(), std::move(request), options_.limits.max_output_bytes);
    const auto& req = session->request();
    logger_.debug("Session " + session->id() + " queued: language="
                  + std::string(to_string(req.language)) + " code_bytes="
                  + std::to_string(req.code.size()) + " packages="
                  + std::to_string(req.packages.size()));

    // ── Admission ───────────────────────────
    std::stop_source queue_stop;
    auto token = [&] {
        std::stop_callback on_caller(caller_stop, [&queue_stop] { queue_stop.request_stop(); });
        std::stop_callback on_shutdown(shutdown_source_.get_token(),
                                       [&queue_stop] { queue_stop.request_stop(); });
        return admission_.acquire(req.priority, queue_stop.get_token());
    }();

    if (!token) {
        const auto& error = token.error();
        move_to(*session, state_for_error(error), logger_);
        return finish(*session, reporter_.from_error(*session, error));
    }
    logger_.debug("Session " + session->id() + " admitted after "
                  + std::to_string(std::chrono::duration_cast<std::chrono::milliseconds>(
                        token->queue_wait()).count())
                  + "ms in queue");

    // ── Hand off to a worker ────────────────
    auto job = std::make_shared<Job>();
    job->session = session;
    job->token = std::move(*token);
    job->deadline = std::chrono::steady_clock::now() + req.timeout;

    std::stop_callback cancel_on_caller(caller_stop, [job] { job->stop.request_stop(); });
    std::stop_callback cancel_on_shutdown(shutdown_source_.get_token(),
                                          [job] { job->stop.request_stop(); });

    auto future = pool_.submit_cancellable([this, job](std::stop_token worker_stop) {
        return run_job(*job, worker_stop);
    });

    // ── Wait: deadline, then stop, then abandon ─
    auto hard_deadline = job->deadline + options_.kill_grace;
    if (future.wait_until(hard_deadline) != std::future_status::ready) {
        job->stop.request_stop();
        if (future.wait_for(options_.kill_grace) != std::future_status::ready) {
            auto abandoned = session->transition(SessionState::TimedOut);
            if (abandoned || future.wait_for(options_.kill_grace) != std::future_status::ready) {
                logger_.error("Session " + session->id()
                              + " did not stop after cancellation; abandoning it");
                return finish(*session, reporter_.abandoned(*session));
            }
        }
    }

    try {
        return finish(*session, future.get());
    } catch (const std::exception& e) {
        move_to(*session, SessionState::Failed, logger_);
        return finish(*session, reporter_.from_error(
                                    *session, Error{ErrorKind::Internal, e.what()}));
    }
}

ExecutionReport Executor::run_job(Job& job, std::stop_token worker_stop) {
    std::stop_callback on_worker_stop(worker_stop, [&job] { job.stop.request_stop(); });
    auto stop = job.stop.get_token();
    auto& session = *job.session;
    const auto& request = session.request();

    auto report = [&]() -> ExecutionReport {
        move_to(session, SessionState::Provisioning, logger_);

        EnvironmentSpec spec{
            .session_id = session.id(),
            .language = request.language,
            .packages = request.packages,
            .mount_dataset = request.use_shared_dataset,
            .limits = options_.limits,
        };
        auto env = backend_.provision(spec, job.deadline, stop);
        if (!env) {
            move_to(session, state_for_error(env.error()), logger_);
            return reporter_.from_error(session, env.error());
        }

        session.attach_environment(*env);
        EnvironmentGuard guard(backend_, *env, logger_);
        move_to(session, SessionState::Running, logger_);
        logger_.debug("Session " + session.id() + " running in " + env->id);

        auto outcome = backend_.run(*env, request.code, job.deadline, session.output(), stop);
        ExecutionReport result;
        if (!outcome) {
            move_to(session, state_for_error(outcome.error()), logger_);
            result = reporter_.from_error(session, outcome.error());
        } else {
            move_to(session, classify_outcome(*outcome).state, logger_);
            result = reporter_.from_outcome(session, *outcome);
        }

        guard.release();
        session.detach_environment();
        return result;
    }();

    // Only after the environment is gone.
    job.token.release();
    return report;
}

ExecutionReport Executor::finish(ExecutionSession& session, ExecutionReport report) {
    report.session_id = session.id();

    std::string line = "Session " + report.session_id + " " + std::string(to_string(report.status))
                     + " in " + std::to_string(report.duration_seconds) + "s";
    if (report.error_kind) {
        line += " (" + std::string(to_string(*report.error_kind));
        if (!report.reason.empty()) line += "/" + report.reason;
        line += ")";
    }
    if (report.status == SessionState::Completed) {
        logger_.debug(line);
    } else {
        logger_.info(line);
    }

    if (metrics_) metrics_->record_session(report);
    return report;
}

bool Executor::shutdown(std::chrono::milliseconds drain_timeout) {
    logger_.info("Executor shutting down: " + std::to_string(in_flight_.load())
                 + " session(s) in flight");
    admission_.shutdown();
    shutdown_source_.request_stop();
    return admission_.wait_idle(drain_timeout);
}

}  // namespace sandbox_runner
