/**
 * @file executor.hpp
 * @brief Drives one request through admission, provisioning, execution,
 *        teardown and reporting.
 * @author Dimitris Kafetzis
 *
 * Guarantees:
 *   - Validation happens before anything is allocated.
 *   - Every provisioned environment is destroyed before its CapacityToken
 *     is released, on every path including exceptions.
 *   - The caller gets an answer by deadline + 2 * kill_grace even if the
 *     backend ignores cancellation; the stuck work keeps its token so the
 *     concurrency ceiling still holds.
 *   - Caller disconnect or shutdown cancels queued, provisioning and
 *     running work.
 */

#pragma once

#include "admission/admission_controller.hpp"
#include "core/logger.hpp"
#include "core/result.hpp"
#include "executor/result_reporter.hpp"
#include "executor/session.hpp"
#include "executor/thread_pool.hpp"
#include "sandbox/isolation_backend.hpp"
#include "sandbox/language_table.hpp"

#include <atomic>
#include <chrono>
#include <memory>
#include <stop_token>

namespace sandbox_runner {

class MetricsCollector;

struct ExecutorOptions {
    ResourceLimits limits;
    std::chrono::milliseconds max_timeout{120000};
    std::chrono::milliseconds kill_grace{2000};
    size_t max_code_bytes{256 * 1024};
    size_t max_packages{32};
    bool dataset_available{false};
};

/**
 * @brief Validate a request against server limits and the template table.
 *
 * Errors are always ErrorKind::Validation.
 */
Result<void> validate_request(const ExecutionRequest& request,
                              const ExecutorOptions& options,
                              const LanguageTable& languages);

/// Package entry check: non-empty, bounded, no option injection or whitespace.
Result<void> validate_package_name(std::string_view name);

class Executor {
public:
    Executor(IsolationBackend& backend,
             AdmissionController& admission,
             const LanguageTable& languages,
             ExecutorOptions options,
             Logger& logger,
             MetricsCollector* metrics = nullptr);
    ~Executor();

    Executor(const Executor&) = delete;
    Executor& operator=(const Executor&) = delete;

    /**
     * @brief Execute a request to a terminal report.
     *
     * Only validation failures are returned as errors; every other outcome
     * (rejection, provision failure, timeout, ...) is a report.
     *
     * @param caller_stop Fires when the client goes away.
     */
    Result<ExecutionReport> execute(ExecutionRequest request,
                                    std::stop_token caller_stop = {});

    /**
     * @brief Stop admitting, cancel in-flight work and wait for it to drain.
     * @return false if work was still running after @p drain_timeout.
     */
    bool shutdown(std::chrono::milliseconds drain_timeout);

    [[nodiscard]] size_t in_flight() const noexcept { return in_flight_.load(); }
    [[nodiscard]] const ExecutorOptions& options() const noexcept { return options_; }

private:
    struct Job;

    ExecutionReport run_job(Job& job, std::stop_token worker_stop);
    ExecutionReport finish(ExecutionSession& session, ExecutionReport report);

    IsolationBackend& backend_;
    AdmissionController& admission_;
    const LanguageTable& languages_;
    ExecutorOptions options_;
    Logger& logger_;
    MetricsCollector* metrics_;
    ResultReporter reporter_;

    std::stop_source shutdown_source_;
    std::atomic<size_t> in_flight_{0};
    ThreadPool pool_;
};

}  // namespace sandbox_runner
