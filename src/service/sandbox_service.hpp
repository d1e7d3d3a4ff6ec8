/**
 * @file sandbox_service.hpp
 * @brief Facade that wires configuration, isolation backend, admission,
 *        executor, telemetry and the HTTP routes into one service.
 * @author Dimitris Kafetzis
 *
 * Routes:
 *   GET  /           service banner (no auth)
 *   GET  /health     liveness, never touches the execution engine
 *   GET  /languages  supported languages
 *   GET  /stats      capacity and QPS signal for the autoscaler
 *   POST /execute    run code in a fresh isolated environment
 */

#pragma once

#include "admission/admission_controller.hpp"
#include "api/auth.hpp"
#include "core/config.hpp"
#include "core/logger.hpp"
#include "executor/executor.hpp"
#include "network/http_server.hpp"
#include "resource_monitor/host_monitor.hpp"
#include "sandbox/dataset_mount.hpp"
#include "sandbox/isolation_backend.hpp"
#include "sandbox/language_table.hpp"
#include "telemetry/metrics_collector.hpp"

#include <chrono>
#include <memory>
#include <stop_token>
#include <string_view>

namespace sandbox_runner {

inline constexpr std::string_view kServiceName = "SandboxRunner code execution service";
inline constexpr std::string_view kServiceVersion = "1.0.0";

class SandboxService {
public:
    /**
     * @brief Build the production service from configuration.
     *
     * Opens the dataset (when enabled), creates the process backend and
     * loads the bearer token. Any failure aborts start-up.
     */
    static Result<std::unique_ptr<SandboxService>> create(const Config& config, Logger& logger);

    /**
     * @brief Assemble a service around an existing backend and authenticator.
     *
     * @param event_sink Destination of session_finished events; null = discard.
     */
    SandboxService(const Config& config,
                   std::unique_ptr<IsolationBackend> backend,
                   BearerAuthenticator authenticator,
                   DatasetHandle dataset,
                   Logger& logger,
                   std::unique_ptr<ILogSink> event_sink = nullptr);
    ~SandboxService();

    SandboxService(const SandboxService&) = delete;
    SandboxService& operator=(const SandboxService&) = delete;

    /// Clean stale environments, start sampling, bind and serve.
    Result<void> start();

    /// Stop admitting, drain in-flight sessions, stop serving. Idempotent.
    void stop(std::chrono::milliseconds drain_timeout);

    /// Route one request. Used by the HTTP server and directly by tests.
    HttpResponse handle(const HttpRequest& request, std::stop_token client_gone = {});

    /// Emit a periodic status line and host snapshot event.
    void record_status();

    [[nodiscard]] uint16_t port() const noexcept { return server_ ? server_->port() : 0; }
    [[nodiscard]] uint32_t capacity() const noexcept { return admission_->capacity(); }
    [[nodiscard]] Executor& executor() noexcept { return *executor_; }
    [[nodiscard]] AdmissionController& admission() noexcept { return *admission_; }
    [[nodiscard]] MetricsCollector& metrics() noexcept { return *metrics_; }
    [[nodiscard]] IsolationBackend& backend() noexcept { return *backend_; }

private:
    HttpResponse handle_health() const;
    HttpResponse handle_stats() const;
    HttpResponse handle_languages() const;
    HttpResponse handle_execute(const HttpRequest& request, std::stop_token client_gone);
    HttpResponse error_response(const Error& error) const;

    Config config_;
    Logger& logger_;
    LanguageTable languages_;
    DatasetHandle dataset_;
    std::unique_ptr<IsolationBackend> backend_;
    BearerAuthenticator authenticator_;

    std::unique_ptr<MetricsCollector> metrics_;
    std::unique_ptr<HostMonitor> monitor_;
    std::unique_ptr<AdmissionController> admission_;
    std::unique_ptr<Executor> executor_;
    std::unique_ptr<HttpServer> server_;
    bool stopped_{false};
};

}  // namespace sandbox_runner
