/**
 * @file sandbox_service.cpp
 * @brief SandboxService implementation.
 * @author Dimitris Kafetzis
 */

#include "service/sandbox_service.hpp"

#include "api/codec.hpp"
#include "sandbox/process_backend.hpp"
#include "telemetry/json_sink.hpp"

#include <algorithm>

namespace sandbox_runner {

namespace {

constexpr uint32_t kHostSampleIntervalMs = 1000;
constexpr size_t kExtraServerThreads = 4;

HttpResponse method_not_allowed(std::string_view allow) {
    auto response = HttpResponse::json(
        405, encode_error(Error{ErrorKind::Validation, "Method not allowed"}));
    response.set_header("Allow", std::string(allow));
    return response;
}

HttpResponse not_found(std::string_view path) {
    return HttpResponse::json(
        404, encode_error(Error{ErrorKind::Validation, "No route for " + std::string(path)}));
}

}  // anonymous namespace

// ─────────────────────────────────────────────
// Construction
// ─────────────────────────────────────────────

Result<std::unique_ptr<SandboxService>> SandboxService::create(const Config& config,
                                                               Logger& logger) {
    auto authenticator = BearerAuthenticator::from_config(config.auth);
    if (!authenticator) return authenticator.error();

    if (config.sandbox.backend != "process") {
        return Error{ErrorKind::Validation,
                     "Unknown sandbox backend: " + config.sandbox.backend};
    }

    DatasetHandle dataset;
    if (config.dataset.enabled) {
        auto opened = SharedDatasetMount::open(config.dataset.path, config.dataset.mount_name);
        if (opened) {
            dataset = *opened;
            logger.info("Shared dataset " + config.dataset.path.string() + " exposed as "
                        + config.dataset.mount_name
                        + (dataset->read_only() ? "" : " (host mount is writable)"));
        } else {
            logger.warn("Shared dataset unavailable: " + opened.error().message);
        }
    }

    ProcessBackendOptions options;
    options.work_root = config.sandbox.work_root;
    options.isolate_network = config.sandbox.isolate_network;
    options.require_isolation = config.sandbox.require_isolation;
    if (!config.auth.token_file.empty()) {
        options.masked_files.push_back(config.auth.token_file);
    }

    auto backend = ProcessBackend::create(options, LanguageTable::from_config(config), dataset, logger);
    if (!backend) return backend.error();

    std::unique_ptr<ILogSink> events;
    if (!config.telemetry.log_dir.empty()) {
        events = std::make_unique<JsonFileSink>(config.telemetry.log_dir, "sessions",
                                                config.telemetry.max_file_size_mb,
                                                config.telemetry.rotate_count);
    }

    return std::make_unique<SandboxService>(config, std::move(*backend),
                                            std::move(*authenticator), std::move(dataset),
                                            logger, std::move(events));
}

SandboxService::SandboxService(const Config& config,
                               std::unique_ptr<IsolationBackend> backend,
                               BearerAuthenticator authenticator,
                               DatasetHandle dataset,
                               Logger& logger,
                               std::unique_ptr<ILogSink> event_sink)
    : config_(config)
    , logger_(logger)
    , languages_(LanguageTable::from_config(config))
    , dataset_(std::move(dataset))
    , backend_(std::move(backend))
    , authenticator_(std::move(authenticator)) {
    if (!event_sink) event_sink = std::make_unique<NullSink>();
    metrics_ = std::make_unique<MetricsCollector>(
        std::move(event_sink), std::chrono::seconds(std::max<uint32_t>(config_.telemetry.qps_window_s, 1)));
    monitor_ = std::make_unique<HostMonitor>(kHostSampleIntervalMs);

    uint64_t host_memory = read_meminfo().total_kb * 1024;
    admission_ = std::make_unique<AdmissionController>(AdmissionOptions{
        .capacity = derive_capacity(config_, host_memory),
        .backlog = config_.admission.backlog,
        .max_queue_wait = std::chrono::milliseconds(config_.admission.max_queue_wait_ms),
    });

    ExecutorOptions exec_options{
        .limits = resource_limits(config_.limits),
        .max_timeout = std::chrono::seconds(config_.limits.max_timeout_s),
        .kill_grace = std::chrono::milliseconds(config_.sandbox.kill_grace_ms),
        .max_code_bytes = static_cast<size_t>(config_.limits.max_code_bytes),
        .max_packages = config_.limits.max_packages,
        .dataset_available = dataset_ != nullptr,
    };
    executor_ = std::make_unique<Executor>(*backend_, *admission_, languages_, exec_options,
                                           logger_, metrics_.get());

    logger_.info("Capacity: " + std::to_string(admission_->capacity()) + " concurrent sessions, backlog "
                 + std::to_string(config_.admission.backlog) + ", max queue wait "
                 + std::to_string(config_.admission.max_queue_wait_ms) + "ms");
}

SandboxService::~SandboxService() {
    stop(std::chrono::milliseconds(config_.sandbox.kill_grace_ms));
}

// ─────────────────────────────────────────────
// Lifecycle
// ─────────────────────────────────────────────

Result<void> SandboxService::start() {
    if (config_.sandbox.cleanup_stale_on_start) {
        auto removed = backend_->destroy_stale(backend_->epoch());
        if (removed > 0) {
            logger_.info("Removed " + std::to_string(removed) + " stale environment(s)");
        }
    }

    monitor_->start();

    size_t threads = config_.server.worker_threads > 0
        ? config_.server.worker_threads
        : admission_->capacity() + config_.admission.backlog + kExtraServerThreads;

    HttpServerOptions options{
        .host = config_.server.host,
        .port = config_.server.port,
        .worker_threads = threads,
        .max_pending_connections = config_.server.max_pending_connections,
        .limits = HttpLimits{.max_body_bytes = static_cast<size_t>(config_.server.max_request_bytes)},
        .io_timeout = std::chrono::milliseconds(config_.server.io_timeout_ms),
    };
    server_ = std::make_unique<HttpServer>(
        options,
        [this](const HttpRequest& request, std::stop_token client_gone) {
            return handle(request, std::move(client_gone));
        },
        logger_);

    auto listening = server_->listen();
    if (!listening) {
        monitor_->stop();
        return listening.error();
    }
    server_->start();
    return Result<void>{};
}

void SandboxService::stop(std::chrono::milliseconds drain_timeout) {
    if (stopped_) return;
    stopped_ = true;

    if (!executor_->shutdown(drain_timeout)) {
        logger_.warn("Sessions still running after " + std::to_string(drain_timeout.count())
                     + "ms drain");
    }
    if (server_) server_->stop();
    monitor_->stop();
    metrics_->flush();
    logger_.info("Service stopped: " + std::to_string(metrics_->snapshot().total)
                 + " session(s) served");
}

void SandboxService::record_status() {
    auto stats = admission_->stats();
    auto metrics = metrics_->snapshot();
    std::string line = "Status: " + std::to_string(stats.active) + "/"
                     + std::to_string(stats.capacity) + " active, "
                     + std::to_string(stats.queued) + " queued, qps "
                     + std::to_string(metrics.qps);
    if (auto host = monitor_->read()) {
        metrics_->record_host_snapshot(*host);
        line += ", CPU " + std::to_string(static_cast<int>(host->cpu_usage_percent)) + "%, mem "
              + std::to_string(host->memory_available_bytes / (1024 * 1024)) + " MB avail";
    }
    logger_.info(line);
}

// ─────────────────────────────────────────────
// Routing
// ─────────────────────────────────────────────

HttpResponse SandboxService::handle(const HttpRequest& request, std::stop_token client_gone) {
    const auto& path = request.path;
    const bool is_get = request.method == "GET";

    if (path == "/") {
        if (!is_get) return method_not_allowed("GET");
        return HttpResponse::json(200, encode_root(kServiceName, kServiceVersion));
    }

    const bool known = path == "/health" || path == "/stats" || path == "/languages"
                    || path == "/execute";
    if (!known) return not_found(path);

    if (path != "/health" || config_.auth.health_requires_auth) {
        auto authorized = authenticator_.verify(request.header("Authorization"));
        if (!authorized) {
            logger_.debug("Rejected " + request.method + " " + path + ": "
                          + authorized.error().reason);
            return error_response(authorized.error());
        }
    }

    if (path == "/execute") {
        if (request.method != "POST") return method_not_allowed("POST");
        return handle_execute(request, std::move(client_gone));
    }

    if (!is_get) return method_not_allowed("GET");
    if (path == "/health") return handle_health();
    if (path == "/stats") return handle_stats();
    return handle_languages();
}

HttpResponse SandboxService::handle_health() const {
    bool namespaces = false;
    if (const auto* process = dynamic_cast<const ProcessBackend*>(backend_.get())) {
        namespaces = process->namespaces_enabled();
    }
    HealthInfo info{
        .backend = backend_->name(),
        .epoch = backend_->epoch(),
        .namespaces = namespaces,
        .dataset_available = dataset_ != nullptr,
        .admission = admission_->stats(),
    };
    return HttpResponse::json(info.admission.shutting_down ? 503 : 200, encode_health(info));
}

HttpResponse SandboxService::handle_stats() const {
    StatsInfo info{
        .admission = admission_->stats(),
        .metrics = metrics_->snapshot(),
        .host = std::nullopt,
        .live_environments = backend_->list_environments().size(),
    };
    if (auto host = monitor_->read()) info.host = *host;
    return HttpResponse::json(200, encode_stats(info));
}

HttpResponse SandboxService::handle_languages() const {
    return HttpResponse::json(200, encode_languages(languages_));
}

HttpResponse SandboxService::handle_execute(const HttpRequest& request,
                                            std::stop_token client_gone) {
    DecodeDefaults defaults{
        .timeout = std::chrono::seconds(config_.limits.default_timeout_s),
        .use_shared_dataset = config_.dataset.mount_by_default && dataset_ != nullptr,
    };
    auto decoded = decode_execute_request(request.body, defaults);
    if (!decoded) return error_response(decoded.error());

    auto report = executor_->execute(std::move(*decoded), std::move(client_gone));
    if (!report) return error_response(report.error());

    auto response = HttpResponse::json(http_status_for(*report), encode_report(*report));
    if (report->retryable()) response.set_header("Retry-After", "1");
    return response;
}

HttpResponse SandboxService::error_response(const Error& error) const {
    auto response = HttpResponse::json(http_status_for(error.kind), encode_error(error));
    if (error.kind == ErrorKind::Auth) {
        response.set_header("WWW-Authenticate", "Bearer");
    } else if (is_retryable(error.kind)) {
        response.set_header("Retry-After", "1");
    }
    return response;
}

}  // namespace sandbox_runner
