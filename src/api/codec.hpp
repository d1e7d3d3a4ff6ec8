/**
 * @file codec.hpp
 * @brief JSON request decoding and response encoding for the HTTP surface.
 * @author Dimitris Kafetzis
 *
 * POST /execute body:
 *   {"language": "python", "code": "...", "timeout": 30,
 *    "packages": ["numpy"], "use_shared_dataset": true, "priority": 0}
 *
 * "libraries" is accepted as an alias of "packages", and either may be a
 * comma-separated string. Unknown fields are ignored.
 */

#pragma once

#include "admission/admission_controller.hpp"
#include "core/result.hpp"
#include "core/types.hpp"
#include "executor/result_reporter.hpp"
#include "resource_monitor/host_monitor.hpp"
#include "sandbox/language_table.hpp"
#include "telemetry/metrics_collector.hpp"

#include <chrono>
#include <optional>
#include <string>
#include <string_view>

namespace sandbox_runner {

struct DecodeDefaults {
    std::chrono::milliseconds timeout{30000};
    bool use_shared_dataset{false};
};

/**
 * @brief Parse and shape-check an /execute body.
 *
 * Errors are ErrorKind::Validation. Semantic limits (timeout ceiling,
 * package count, language support) are checked later by validate_request.
 */
Result<ExecutionRequest> decode_execute_request(std::string_view body,
                                                const DecodeDefaults& defaults);

[[nodiscard]] std::string encode_report(const ExecutionReport& report);

/// Body for requests that never became a session (auth, validation, parse).
[[nodiscard]] std::string encode_error(const Error& error);

struct HealthInfo {
    std::string_view backend;
    uint64_t epoch{0};
    bool namespaces{false};
    bool dataset_available{false};
    AdmissionStats admission;
};

[[nodiscard]] std::string encode_health(const HealthInfo& info);

struct StatsInfo {
    AdmissionStats admission;
    MetricsSnapshot metrics;
    std::optional<HostSnapshot> host;
    size_t live_environments{0};
};

[[nodiscard]] std::string encode_stats(const StatsInfo& info);
[[nodiscard]] std::string encode_languages(const LanguageTable& languages);
[[nodiscard]] std::string encode_root(std::string_view name, std::string_view version);

/// HTTP status for an error that ended a request before or instead of a run.
[[nodiscard]] int http_status_for(ErrorKind kind) noexcept;

/// HTTP status for a finished session.
[[nodiscard]] int http_status_for(const ExecutionReport& report) noexcept;

}  // namespace sandbox_runner
