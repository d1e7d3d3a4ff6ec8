/**
 * @file codec.cpp
 * @brief JSON codec implementation (nlohmann/json).
 * @author Dimitris Kafetzis
 */

#include "api/codec.hpp"

#include <nlohmann/json.hpp>

#include <cmath>

namespace sandbox_runner {

using nlohmann::json;

namespace {

constexpr int kMinPriority = -100;
constexpr int kMaxPriority = 100;
constexpr double kMaxTimeoutSeconds = 1.0e7;

/// Program output is arbitrary bytes; invalid UTF-8 is replaced, never thrown on.
std::string dump(const json& value) {
    return value.dump(-1, ' ', false, json::error_handler_t::replace);
}

Error invalid(std::string message) {
    return Error{ErrorKind::Validation, std::move(message)};
}

Result<void> append_packages(const json& value, std::string_view field,
                             std::vector<std::string>& out) {
    if (value.is_null()) return Result<void>{};

    if (value.is_string()) {
        const auto& text = value.get_ref<const std::string&>();
        size_t start = 0;
        while (start <= text.size()) {
            size_t end = text.find(',', start);
            if (end == std::string::npos) end = text.size();
            auto piece = text.substr(start, end - start);
            auto first = piece.find_first_not_of(" \t");
            auto last = piece.find_last_not_of(" \t");
            if (first != std::string::npos) out.push_back(piece.substr(first, last - first + 1));
            start = end + 1;
        }
        return Result<void>{};
    }

    if (!value.is_array()) {
        return invalid(std::string(field) + " must be an array of strings");
    }
    for (const auto& item : value) {
        if (!item.is_string()) {
            return invalid(std::string(field) + " must be an array of strings");
        }
        out.push_back(item.get<std::string>());
    }
    return Result<void>{};
}

json usage_json(const ResourceUsage& usage) {
    return json{
        {"wall_seconds", std::chrono::duration<double>(usage.wall_time).count()},
        {"cpu_seconds", std::chrono::duration<double>(usage.cpu_time).count()},
        {"peak_memory_bytes", usage.peak_memory_bytes},
    };
}

json admission_json(const AdmissionStats& stats) {
    return json{
        {"capacity", stats.capacity},
        {"active", stats.active},
        {"queued", stats.queued},
        {"backlog", stats.backlog},
        {"available", stats.capacity > stats.active ? stats.capacity - stats.active : 0},
        {"peak_active", stats.peak_active},
        {"admitted", stats.admitted},
        {"rejected", {
            {"capacity_exhausted", stats.rejected_capacity},
            {"queue_timeout", stats.rejected_timeout},
            {"shutting_down", stats.rejected_shutdown},
        }},
        {"cancelled_in_queue", stats.cancelled},
    };
}

}  // anonymous namespace

// ─────────────────────────────────────────────
// Decoding
// ─────────────────────────────────────────────

Result<ExecutionRequest> decode_execute_request(std::string_view body,
                                                const DecodeDefaults& defaults) {
    json doc = json::parse(body.begin(), body.end(), nullptr, false);
    if (doc.is_discarded()) {
        return invalid("Request body is not valid JSON");
    }
    if (!doc.is_object()) {
        return invalid("Request body must be a JSON object");
    }

    ExecutionRequest request;
    request.timeout = defaults.timeout;
    request.use_shared_dataset = defaults.use_shared_dataset;

    // language (default python)
    if (auto it = doc.find("language"); it != doc.end() && !it->is_null()) {
        if (!it->is_string()) return invalid("language must be a string");
        const auto& name = it->get_ref<const std::string&>();
        auto language = parse_language(name);
        if (!language) return invalid("Unsupported language: " + name);
        request.language = *language;
    }

    // code
    auto code = doc.find("code");
    if (code == doc.end() || code->is_null()) return invalid("code is required");
    if (!code->is_string()) return invalid("code must be a string");
    request.code = code->get<std::string>();

    // timeout, in seconds
    if (auto it = doc.find("timeout"); it != doc.end() && !it->is_null()) {
        if (!it->is_number()) return invalid("timeout must be a number of seconds");
        double seconds = it->get<double>();
        if (!std::isfinite(seconds) || seconds <= 0.0) {
            return invalid("timeout must be positive");
        }
        seconds = std::min(seconds, kMaxTimeoutSeconds);
        request.timeout = std::chrono::milliseconds(
            std::max<int64_t>(1, static_cast<int64_t>(std::llround(seconds * 1000.0))));
    }

    // packages / libraries
    for (const char* field : {"packages", "libraries"}) {
        if (auto it = doc.find(field); it != doc.end()) {
            auto appended = append_packages(*it, field, request.packages);
            if (!appended) return appended.error();
        }
    }

    if (auto it = doc.find("use_shared_dataset"); it != doc.end() && !it->is_null()) {
        if (!it->is_boolean()) return invalid("use_shared_dataset must be a boolean");
        request.use_shared_dataset = it->get<bool>();
    }

    if (auto it = doc.find("priority"); it != doc.end() && !it->is_null()) {
        if (!it->is_number_integer()) return invalid("priority must be an integer");
        auto priority = it->get<int64_t>();
        if (priority < kMinPriority || priority > kMaxPriority) {
            return invalid("priority must be between " + std::to_string(kMinPriority) + " and "
                           + std::to_string(kMaxPriority));
        }
        request.priority = static_cast<int>(priority);
    }

    return request;
}

// ─────────────────────────────────────────────
// Encoding
// ─────────────────────────────────────────────

std::string encode_report(const ExecutionReport& report) {
    json body{
        {"session_id", report.session_id},
        {"status", std::string(to_string(report.status))},
        {"success", report.success()},
        {"language", std::string(to_string(report.language))},
        {"stdout", report.stdout_data},
        {"stderr", report.stderr_data},
        {"exit_code", report.exit_code ? json(*report.exit_code) : json(nullptr)},
        {"duration_seconds", report.duration_seconds},
        {"queue_wait_seconds", std::chrono::duration<double>(report.queue_wait).count()},
        {"truncated", report.truncated},
        {"retryable", report.retryable()},
        {"usage", usage_json(report.usage)},
    };
    if (report.error_kind) {
        body["error_kind"] = std::string(to_string(*report.error_kind));
        body["message"] = report.message;
        if (!report.reason.empty()) body["reason"] = report.reason;
    }
    return dump(body);
}

std::string encode_error(const Error& error) {
    json body{
        {"status", error.kind == ErrorKind::AdmissionRejected ? "rejected" : "failed"},
        {"success", false},
        {"error_kind", std::string(to_string(error.kind))},
        {"message", error.message},
        {"detail", error.message},
        {"retryable", is_retryable(error.kind)},
    };
    if (!error.reason.empty()) body["reason"] = error.reason;
    return dump(body);
}

std::string encode_health(const HealthInfo& info) {
    json body{
        {"status", info.admission.shutting_down ? "draining" : "healthy"},
        {"backend", std::string(info.backend)},
        {"epoch", info.epoch},
        {"namespaces", info.namespaces},
        {"shared_dataset", info.dataset_available},
        {"capacity", info.admission.capacity},
        {"active", info.admission.active},
        {"queued", info.admission.queued},
    };
    return dump(body);
}

std::string encode_stats(const StatsInfo& info) {
    const auto& m = info.metrics;
    json body{
        {"admission", admission_json(info.admission)},
        {"sessions", {
            {"total", m.total},
            {"completed", m.completed},
            {"failed", m.failed},
            {"timed_out", m.timed_out},
            {"rejected", m.rejected},
            {"mean_duration_seconds", m.mean_duration_seconds},
            {"max_duration_seconds", m.max_duration_seconds},
        }},
        {"qps", m.qps},
        {"qps_window_seconds", m.window.count()},
        {"live_environments", info.live_environments},
    };
    if (info.host) {
        body["host"] = json{
            {"cpu_usage_percent", info.host->cpu_usage_percent},
            {"cpu_count", info.host->cpu_count},
            {"memory_total_bytes", info.host->memory_total_bytes},
            {"memory_available_bytes", info.host->memory_available_bytes},
        };
    }
    return dump(body);
}

std::string encode_languages(const LanguageTable& languages) {
    json list = json::array();
    json details = json::array();
    for (auto language : kAllLanguages) {
        const auto* tmpl = languages.find(language);
        if (!tmpl) continue;
        list.push_back(std::string(to_string(language)));
        details.push_back(json{
            {"name", std::string(to_string(language))},
            {"packages", tmpl->supports_packages()},
            {"compiled", tmpl->is_compiled()},
        });
    }
    return dump(json{{"languages", list}, {"details", details}});
}

std::string encode_root(std::string_view name, std::string_view version) {
    return dump(json{
        {"message", std::string(name)},
        {"version", std::string(version)},
        {"authentication", "required"},
    });
}

// ─────────────────────────────────────────────
// Status mapping
// ─────────────────────────────────────────────

int http_status_for(ErrorKind kind) noexcept {
    switch (kind) {
        case ErrorKind::Auth:              return 401;
        case ErrorKind::Validation:        return 400;
        case ErrorKind::AdmissionRejected: return 503;
        case ErrorKind::Provision:         return 503;
        case ErrorKind::ExecutionFailure:  return 200;
        case ErrorKind::Timeout:           return 200;
        case ErrorKind::Internal:          return 500;
    }
    return 500;
}

int http_status_for(const ExecutionReport& report) noexcept {
    if (!report.error_kind) return 200;
    return http_status_for(*report.error_kind);
}

}  // namespace sandbox_runner
