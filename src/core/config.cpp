/**
 * @file config.cpp
 * @brief Configuration loading from TOML files using toml++.
 * @author Dimitris Kafetzis
 */

#include "core/config.hpp"

#include <toml++/toml.hpp>

#include <algorithm>

namespace sandbox_runner {

namespace {

/**
 * @brief Read an array of strings; non-string elements make the key invalid.
 */
Result<std::vector<std::string>> read_string_array(const toml::node* node,
                                                   const std::string& key) {
    const auto* arr = node ? node->as_array() : nullptr;
    if (!arr) {
        return Error{ErrorKind::Validation, "Expected an array of strings for " + key};
    }
    std::vector<std::string> out;
    out.reserve(arr->size());
    for (const auto& elem : *arr) {
        auto value = elem.value<std::string>();
        if (!value) {
            return Error{ErrorKind::Validation, "Non-string element in " + key};
        }
        out.push_back(std::move(*value));
    }
    return out;
}

Result<void> load_language_overrides(const toml::table* languages, Config& config) {
    if (!languages) return Result<void>{};

    for (const auto& [name, node] : *languages) {
        auto language = parse_language(name.str());
        if (!language) {
            return Error{ErrorKind::Validation,
                         "Unknown language in [languages]: " + std::string(name.str())};
        }
        const auto* entry = node.as_table();
        if (!entry) continue;

        std::string prefix = "languages." + std::string(name.str()) + ".";
        LanguageOverride override_entry;

        if (const auto* source = entry->get("source_file")) {
            if (auto value = source->value<std::string>()) {
                override_entry.source_file = *value;
            }
        }
        if (entry->contains("compile")) {
            auto argv = read_string_array(entry->get("compile"), prefix + "compile");
            if (!argv) return argv.error();
            override_entry.compile = std::move(*argv);
        }
        if (entry->contains("run")) {
            auto argv = read_string_array(entry->get("run"), prefix + "run");
            if (!argv) return argv.error();
            override_entry.run = std::move(*argv);
        }
        if (entry->contains("install")) {
            auto argv = read_string_array(entry->get("install"), prefix + "install");
            if (!argv) return argv.error();
            override_entry.install = std::move(*argv);
        }
        if (const auto* env = entry->get_as<toml::table>("env")) {
            for (const auto& [env_key, env_value] : *env) {
                auto value = env_value.value<std::string>();
                if (!value) {
                    return Error{ErrorKind::Validation,
                                 "Non-string value in " + prefix + "env"};
                }
                override_entry.env[std::string(env_key.str())] = *value;
            }
        }

        config.languages[*language] = std::move(override_entry);
    }
    return Result<void>{};
}

}  // anonymous namespace

Result<Config> load_config(const std::filesystem::path& path) {
    if (!std::filesystem::exists(path)) {
        return Error{"Configuration file not found: " + path.string()};
    }

    try {
        auto tbl = toml::parse_file(path.string());
        Config config;

        // [server]
        if (auto server = tbl["server"]; server.is_table()) {
            config.server.host = server["host"].value_or(std::string{"0.0.0.0"});
            config.server.port = static_cast<uint16_t>(
                server["port"].value_or(int64_t{8080}));
            config.server.worker_threads = static_cast<uint32_t>(
                server["worker_threads"].value_or(int64_t{0}));
            config.server.max_request_bytes = static_cast<uint64_t>(
                server["max_request_bytes"].value_or(int64_t{1048576}));
            config.server.io_timeout_ms = static_cast<uint32_t>(
                server["io_timeout_ms"].value_or(int64_t{10000}));
            config.server.max_pending_connections = static_cast<uint32_t>(
                server["max_pending_connections"].value_or(int64_t{64}));
        }

        // [auth]
        if (auto auth = tbl["auth"]; auth.is_table()) {
            config.auth.token_env = auth["token_env"].value_or(std::string{"AUTH_TOKEN"});
            config.auth.token_file = auth["token_file"].value_or(std::string{});
            config.auth.health_requires_auth = auth["health_requires_auth"].value_or(true);
        }

        // [admission]
        if (auto admission = tbl["admission"]; admission.is_table()) {
            config.admission.max_concurrent = static_cast<uint32_t>(
                admission["max_concurrent"].value_or(int64_t{0}));
            config.admission.cpus = static_cast<uint32_t>(
                admission["cpus"].value_or(int64_t{4}));
            config.admission.sessions_per_cpu = static_cast<uint32_t>(
                admission["sessions_per_cpu"].value_or(int64_t{1}));
            config.admission.memory_budget_mb = static_cast<uint64_t>(
                admission["memory_budget_mb"].value_or(int64_t{0}));
            config.admission.backlog = static_cast<uint32_t>(
                admission["backlog"].value_or(int64_t{16}));
            config.admission.max_queue_wait_ms = static_cast<uint32_t>(
                admission["max_queue_wait_ms"].value_or(int64_t{10000}));
        }

        // [limits]
        if (auto limits = tbl["limits"]; limits.is_table()) {
            config.limits.default_timeout_s = static_cast<uint32_t>(
                limits["default_timeout_s"].value_or(int64_t{30}));
            config.limits.max_timeout_s = static_cast<uint32_t>(
                limits["max_timeout_s"].value_or(int64_t{120}));
            config.limits.memory_mb = static_cast<uint64_t>(
                limits["memory_mb"].value_or(int64_t{512}));
            config.limits.cpu_time_s = static_cast<uint32_t>(
                limits["cpu_time_s"].value_or(int64_t{0}));
            config.limits.max_processes = static_cast<uint32_t>(
                limits["max_processes"].value_or(int64_t{256}));
            config.limits.max_output_bytes = static_cast<uint64_t>(
                limits["max_output_bytes"].value_or(int64_t{1048576}));
            config.limits.max_file_size_mb = static_cast<uint64_t>(
                limits["max_file_size_mb"].value_or(int64_t{64}));
            config.limits.max_code_bytes = static_cast<uint64_t>(
                limits["max_code_bytes"].value_or(int64_t{262144}));
            config.limits.max_packages = static_cast<uint32_t>(
                limits["max_packages"].value_or(int64_t{32}));
        }

        // [sandbox]
        if (auto sandbox = tbl["sandbox"]; sandbox.is_table()) {
            config.sandbox.backend = sandbox["backend"].value_or(std::string{"process"});
            config.sandbox.work_root =
                sandbox["work_root"].value_or(std::string{"/tmp/sandbox_runner"});
            config.sandbox.isolate_network = sandbox["isolate_network"].value_or(true);
            config.sandbox.require_isolation = sandbox["require_isolation"].value_or(true);
            config.sandbox.kill_grace_ms = static_cast<uint32_t>(
                sandbox["kill_grace_ms"].value_or(int64_t{2000}));
            config.sandbox.cleanup_stale_on_start =
                sandbox["cleanup_stale_on_start"].value_or(true);
        }

        // [dataset]
        if (auto dataset = tbl["dataset"]; dataset.is_table()) {
            config.dataset.path = dataset["path"].value_or(std::string{"/bucket_data"});
            config.dataset.mount_name = dataset["mount_name"].value_or(std::string{"data"});
            config.dataset.enabled = dataset["enabled"].value_or(true);
            config.dataset.mount_by_default = dataset["mount_by_default"].value_or(true);
        }

        // [telemetry]
        if (auto telemetry = tbl["telemetry"]; telemetry.is_table()) {
            config.telemetry.log_dir = telemetry["log_dir"].value_or(std::string{});
            config.telemetry.max_file_size_mb = static_cast<uint32_t>(
                telemetry["max_file_size_mb"].value_or(int64_t{50}));
            config.telemetry.rotate_count = static_cast<uint32_t>(
                telemetry["rotate_count"].value_or(int64_t{5}));
            config.telemetry.log_level = telemetry["log_level"].value_or(std::string{"info"});
            config.telemetry.qps_window_s = static_cast<uint32_t>(
                telemetry["qps_window_s"].value_or(int64_t{60}));
        }

        // [languages.*]
        auto overrides = load_language_overrides(tbl["languages"].as_table(), config);
        if (!overrides) {
            return overrides.error();
        }

        if (config.limits.default_timeout_s == 0
            || config.limits.default_timeout_s > config.limits.max_timeout_s) {
            return Error{ErrorKind::Validation,
                         "limits.default_timeout_s must be in (0, max_timeout_s]"};
        }
        if (!parse_log_level(config.telemetry.log_level)) {
            return Error{ErrorKind::Validation,
                         "Unknown telemetry.log_level: " + config.telemetry.log_level};
        }

        return config;

    } catch (const toml::parse_error& err) {
        return Error{std::string{"TOML parse error: "} + std::string{err.description()}};
    }
}

Config default_config() {
    return Config{};
}

uint32_t derive_capacity(const Config& config, uint64_t host_memory_bytes) {
    if (config.admission.max_concurrent > 0) {
        return config.admission.max_concurrent;
    }

    uint64_t by_cpu = static_cast<uint64_t>(config.admission.cpus)
                    * std::max<uint32_t>(config.admission.sessions_per_cpu, 1);

    uint64_t budget_bytes = config.admission.memory_budget_mb > 0
        ? config.admission.memory_budget_mb * 1024 * 1024
        : host_memory_bytes;
    uint64_t per_session = std::max<uint64_t>(config.limits.memory_mb, 1) * 1024 * 1024;
    uint64_t by_memory = budget_bytes > 0 ? budget_bytes / per_session : by_cpu;

    uint64_t ceiling = std::min(by_cpu, by_memory);
    return static_cast<uint32_t>(std::max<uint64_t>(ceiling, 1));
}

ResourceLimits resource_limits(const LimitsConfig& limits) {
    ResourceLimits out;
    out.memory_bytes = limits.memory_mb * 1024 * 1024;
    out.cpu_time_seconds = limits.cpu_time_s;
    out.max_processes = limits.max_processes;
    out.max_file_size_bytes = limits.max_file_size_mb * 1024 * 1024;
    out.max_output_bytes = static_cast<size_t>(limits.max_output_bytes);
    return out;
}

}  // namespace sandbox_runner
