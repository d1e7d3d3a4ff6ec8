/**
 * @file config.hpp
 * @brief Service configuration with TOML deserialization.
 * @author Dimitris Kafetzis
 */

#pragma once

#include <cstdint>
#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <vector>

#include "core/result.hpp"
#include "core/types.hpp"

namespace sandbox_runner {

struct ServerConfig {
    std::string host = "0.0.0.0";
    uint16_t port = 8080;
    uint32_t worker_threads = 0;            ///< 0 = capacity + backlog + 4
    uint64_t max_request_bytes = 1048576;
    uint32_t io_timeout_ms = 10000;
    uint32_t max_pending_connections = 64;
};

struct AuthConfig {
    std::string token_env = "AUTH_TOKEN";
    std::filesystem::path token_file;       ///< Takes precedence when set
    bool health_requires_auth = true;
};

struct AdmissionConfig {
    uint32_t max_concurrent = 0;            ///< 0 = derive from cpus/memory budget
    uint32_t cpus = 4;
    uint32_t sessions_per_cpu = 1;
    uint64_t memory_budget_mb = 0;          ///< 0 = host total memory
    uint32_t backlog = 16;
    uint32_t max_queue_wait_ms = 10000;
};

struct LimitsConfig {
    uint32_t default_timeout_s = 30;
    uint32_t max_timeout_s = 120;
    uint64_t memory_mb = 512;
    uint32_t cpu_time_s = 0;                ///< 0 = follow the request timeout
    uint32_t max_processes = 256;
    uint64_t max_output_bytes = 1048576;    ///< Per stream
    uint64_t max_file_size_mb = 64;
    uint64_t max_code_bytes = 262144;
    uint32_t max_packages = 32;
};

struct SandboxConfig {
    std::string backend = "process";
    std::filesystem::path work_root = "/tmp/sandbox_runner";
    bool isolate_network = true;
    bool require_isolation = true;          ///< Refuse to start without namespaces
    uint32_t kill_grace_ms = 2000;
    bool cleanup_stale_on_start = true;
};

struct DatasetConfig {
    std::filesystem::path path = "/bucket_data";
    std::string mount_name = "data";
    bool enabled = true;
    bool mount_by_default = true;
};

struct TelemetryConfig {
    std::filesystem::path log_dir;          ///< Empty = stdout
    uint32_t max_file_size_mb = 50;
    uint32_t rotate_count = 5;
    std::string log_level = "info";
    uint32_t qps_window_s = 60;
};

/**
 * @brief Per-language overrides of the built-in template table.
 */
struct LanguageOverride {
    std::optional<std::string> source_file;
    std::optional<std::vector<std::string>> compile;
    std::optional<std::vector<std::string>> run;
    std::optional<std::vector<std::string>> install;
    std::map<std::string, std::string> env;
};

/**
 * @brief Top-level service configuration.
 */
struct Config {
    ServerConfig server;
    AuthConfig auth;
    AdmissionConfig admission;
    LimitsConfig limits;
    SandboxConfig sandbox;
    DatasetConfig dataset;
    TelemetryConfig telemetry;
    std::map<Language, LanguageOverride> languages;
};

/**
 * @brief Load configuration from a TOML file.
 */
Result<Config> load_config(const std::filesystem::path& path);

/**
 * @brief Create a default configuration.
 */
Config default_config();

/**
 * @brief Concurrent-environment ceiling for this replica.
 *
 * Uses admission.max_concurrent when set, otherwise
 * min(cpus * sessions_per_cpu, memory_budget / limits.memory_mb), never below 1.
 *
 * @param host_memory_bytes Host total memory, used when memory_budget_mb is 0.
 */
[[nodiscard]] uint32_t derive_capacity(const Config& config, uint64_t host_memory_bytes);

/**
 * @brief Resource ceilings applied to every run, from [limits].
 */
[[nodiscard]] ResourceLimits resource_limits(const LimitsConfig& limits);

}  // namespace sandbox_runner
