/**
 * @file process_backend.hpp
 * @brief IsolationBackend built on per-session work directories, rlimits
 *        and unprivileged Linux namespaces.
 * @author Dimitris Kafetzis
 *
 * Each environment is a private directory <work_root>/e<epoch>-<seq>.
 * Programs run under a supervisor with resource ceilings, a fresh user,
 * mount and PID namespace and (optionally) an empty network namespace.
 * Inside, the work root holds only the environment's own directory and
 * masked host files read as empty. When namespaces are unavailable the
 * backend refuses to start unless require_isolation is off, in which case
 * it degrades to rlimits-only isolation.
 */

#pragma once

#include "core/logger.hpp"
#include "sandbox/dataset_mount.hpp"
#include "sandbox/isolation_backend.hpp"
#include "sandbox/language_table.hpp"
#include "sandbox/subprocess.hpp"

#include <sys/types.h>

#include <atomic>
#include <chrono>
#include <map>
#include <memory>
#include <mutex>
#include <vector>

namespace sandbox_runner {

struct ProcessBackendOptions {
    std::filesystem::path work_root = "/tmp/sandbox_runner";
    bool isolate_network{true};
    bool require_isolation{true};
    bool use_namespaces{true};              ///< false skips the support check entirely
    std::vector<std::filesystem::path> masked_files;   ///< Read as empty inside
    std::string sandbox_path = "/usr/local/sbin:/usr/local/bin:/usr/sbin:/usr/bin:/sbin:/bin";
    size_t install_output_bytes{64 * 1024};
};

class ProcessBackend final : public IsolationBackend {
public:
    /**
     * @brief Create the work root and check namespace support.
     *
     * Fails with Provision when the work root cannot be created, or when
     * require_isolation is set and namespaces are unavailable.
     */
    static Result<std::unique_ptr<ProcessBackend>> create(ProcessBackendOptions options,
                                                          LanguageTable languages,
                                                          DatasetHandle dataset,
                                                          Logger& logger);

    ~ProcessBackend() override;

    ProcessBackend(const ProcessBackend&) = delete;
    ProcessBackend& operator=(const ProcessBackend&) = delete;

    Result<EnvironmentHandle> provision(const EnvironmentSpec& spec,
                                        SteadyTime deadline,
                                        std::stop_token stop) override;

    Result<RawOutcome> run(const EnvironmentHandle& handle,
                           std::string_view code,
                           SteadyTime deadline,
                           OutputCapture& capture,
                           std::stop_token stop) override;

    Result<void> destroy(const EnvironmentHandle& handle) override;

    [[nodiscard]] std::vector<EnvironmentHandle> list_environments() const override;
    size_t destroy_stale(uint64_t current_epoch) override;

    [[nodiscard]] uint64_t epoch() const noexcept override { return epoch_; }
    [[nodiscard]] std::string_view name() const noexcept override { return "process"; }

    /// Whether runs are namespace-isolated on this host.
    [[nodiscard]] bool namespaces_enabled() const noexcept { return namespaces_; }

    [[nodiscard]] const std::filesystem::path& work_root() const noexcept {
        return options_.work_root;
    }

private:
    ProcessBackend(ProcessBackendOptions options, LanguageTable languages,
                   DatasetHandle dataset, Logger& logger, bool namespaces);

    struct Environment {
        EnvironmentHandle handle;
        LanguageTemplate tmpl;
        std::vector<std::string> packages;
        bool dataset_mounted{false};
        ResourceLimits limits;
        std::vector<pid_t> supervisors;   ///< Live runs, stopped on destroy
    };

    [[nodiscard]] TemplateContext context_for(const Environment& env) const;
    /// Namespace, private work root and masked files for one spawn.
    void confine(SpawnOptions& options, const Environment& env) const;
    [[nodiscard]] std::vector<std::string> environment_for(const Environment& env,
                                                           const TemplateContext& ctx) const;

    Result<void> install_packages(const Environment& env, SteadyTime deadline,
                                  std::stop_token stop);

    /// Spawn one step of a run and keep its supervisor registered.
    Result<ProcessExit> spawn_tracked(const std::string& env_id,
                                      const SpawnOptions& options,
                                      OutputCapture& capture,
                                      SteadyTime deadline,
                                      std::stop_token stop);

    ProcessBackendOptions options_;
    LanguageTable languages_;
    DatasetHandle dataset_;
    Logger& logger_;
    bool namespaces_;
    uint64_t epoch_;
    std::atomic<uint64_t> next_id_{1};

    mutable std::mutex mutex_;
    std::map<std::string, Environment> environments_;
};

/**
 * @brief Remove a directory tree, first restoring write permission on
 *        subdirectories that sandboxed code made read-only.
 */
Result<void> force_remove_tree(const std::filesystem::path& path);

}  // namespace sandbox_runner
