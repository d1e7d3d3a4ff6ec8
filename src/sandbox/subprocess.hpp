/**
 * @file subprocess.hpp
 * @brief Fork/exec of one sandboxed child with rlimits, namespaces and
 *        deadline-driven termination.
 * @author Dimitris Kafetzis
 *
 * Process tree of one run:
 *
 *   service ── supervisor ── [init] ── program
 *
 * The supervisor is the direct child. It blocks every signal, is a child
 * subreaper, and owns the run: when the program exits, or when the service
 * closes the lifeline pipe (deadline, cancellation, service death), it
 * kills everything the program started, including descendants that called
 * setsid(), then exits with the program's status. Under namespaces the
 * program runs in a fresh PID namespace behind a minimal init, so killing
 * the init tears the whole namespace down and the service's processes are
 * not addressable from inside.
 *
 * stdout/stderr are drained through poll() into an OutputCapture. Setup
 * and exec failures are reported back through a CLOEXEC pipe, so "command
 * not found" is distinguished from "program exited 127".
 */

#pragma once

#include "core/result.hpp"
#include "core/types.hpp"
#include "sandbox/output_capture.hpp"

#include <sys/types.h>

#include <filesystem>
#include <functional>
#include <optional>
#include <stop_token>
#include <string>
#include <vector>

namespace sandbox_runner {

/**
 * @brief Read-only bind of a host directory into the child's mount namespace.
 */
struct ReadOnlyBind {
    std::filesystem::path source;
    std::filesystem::path target;   ///< Must already exist
};

struct SpawnOptions {
    std::vector<std::string> argv;
    std::filesystem::path cwd;
    std::vector<std::string> env;   ///< Full environment, "KEY=VALUE"

    bool apply_limits{true};
    ResourceLimits limits;
    uint32_t cpu_seconds{0};        ///< RLIMIT_CPU; 0 leaves it unset

    bool use_namespaces{false};     ///< New user, mount and PID namespace
    bool isolate_network{false};    ///< Also a new, empty network namespace
    std::optional<ReadOnlyBind> readonly_bind;

    /// Namespaces only: replace this directory with an empty tmpfs that
    /// holds nothing but cwd, which must be a direct child of it.
    std::filesystem::path private_root;
    /// Namespaces only: host files overlaid with /dev/null.
    std::vector<std::filesystem::path> masked_files;
};

/**
 * @brief How the child ended.
 */
struct ProcessExit {
    std::optional<int> exit_code;
    std::optional<int> term_signal;
    bool timed_out{false};
    bool cancelled{false};
    ResourceUsage usage;
};

/// Called in the parent right after fork with the supervisor's pid (== pgid).
using SpawnObserver = std::function<void(pid_t)>;

/**
 * @brief Run a child to completion, deadline or cancellation.
 *
 * Errors are reserved for failures to start the child (Provision).
 * Output beyond the capture cap is discarded but still drained.
 */
Result<ProcessExit> run_process(const SpawnOptions& options,
                                OutputCapture& capture,
                                SteadyTime deadline,
                                std::stop_token stop,
                                const SpawnObserver& on_spawn = {});

/**
 * @brief Check whether unprivileged user namespaces work on this host.
 *
 * Forks a throwaway child that attempts the same unshare() sequence
 * run_process() uses, including mounting /proc for the new PID namespace.
 */
[[nodiscard]] bool namespaces_available(bool with_network);

/// SIGKILL a whole process group; ignores ESRCH.
void kill_process_group(pid_t pgid) noexcept;

/// Ask a supervisor to kill everything its program started and exit.
void terminate_supervisor(pid_t pid) noexcept;

}  // namespace sandbox_runner
