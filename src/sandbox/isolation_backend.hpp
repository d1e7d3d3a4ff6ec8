/**
 * @file isolation_backend.hpp
 * @brief Isolation backend adapter interface.
 * @author Dimitris Kafetzis
 *
 * An IsolationBackend creates one ephemeral environment per session, runs
 * code inside it under resource ceilings, and destroys it. Backends are
 * selected once at start-up, so the interface uses virtual dispatch.
 *
 * Cancellation contract (identical for every implementation):
 *   - provision() and run() receive a deadline and a std::stop_token and
 *     check both at every blocking point; on either they kill any child
 *     work and return promptly.
 *   - destroy() is idempotent, never blocks on the sandboxed program and
 *     is safe for handles whose provisioning partially failed.
 */

#pragma once

#include "core/result.hpp"
#include "core/types.hpp"
#include "sandbox/output_capture.hpp"

#include <cstdint>
#include <filesystem>
#include <optional>
#include <stop_token>
#include <string>
#include <string_view>
#include <vector>

namespace sandbox_runner {

/**
 * @brief What an environment must contain.
 */
struct EnvironmentSpec {
    SessionId session_id;
    Language language{Language::Python};
    std::vector<std::string> packages;
    bool mount_dataset{false};
    ResourceLimits limits;
};

/**
 * @brief Opaque reference to a live environment.
 *
 * The epoch tag identifies which process lifetime created the environment,
 * so a restarted service can find and destroy stale ones.
 */
struct EnvironmentHandle {
    std::string id;
    SessionId session_id;
    Language language{Language::Python};
    uint64_t epoch{0};
    std::filesystem::path workdir;

    [[nodiscard]] bool valid() const noexcept { return !id.empty(); }
};

/**
 * @brief Phase in which a run stopped.
 */
enum class RunPhase : uint8_t {
    Compile,
    Execute
};

/**
 * @brief Raw result of one run, before normalization.
 *
 * Output is also streamed into the session's OutputCapture while the run is
 * in progress; the copies here are the final contents.
 */
struct RawOutcome {
    std::string stdout_data;
    std::string stderr_data;
    std::optional<int> exit_code;      ///< Set when the program exited normally
    std::optional<int> term_signal;    ///< Set when killed by a signal
    Duration duration{0};
    bool truncated{false};
    bool timed_out{false};             ///< Deadline hit, program killed
    bool cancelled{false};             ///< Stop requested, program killed
    RunPhase phase{RunPhase::Execute};
    ResourceUsage usage;
};

class IsolationBackend {
public:
    virtual ~IsolationBackend() = default;

    /**
     * @brief Materialize a fresh environment, installing packages if any.
     *
     * Errors: Provision (no resources / backend failure), ExecutionFailure
     * with reason "package_install_failed", Timeout, Internal "cancelled".
     * On error nothing is left allocated.
     */
    virtual Result<EnvironmentHandle> provision(const EnvironmentSpec& spec,
                                                SteadyTime deadline,
                                                std::stop_token stop) = 0;

    /**
     * @brief Execute code inside a provisioned environment.
     *
     * Streams output into @p capture. Timeouts and cancellation are not
     * errors: they are reported in RawOutcome. Errors are reserved for
     * infrastructure failures (Provision / Internal).
     */
    virtual Result<RawOutcome> run(const EnvironmentHandle& handle,
                                   std::string_view code,
                                   SteadyTime deadline,
                                   OutputCapture& capture,
                                   std::stop_token stop) = 0;

    /// Idempotent teardown. Unknown or already-destroyed handles succeed.
    virtual Result<void> destroy(const EnvironmentHandle& handle) = 0;

    /// Live environments known to this backend instance.
    [[nodiscard]] virtual std::vector<EnvironmentHandle> list_environments() const = 0;

    /**
     * @brief Destroy environments left behind by another epoch.
     * @return Number of environments removed.
     */
    virtual size_t destroy_stale(uint64_t current_epoch) = 0;

    [[nodiscard]] virtual uint64_t epoch() const noexcept = 0;
    [[nodiscard]] virtual std::string_view name() const noexcept = 0;
};

}  // namespace sandbox_runner
