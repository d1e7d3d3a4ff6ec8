/**
 * @file fake_backend.hpp
 * @brief Scriptable in-memory IsolationBackend for tests and benchmarks.
 * @author Dimitris Kafetzis
 *
 * Honors the same deadline / stop_token contract as ProcessBackend and
 * keeps counters (provisions, destroys, live and peak-live environments)
 * so tests can assert that every environment is torn down.
 */

#pragma once

#include "sandbox/isolation_backend.hpp"

#include <atomic>
#include <chrono>
#include <functional>
#include <map>
#include <mutex>

namespace sandbox_runner {

/**
 * @brief What the fake does for every session.
 */
struct FakeBehavior {
    std::chrono::milliseconds provision_delay{0};
    std::chrono::milliseconds run_delay{0};
    std::string stdout_data;
    std::string stderr_data;
    int exit_code{0};
    std::optional<int> term_signal;
    bool fail_provision{false};           ///< Provision error, retryable
    bool fail_install{false};             ///< package_install_failed when packages given
    bool fail_compile{false};             ///< Nonzero exit in the compile phase
    bool ignore_cancellation{false};      ///< Sleep through deadline and stop
    /// Optional per-code override of stdout/stderr/exit code.
    std::function<RawOutcome(std::string_view code)> responder;
};

class FakeBackend final : public IsolationBackend {
public:
    explicit FakeBackend(FakeBehavior behavior = {});

    void set_behavior(FakeBehavior behavior);

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
    [[nodiscard]] std::string_view name() const noexcept override { return "fake"; }

    // ── Test observers ──────────────────────

    [[nodiscard]] uint64_t provision_count() const noexcept { return provisions_.load(); }
    [[nodiscard]] uint64_t run_count() const noexcept { return runs_.load(); }
    [[nodiscard]] uint64_t destroy_count() const noexcept { return destroys_.load(); }
    [[nodiscard]] size_t live_count() const;
    [[nodiscard]] size_t peak_live() const;

    /// Plant an environment from another epoch, as a crashed process would.
    void inject_stale(uint64_t epoch);

    /// Last spec passed to provision().
    [[nodiscard]] EnvironmentSpec last_spec() const;

private:
    enum class Wait { Elapsed, Deadline, Stopped };

    [[nodiscard]] Wait sleep_for(std::chrono::milliseconds delay, SteadyTime deadline,
                                 const std::stop_token& stop, bool ignore_cancellation) const;
    [[nodiscard]] FakeBehavior behavior() const;

    uint64_t epoch_;
    std::atomic<uint64_t> next_id_{1};
    std::atomic<uint64_t> provisions_{0};
    std::atomic<uint64_t> runs_{0};
    std::atomic<uint64_t> destroys_{0};

    mutable std::mutex mutex_;
    FakeBehavior behavior_;
    std::map<std::string, EnvironmentHandle> live_;
    size_t peak_live_{0};
    EnvironmentSpec last_spec_;
};

}  // namespace sandbox_runner
