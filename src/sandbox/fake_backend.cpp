/**
 * @file fake_backend.cpp
 * @brief FakeBackend implementation.
 * @author Dimitris Kafetzis
 */

#include "sandbox/fake_backend.hpp"

#include <algorithm>
#include <csignal>
#include <thread>

namespace sandbox_runner {

namespace {

constexpr auto kSleepSlice = std::chrono::milliseconds(2);

}  // anonymous namespace

FakeBackend::FakeBackend(FakeBehavior behavior)
    : epoch_(static_cast<uint64_t>(std::chrono::steady_clock::now().time_since_epoch().count()))
    , behavior_(std::move(behavior)) {}

void FakeBackend::set_behavior(FakeBehavior behavior) {
    std::lock_guard lock(mutex_);
    behavior_ = std::move(behavior);
}

FakeBehavior FakeBackend::behavior() const {
    std::lock_guard lock(mutex_);
    return behavior_;
}

FakeBackend::Wait FakeBackend::sleep_for(std::chrono::milliseconds delay, SteadyTime deadline,
                                         const std::stop_token& stop,
                                         bool ignore_cancellation) const {
    auto until = std::chrono::steady_clock::now() + delay;
    while (true) {
        auto now = std::chrono::steady_clock::now();
        if (now >= until) return Wait::Elapsed;
        if (!ignore_cancellation) {
            if (stop.stop_requested()) return Wait::Stopped;
            if (now >= deadline) return Wait::Deadline;
        }
        std::this_thread::sleep_for(std::min<std::chrono::steady_clock::duration>(
            kSleepSlice, until - now));
    }
}

// ─────────────────────────────────────────────
// IsolationBackend
// ─────────────────────────────────────────────

Result<EnvironmentHandle> FakeBackend::provision(const EnvironmentSpec& spec,
                                                 SteadyTime deadline,
                                                 std::stop_token stop) {
    auto script = behavior();
    {
        std::lock_guard lock(mutex_);
        last_spec_ = spec;
    }

    switch (sleep_for(script.provision_delay, deadline, stop, script.ignore_cancellation)) {
        case Wait::Stopped:
            return Error{ErrorKind::Internal, "Provisioning cancelled", "cancelled"};
        case Wait::Deadline:
            return Error{ErrorKind::Timeout, "Provisioning exceeded the time limit"};
        case Wait::Elapsed:
            break;
    }

    if (script.fail_provision) {
        return Error{ErrorKind::Provision, "Fake backend has no capacity"};
    }
    if (script.fail_install && !spec.packages.empty()) {
        return Error{ErrorKind::ExecutionFailure,
                     "Package installation failed: no matching distribution",
                     "package_install_failed"};
    }

    EnvironmentHandle handle;
    handle.id = "fake-" + std::to_string(next_id_.fetch_add(1));
    handle.session_id = spec.session_id;
    handle.language = spec.language;
    handle.epoch = epoch_;
    handle.workdir = "/fake/" + handle.id;

    {
        std::lock_guard lock(mutex_);
        live_.emplace(handle.id, handle);
        peak_live_ = std::max(peak_live_, live_.size());
    }
    provisions_.fetch_add(1);
    return handle;
}

Result<RawOutcome> FakeBackend::run(const EnvironmentHandle& handle,
                                    std::string_view code,
                                    SteadyTime deadline,
                                    OutputCapture& capture,
                                    std::stop_token stop) {
    {
        std::lock_guard lock(mutex_);
        if (!live_.contains(handle.id)) {
            return Error{ErrorKind::Internal, "Unknown environment: " + handle.id};
        }
    }
    runs_.fetch_add(1);
    auto script = behavior();

    RawOutcome outcome;
    outcome.stdout_data = script.stdout_data;
    outcome.stderr_data = script.stderr_data;
    outcome.exit_code = script.exit_code;
    outcome.term_signal = script.term_signal;
    if (script.term_signal) outcome.exit_code.reset();
    if (script.responder) {
        outcome = script.responder(code);
    }
    if (script.fail_compile) {
        outcome.phase = RunPhase::Compile;
        outcome.exit_code = 1;
        outcome.term_signal.reset();
    }

    // Output appears before the program finishes, as a real one would.
    capture.append(Stream::Stdout, outcome.stdout_data);
    capture.append(Stream::Stderr, outcome.stderr_data);

    auto started = std::chrono::steady_clock::now();
    auto waited = sleep_for(script.run_delay, deadline, stop, script.ignore_cancellation);
    if (waited != Wait::Elapsed) {
        outcome.exit_code.reset();
        outcome.term_signal = SIGKILL;
        outcome.timed_out = waited == Wait::Deadline;
        outcome.cancelled = waited == Wait::Stopped;
    }

    auto snapshot = capture.snapshot();
    outcome.stdout_data = std::move(snapshot.stdout_data);
    outcome.stderr_data = std::move(snapshot.stderr_data);
    outcome.truncated = snapshot.truncated;
    outcome.duration = std::chrono::duration_cast<Duration>(
        std::chrono::steady_clock::now() - started);
    outcome.usage.wall_time = outcome.duration;
    return outcome;
}

Result<void> FakeBackend::destroy(const EnvironmentHandle& handle) {
    std::lock_guard lock(mutex_);
    if (live_.erase(handle.id) > 0) {
        destroys_.fetch_add(1);
    }
    return Result<void>{};
}

std::vector<EnvironmentHandle> FakeBackend::list_environments() const {
    std::lock_guard lock(mutex_);
    std::vector<EnvironmentHandle> out;
    for (const auto& [id, handle] : live_) {
        out.push_back(handle);
    }
    return out;
}

size_t FakeBackend::destroy_stale(uint64_t current_epoch) {
    std::lock_guard lock(mutex_);
    return std::erase_if(live_, [current_epoch](const auto& entry) {
        return entry.second.epoch != current_epoch;
    });
}

// ─────────────────────────────────────────────
// Test Observers
// ─────────────────────────────────────────────

size_t FakeBackend::live_count() const {
    std::lock_guard lock(mutex_);
    return live_.size();
}

size_t FakeBackend::peak_live() const {
    std::lock_guard lock(mutex_);
    return peak_live_;
}

void FakeBackend::inject_stale(uint64_t epoch) {
    EnvironmentHandle handle;
    handle.id = "stale-" + std::to_string(next_id_.fetch_add(1));
    handle.epoch = epoch;
    std::lock_guard lock(mutex_);
    live_.emplace(handle.id, handle);
}

EnvironmentSpec FakeBackend::last_spec() const {
    std::lock_guard lock(mutex_);
    return last_spec_;
}

}  // namespace sandbox_runner
