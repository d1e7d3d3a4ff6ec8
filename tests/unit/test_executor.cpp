/**
 * @file test_executor.cpp
 * @brief Unit tests for Executor and request validation, driven by FakeBackend.
 * @author Dimitris Kafetzis
 */

#include "executor/executor.hpp"
#include "sandbox/fake_backend.hpp"
#include "telemetry/json_sink.hpp"
#include "telemetry/metrics_collector.hpp"

#include <gtest/gtest.h>
#include <atomic>
#include <chrono>
#include <csignal>
#include <future>
#include <memory>
#include <string>
#include <thread>
#include <vector>

using namespace sandbox_runner;
using namespace std::chrono_literals;

namespace {

ExecutionRequest python(std::string code, std::chrono::milliseconds timeout = 5000ms) {
    ExecutionRequest request;
    request.language = Language::Python;
    request.code = std::move(code);
    request.timeout = timeout;
    return request;
}

/// Bounded wait for a condition that settles asynchronously.
template <typename Pred>
bool eventually(Pred pred, std::chrono::milliseconds limit = 3000ms) {
    auto until = std::chrono::steady_clock::now() + limit;
    while (std::chrono::steady_clock::now() < until) {
        if (pred()) return true;
        std::this_thread::sleep_for(5ms);
    }
    return pred();
}

struct CaptureSink : ILogSink {
    std::shared_ptr<std::vector<std::string>> lines;
    explicit CaptureSink(std::shared_ptr<std::vector<std::string>> out) : lines(std::move(out)) {}
    void write(std::string_view json_line) override { lines->emplace_back(json_line); }
    void flush() override {}
};

bool any_line_contains(const std::vector<std::string>& lines, std::string_view needle) {
    for (const auto& line : lines) {
        if (line.find(needle) != std::string::npos) return true;
    }
    return false;
}

class ExecutorTest : public ::testing::Test {
protected:
    std::shared_ptr<std::vector<std::string>> log_lines_ =
        std::make_shared<std::vector<std::string>>();
    Logger logger_{std::make_unique<CaptureSink>(log_lines_), LogLevel::Error};
    LanguageTable languages_ = LanguageTable::defaults();
    FakeBackend backend_;
    std::unique_ptr<AdmissionController> admission_;
    std::unique_ptr<MetricsCollector> metrics_;
    std::unique_ptr<Executor> executor_;

    void build(uint32_t capacity = 2, uint32_t backlog = 8,
               std::chrono::milliseconds kill_grace = 200ms,
               bool dataset_available = false) {
        executor_.reset();
        admission_ = std::make_unique<AdmissionController>(AdmissionOptions{
            .capacity = capacity, .backlog = backlog, .max_queue_wait = 5000ms});
        metrics_ = std::make_unique<MetricsCollector>(std::make_unique<NullSink>());
        ExecutorOptions options;
        options.max_timeout = 30000ms;
        options.kill_grace = kill_grace;
        options.dataset_available = dataset_available;
        executor_ = std::make_unique<Executor>(backend_, *admission_, languages_, options,
                                               logger_, metrics_.get());
    }

    void SetUp() override { build(); }

    void TearDown() override {
        executor_.reset();
        admission_.reset();
    }
};

}  // namespace

// ═══════════════════════════════════════════════
// Validation
// ═══════════════════════════════════════════════

TEST(ValidateRequestTest, AcceptsMinimalRequest) {
    auto languages = LanguageTable::defaults();
    ExecutorOptions options;
    EXPECT_TRUE(validate_request(python("print(1)"), options, languages).has_value());
}

TEST(ValidateRequestTest, RejectsEmptyCode) {
    auto languages = LanguageTable::defaults();
    auto result = validate_request(python(""), ExecutorOptions{}, languages);
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().kind, ErrorKind::Validation);
}

TEST(ValidateRequestTest, RejectsOversizedCode) {
    auto languages = LanguageTable::defaults();
    ExecutorOptions options;
    options.max_code_bytes = 16;
    EXPECT_FALSE(validate_request(python(std::string(17, 'x')), options, languages).has_value());
}

TEST(ValidateRequestTest, RejectsTimeoutAboveMaximum) {
    auto languages = LanguageTable::defaults();
    ExecutorOptions options;
    options.max_timeout = 10000ms;
    EXPECT_TRUE(validate_request(python("x", 10000ms), options, languages).has_value());
    auto result = validate_request(python("x", 10001ms), options, languages);
    ASSERT_FALSE(result.has_value());
    EXPECT_NE(result.error().message.find("10 seconds"), std::string::npos);
}

TEST(ValidateRequestTest, RejectsPackagesForLanguageWithoutInstaller) {
    auto languages = LanguageTable::defaults();
    auto request = python("int main() {}");
    request.language = Language::Cpp;
    request.packages = {"boost"};
    auto result = validate_request(request, ExecutorOptions{}, languages);
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().kind, ErrorKind::Validation);
}

TEST(ValidateRequestTest, RejectsTooManyPackages) {
    auto languages = LanguageTable::defaults();
    ExecutorOptions options;
    options.max_packages = 2;
    auto request = python("x");
    request.packages = {"a", "b", "c"};
    EXPECT_FALSE(validate_request(request, options, languages).has_value());
}

TEST(ValidateRequestTest, RejectsDatasetWhenUnavailable) {
    auto languages = LanguageTable::defaults();
    auto request = python("x");
    request.use_shared_dataset = true;
    ExecutorOptions options;
    EXPECT_FALSE(validate_request(request, options, languages).has_value());
    options.dataset_available = true;
    EXPECT_TRUE(validate_request(request, options, languages).has_value());
}

TEST(ValidatePackageNameTest, Rules) {
    EXPECT_TRUE(validate_package_name("numpy").has_value());
    EXPECT_TRUE(validate_package_name("requests==2.31.0").has_value());
    EXPECT_TRUE(validate_package_name("@types/node").has_value());
    EXPECT_FALSE(validate_package_name("").has_value());
    EXPECT_FALSE(validate_package_name("--index-url=http://evil").has_value());
    EXPECT_FALSE(validate_package_name("numpy pandas").has_value());
    EXPECT_FALSE(validate_package_name("bad\nname").has_value());
    EXPECT_FALSE(validate_package_name(std::string(215, 'a')).has_value());
}

// ═══════════════════════════════════════════════
// Outcomes
// ═══════════════════════════════════════════════

TEST_F(ExecutorTest, CompletedRun) {
    backend_.set_behavior(FakeBehavior{.stdout_data = "4950\n"});

    auto report = executor_->execute(python("print(sum(range(100)))"));
    ASSERT_TRUE(report.has_value()) << report.error().message;
    EXPECT_EQ(report->status, SessionState::Completed);
    EXPECT_TRUE(report->success());
    EXPECT_EQ(report->stdout_data, "4950\n");
    ASSERT_TRUE(report->exit_code.has_value());
    EXPECT_EQ(*report->exit_code, 0);
    EXPECT_FALSE(report->error_kind.has_value());
    EXPECT_EQ(report->session_id.size(), 36u);

    EXPECT_EQ(backend_.provision_count(), 1u);
    EXPECT_EQ(backend_.destroy_count(), 1u);
    EXPECT_EQ(backend_.live_count(), 0u);
    EXPECT_EQ(admission_->stats().active, 0u);
}

TEST_F(ExecutorTest, NonzeroExitIsExecutionFailure) {
    backend_.set_behavior(FakeBehavior{.stderr_data = "Traceback...\n", .exit_code = 1});

    auto report = executor_->execute(python("raise SystemExit(1)"));
    ASSERT_TRUE(report.has_value());
    EXPECT_EQ(report->status, SessionState::Failed);
    EXPECT_EQ(report->error_kind, ErrorKind::ExecutionFailure);
    EXPECT_EQ(report->reason, "nonzero_exit");
    EXPECT_EQ(report->stderr_data, "Traceback...\n");
    EXPECT_EQ(report->exit_code, 1);
    EXPECT_FALSE(report->retryable());
    EXPECT_EQ(backend_.live_count(), 0u);
}

TEST_F(ExecutorTest, SignalIsExecutionFailure) {
    backend_.set_behavior(FakeBehavior{.term_signal = SIGSEGV});

    auto report = executor_->execute(python("crash"));
    ASSERT_TRUE(report.has_value());
    EXPECT_EQ(report->status, SessionState::Failed);
    EXPECT_EQ(report->reason, "killed_by_signal");
    EXPECT_FALSE(report->exit_code.has_value());
}

TEST_F(ExecutorTest, CompileErrorReported) {
    backend_.set_behavior(FakeBehavior{.stderr_data = "main.cpp:1: error", .fail_compile = true});

    auto request = python("int main( {");
    request.language = Language::Cpp;
    auto report = executor_->execute(request);
    ASSERT_TRUE(report.has_value());
    EXPECT_EQ(report->status, SessionState::Failed);
    EXPECT_EQ(report->reason, "compile_error");
    EXPECT_EQ(report->language, Language::Cpp);
}

TEST_F(ExecutorTest, ResponderSeesCode) {
    backend_.set_behavior(FakeBehavior{.responder = [](std::string_view code) {
        RawOutcome outcome;
        outcome.stdout_data = std::string(code) + "\n";
        outcome.exit_code = 0;
        return outcome;
    }});

    auto report = executor_->execute(python("echo-me"));
    ASSERT_TRUE(report.has_value());
    EXPECT_EQ(report->stdout_data, "echo-me\n");
}

TEST_F(ExecutorTest, ValidationFailureAllocatesNothing) {
    auto request = python("x");
    request.language = Language::Go;
    request.packages = {"github.com/x/y"};

    auto report = executor_->execute(request);
    ASSERT_FALSE(report.has_value());
    EXPECT_EQ(report.error().kind, ErrorKind::Validation);
    EXPECT_EQ(backend_.provision_count(), 0u);
    EXPECT_EQ(admission_->stats().admitted, 0u);
}

TEST_F(ExecutorTest, ProvisionFailureIsRetryableAndLeaksNothing) {
    backend_.set_behavior(FakeBehavior{.fail_provision = true});

    auto report = executor_->execute(python("print(1)"));
    ASSERT_TRUE(report.has_value());
    EXPECT_EQ(report->status, SessionState::Failed);
    EXPECT_EQ(report->error_kind, ErrorKind::Provision);
    EXPECT_TRUE(report->retryable());
    // Backend detail stays in the log
    EXPECT_EQ(report->message.find("Fake backend"), std::string::npos);
    EXPECT_EQ(backend_.live_count(), 0u);
    EXPECT_EQ(admission_->stats().active, 0u);
}

TEST_F(ExecutorTest, PackageInstallFailure) {
    backend_.set_behavior(FakeBehavior{.fail_install = true});

    auto request = python("import nothere");
    request.packages = {"nothere"};
    auto report = executor_->execute(request);
    ASSERT_TRUE(report.has_value());
    EXPECT_EQ(report->status, SessionState::Failed);
    EXPECT_EQ(report->error_kind, ErrorKind::ExecutionFailure);
    EXPECT_EQ(report->reason, "package_install_failed");
    EXPECT_NE(report->message.find("no matching distribution"), std::string::npos);
    EXPECT_EQ(backend_.last_spec().packages, std::vector<std::string>{"nothere"});
}

TEST_F(ExecutorTest, SpecCarriesDatasetAndLimits) {
    build(2, 8, 200ms, /*dataset_available=*/true);
    auto request = python("print(open('data/x').read())");
    request.use_shared_dataset = true;

    auto report = executor_->execute(request);
    ASSERT_TRUE(report.has_value());
    auto spec = backend_.last_spec();
    EXPECT_TRUE(spec.mount_dataset);
    EXPECT_EQ(spec.session_id, report->session_id);
    EXPECT_EQ(spec.limits.max_output_bytes, ResourceLimits{}.max_output_bytes);
}

// ═══════════════════════════════════════════════
// Timeouts & Cancellation
// ═══════════════════════════════════════════════

TEST_F(ExecutorTest, TimeoutKeepsPartialOutput) {
    backend_.set_behavior(FakeBehavior{.run_delay = 5000ms, .stdout_data = "started\n"});

    auto start = std::chrono::steady_clock::now();
    auto report = executor_->execute(python("import time; time.sleep(60)", 150ms));
    auto elapsed = std::chrono::steady_clock::now() - start;

    ASSERT_TRUE(report.has_value());
    EXPECT_EQ(report->status, SessionState::TimedOut);
    EXPECT_EQ(report->error_kind, ErrorKind::Timeout);
    EXPECT_FALSE(report->exit_code.has_value());
    EXPECT_EQ(report->stdout_data, "started\n");
    EXPECT_LT(elapsed, 2000ms);
    EXPECT_EQ(backend_.destroy_count(), 1u);
    EXPECT_EQ(backend_.live_count(), 0u);
}

TEST_F(ExecutorTest, SlowProvisioningCountsAgainstTimeout) {
    backend_.set_behavior(FakeBehavior{.provision_delay = 5000ms});

    auto report = executor_->execute(python("print(1)", 100ms));
    ASSERT_TRUE(report.has_value());
    EXPECT_EQ(report->status, SessionState::TimedOut);
    EXPECT_EQ(backend_.run_count(), 0u);
    EXPECT_EQ(backend_.live_count(), 0u);
}

TEST_F(ExecutorTest, UnresponsiveBackendIsAbandonedAtHardDeadline) {
    build(1, 0, 50ms);
    backend_.set_behavior(FakeBehavior{.run_delay = 1000ms, .ignore_cancellation = true});

    auto start = std::chrono::steady_clock::now();
    auto report = executor_->execute(python("while True: pass", 100ms));
    auto elapsed = std::chrono::steady_clock::now() - start;

    ASSERT_TRUE(report.has_value());
    EXPECT_EQ(report->status, SessionState::TimedOut);
    EXPECT_LT(elapsed, 800ms);

    // The stuck work still holds its slot until the environment is gone
    EXPECT_EQ(admission_->stats().active, 1u);
    EXPECT_TRUE(eventually([&] { return backend_.live_count() == 0; }));
    EXPECT_TRUE(admission_->wait_idle(3000ms));
    EXPECT_EQ(backend_.destroy_count(), 1u);
}

TEST_F(ExecutorTest, CallerDisconnectCancelsRun) {
    backend_.set_behavior(FakeBehavior{.run_delay = 5000ms});
    std::stop_source caller;

    std::jthread hangup([&] {
        std::this_thread::sleep_for(50ms);
        caller.request_stop();
    });

    auto start = std::chrono::steady_clock::now();
    auto report = executor_->execute(python("sleep", 10000ms), caller.get_token());
    ASSERT_TRUE(report.has_value());
    EXPECT_EQ(report->status, SessionState::Failed);
    EXPECT_EQ(report->error_kind, ErrorKind::Internal);
    EXPECT_EQ(report->reason, "cancelled");
    EXPECT_LT(std::chrono::steady_clock::now() - start, 2000ms);
    EXPECT_EQ(backend_.live_count(), 0u);
    EXPECT_EQ(backend_.destroy_count(), 1u);
}

TEST_F(ExecutorTest, CancelWhileQueued) {
    build(1, 4);
    backend_.set_behavior(FakeBehavior{.run_delay = 300ms});

    auto first = std::async(std::launch::async, [&] { return executor_->execute(python("a")); });
    ASSERT_TRUE(eventually([&] { return admission_->stats().active == 1; }));

    std::stop_source caller;
    auto second = std::async(std::launch::async, [&] {
        return executor_->execute(python("b"), caller.get_token());
    });
    ASSERT_TRUE(eventually([&] { return admission_->stats().queued == 1; }));
    caller.request_stop();

    auto cancelled = second.get();
    ASSERT_TRUE(cancelled.has_value());
    EXPECT_EQ(cancelled->status, SessionState::Failed);
    EXPECT_EQ(cancelled->reason, "cancelled");

    auto done = first.get();
    ASSERT_TRUE(done.has_value());
    EXPECT_EQ(done->status, SessionState::Completed);
    EXPECT_EQ(backend_.provision_count(), 1u);
}

// ═══════════════════════════════════════════════
// Concurrency
// ═══════════════════════════════════════════════

TEST_F(ExecutorTest, CeilingHoldsWithoutBacklog) {
    constexpr uint32_t kCapacity = 4;
    constexpr int kRequests = 20;
    build(kCapacity, 0);
    backend_.set_behavior(FakeBehavior{.run_delay = 150ms, .stdout_data = "ok"});

    std::vector<std::future<Result<ExecutionReport>>> futures;
    for (int i = 0; i < kRequests; ++i) {
        futures.push_back(std::async(std::launch::async, [&] {
            return executor_->execute(python("print('ok')"));
        }));
    }

    int completed = 0;
    int rejected = 0;
    for (auto& f : futures) {
        auto report = f.get();
        ASSERT_TRUE(report.has_value());
        if (report->status == SessionState::Completed) {
            ++completed;
        } else {
            EXPECT_EQ(report->status, SessionState::Rejected);
            EXPECT_EQ(report->error_kind, ErrorKind::AdmissionRejected);
            EXPECT_EQ(report->reason, "capacity_exhausted");
            EXPECT_TRUE(report->retryable());
            ++rejected;
        }
    }

    EXPECT_EQ(completed + rejected, kRequests);
    EXPECT_GE(completed, static_cast<int>(kCapacity));
    EXPECT_LE(backend_.peak_live(), kCapacity);
    EXPECT_EQ(backend_.provision_count(), backend_.destroy_count());
    EXPECT_EQ(backend_.live_count(), 0u);
}

TEST_F(ExecutorTest, BacklogQueuesInsteadOfRejecting) {
    build(1, 8);
    backend_.set_behavior(FakeBehavior{.run_delay = 50ms});

    std::vector<std::future<Result<ExecutionReport>>> futures;
    for (int i = 0; i < 4; ++i) {
        futures.push_back(std::async(std::launch::async, [&] {
            return executor_->execute(python("x"));
        }));
    }

    Duration max_wait{0};
    for (auto& f : futures) {
        auto report = f.get();
        ASSERT_TRUE(report.has_value());
        EXPECT_EQ(report->status, SessionState::Completed);
        max_wait = std::max(max_wait, report->queue_wait);
    }
    EXPECT_GT(max_wait.count(), 0);
    EXPECT_EQ(backend_.peak_live(), 1u);
}

TEST_F(ExecutorTest, ShutdownRejectsNewWork) {
    EXPECT_TRUE(executor_->shutdown(1000ms));

    auto report = executor_->execute(python("print(1)"));
    ASSERT_TRUE(report.has_value());
    EXPECT_EQ(report->status, SessionState::Rejected);
    EXPECT_EQ(report->reason, "shutting_down");
    EXPECT_EQ(backend_.provision_count(), 0u);
}

TEST_F(ExecutorTest, ShutdownCancelsRunningWork) {
    backend_.set_behavior(FakeBehavior{.run_delay = 5000ms});

    auto running = std::async(std::launch::async, [&] {
        return executor_->execute(python("sleep", 20000ms));
    });
    ASSERT_TRUE(eventually([&] { return backend_.run_count() == 1; }));

    EXPECT_TRUE(executor_->shutdown(3000ms));
    auto report = running.get();
    ASSERT_TRUE(report.has_value());
    EXPECT_EQ(report->reason, "cancelled");
    EXPECT_EQ(backend_.live_count(), 0u);
}

// ═══════════════════════════════════════════════
// Metrics
// ═══════════════════════════════════════════════

TEST_F(ExecutorTest, FinishedSessionsRecorded) {
    backend_.set_behavior(FakeBehavior{.exit_code = 0});
    ASSERT_TRUE(executor_->execute(python("a")).has_value());
    backend_.set_behavior(FakeBehavior{.exit_code = 2});
    ASSERT_TRUE(executor_->execute(python("b")).has_value());

    auto snap = metrics_->snapshot();
    EXPECT_EQ(snap.total, 2u);
    EXPECT_EQ(snap.completed, 1u);
    EXPECT_EQ(snap.failed, 1u);
    EXPECT_GT(snap.qps, 0.0);
}

// ═══════════════════════════════════════════════
// Logging
// ═══════════════════════════════════════════════

TEST_F(ExecutorTest, DebugLogTracesAdmissionAndStart) {
    logger_.set_level(LogLevel::Debug);
    backend_.set_behavior(FakeBehavior{.stdout_data = "ok\n"});

    auto report = executor_->execute(python("print('ok')"));
    ASSERT_TRUE(report.has_value());

    const auto& id = report->session_id;
    EXPECT_TRUE(any_line_contains(*log_lines_, "Session " + id + " admitted after "));
    EXPECT_TRUE(any_line_contains(*log_lines_, "ms in queue"));
    EXPECT_TRUE(any_line_contains(*log_lines_, "Session " + id + " running in fake-"));
}
