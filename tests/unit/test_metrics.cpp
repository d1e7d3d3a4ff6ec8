/**
 * @file test_metrics.cpp
 * @brief Unit tests for MetricsCollector counters and session events.
 * @author Dimitris Kafetzis
 */

#include "telemetry/json_sink.hpp"
#include "telemetry/metrics_collector.hpp"

#include <gtest/gtest.h>
#include <nlohmann/json.hpp>

#include <memory>
#include <string>
#include <vector>

using namespace sandbox_runner;

namespace {

struct CaptureSink : ILogSink {
    std::shared_ptr<std::vector<std::string>> lines = std::make_shared<std::vector<std::string>>();
    void write(std::string_view json_line) override { lines->emplace_back(json_line); }
    void flush() override {}
};

ExecutionReport make_report(SessionState status, double seconds) {
    ExecutionReport report;
    report.session_id = "s-" + std::string(to_string(status));
    report.status = status;
    report.duration_seconds = seconds;
    return report;
}

}  // namespace

TEST(MetricsCollectorTest, CountsOutcomes) {
    MetricsCollector metrics(std::make_unique<CaptureSink>());
    metrics.record_session(make_report(SessionState::Completed, 1.0));
    metrics.record_session(make_report(SessionState::Completed, 3.0));
    metrics.record_session(make_report(SessionState::Failed, 0.5));
    metrics.record_session(make_report(SessionState::TimedOut, 5.0));
    metrics.record_session(make_report(SessionState::Rejected, 0.0));

    auto snap = metrics.snapshot();
    EXPECT_EQ(snap.total, 5u);
    EXPECT_EQ(snap.completed, 2u);
    EXPECT_EQ(snap.failed, 1u);
    EXPECT_EQ(snap.timed_out, 1u);
    EXPECT_EQ(snap.rejected, 1u);
    EXPECT_DOUBLE_EQ(snap.max_duration_seconds, 5.0);
    EXPECT_DOUBLE_EQ(snap.mean_duration_seconds, 9.5 / 5.0);
}

TEST(MetricsCollectorTest, QpsOverWindow) {
    MetricsCollector metrics(std::make_unique<NullSink>(), std::chrono::seconds(10));
    EXPECT_DOUBLE_EQ(metrics.qps(), 0.0);
    for (int i = 0; i < 20; ++i) {
        metrics.record_session(make_report(SessionState::Completed, 0.01));
    }
    EXPECT_DOUBLE_EQ(metrics.qps(), 2.0);
    EXPECT_EQ(metrics.snapshot().window, std::chrono::seconds(10));
}

TEST(MetricsCollectorTest, SessionEventIsJson) {
    auto sink = std::make_unique<CaptureSink>();
    auto lines = sink->lines;
    MetricsCollector metrics(std::move(sink));

    auto report = make_report(SessionState::TimedOut, 2.0);
    report.error_kind = ErrorKind::Timeout;
    report.reason = "wall_clock";
    metrics.record_session(report);

    ASSERT_EQ(lines->size(), 1u);
    auto event = nlohmann::json::parse(lines->front());
    EXPECT_EQ(event["event"], "session_finished");
    EXPECT_EQ(event["status"], "timed_out");
    EXPECT_EQ(event["error_kind"], "timeout_error");
    EXPECT_EQ(event["reason"], "wall_clock");
    EXPECT_FALSE(event.contains("exit_code"));
}

TEST(MetricsCollectorTest, HostSnapshotAndCustomEvents) {
    auto sink = std::make_unique<CaptureSink>();
    auto lines = sink->lines;
    MetricsCollector metrics(std::move(sink));

    HostSnapshot snap;
    snap.cpu_count = 8;
    snap.memory_total_bytes = 4ULL * 1024 * 1024 * 1024;
    metrics.record_host_snapshot(snap);
    metrics.record_custom("startup", R"({"capacity":4})");

    ASSERT_EQ(lines->size(), 2u);
    auto host = nlohmann::json::parse((*lines)[0]);
    EXPECT_EQ(host["cpus"], 8);
    EXPECT_EQ(host["mem_total_mb"], 4096);
    auto custom = nlohmann::json::parse((*lines)[1]);
    EXPECT_EQ(custom["data"]["capacity"], 4);
}
