/**
 * @file metrics_collector.hpp
 * @brief Structured session events as NDJSON, plus the rolling counters
 *        behind /stats (totals per outcome, QPS over a sliding window).
 * @author Dimitris Kafetzis
 */

#pragma once

#include "core/logger.hpp"
#include "core/types.hpp"
#include "executor/result_reporter.hpp"
#include "resource_monitor/host_monitor.hpp"

#include <chrono>
#include <cstdint>
#include <deque>
#include <memory>
#include <mutex>

namespace sandbox_runner {

struct MetricsSnapshot {
    uint64_t total{0};
    uint64_t completed{0};
    uint64_t failed{0};
    uint64_t timed_out{0};
    uint64_t rejected{0};
    double qps{0.0};                    ///< Sessions finished per second over the window
    double mean_duration_seconds{0.0};
    double max_duration_seconds{0.0};
    std::chrono::seconds window{0};
};

/**
 * @brief Collects and logs structured telemetry events as NDJSON.
 */
class MetricsCollector {
public:
    explicit MetricsCollector(std::unique_ptr<ILogSink> sink,
                              std::chrono::seconds qps_window = std::chrono::seconds(60));

    /// One line per finished session; updates counters and the QPS window.
    void record_session(const ExecutionReport& report);
    void record_host_snapshot(const HostSnapshot& snap);
    void record_custom(std::string_view event, std::string_view json_payload);

    [[nodiscard]] MetricsSnapshot snapshot() const;
    [[nodiscard]] double qps() const;

    void flush();

private:
    void prune_locked(SteadyTime now) const;
    void emit(std::string_view json_line);

    std::unique_ptr<ILogSink> sink_;
    std::mutex write_mutex_;

    std::chrono::seconds window_;
    mutable std::mutex stats_mutex_;
    mutable std::deque<SteadyTime> finished_;
    MetricsSnapshot totals_;
    double duration_sum_{0.0};
};

}  // namespace sandbox_runner
