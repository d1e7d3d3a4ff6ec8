/**
 * @file metrics_collector.cpp
 * @brief MetricsCollector implementation.
 * @author Dimitris Kafetzis
 */

#include "telemetry/metrics_collector.hpp"

#include <algorithm>
#include <sstream>

namespace sandbox_runner {

MetricsCollector::MetricsCollector(std::unique_ptr<ILogSink> sink, std::chrono::seconds qps_window)
    : sink_(std::move(sink))
    , window_(std::max(qps_window, std::chrono::seconds(1))) {}

void MetricsCollector::record_session(const ExecutionReport& report) {
    auto now = std::chrono::steady_clock::now();
    {
        std::lock_guard lock(stats_mutex_);
        ++totals_.total;
        switch (report.status) {
            case SessionState::Completed: ++totals_.completed; break;
            case SessionState::TimedOut:  ++totals_.timed_out; break;
            case SessionState::Rejected:  ++totals_.rejected; break;
            default:                      ++totals_.failed; break;
        }
        duration_sum_ += report.duration_seconds;
        totals_.max_duration_seconds = std::max(totals_.max_duration_seconds,
                                                report.duration_seconds);
        finished_.push_back(now);
        prune_locked(now);
    }

    std::ostringstream oss;
    oss << R"({"event":"session_finished")"
        << R"(,"session":")" << json_escape(report.session_id) << "\""
        << R"(,"language":")" << to_string(report.language) << "\""
        << R"(,"status":")" << to_string(report.status) << "\""
        << R"(,"duration_s":)" << report.duration_seconds
        << R"(,"queue_wait_us":)" << report.queue_wait.count()
        << R"(,"cpu_us":)" << report.usage.cpu_time.count()
        << R"(,"peak_mem_kb":)" << (report.usage.peak_memory_bytes / 1024);
    if (report.exit_code) oss << R"(,"exit_code":)" << *report.exit_code;
    if (report.error_kind) {
        oss << R"(,"error_kind":")" << to_string(*report.error_kind) << "\"";
    }
    if (!report.reason.empty()) oss << R"(,"reason":")" << json_escape(report.reason) << "\"";
    oss << R"(,"truncated":)" << (report.truncated ? "true" : "false") << "}";
    emit(oss.str());
}

void MetricsCollector::record_host_snapshot(const HostSnapshot& snap) {
    std::ostringstream oss;
    oss << R"({"event":"host_snapshot")"
        << R"(,"cpu_pct":)" << snap.cpu_usage_percent
        << R"(,"cpus":)" << snap.cpu_count
        << R"(,"mem_avail_mb":)" << (snap.memory_available_bytes / (1024 * 1024))
        << R"(,"mem_total_mb":)" << (snap.memory_total_bytes / (1024 * 1024))
        << "}";
    emit(oss.str());
}

void MetricsCollector::record_custom(std::string_view event, std::string_view json_payload) {
    std::ostringstream oss;
    oss << R"({"event":")" << json_escape(event) << "\""
        << R"(,"data":)" << json_payload
        << "}";
    emit(oss.str());
}

MetricsSnapshot MetricsCollector::snapshot() const {
    std::lock_guard lock(stats_mutex_);
    prune_locked(std::chrono::steady_clock::now());
    MetricsSnapshot out = totals_;
    out.window = window_;
    out.qps = static_cast<double>(finished_.size()) / static_cast<double>(window_.count());
    out.mean_duration_seconds = totals_.total == 0
        ? 0.0 : duration_sum_ / static_cast<double>(totals_.total);
    return out;
}

double MetricsCollector::qps() const {
    return snapshot().qps;
}

void MetricsCollector::prune_locked(SteadyTime now) const {
    while (!finished_.empty() && now - finished_.front() > window_) {
        finished_.pop_front();
    }
}

void MetricsCollector::emit(std::string_view json_line) {
    std::lock_guard lock(write_mutex_);
    sink_->write(json_line);
}

void MetricsCollector::flush() {
    std::lock_guard lock(write_mutex_);
    sink_->flush();
}

}  // namespace sandbox_runner
