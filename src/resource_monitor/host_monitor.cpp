/**
 * @file host_monitor.cpp
 * @brief HostMonitor — reads CPU and memory metrics from /proc.
 * @author Dimitris Kafetzis
 */

#include "resource_monitor/host_monitor.hpp"

#include <chrono>
#include <condition_variable>
#include <fstream>
#include <sstream>

namespace sandbox_runner {

// ─────────────────────────────────────────────
// /proc parsing
// ─────────────────────────────────────────────

CpuTimes parse_cpu_line(const std::string& line) {
    CpuTimes times;
    std::istringstream iss(line);
    std::string label;
    iss >> label >> times.user >> times.nice >> times.system >> times.idle
        >> times.iowait >> times.irq >> times.softirq >> times.steal;
    return times;
}

float compute_cpu_percent(const CpuTimes& prev, const CpuTimes& curr) {
    auto prev_total = prev.user + prev.nice + prev.system + prev.idle
                    + prev.iowait + prev.irq + prev.softirq + prev.steal;
    auto curr_total = curr.user + curr.nice + curr.system + curr.idle
                    + curr.iowait + curr.irq + curr.softirq + curr.steal;
    auto prev_active = prev.user + prev.nice + prev.system
                     + prev.irq + prev.softirq + prev.steal;
    auto curr_active = curr.user + curr.nice + curr.system
                     + curr.irq + curr.softirq + curr.steal;

    if (curr_total <= prev_total || curr_active < prev_active) return 0.0f;
    uint64_t total_delta = curr_total - prev_total;
    uint64_t active_delta = curr_active - prev_active;
    return 100.0f * static_cast<float>(active_delta) / static_cast<float>(total_delta);
}

MemInfo parse_meminfo(std::istream& in) {
    MemInfo info;
    std::string line;
    while (std::getline(in, line)) {
        if (line.starts_with("MemTotal:")) {
            std::istringstream iss(line.substr(9));
            iss >> info.total_kb;
        } else if (line.starts_with("MemAvailable:")) {
            std::istringstream iss(line.substr(13));
            iss >> info.available_kb;
        }
    }
    return info;
}

MemInfo read_meminfo() {
    std::ifstream ifs("/proc/meminfo");
    if (!ifs.is_open()) return {};
    return parse_meminfo(ifs);
}

namespace {

CpuTimes read_aggregate_cpu() {
    std::ifstream ifs("/proc/stat");
    std::string line;
    if (ifs.is_open() && std::getline(ifs, line) && line.starts_with("cpu ")) {
        return parse_cpu_line(line);
    }
    return {};
}

}  // anonymous namespace

// ─────────────────────────────────────────────
// HostMonitor
// ─────────────────────────────────────────────

HostMonitor::HostMonitor(uint32_t sampling_interval_ms)
    : interval_ms_(sampling_interval_ms) {}

HostMonitor::~HostMonitor() {
    stop();
}

void HostMonitor::start() {
    if (sampling_thread_.joinable()) return;
    {
        std::lock_guard lock(sample_mutex_);
        prev_cpu_times_ = read_aggregate_cpu();
    }
    sampling_thread_ = std::jthread([this](std::stop_token stop) {
        sampling_loop(stop);
    });
}

void HostMonitor::stop() {
    if (sampling_thread_.joinable()) {
        sampling_thread_.request_stop();
        sampling_thread_.join();
    }
}

Result<HostSnapshot> HostMonitor::read() const {
    auto snapshot = latest_.load();
    if (!snapshot) {
        return Error{ErrorKind::Internal, "No host snapshot available yet"};
    }
    return *snapshot;
}

HostSnapshot HostMonitor::sample_now() {
    auto snapshot = sample_once();
    latest_.store(std::make_shared<HostSnapshot>(snapshot));
    return snapshot;
}

void HostMonitor::sampling_loop(std::stop_token stop) {
    std::mutex sleep_mutex;
    std::condition_variable_any sleep_cv;
    while (!stop.stop_requested()) {
        sample_now();
        std::unique_lock lock(sleep_mutex);
        sleep_cv.wait_for(lock, stop, std::chrono::milliseconds(interval_ms_),
                          [] { return false; });
    }
}

HostSnapshot HostMonitor::sample_once() {
    HostSnapshot snap;
    snap.timestamp = std::chrono::system_clock::now();
    snap.cpu_count = std::thread::hardware_concurrency();

    auto curr = read_aggregate_cpu();
    {
        std::lock_guard lock(sample_mutex_);
        snap.cpu_usage_percent = compute_cpu_percent(prev_cpu_times_, curr);
        prev_cpu_times_ = curr;
    }

    auto mem = read_meminfo();
    snap.memory_total_bytes = mem.total_kb * 1024;
    snap.memory_available_bytes = mem.available_kb * 1024;
    return snap;
}

}  // namespace sandbox_runner
