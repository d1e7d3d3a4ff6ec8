/**
 * @file host_monitor.hpp
 * @brief Host CPU and memory sampling for capacity derivation and /stats.
 * @author Dimitris Kafetzis
 *
 * Data sources:
 *   /proc/stat     — aggregate CPU utilization
 *   /proc/meminfo  — memory total and available
 */

#pragma once

#include "core/result.hpp"
#include "core/types.hpp"

#include <atomic>
#include <cstdint>
#include <istream>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

namespace sandbox_runner {

struct HostSnapshot {
    Timestamp timestamp;
    float cpu_usage_percent{0.0f};
    uint32_t cpu_count{0};
    uint64_t memory_total_bytes{0};
    uint64_t memory_available_bytes{0};

    [[nodiscard]] float memory_usage_percent() const noexcept {
        if (memory_total_bytes == 0) return 0.0f;
        return 100.0f * (1.0f - static_cast<float>(memory_available_bytes)
                                    / static_cast<float>(memory_total_bytes));
    }
};

struct CpuTimes {
    uint64_t user{0}, nice{0}, system{0}, idle{0};
    uint64_t iowait{0}, irq{0}, softirq{0}, steal{0};
};

struct MemInfo {
    uint64_t total_kb{0};
    uint64_t available_kb{0};
};

/// Parse "cpu[N] user nice system idle iowait irq softirq steal ..." from /proc/stat.
[[nodiscard]] CpuTimes parse_cpu_line(const std::string& line);
[[nodiscard]] float compute_cpu_percent(const CpuTimes& prev, const CpuTimes& curr);
[[nodiscard]] MemInfo parse_meminfo(std::istream& in);

/// One-shot read of /proc/meminfo; zeroes when unavailable.
[[nodiscard]] MemInfo read_meminfo();

/**
 * @brief Periodically samples the host on a dedicated std::jthread and
 *        publishes the latest snapshot atomically.
 */
class HostMonitor {
public:
    explicit HostMonitor(uint32_t sampling_interval_ms = 1000);
    ~HostMonitor();

    HostMonitor(const HostMonitor&) = delete;
    HostMonitor& operator=(const HostMonitor&) = delete;

    void start();
    void stop();

    /// Latest snapshot; error until the first sample lands.
    [[nodiscard]] Result<HostSnapshot> read() const;

    /// Take a sample synchronously (also used before start()).
    HostSnapshot sample_now();

private:
    void sampling_loop(std::stop_token stop);
    HostSnapshot sample_once();

    uint32_t interval_ms_;
    std::jthread sampling_thread_;
    std::atomic<std::shared_ptr<HostSnapshot>> latest_;
    CpuTimes prev_cpu_times_{};
    std::mutex sample_mutex_;
};

}  // namespace sandbox_runner
