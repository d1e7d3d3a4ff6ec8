/**
 * @file output_capture.hpp
 * @brief Bounded, thread-safe stdout/stderr capture for one session.
 * @author Dimitris Kafetzis
 */

#pragma once

#include <cstddef>
#include <cstdint>
#include <mutex>
#include <string>
#include <string_view>

namespace sandbox_runner {

enum class Stream : uint8_t { Stdout, Stderr };

/**
 * @brief Captured output at a point in time.
 */
struct CapturedOutput {
    std::string stdout_data;
    std::string stderr_data;
    bool truncated{false};
};

/**
 * @brief Accumulates program output up to a fixed byte cap per stream.
 *
 * Bytes past the cap are dropped and the truncated flag is raised. The
 * backend appends from its I/O loop while the executor may take a
 * snapshot concurrently (partial output on timeout).
 */
class OutputCapture {
public:
    explicit OutputCapture(size_t max_bytes_per_stream);

    void append(Stream stream, std::string_view data);

    [[nodiscard]] CapturedOutput snapshot() const;
    [[nodiscard]] bool truncated() const;
    [[nodiscard]] size_t size(Stream stream) const;
    [[nodiscard]] size_t capacity() const noexcept { return max_bytes_; }

private:
    size_t max_bytes_;
    mutable std::mutex mutex_;
    std::string stdout_;
    std::string stderr_;
    bool truncated_{false};
};

}  // namespace sandbox_runner
