/**
 * @file types.hpp
 * @brief Fundamental types used throughout SandboxRunner.
 * @author Dimitris Kafetzis
 *
 * Defines SessionId, Language, SessionState, ExecutionRequest and the
 * resource vocabulary shared by the sandbox, admission and executor modules.
 * All types are designed for value semantics.
 */

#pragma once

#include <array>
#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace sandbox_runner {

// ─────────────────────────────────────────────
// Identity Types
// ─────────────────────────────────────────────

using SessionId = std::string;
using Timestamp = std::chrono::system_clock::time_point;
using Duration = std::chrono::microseconds;
using SteadyTime = std::chrono::steady_clock::time_point;

/// Random RFC 4122 v4 identifier, e.g. "3f2b8c1e-9a4d-4e6f-b1c2-7d8e9f0a1b2c".
[[nodiscard]] SessionId generate_session_id();

// ─────────────────────────────────────────────
// Language
// ─────────────────────────────────────────────

/**
 * @brief Closed set of supported runtimes.
 *
 * Each value maps to exactly one LanguageTemplate in the template table.
 * Adding a language means adding an enumerator and a table entry.
 */
enum class Language : uint8_t {
    Python,
    JavaScript,
    Java,
    Cpp,
    Go,
    R
};

inline constexpr std::array<Language, 6> kAllLanguages = {
    Language::Python, Language::JavaScript, Language::Java,
    Language::Cpp, Language::Go, Language::R
};

[[nodiscard]] constexpr std::string_view to_string(Language language) noexcept {
    switch (language) {
        case Language::Python:     return "python";
        case Language::JavaScript: return "javascript";
        case Language::Java:       return "java";
        case Language::Cpp:        return "cpp";
        case Language::Go:         return "go";
        case Language::R:          return "r";
    }
    return "unknown";
}

/**
 * @brief Parse a language name (case-insensitive, common aliases accepted).
 */
[[nodiscard]] std::optional<Language> parse_language(std::string_view name);

// ─────────────────────────────────────────────
// Session State
// ─────────────────────────────────────────────

enum class SessionState : uint8_t {
    Queued,        ///< Waiting for a capacity token
    Provisioning,  ///< Token held, environment being created
    Running,       ///< Code executing inside the environment
    Completed,     ///< Ran and exited with status 0
    Failed,        ///< Ran and failed, or infrastructure failure
    TimedOut,      ///< Wall-clock budget exhausted
    Rejected       ///< Never admitted
};

[[nodiscard]] constexpr std::string_view to_string(SessionState state) noexcept {
    switch (state) {
        case SessionState::Queued:       return "queued";
        case SessionState::Provisioning: return "provisioning";
        case SessionState::Running:      return "running";
        case SessionState::Completed:    return "completed";
        case SessionState::Failed:       return "failed";
        case SessionState::TimedOut:     return "timed_out";
        case SessionState::Rejected:     return "rejected";
    }
    return "unknown";
}

[[nodiscard]] constexpr bool is_terminal(SessionState state) noexcept {
    return state == SessionState::Completed || state == SessionState::Failed
        || state == SessionState::TimedOut || state == SessionState::Rejected;
}

// ─────────────────────────────────────────────
// Resource Limits & Usage
// ─────────────────────────────────────────────

/**
 * @brief Ceilings injected into every isolated run.
 */
struct ResourceLimits {
    uint64_t memory_bytes{512ULL * 1024 * 1024};   ///< RLIMIT_AS
    uint32_t cpu_time_seconds{0};                  ///< RLIMIT_CPU, 0 = derive from timeout
    uint32_t max_processes{256};                   ///< RLIMIT_NPROC (per uid)
    uint64_t max_file_size_bytes{64ULL * 1024 * 1024};
    size_t max_output_bytes{1024 * 1024};          ///< Per captured stream
};

/**
 * @brief Measured consumption of one isolated run.
 */
struct ResourceUsage {
    Duration wall_time{0};
    Duration cpu_time{0};
    uint64_t peak_memory_bytes{0};
};

// ─────────────────────────────────────────────
// Execution Request
// ─────────────────────────────────────────────

/**
 * @brief A validated code-execution request.
 *
 * Invariants (enforced by validate_request): supported language,
 * non-empty code, 0 < timeout <= server maximum.
 */
struct ExecutionRequest {
    Language language{Language::Python};
    std::string code;
    std::chrono::milliseconds timeout{30000};
    std::vector<std::string> packages;
    bool use_shared_dataset{false};
    int priority{0};
};

}  // namespace sandbox_runner
