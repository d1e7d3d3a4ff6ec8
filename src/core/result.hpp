/**
 * @file result.hpp
 * @brief Monadic error handling type and the service error taxonomy.
 * @author Dimitris Kafetzis
 *
 * Provides Result<T, E> as the primary error-handling mechanism. Errors are
 * classified into a small fixed taxonomy (ErrorKind) so that every layer
 * from the isolation backend up to the HTTP surface can map failures
 * without string matching.
 */

#pragma once

#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>
#include <variant>

namespace sandbox_runner {

// ─────────────────────────────────────────────
// Error Taxonomy
// ─────────────────────────────────────────────

enum class ErrorKind : uint8_t {
    Auth,               ///< Missing or wrong bearer token
    Validation,         ///< Malformed request, unsupported language, limits exceeded
    AdmissionRejected,  ///< Capacity exhausted or queue wait exceeded
    Provision,          ///< Isolation backend could not create an environment
    ExecutionFailure,   ///< Code ran (or its install/compile step ran) and failed
    Timeout,            ///< Wall-clock budget exhausted
    Internal            ///< Unexpected fault
};

[[nodiscard]] constexpr std::string_view to_string(ErrorKind kind) noexcept {
    switch (kind) {
        case ErrorKind::Auth:              return "auth_error";
        case ErrorKind::Validation:        return "validation_error";
        case ErrorKind::AdmissionRejected: return "admission_rejected";
        case ErrorKind::Provision:         return "provision_error";
        case ErrorKind::ExecutionFailure:  return "execution_failure";
        case ErrorKind::Timeout:           return "timeout_error";
        case ErrorKind::Internal:          return "internal_error";
    }
    return "internal_error";
}

/// Whether a client may reasonably retry the same request later.
[[nodiscard]] constexpr bool is_retryable(ErrorKind kind) noexcept {
    return kind == ErrorKind::AdmissionRejected || kind == ErrorKind::Provision;
}

/**
 * @brief Error type carrying a kind, a descriptive message and an optional
 *        machine-readable sub-reason (e.g. "queue_timeout").
 */
struct Error {
    ErrorKind kind{ErrorKind::Internal};
    std::string message;
    std::string reason;

    explicit Error(std::string msg) : message(std::move(msg)) {}

    Error(ErrorKind k, std::string msg, std::string why = {})
        : kind(k), message(std::move(msg)), reason(std::move(why)) {}

    [[nodiscard]] const std::string& what() const noexcept { return message; }
};

// ─────────────────────────────────────────────
// Result<T, E>
// ─────────────────────────────────────────────

/**
 * @brief Result<T, E> — a monadic error type.
 *
 * Holds either a success value of type T or an error of type E.
 *
 * @note When C++23 std::expected becomes widely available on target
 *       compilers, this can be replaced with a type alias.
 */
template <typename T, typename E = Error>
class Result {
public:
    // ── Constructors ──────────────────────────

    /// Construct a success result.
    Result(T value) : storage_(std::move(value)) {}  // NOLINT(implicit)

    /// Construct an error result.
    Result(E error) : storage_(std::move(error)) {}  // NOLINT(implicit)

    // ── Observers ─────────────────────────────

    [[nodiscard]] bool has_value() const noexcept {
        return std::holds_alternative<T>(storage_);
    }

    [[nodiscard]] explicit operator bool() const noexcept {
        return has_value();
    }

    [[nodiscard]] T& value() & {
        if (!has_value()) throw std::runtime_error("Result has no value");
        return std::get<T>(storage_);
    }

    [[nodiscard]] const T& value() const& {
        if (!has_value()) throw std::runtime_error("Result has no value");
        return std::get<T>(storage_);
    }

    [[nodiscard]] T&& value() && {
        if (!has_value()) throw std::runtime_error("Result has no value");
        return std::get<T>(std::move(storage_));
    }

    [[nodiscard]] T& operator*() & { return value(); }
    [[nodiscard]] const T& operator*() const& { return value(); }
    [[nodiscard]] T* operator->() { return &value(); }
    [[nodiscard]] const T* operator->() const { return &value(); }

    [[nodiscard]] E& error() & {
        if (has_value()) throw std::runtime_error("Result has no error");
        return std::get<E>(storage_);
    }

    [[nodiscard]] const E& error() const& {
        if (has_value()) throw std::runtime_error("Result has no error");
        return std::get<E>(storage_);
    }

    // ── Monadic operations ────────────────────

    /// Transform the success value.
    template <typename F>
    auto map(F&& func) const -> Result<std::invoke_result_t<F, const T&>, E> {
        if (has_value()) {
            return func(value());
        }
        return error();
    }

    /// Chain with a function that returns a Result.
    template <typename F>
    auto and_then(F&& func) const -> std::invoke_result_t<F, const T&> {
        if (has_value()) {
            return func(value());
        }
        return error();
    }

    /// Provide a fallback value.
    [[nodiscard]] T value_or(T default_value) const& {
        if (has_value()) return value();
        return default_value;
    }

private:
    std::variant<T, E> storage_;
};

/**
 * @brief Specialization of Result for void success type.
 */
template <typename E>
class Result<void, E> {
public:
    Result() : has_value_(true) {}
    Result(E error) : error_(std::move(error)), has_value_(false) {}  // NOLINT(implicit)

    [[nodiscard]] bool has_value() const noexcept { return has_value_; }
    [[nodiscard]] explicit operator bool() const noexcept { return has_value_; }

    [[nodiscard]] E& error() & {
        if (has_value_) throw std::runtime_error("Result has no error");
        return *error_;
    }

    [[nodiscard]] const E& error() const& {
        if (has_value_) throw std::runtime_error("Result has no error");
        return *error_;
    }

private:
    std::optional<E> error_;
    bool has_value_;
};

/// Convenience factory for classified error results.
template <typename T>
Result<T> make_error(ErrorKind kind, std::string message, std::string reason = {}) {
    return Result<T>(Error{kind, std::move(message), std::move(reason)});
}

}  // namespace sandbox_runner
