/**
 * @file auth.hpp
 * @brief Shared-secret bearer token authentication.
 * @author Dimitris Kafetzis
 */

#pragma once

#include "core/config.hpp"
#include "core/result.hpp"

#include <optional>
#include <string>
#include <string_view>

namespace sandbox_runner {

/// Length-independent comparison; runtime depends only on the longer input.
[[nodiscard]] bool constant_time_equals(std::string_view a, std::string_view b) noexcept;

class BearerAuthenticator {
public:
    explicit BearerAuthenticator(std::string token) : token_(std::move(token)) {}

    /**
     * @brief Load the token from auth.token_file, else the auth.token_env variable.
     *
     * Fails when neither yields a non-empty token.
     */
    static Result<BearerAuthenticator> from_config(const AuthConfig& config);

    /**
     * @brief Check an Authorization header value.
     * @return Auth error when missing, malformed or wrong.
     */
    [[nodiscard]] Result<void> verify(std::optional<std::string_view> authorization) const;

private:
    std::string token_;
};

}  // namespace sandbox_runner
