/**
 * @file auth.cpp
 * @brief BearerAuthenticator implementation.
 * @author Dimitris Kafetzis
 */

#include "api/auth.hpp"

#include "network/http_message.hpp"

#include <cstdlib>
#include <fstream>

namespace sandbox_runner {

namespace {

std::string_view trim(std::string_view text) {
    while (!text.empty() && (text.front() == ' ' || text.front() == '\t')) text.remove_prefix(1);
    while (!text.empty() && (text.back() == ' ' || text.back() == '\t' || text.back() == '\r'
                             || text.back() == '\n')) {
        text.remove_suffix(1);
    }
    return text;
}

}  // anonymous namespace

bool constant_time_equals(std::string_view a, std::string_view b) noexcept {
    size_t length = a.size() > b.size() ? a.size() : b.size();
    unsigned char diff = a.size() == b.size() ? 0 : 1;
    for (size_t i = 0; i < length; ++i) {
        auto ca = i < a.size() ? static_cast<unsigned char>(a[i]) : 0;
        auto cb = i < b.size() ? static_cast<unsigned char>(b[i]) : 0;
        diff |= static_cast<unsigned char>(ca ^ cb);
    }
    return diff == 0;
}

Result<BearerAuthenticator> BearerAuthenticator::from_config(const AuthConfig& config) {
    std::string token;
    if (!config.token_file.empty()) {
        std::ifstream ifs(config.token_file);
        if (!ifs.is_open()) {
            return Error{ErrorKind::Auth, "Cannot read token file: " + config.token_file.string()};
        }
        std::getline(ifs, token);
        token = std::string(trim(token));
    } else if (const char* value = std::getenv(config.token_env.c_str())) {
        token = std::string(trim(value));
    }

    if (token.empty()) {
        return Error{ErrorKind::Auth,
                     "No authentication token configured (set " + config.token_env
                         + " or auth.token_file)"};
    }
    return BearerAuthenticator(std::move(token));
}

Result<void> BearerAuthenticator::verify(std::optional<std::string_view> authorization) const {
    if (!authorization) {
        return Error{ErrorKind::Auth, "Not authenticated", "missing_token"};
    }

    auto value = trim(*authorization);
    auto space = value.find(' ');
    if (space == std::string_view::npos || !iequals(value.substr(0, space), "Bearer")) {
        return Error{ErrorKind::Auth, "Invalid authentication scheme", "invalid_scheme"};
    }

    auto presented = trim(value.substr(space + 1));
    if (presented.empty() || !constant_time_equals(presented, token_)) {
        return Error{ErrorKind::Auth, "Invalid authentication token", "invalid_token"};
    }
    return Result<void>{};
}

}  // namespace sandbox_runner
