/**
 * @file http_message.hpp
 * @brief Minimal HTTP/1.1 request parsing and response serialization.
 * @author Dimitris Kafetzis
 *
 * Only what the service needs: a request line, headers, and a body framed
 * by Content-Length. Chunked request bodies are refused with 411/501 and
 * every response closes the connection.
 */

#pragma once

#include "core/result.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace sandbox_runner {

using HeaderList = std::vector<std::pair<std::string, std::string>>;

/// Case-insensitive ASCII comparison, for header names and auth schemes.
[[nodiscard]] bool iequals(std::string_view a, std::string_view b) noexcept;

struct HttpRequest {
    std::string method;
    std::string target;     ///< As sent, including any query
    std::string path;       ///< target without the query
    std::string version;
    HeaderList headers;
    std::string body;

    /// First header with this name, compared case-insensitively.
    [[nodiscard]] std::optional<std::string_view> header(std::string_view name) const;
};

struct HttpResponse {
    int status{200};
    HeaderList headers;
    std::string body;

    [[nodiscard]] static HttpResponse json(int status, std::string body);

    /// Replace an existing header of the same name or append one.
    void set_header(std::string name, std::string value);

    /// Status line, headers (with Content-Length and Connection: close) and body.
    [[nodiscard]] std::string serialize() const;
};

[[nodiscard]] std::string_view reason_phrase(int status) noexcept;

/// Reason sub-codes on parse errors; each maps to its own status.
namespace http_reason {
inline constexpr std::string_view kMalformed = "malformed_request";
inline constexpr std::string_view kHeaderTooLarge = "header_too_large";
inline constexpr std::string_view kBodyTooLarge = "body_too_large";
inline constexpr std::string_view kLengthRequired = "length_required";
inline constexpr std::string_view kUnsupportedEncoding = "unsupported_transfer_encoding";
}  // namespace http_reason

struct HttpLimits {
    size_t max_header_bytes{16 * 1024};
    size_t max_body_bytes{1024 * 1024};
};

/**
 * @brief Parse a request from the bytes received so far.
 *
 * @return std::nullopt while more bytes are needed, the request once the
 *         header block and the full body are present, or a Validation
 *         error carrying an http_reason sub-code.
 */
Result<std::optional<HttpRequest>> parse_request(std::string_view buffer,
                                                 const HttpLimits& limits = {});

/// HTTP status for a parse_request error.
[[nodiscard]] int status_for_parse_error(const Error& error) noexcept;

}  // namespace sandbox_runner
