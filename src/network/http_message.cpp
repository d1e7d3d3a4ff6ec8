/**
 * @file http_message.cpp
 * @brief HTTP/1.1 message implementation.
 * @author Dimitris Kafetzis
 */

#include "network/http_message.hpp"

#include <algorithm>
#include <cctype>
#include <charconv>

namespace sandbox_runner {

namespace {

constexpr std::string_view kCrlf = "\r\n";
constexpr std::string_view kHeaderEnd = "\r\n\r\n";

Error parse_error(std::string message, std::string_view reason) {
    return Error{ErrorKind::Validation, std::move(message), std::string(reason)};
}

std::string_view trim(std::string_view text) {
    while (!text.empty() && (text.front() == ' ' || text.front() == '\t')) text.remove_prefix(1);
    while (!text.empty() && (text.back() == ' ' || text.back() == '\t')) text.remove_suffix(1);
    return text;
}

bool is_token_char(char c) {
    auto uc = static_cast<unsigned char>(c);
    if (std::isalnum(uc)) return true;
    return std::string_view("!#$%&'*+-.^_`|~").find(c) != std::string_view::npos;
}

}  // anonymous namespace

bool iequals(std::string_view a, std::string_view b) noexcept {
    return a.size() == b.size()
        && std::equal(a.begin(), a.end(), b.begin(), [](char x, char y) {
               return std::tolower(static_cast<unsigned char>(x))
                   == std::tolower(static_cast<unsigned char>(y));
           });
}

// ─────────────────────────────────────────────
// HttpRequest
// ─────────────────────────────────────────────

std::optional<std::string_view> HttpRequest::header(std::string_view name) const {
    for (const auto& [key, value] : headers) {
        if (iequals(key, name)) return std::string_view(value);
    }
    return std::nullopt;
}

Result<std::optional<HttpRequest>> parse_request(std::string_view buffer,
                                                 const HttpLimits& limits) {
    auto header_end = buffer.find(kHeaderEnd);
    if (header_end == std::string_view::npos) {
        if (buffer.size() > limits.max_header_bytes) {
            return parse_error("Request header block too large", http_reason::kHeaderTooLarge);
        }
        return std::optional<HttpRequest>{};
    }
    if (header_end + kHeaderEnd.size() > limits.max_header_bytes) {
        return parse_error("Request header block too large", http_reason::kHeaderTooLarge);
    }

    HttpRequest request;
    std::string_view head = buffer.substr(0, header_end);

    // ── Request line ────────────────────────
    auto line_end = head.find(kCrlf);
    std::string_view line = head.substr(0, line_end);
    head = line_end == std::string_view::npos ? std::string_view{} : head.substr(line_end + 2);

    auto sp1 = line.find(' ');
    auto sp2 = sp1 == std::string_view::npos ? sp1 : line.find(' ', sp1 + 1);
    if (sp1 == std::string_view::npos || sp2 == std::string_view::npos) {
        return parse_error("Malformed request line", http_reason::kMalformed);
    }
    request.method = std::string(line.substr(0, sp1));
    request.target = std::string(line.substr(sp1 + 1, sp2 - sp1 - 1));
    request.version = std::string(line.substr(sp2 + 1));

    if (request.method.empty() || !std::all_of(request.method.begin(), request.method.end(), is_token_char)) {
        return parse_error("Malformed request method", http_reason::kMalformed);
    }
    if (request.target.empty() || request.target.front() != '/') {
        return parse_error("Request target must be an absolute path", http_reason::kMalformed);
    }
    if (!request.version.starts_with("HTTP/1.")) {
        return parse_error("Unsupported HTTP version", http_reason::kMalformed);
    }
    request.path = request.target.substr(0, request.target.find('?'));

    // ── Headers ─────────────────────────────
    while (!head.empty()) {
        auto end = head.find(kCrlf);
        std::string_view field = head.substr(0, end);
        head = end == std::string_view::npos ? std::string_view{} : head.substr(end + 2);

        auto colon = field.find(':');
        if (colon == std::string_view::npos || colon == 0) {
            return parse_error("Malformed header line", http_reason::kMalformed);
        }
        auto name = field.substr(0, colon);
        if (!std::all_of(name.begin(), name.end(), is_token_char)) {
            return parse_error("Malformed header name", http_reason::kMalformed);
        }
        request.headers.emplace_back(std::string(name), std::string(trim(field.substr(colon + 1))));
    }

    // ── Body ────────────────────────────────
    if (auto encoding = request.header("Transfer-Encoding")) {
        if (!iequals(*encoding, "identity")) {
            return parse_error("Transfer-Encoding is not supported; send Content-Length",
                               http_reason::kUnsupportedEncoding);
        }
    }

    size_t content_length = 0;
    if (auto length = request.header("Content-Length")) {
        auto [ptr, ec] = std::from_chars(length->data(), length->data() + length->size(),
                                         content_length);
        if (ec != std::errc{} || ptr != length->data() + length->size()) {
            return parse_error("Invalid Content-Length", http_reason::kMalformed);
        }
    } else if (request.method == "POST" || request.method == "PUT") {
        return parse_error("Content-Length required", http_reason::kLengthRequired);
    }

    if (content_length > limits.max_body_bytes) {
        return parse_error("Request body exceeds " + std::to_string(limits.max_body_bytes) + " bytes",
                           http_reason::kBodyTooLarge);
    }

    size_t body_start = header_end + kHeaderEnd.size();
    if (buffer.size() - body_start < content_length) {
        return std::optional<HttpRequest>{};
    }
    request.body = std::string(buffer.substr(body_start, content_length));
    return std::optional<HttpRequest>{std::move(request)};
}

int status_for_parse_error(const Error& error) noexcept {
    if (error.reason == http_reason::kHeaderTooLarge) return 431;
    if (error.reason == http_reason::kBodyTooLarge) return 413;
    if (error.reason == http_reason::kLengthRequired) return 411;
    if (error.reason == http_reason::kUnsupportedEncoding) return 501;
    return 400;
}

// ─────────────────────────────────────────────
// HttpResponse
// ─────────────────────────────────────────────

HttpResponse HttpResponse::json(int status, std::string body) {
    HttpResponse response;
    response.status = status;
    response.body = std::move(body);
    response.headers.emplace_back("Content-Type", "application/json");
    return response;
}

void HttpResponse::set_header(std::string name, std::string value) {
    for (auto& [key, existing] : headers) {
        if (iequals(key, name)) {
            existing = std::move(value);
            return;
        }
    }
    headers.emplace_back(std::move(name), std::move(value));
}

std::string HttpResponse::serialize() const {
    std::string out;
    out.reserve(body.size() + 256);
    out += "HTTP/1.1 ";
    out += std::to_string(status);
    out += ' ';
    out += reason_phrase(status);
    out += kCrlf;
    for (const auto& [name, value] : headers) {
        if (iequals(name, "Content-Length") || iequals(name, "Connection")) continue;
        out += name;
        out += ": ";
        out += value;
        out += kCrlf;
    }
    out += "Content-Length: ";
    out += std::to_string(body.size());
    out += kCrlf;
    out += "Connection: close";
    out += kCrlf;
    out += kCrlf;
    out += body;
    return out;
}

std::string_view reason_phrase(int status) noexcept {
    switch (status) {
        case 200: return "OK";
        case 400: return "Bad Request";
        case 401: return "Unauthorized";
        case 404: return "Not Found";
        case 405: return "Method Not Allowed";
        case 408: return "Request Timeout";
        case 411: return "Length Required";
        case 413: return "Payload Too Large";
        case 431: return "Request Header Fields Too Large";
        case 500: return "Internal Server Error";
        case 501: return "Not Implemented";
        case 503: return "Service Unavailable";
        default:  return "Unknown";
    }
}

}  // namespace sandbox_runner
