/**
 * @file http_server.cpp
 * @brief HttpServer implementation.
 * @author Dimitris Kafetzis
 */

#include "network/http_server.hpp"

#include <arpa/inet.h>
#include <cerrno>
#include <cstring>
#include <netinet/in.h>
#include <netinet/tcp.h>
#include <poll.h>
#include <sys/socket.h>
#include <unistd.h>

namespace sandbox_runner {

namespace {

constexpr int kPollSliceMs = 100;
constexpr size_t kReadChunk = 8192;

/**
 * @brief Closes a client socket when the handler is done with it.
 */
class SocketGuard {
public:
    explicit SocketGuard(int fd) : fd_(fd) {}
    ~SocketGuard() {
        if (fd_ >= 0) {
            ::shutdown(fd_, SHUT_RDWR);
            ::close(fd_);
        }
    }
    SocketGuard(const SocketGuard&) = delete;
    SocketGuard& operator=(const SocketGuard&) = delete;

private:
    int fd_;
};

void configure_socket(int fd) {
    int flag = 1;
    ::setsockopt(fd, IPPROTO_TCP, TCP_NODELAY, &flag, sizeof(flag));
}

bool send_all(int fd, std::string_view data, std::chrono::milliseconds timeout) {
    const char* ptr = data.data();
    size_t remaining = data.size();

    while (remaining > 0) {
        pollfd pfd{};
        pfd.fd = fd;
        pfd.events = POLLOUT;

        int ready = ::poll(&pfd, 1, static_cast<int>(timeout.count()));
        if (ready < 0 && errno == EINTR) continue;
        if (ready <= 0) return false;

        auto sent = ::send(fd, ptr, remaining, MSG_NOSIGNAL);
        if (sent <= 0) {
            if (sent < 0 && (errno == EAGAIN || errno == EWOULDBLOCK || errno == EINTR)) continue;
            return false;
        }

        ptr += sent;
        remaining -= static_cast<size_t>(sent);
    }
    return true;
}

HttpResponse plain_error(int status, std::string_view message) {
    std::string body = "{\"status\":\"failed\",\"success\":false,\"message\":\""
                     + json_escape(message) + "\"}";
    return HttpResponse::json(status, std::move(body));
}

}  // anonymous namespace

// ─────────────────────────────────────────────
// Construction / Destruction
// ─────────────────────────────────────────────

HttpServer::HttpServer(HttpServerOptions options, HttpHandler handler, Logger& logger)
    : options_(std::move(options)), handler_(std::move(handler)), logger_(logger) {}

HttpServer::~HttpServer() {
    stop();
}

// ─────────────────────────────────────────────
// Listening
// ─────────────────────────────────────────────

Result<void> HttpServer::listen() {
    if (server_fd_ >= 0) {
        return Error{ErrorKind::Internal, "Already listening"};
    }

    server_fd_ = ::socket(AF_INET, SOCK_STREAM | SOCK_NONBLOCK | SOCK_CLOEXEC, 0);
    if (server_fd_ < 0) {
        return Error{ErrorKind::Internal,
                     "Failed to create server socket: " + std::string(strerror(errno))};
    }

    int optval = 1;
    ::setsockopt(server_fd_, SOL_SOCKET, SO_REUSEADDR, &optval, sizeof(optval));

    sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_port = htons(options_.port);
    if (::inet_pton(AF_INET, options_.host.c_str(), &addr.sin_addr) != 1) {
        ::close(server_fd_);
        server_fd_ = -1;
        return Error{ErrorKind::Internal, "Invalid listen address: " + options_.host};
    }

    if (::bind(server_fd_, reinterpret_cast<const sockaddr*>(&addr), sizeof(addr)) < 0) {
        auto message = "Bind to " + options_.host + ":" + std::to_string(options_.port)
                     + " failed: " + std::string(strerror(errno));
        ::close(server_fd_);
        server_fd_ = -1;
        return Error{ErrorKind::Internal, std::move(message)};
    }

    if (::listen(server_fd_, DEFAULT_BACKLOG) < 0) {
        auto message = "Listen failed: " + std::string(strerror(errno));
        ::close(server_fd_);
        server_fd_ = -1;
        return Error{ErrorKind::Internal, std::move(message)};
    }

    sockaddr_in bound{};
    socklen_t len = sizeof(bound);
    if (::getsockname(server_fd_, reinterpret_cast<sockaddr*>(&bound), &len) == 0) {
        bound_port_ = ntohs(bound.sin_port);
    } else {
        bound_port_ = options_.port;
    }
    return Result<void>{};
}

void HttpServer::start() {
    if (server_fd_ < 0 || accept_thread_.joinable()) return;

    pool_ = std::make_unique<ThreadPool>(options_.worker_threads, "sr-http");
    accept_thread_ = std::jthread([this](std::stop_token stop) { accept_loop(stop); });
    logger_.info("HTTP server listening on " + options_.host + ":" + std::to_string(bound_port_)
                 + " (" + std::to_string(pool_->thread_count()) + " workers)");
}

void HttpServer::stop() {
    if (accept_thread_.joinable()) {
        accept_thread_.request_stop();
        accept_thread_.join();
    }
    // Cancels running handlers through their worker stop_token, then joins.
    pool_.reset();
    if (server_fd_ >= 0) {
        ::close(server_fd_);
        server_fd_ = -1;
    }
}

// ─────────────────────────────────────────────
// Accept Loop
// ─────────────────────────────────────────────

void HttpServer::accept_loop(std::stop_token stop) {
    while (!stop.stop_requested()) {
        pollfd pfd{};
        pfd.fd = server_fd_;
        pfd.events = POLLIN;

        int ready = ::poll(&pfd, 1, kPollSliceMs);  // 100ms timeout for stop check
        if (ready <= 0) continue;

        int client_fd = ::accept4(server_fd_, nullptr, nullptr, SOCK_CLOEXEC);
        if (client_fd < 0) {
            if (errno != EAGAIN && errno != EWOULDBLOCK && errno != EINTR) {
                logger_.warn("accept failed: " + std::string(strerror(errno)));
            }
            continue;
        }
        configure_socket(client_fd);

        auto submitted = pool_->try_submit_cancellable(
            [this, client_fd](std::stop_token worker_stop) {
                handle_connection(client_fd, worker_stop);
            },
            options_.max_pending_connections);

        if (!submitted) {
            reject_overloaded(client_fd);
        }
    }
}

void HttpServer::reject_overloaded(int fd) {
    SocketGuard guard(fd);
    logger_.warn("Connection backlog full; answering 503");
    auto response = plain_error(503, "Server is overloaded; retry later");
    response.set_header("Retry-After", "1");
    send_all(fd, response.serialize(), std::chrono::milliseconds(kPollSliceMs * 10));
}

// ─────────────────────────────────────────────
// Connection Handling
// ─────────────────────────────────────────────

void HttpServer::handle_connection(int fd, std::stop_token worker_stop) {
    SocketGuard guard(fd);
    ++served_;

    auto request = read_request(fd, worker_stop);
    if (!request) {
        const auto& error = request.error();
        if (error.kind == ErrorKind::Validation) {
            send_response(fd, plain_error(status_for_parse_error(error), error.message));
        } else if (error.kind == ErrorKind::Timeout) {
            send_response(fd, plain_error(408, error.message));
        } else {
            logger_.debug("Connection dropped before a full request: " + error.message);
        }
        return;
    }

    // Hang-up watcher: trips client_gone while the handler runs.
    std::stop_source client_gone;
    std::stop_callback on_worker_stop(worker_stop, [&client_gone] { client_gone.request_stop(); });
    std::jthread watcher([fd, &client_gone](std::stop_token done) {
        while (!done.stop_requested() && !client_gone.stop_requested()) {
            pollfd pfd{};
            pfd.fd = fd;
            pfd.events = POLLRDHUP;
            int ready = ::poll(&pfd, 1, kPollSliceMs);
            if (ready > 0 && (pfd.revents & (POLLRDHUP | POLLHUP | POLLERR))) {
                client_gone.request_stop();
                return;
            }
        }
    });

    HttpResponse response;
    try {
        response = handler_(*request, client_gone.get_token());
    } catch (const std::exception& e) {
        logger_.error("Handler for " + request->method + " " + request->path
                      + " threw: " + e.what());
        response = plain_error(500, "Internal server error");
    }

    watcher.request_stop();
    watcher.join();

    if (client_gone.stop_requested() && !worker_stop.stop_requested()) {
        logger_.info("Client went away during " + request->method + " " + request->path);
        return;
    }
    send_response(fd, response);
}

Result<HttpRequest> HttpServer::read_request(int fd, const std::stop_token& stop) {
    std::string buffer;
    auto deadline = std::chrono::steady_clock::now() + options_.io_timeout;
    char chunk[kReadChunk];

    while (true) {
        auto parsed = parse_request(buffer, options_.limits);
        if (!parsed) return parsed.error();
        if (parsed->has_value()) return std::move(**parsed);

        if (stop.stop_requested()) {
            return Error{ErrorKind::Internal, "Server stopping"};
        }
        auto now = std::chrono::steady_clock::now();
        if (now >= deadline) {
            return Error{ErrorKind::Timeout, "Timed out reading the request"};
        }

        pollfd pfd{};
        pfd.fd = fd;
        pfd.events = POLLIN;
        auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now);
        int ready = ::poll(&pfd, 1, static_cast<int>(std::min<int64_t>(remaining.count(), kPollSliceMs)));
        if (ready < 0 && errno != EINTR) {
            return Error{ErrorKind::Internal, "poll failed: " + std::string(strerror(errno))};
        }
        if (ready <= 0) continue;

        auto received = ::recv(fd, chunk, sizeof(chunk), 0);
        if (received == 0) {
            return Error{ErrorKind::Internal, "Client closed the connection"};
        }
        if (received < 0) {
            if (errno == EAGAIN || errno == EWOULDBLOCK || errno == EINTR) continue;
            return Error{ErrorKind::Internal, "recv failed: " + std::string(strerror(errno))};
        }
        buffer.append(chunk, static_cast<size_t>(received));
    }
}

bool HttpServer::send_response(int fd, const HttpResponse& response) {
    if (!send_all(fd, response.serialize(), options_.io_timeout)) {
        logger_.debug("Failed to send a " + std::to_string(response.status) + " response");
        return false;
    }
    return true;
}

}  // namespace sandbox_runner
