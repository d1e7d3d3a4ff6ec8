/**
 * @file http_server.hpp
 * @brief Blocking-socket HTTP/1.1 server: a poll() accept loop on a
 *        std::jthread and one pooled worker per connection.
 * @author Dimitris Kafetzis
 *
 * Each connection carries exactly one request. While the handler runs, a
 * watcher polls the socket for POLLRDHUP; a client that hangs up trips the
 * stop_token handed to the handler so in-flight work can be cancelled.
 */

#pragma once

#include "core/logger.hpp"
#include "core/result.hpp"
#include "executor/thread_pool.hpp"
#include "network/http_message.hpp"

#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <stop_token>
#include <string>
#include <thread>

namespace sandbox_runner {

using HttpHandler = std::function<HttpResponse(const HttpRequest&, std::stop_token client_gone)>;

struct HttpServerOptions {
    std::string host = "0.0.0.0";
    uint16_t port = 8080;                       ///< 0 = ephemeral, see HttpServer::port()
    size_t worker_threads = 8;
    size_t max_pending_connections = 64;        ///< Accepted but not yet handled
    HttpLimits limits;
    std::chrono::milliseconds io_timeout{10000};
};

class HttpServer {
public:
    static constexpr int DEFAULT_BACKLOG = 128;

    HttpServer(HttpServerOptions options, HttpHandler handler, Logger& logger);
    ~HttpServer();

    HttpServer(const HttpServer&) = delete;
    HttpServer& operator=(const HttpServer&) = delete;

    /// Bind and listen. Errors are Internal with errno text.
    Result<void> listen();

    /// Start the accept loop. listen() must have succeeded.
    void start();

    /// Stop accepting, cancel handlers and join workers. Idempotent.
    void stop();

    [[nodiscard]] uint16_t port() const noexcept { return bound_port_; }
    [[nodiscard]] bool is_listening() const noexcept { return server_fd_ >= 0; }
    [[nodiscard]] uint64_t connections_served() const noexcept { return served_.load(); }

private:
    void accept_loop(std::stop_token stop);
    void handle_connection(int fd, std::stop_token worker_stop);
    void reject_overloaded(int fd);

    /**
     * @brief Read one request.
     *
     * Errors: Validation with an http_reason sub-code for a bad request,
     * Timeout when the client is too slow, Internal when it disconnects.
     */
    Result<HttpRequest> read_request(int fd, const std::stop_token& stop);
    bool send_response(int fd, const HttpResponse& response);

    HttpServerOptions options_;
    HttpHandler handler_;
    Logger& logger_;

    int server_fd_ = -1;
    uint16_t bound_port_ = 0;
    std::atomic<uint64_t> served_{0};
    std::unique_ptr<ThreadPool> pool_;
    std::jthread accept_thread_;
};

}  // namespace sandbox_runner
