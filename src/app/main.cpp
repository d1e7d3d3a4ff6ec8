/**
 * @file main.cpp
 * @brief SandboxRunner daemon entry point.
 * @author Dimitris Kafetzis
 *
 * Wires all modules into the serving pipeline:
 *   Config → Logger → Dataset → Backend → Admission → Executor → HTTP
 */

#include "core/config.hpp"
#include "core/logger.hpp"
#include "service/sandbox_service.hpp"
#include "telemetry/json_sink.hpp"

#include <csignal>
#include <filesystem>
#include <iostream>
#include <memory>
#include <string>
#include <thread>

using namespace sandbox_runner;

namespace {

volatile std::sig_atomic_t g_shutdown_requested = 0;

void signal_handler(int /*signal*/) {
    g_shutdown_requested = 1;
}

struct CLIArgs {
    std::filesystem::path config_path = "config/default.toml";
    bool config_given = false;
    uint16_t port = 0;
    std::string log_dir;
    uint32_t max_concurrent = 0;
    std::string work_root;
};

void print_usage() {
    std::cout << "Usage: sandbox_runner [OPTIONS]\n"
              << "  --config <path>          Configuration file (default: config/default.toml)\n"
              << "  --port <port>            HTTP listen port\n"
              << "  --log-dir <path>         Log output directory (default: stdout)\n"
              << "  --max-concurrent <n>     Concurrent sandbox ceiling (default: derived)\n"
              << "  --work-root <path>       Directory holding sandbox environments\n"
              << "  --help, -h               Show this help message\n"
              << "\nThe bearer token is read from $AUTH_TOKEN unless [auth] says otherwise.\n";
}

Result<CLIArgs> parse_args(int argc, char* argv[]) {
    CLIArgs args;
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        bool has_value = i + 1 < argc;
        try {
            if (arg == "--config" && has_value) {
                args.config_path = argv[++i];
                args.config_given = true;
            } else if (arg == "--port" && has_value) {
                int port = std::stoi(argv[++i]);
                if (port <= 0 || port > 65535) return Error{ErrorKind::Validation, "Invalid --port"};
                args.port = static_cast<uint16_t>(port);
            } else if (arg == "--log-dir" && has_value) {
                args.log_dir = argv[++i];
            } else if (arg == "--max-concurrent" && has_value) {
                int n = std::stoi(argv[++i]);
                if (n <= 0) return Error{ErrorKind::Validation, "--max-concurrent must be positive"};
                args.max_concurrent = static_cast<uint32_t>(n);
            } else if (arg == "--work-root" && has_value) {
                args.work_root = argv[++i];
            } else if (arg == "--help" || arg == "-h") {
                print_usage();
                std::exit(0);
            } else {
                return Error{ErrorKind::Validation, "Unknown or incomplete option: " + arg};
            }
        } catch (const std::exception&) {
            return Error{ErrorKind::Validation, "Invalid number for " + arg};
        }
    }
    return args;
}

}  // namespace

int main(int argc, char* argv[]) {
    auto args_result = parse_args(argc, argv);
    if (!args_result) {
        std::cerr << args_result.error().message << "\n";
        print_usage();
        return 2;
    }
    auto args = *args_result;

    // Load configuration; a missing default file falls back to built-ins
    Config config = default_config();
    if (args.config_given || std::filesystem::exists(args.config_path)) {
        auto config_result = load_config(args.config_path);
        if (!config_result) {
            std::cerr << "Failed to load config: " << config_result.error().message << std::endl;
            return 1;
        }
        config = *config_result;
    }

    // Apply CLI overrides
    if (args.port != 0) config.server.port = args.port;
    if (!args.log_dir.empty()) config.telemetry.log_dir = args.log_dir;
    if (args.max_concurrent != 0) config.admission.max_concurrent = args.max_concurrent;
    if (!args.work_root.empty()) config.sandbox.work_root = args.work_root;

    // ── Initialize Logger ────────────────────
    std::unique_ptr<ILogSink> log_sink;
    if (!config.telemetry.log_dir.empty()) {
        log_sink = std::make_unique<JsonFileSink>(config.telemetry.log_dir, "sandbox_runner",
                                                  config.telemetry.max_file_size_mb,
                                                  config.telemetry.rotate_count);
    } else {
        log_sink = std::make_unique<StdoutSink>();
    }
    auto level = parse_log_level(config.telemetry.log_level).value_or(LogLevel::Info);
    Logger logger(std::move(log_sink), level);
    logger.info("SandboxRunner " + std::string(kServiceVersion) + " starting...");
    logger.info("Work root: " + config.sandbox.work_root.string());

    // Register signal handlers
    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);
    std::signal(SIGPIPE, SIG_IGN);

    // ── Build and start the service ──────────
    auto service = SandboxService::create(config, logger);
    if (!service) {
        logger.error("Start-up failed: " + service.error().message);
        logger.flush();
        return 1;
    }

    auto started = (*service)->start();
    if (!started) {
        logger.error("Start-up failed: " + started.error().message);
        logger.flush();
        return 1;
    }

    // ── Main Loop ────────────────────────────
    logger.info("Serving on port " + std::to_string((*service)->port())
                + ". Press Ctrl+C to shutdown.");

    uint64_t loop_count = 0;
    while (!g_shutdown_requested) {
        // Periodic status logging (every 30 seconds at 100ms intervals)
        if (loop_count % 300 == 0 && loop_count > 0) {
            (*service)->record_status();
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(100));
        ++loop_count;
    }

    // ── Graceful Shutdown ────────────────────
    logger.info("Shutdown requested. Draining...");
    (*service)->stop(std::chrono::milliseconds(config.sandbox.kill_grace_ms)
                     + std::chrono::seconds(config.limits.max_timeout_s));

    logger.info("SandboxRunner stopped.");
    logger.flush();
    return 0;
}
