/**
 * @file process_backend.cpp
 * @brief ProcessBackend implementation.
 * @author Dimitris Kafetzis
 */

#include "sandbox/process_backend.hpp"

#include <sys/prctl.h>

#include <algorithm>
#include <cerrno>
#include <cmath>
#include <cstring>
#include <fstream>

namespace sandbox_runner {

namespace {

constexpr std::string_view kEnvPrefix = "e";

/// Monotonic per-process epoch, distinct across restarts and across
/// backends created in the same process.
uint64_t next_epoch() {
    static std::atomic<uint64_t> last{0};
    auto now = static_cast<uint64_t>(std::chrono::duration_cast<std::chrono::microseconds>(
        std::chrono::system_clock::now().time_since_epoch()).count());
    uint64_t prev = last.load();
    uint64_t next = 0;
    do {
        next = std::max(now, prev + 1);
    } while (!last.compare_exchange_weak(prev, next));
    return next;
}

/// Parse the epoch out of "e<epoch>-<seq>"; nullopt for foreign entries.
std::optional<uint64_t> parse_epoch(const std::string& name) {
    if (!name.starts_with(kEnvPrefix)) return std::nullopt;
    auto dash = name.find('-');
    if (dash == std::string::npos || dash == kEnvPrefix.size()) return std::nullopt;
    uint64_t value = 0;
    for (size_t i = kEnvPrefix.size(); i < dash; ++i) {
        char c = name[i];
        if (c < '0' || c > '9') return std::nullopt;
        value = value * 10 + static_cast<uint64_t>(c - '0');
    }
    return value;
}

std::string tail(const std::string& text, size_t max_bytes) {
    if (text.size() <= max_bytes) return text;
    return text.substr(text.size() - max_bytes);
}

}  // anonymous namespace

// ─────────────────────────────────────────────
// Helpers
// ─────────────────────────────────────────────

Result<void> force_remove_tree(const std::filesystem::path& path) {
    namespace fs = std::filesystem;
    std::error_code ec;
    if (!fs::exists(fs::symlink_status(path, ec))) return Result<void>{};

    fs::remove_all(path, ec);
    if (!ec) return Result<void>{};

    // Sandboxed code (or a toolchain cache) may have left 0555 directories.
    std::error_code walk_ec;
    fs::permissions(path, fs::perms::owner_all, fs::perm_options::add, walk_ec);
    for (auto it = fs::recursive_directory_iterator(
             path, fs::directory_options::skip_permission_denied, walk_ec);
         it != fs::recursive_directory_iterator(); it.increment(walk_ec)) {
        if (walk_ec) break;
        if (it->is_directory(walk_ec) && !it->is_symlink(walk_ec)) {
            fs::permissions(it->path(), fs::perms::owner_all, fs::perm_options::add, walk_ec);
        }
    }

    ec.clear();
    fs::remove_all(path, ec);
    if (ec) {
        return Error{ErrorKind::Internal,
                     "Failed to remove " + path.string() + ": " + ec.message()};
    }
    return Result<void>{};
}

// ─────────────────────────────────────────────
// Construction / Destruction
// ─────────────────────────────────────────────

Result<std::unique_ptr<ProcessBackend>> ProcessBackend::create(ProcessBackendOptions options,
                                                               LanguageTable languages,
                                                               DatasetHandle dataset,
                                                               Logger& logger) {
    std::error_code ec;
    std::filesystem::create_directories(options.work_root, ec);
    if (ec) {
        return Error{ErrorKind::Provision,
                     "Cannot create work root " + options.work_root.string() + ": " + ec.message()};
    }
    std::filesystem::permissions(options.work_root, std::filesystem::perms::owner_all,
                                 std::filesystem::perm_options::replace, ec);

    bool namespaces = options.use_namespaces && namespaces_available(options.isolate_network);
    if (!namespaces) {
        if (options.require_isolation) {
            return Error{ErrorKind::Provision,
                         "Namespace isolation required but unavailable on this host "
                         "(set sandbox.require_isolation = false to run without it)"};
        }
        if (options.use_namespaces) {
            logger.warn("User namespaces unavailable; sandboxes run with rlimits only, "
                        "share the host network and run as the service user without "
                        "isolation from each other");
        }
    }

    // Same-uid sandboxes must not read our environment or memory via /proc.
    if (::prctl(PR_SET_DUMPABLE, 0, 0, 0, 0) != 0) {
        logger.warn(std::string("Cannot mark the service non-dumpable: ") + std::strerror(errno));
    }

    return std::unique_ptr<ProcessBackend>(new ProcessBackend(
        std::move(options), std::move(languages), std::move(dataset), logger, namespaces));
}

ProcessBackend::ProcessBackend(ProcessBackendOptions options, LanguageTable languages,
                               DatasetHandle dataset, Logger& logger, bool namespaces)
    : options_(std::move(options))
    , languages_(std::move(languages))
    , dataset_(std::move(dataset))
    , logger_(logger)
    , namespaces_(namespaces)
    , epoch_(next_epoch()) {}

ProcessBackend::~ProcessBackend() {
    for (const auto& handle : list_environments()) {
        auto result = destroy(handle);
        if (!result) {
            logger_.warn("Environment " + handle.id + " not cleaned up: "
                         + result.error().message);
        }
    }
}

// ─────────────────────────────────────────────
// Template Context
// ─────────────────────────────────────────────

TemplateContext ProcessBackend::context_for(const Environment& env) const {
    const auto& workdir = env.handle.workdir;
    TemplateContext ctx;
    ctx.workdir = workdir.string();
    ctx.source = (workdir / env.tmpl.source_file).string();
    ctx.binary = (workdir / "program").string();
    if (env.dataset_mounted && dataset_) {
        ctx.dataset = dataset_->path_in(workdir).string();
    }
    ctx.packages = env.packages;
    return ctx;
}

void ProcessBackend::confine(SpawnOptions& options, const Environment& env) const {
    options.use_namespaces = namespaces_;
    if (!namespaces_) return;
    options.private_root = env.handle.workdir.parent_path();
    options.masked_files = options_.masked_files;
}

std::vector<std::string> ProcessBackend::environment_for(const Environment& env,
                                                         const TemplateContext& ctx) const {
    // The service's own environment (credentials included) is never inherited.
    std::map<std::string, std::string> vars = {
        {"PATH", options_.sandbox_path},
        {"HOME", ctx.workdir},
        {"TMPDIR", ctx.workdir + "/tmp"},
        {"LANG", "C.UTF-8"},
    };
    if (!ctx.dataset.empty()) {
        vars["DATASET_DIR"] = ctx.dataset;
    }
    for (const auto& [key, value] : env.tmpl.env) {
        vars[key] = LanguageTable::expand_value(value, ctx);
    }

    std::vector<std::string> out;
    out.reserve(vars.size());
    for (const auto& [key, value] : vars) {
        out.push_back(key + "=" + value);
    }
    return out;
}

// ─────────────────────────────────────────────
// Provision
// ─────────────────────────────────────────────

Result<EnvironmentHandle> ProcessBackend::provision(const EnvironmentSpec& spec,
                                                    SteadyTime deadline,
                                                    std::stop_token stop) {
    if (stop.stop_requested()) {
        return Error{ErrorKind::Internal, "Provisioning cancelled", "cancelled"};
    }

    const auto* tmpl = languages_.find(spec.language);
    if (!tmpl) {
        return Error{ErrorKind::Provision,
                     "No template for language " + std::string(to_string(spec.language))};
    }
    if (!spec.packages.empty() && !tmpl->supports_packages()) {
        return Error{ErrorKind::Validation,
                     "Package installation is not supported for "
                         + std::string(to_string(spec.language))};
    }
    if (spec.mount_dataset && !dataset_) {
        return Error{ErrorKind::Provision, "Shared dataset is not available"};
    }

    Environment env;
    env.handle.id = std::string(kEnvPrefix) + std::to_string(epoch_) + "-"
                  + std::to_string(next_id_.fetch_add(1));
    env.handle.session_id = spec.session_id;
    env.handle.language = spec.language;
    env.handle.epoch = epoch_;
    env.handle.workdir = options_.work_root / env.handle.id;
    env.tmpl = *tmpl;
    env.packages = spec.packages;
    env.dataset_mounted = spec.mount_dataset;
    env.limits = spec.limits;

    namespace fs = std::filesystem;
    std::error_code ec;
    if (!fs::create_directory(env.handle.workdir, ec) || ec) {
        return Error{ErrorKind::Provision,
                     "Cannot create environment directory: "
                         + (ec ? ec.message() : std::string("already exists"))};
    }
    fs::permissions(env.handle.workdir, fs::perms::owner_all, fs::perm_options::replace, ec);
    fs::create_directory(env.handle.workdir / "tmp", ec);

    if (env.dataset_mounted) {
        auto target = dataset_->path_in(env.handle.workdir);
        // Under namespaces the directory is a mountpoint for a read-only
        // bind; otherwise a symlink to the host mount.
        if (namespaces_) {
            fs::create_directory(target, ec);
        } else {
            fs::create_directory_symlink(dataset_->host_path(), target, ec);
        }
        if (ec) {
            auto cleanup = force_remove_tree(env.handle.workdir);
            if (!cleanup) logger_.warn(cleanup.error().message);
            return Error{ErrorKind::Provision, "Cannot attach shared dataset: " + ec.message()};
        }
    }

    auto handle = env.handle;
    {
        std::lock_guard lock(mutex_);
        environments_.emplace(handle.id, env);
    }

    if (!env.packages.empty()) {
        auto installed = install_packages(env, deadline, stop);
        if (!installed) {
            auto cleanup = destroy(handle);
            if (!cleanup) {
                logger_.warn("Cleanup after failed install: " + cleanup.error().message);
            }
            return installed.error();
        }
    }

    logger_.debug("Provisioned environment " + handle.id + " for session " + spec.session_id);
    return handle;
}

Result<void> ProcessBackend::install_packages(const Environment& env, SteadyTime deadline,
                                              std::stop_token stop) {
    auto ctx = context_for(env);

    SpawnOptions options;
    options.argv = LanguageTable::expand(env.tmpl.install_argv, ctx);
    options.cwd = env.handle.workdir;
    options.env = environment_for(env, ctx);
    options.apply_limits = true;
    options.limits = env.limits;
    confine(options, env);
    options.isolate_network = false;   // Installers need the package index

    OutputCapture capture(options_.install_output_bytes);
    auto exit = spawn_tracked(env.handle.id, options, capture, deadline, stop);
    if (!exit) return exit.error();

    if (exit->cancelled) {
        return Error{ErrorKind::Internal, "Package installation cancelled", "cancelled"};
    }
    if (exit->timed_out) {
        return Error{ErrorKind::Timeout, "Package installation exceeded the time limit",
                     "package_install"};
    }
    if (exit->exit_code != 0) {
        auto output = capture.snapshot();
        std::string detail = tail(output.stderr_data.empty() ? output.stdout_data
                                                             : output.stderr_data, 2048);
        return Error{ErrorKind::ExecutionFailure, "Package installation failed: " + detail,
                     "package_install_failed"};
    }
    return Result<void>{};
}

// ─────────────────────────────────────────────
// Run
// ─────────────────────────────────────────────

Result<ProcessExit> ProcessBackend::spawn_tracked(const std::string& env_id,
                                                  const SpawnOptions& options,
                                                  OutputCapture& capture,
                                                  SteadyTime deadline,
                                                  std::stop_token stop) {
    pid_t spawned = 0;
    auto result = run_process(options, capture, deadline, stop, [&](pid_t pid) {
        spawned = pid;
        std::lock_guard lock(mutex_);
        auto it = environments_.find(env_id);
        if (it != environments_.end()) it->second.supervisors.push_back(pid);
    });

    if (spawned > 0) {
        std::lock_guard lock(mutex_);
        auto it = environments_.find(env_id);
        if (it != environments_.end()) {
            std::erase(it->second.supervisors, spawned);
        }
    }
    return result;
}

Result<RawOutcome> ProcessBackend::run(const EnvironmentHandle& handle,
                                       std::string_view code,
                                       SteadyTime deadline,
                                       OutputCapture& capture,
                                       std::stop_token stop) {
    Environment env;
    {
        std::lock_guard lock(mutex_);
        auto it = environments_.find(handle.id);
        if (it == environments_.end()) {
            return Error{ErrorKind::Internal, "Unknown environment: " + handle.id};
        }
        env = it->second;
    }

    auto ctx = context_for(env);
    {
        std::ofstream source(ctx.source, std::ios::binary | std::ios::trunc);
        source.write(code.data(), static_cast<std::streamsize>(code.size()));
        if (!source) {
            return Error{ErrorKind::Provision, "Cannot write source file " + ctx.source};
        }
    }

    SpawnOptions options;
    options.cwd = env.handle.workdir;
    options.env = environment_for(env, ctx);
    options.apply_limits = true;
    options.limits = env.limits;
    confine(options, env);
    options.isolate_network = options_.isolate_network;

    auto start = std::chrono::steady_clock::now();
    RawOutcome outcome;

    // ── Compile step ────────────────────────
    if (env.tmpl.is_compiled()) {
        outcome.phase = RunPhase::Compile;
        options.argv = LanguageTable::expand(env.tmpl.compile_argv, ctx);
        OutputCapture compile_capture(capture.capacity());
        auto compiled = spawn_tracked(env.handle.id, options, compile_capture, deadline, stop);
        if (!compiled) return compiled.error();

        if (compiled->timed_out || compiled->cancelled || compiled->exit_code != 0) {
            auto diag = compile_capture.snapshot();
            capture.append(Stream::Stdout, diag.stdout_data);
            capture.append(Stream::Stderr, diag.stderr_data);
            auto final_output = capture.snapshot();
            outcome.stdout_data = std::move(final_output.stdout_data);
            outcome.stderr_data = std::move(final_output.stderr_data);
            outcome.truncated = final_output.truncated;
            outcome.exit_code = compiled->exit_code;
            outcome.term_signal = compiled->term_signal;
            outcome.timed_out = compiled->timed_out;
            outcome.cancelled = compiled->cancelled;
            outcome.usage = compiled->usage;
            outcome.duration = std::chrono::duration_cast<Duration>(
                std::chrono::steady_clock::now() - start);
            return outcome;
        }
    }

    // ── Execute step ────────────────────────
    outcome.phase = RunPhase::Execute;
    options.argv = LanguageTable::expand(env.tmpl.run_argv, ctx);
    if (env.limits.cpu_time_seconds > 0) {
        options.cpu_seconds = env.limits.cpu_time_seconds;
    } else {
        auto remaining = std::chrono::duration<double>(deadline - std::chrono::steady_clock::now());
        options.cpu_seconds = static_cast<uint32_t>(std::max(1.0, std::ceil(remaining.count()))) + 1;
    }
    if (env.dataset_mounted && namespaces_ && dataset_) {
        options.readonly_bind = ReadOnlyBind{dataset_->host_path(),
                                             dataset_->path_in(env.handle.workdir)};
    }

    auto executed = spawn_tracked(env.handle.id, options, capture, deadline, stop);
    if (!executed) return executed.error();

    auto final_output = capture.snapshot();
    outcome.stdout_data = std::move(final_output.stdout_data);
    outcome.stderr_data = std::move(final_output.stderr_data);
    outcome.truncated = final_output.truncated;
    outcome.exit_code = executed->exit_code;
    outcome.term_signal = executed->term_signal;
    outcome.timed_out = executed->timed_out;
    outcome.cancelled = executed->cancelled;
    outcome.usage = executed->usage;
    outcome.duration = std::chrono::duration_cast<Duration>(
        std::chrono::steady_clock::now() - start);
    return outcome;
}

// ─────────────────────────────────────────────
// Teardown
// ─────────────────────────────────────────────

Result<void> ProcessBackend::destroy(const EnvironmentHandle& handle) {
    std::vector<pid_t> supervisors;
    std::filesystem::path workdir = handle.workdir;
    {
        std::lock_guard lock(mutex_);
        auto it = environments_.find(handle.id);
        if (it != environments_.end()) {
            supervisors = std::move(it->second.supervisors);
            workdir = it->second.handle.workdir;
            environments_.erase(it);
        }
    }

    for (pid_t pid : supervisors) {
        terminate_supervisor(pid);
    }

    // Only ever delete inside the work root.
    std::error_code ec;
    if (workdir.empty() || !std::filesystem::equivalent(workdir.parent_path(),
                                                         options_.work_root, ec)) {
        return Result<void>{};
    }
    auto removed = force_remove_tree(workdir);
    if (!removed) return removed.error();

    logger_.debug("Destroyed environment " + handle.id);
    return Result<void>{};
}

std::vector<EnvironmentHandle> ProcessBackend::list_environments() const {
    std::lock_guard lock(mutex_);
    std::vector<EnvironmentHandle> out;
    out.reserve(environments_.size());
    for (const auto& [id, env] : environments_) {
        out.push_back(env.handle);
    }
    return out;
}

size_t ProcessBackend::destroy_stale(uint64_t current_epoch) {
    size_t removed = 0;
    std::error_code ec;
    std::vector<std::filesystem::path> stale;
    for (const auto& entry : std::filesystem::directory_iterator(options_.work_root, ec)) {
        auto name = entry.path().filename().string();
        auto tag = parse_epoch(name);
        if (tag && *tag != current_epoch) stale.push_back(entry.path());
    }

    for (const auto& path : stale) {
        auto result = force_remove_tree(path);
        if (result) {
            ++removed;
        } else {
            logger_.warn("Stale environment not removed: " + result.error().message);
        }
    }
    if (removed > 0) {
        logger_.info("Removed " + std::to_string(removed) + " stale environment(s)");
    }
    return removed;
}

}  // namespace sandbox_runner
