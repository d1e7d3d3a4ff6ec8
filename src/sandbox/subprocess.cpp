/**
 * @file subprocess.cpp
 * @brief run_process() implementation.
 * @author Dimitris Kafetzis
 *
 * Everything the children need (argv, envp, id maps, mount flags) is built
 * before fork(); between fork() and execve() the supervisor, the init and
 * the program only make async-signal-safe calls.
 */

#include "sandbox/subprocess.hpp"

#include <fcntl.h>
#include <poll.h>
#include <sched.h>
#include <signal.h>
#include <sys/mount.h>
#include <sys/prctl.h>
#include <sys/resource.h>
#include <sys/signalfd.h>
#include <sys/stat.h>
#include <sys/statvfs.h>
#include <sys/wait.h>
#include <time.h>
#include <unistd.h>

#include <algorithm>
#include <cerrno>
#include <chrono>
#include <cstring>
#include <thread>

namespace sandbox_runner {

namespace {

constexpr int kPollSliceMs = 50;
constexpr auto kDrainGrace = std::chrono::seconds(1);
constexpr auto kReapPoll = std::chrono::milliseconds(10);

// Supervisor wakes on SIGCHLD or the lifeline; the timeout is a safety net.
constexpr int kSupervisePollMs = 100;

// out, err, report, lifeline; renumbered to 3..6 in the supervisor.
constexpr int kKeptFds = 4;
constexpr int kFallbackMaxFd = 65536;

enum class ChildStage : int {
    Namespaces = 1,
    IdMap,
    Mount,
    Supervisor,
    Fork,
    Proc,
    Limits,
    Chdir,
    Redirect,
    Exec
};

std::string_view stage_name(int stage) {
    switch (static_cast<ChildStage>(stage)) {
        case ChildStage::Namespaces: return "unshare";
        case ChildStage::IdMap:      return "id map";
        case ChildStage::Mount:      return "mount";
        case ChildStage::Supervisor: return "supervisor setup";
        case ChildStage::Fork:       return "fork";
        case ChildStage::Proc:       return "/proc mount";
        case ChildStage::Limits:     return "setrlimit";
        case ChildStage::Chdir:      return "chdir";
        case ChildStage::Redirect:   return "redirect";
        case ChildStage::Exec:       return "exec";
    }
    return "setup";
}

struct ChildFailure {
    int stage;
    int error;
};

/**
 * @brief Pre-fork snapshot of everything the children touch.
 */
struct ChildPlan {
    std::vector<char*> argv;
    std::vector<char*> envp;
    std::string executable;
    const char* cwd{nullptr};

    bool apply_limits{false};
    ResourceLimits limits;
    uint32_t cpu_seconds{0};

    bool use_namespaces{false};
    bool isolate_network{false};
    std::string uid_map;
    std::string gid_map;

    const char* bind_source{nullptr};
    const char* bind_target{nullptr};
    unsigned long remount_flags{0};

    const char* private_root{nullptr};
    std::vector<const char*> masked_files;

    int max_fd{kFallbackMaxFd};
};

std::vector<char*> to_c_array(const std::vector<std::string>& values) {
    std::vector<char*> out;
    out.reserve(values.size() + 1);
    for (const auto& v : values) {
        out.push_back(const_cast<char*>(v.c_str()));
    }
    out.push_back(nullptr);
    return out;
}

/**
 * @brief Resolve argv[0] against PATH (from the child env, else ours).
 */
std::optional<std::string> resolve_executable(const std::string& name,
                                              const std::vector<std::string>& env) {
    if (name.find('/') != std::string::npos) {
        return ::access(name.c_str(), X_OK) == 0 ? std::optional(name) : std::nullopt;
    }

    std::string path_var;
    for (const auto& entry : env) {
        if (entry.starts_with("PATH=")) {
            path_var = entry.substr(5);
            break;
        }
    }
    if (path_var.empty()) {
        const char* host = ::getenv("PATH");
        path_var = host ? host : "/usr/local/bin:/usr/bin:/bin";
    }

    size_t start = 0;
    while (start <= path_var.size()) {
        size_t end = path_var.find(':', start);
        if (end == std::string::npos) end = path_var.size();
        std::string dir = path_var.substr(start, end - start);
        if (!dir.empty()) {
            std::string candidate = dir + "/" + name;
            if (::access(candidate.c_str(), X_OK) == 0) return candidate;
        }
        start = end + 1;
    }
    return std::nullopt;
}

unsigned long locked_mount_flags(const std::filesystem::path& path) {
    struct statvfs info{};
    unsigned long flags = 0;
    if (::statvfs(path.c_str(), &info) == 0) {
        if (info.f_flag & ST_NOSUID) flags |= MS_NOSUID;
        if (info.f_flag & ST_NODEV) flags |= MS_NODEV;
        if (info.f_flag & ST_NOEXEC) flags |= MS_NOEXEC;
    }
    return flags;
}

int open_file_limit() {
    rlimit rl{};
    if (::getrlimit(RLIMIT_NOFILE, &rl) != 0 || rl.rlim_cur == RLIM_INFINITY
        || rl.rlim_cur > static_cast<rlim_t>(kFallbackMaxFd)) {
        return kFallbackMaxFd;
    }
    return static_cast<int>(rl.rlim_cur);
}

std::string identity_map(unsigned id) {
    return std::to_string(id) + " " + std::to_string(id) + " 1\n";
}

// ── Child side (async-signal-safe only) ─────

[[noreturn]] void child_fail(int report_fd, ChildStage stage) {
    ChildFailure failure{static_cast<int>(stage), errno};
    ssize_t written = ::write(report_fd, &failure, sizeof(failure));
    static_cast<void>(written);
    ::_exit(127);
}

bool write_proc_file(const char* path, const char* data, size_t len) {
    int fd = ::open(path, O_WRONLY | O_CLOEXEC);
    if (fd < 0) return false;
    ssize_t n = ::write(fd, data, len);
    int saved = errno;
    ::close(fd);
    errno = saved;
    return n == static_cast<ssize_t>(len);
}

bool set_limit(int resource, rlim_t soft, rlim_t hard) {
    rlimit rl{soft, hard};
    return ::setrlimit(resource, &rl) == 0;
}

/// "/proc/self/fd/<fd>" without allocating.
void fd_link(char (&out)[32], int fd) {
    constexpr char prefix[] = "/proc/self/fd/";
    size_t len = sizeof(prefix) - 1;
    std::memcpy(out, prefix, len);
    char digits[12];
    int count = 0;
    do {
        digits[count++] = static_cast<char>('0' + fd % 10);
        fd /= 10;
    } while (fd > 0);
    while (count > 0) out[len++] = digits[--count];
    out[len] = '\0';
}

bool mount_proc() {
    return ::mount("proc", "/proc", "proc", MS_NOSUID | MS_NODEV | MS_NOEXEC, nullptr) == 0;
}

/**
 * @brief Swap private_root for an empty tmpfs holding only cwd.
 *
 * Sibling work directories stop being reachable by path.
 */
bool hide_siblings(const ChildPlan& plan) {
    int keep = ::open(plan.cwd, O_PATH | O_DIRECTORY | O_CLOEXEC);
    if (keep < 0) return false;

    char source[32];
    fd_link(source, keep);
    bool ok = ::mount("tmpfs", plan.private_root, "tmpfs", MS_NOSUID | MS_NODEV,
                      "mode=0755,size=16k") == 0
           && ::mkdir(plan.cwd, 0700) == 0
           && ::mount(source, plan.cwd, nullptr, MS_BIND | MS_REC, nullptr) == 0;
    int saved = errno;
    ::close(keep);
    errno = saved;
    return ok;
}

/**
 * @brief Unshare user, mount and PID namespaces and shape the mount tree.
 *
 * The caller stays in its PID namespace; its next child becomes init.
 */
int enter_namespaces(const ChildPlan& plan) {
    // A non-dumpable process cannot write its own id maps.
    ::prctl(PR_SET_DUMPABLE, 1, 0, 0, 0);

    int flags = CLONE_NEWUSER | CLONE_NEWNS | CLONE_NEWPID;
    if (plan.isolate_network) flags |= CLONE_NEWNET;
    if (::unshare(flags) != 0) return static_cast<int>(ChildStage::Namespaces);

    // Older kernels lack setgroups; the uid_map write then still succeeds.
    if (!write_proc_file("/proc/self/setgroups", "deny", 4) && errno != ENOENT) {
        return static_cast<int>(ChildStage::IdMap);
    }
    if (!write_proc_file("/proc/self/uid_map", plan.uid_map.data(), plan.uid_map.size())
        || !write_proc_file("/proc/self/gid_map", plan.gid_map.data(), plan.gid_map.size())) {
        return static_cast<int>(ChildStage::IdMap);
    }
    ::prctl(PR_SET_DUMPABLE, 0, 0, 0, 0);

    if (::mount(nullptr, "/", nullptr, MS_REC | MS_PRIVATE, nullptr) != 0) {
        return static_cast<int>(ChildStage::Mount);
    }
    if (plan.private_root != nullptr && plan.cwd != nullptr && !hide_siblings(plan)) {
        return static_cast<int>(ChildStage::Mount);
    }
    if (plan.bind_source != nullptr) {
        if (::mount(plan.bind_source, plan.bind_target, nullptr, MS_BIND | MS_REC, nullptr) != 0) {
            return static_cast<int>(ChildStage::Mount);
        }
        if (::mount(nullptr, plan.bind_target, nullptr, plan.remount_flags, nullptr) != 0) {
            return static_cast<int>(ChildStage::Mount);
        }
    }
    for (const char* file : plan.masked_files) {
        if (::mount("/dev/null", file, nullptr, MS_BIND, nullptr) != 0) {
            return static_cast<int>(ChildStage::Mount);
        }
    }
    return 0;
}

[[noreturn]] void exec_program(const ChildPlan& plan, int out_fd, int err_fd, int report_fd) {
    sigset_t none;
    ::sigemptyset(&none);
    ::sigprocmask(SIG_SETMASK, &none, nullptr);
    ::signal(SIGPIPE, SIG_DFL);

    if (plan.apply_limits) {
        const auto& l = plan.limits;
        bool ok = set_limit(RLIMIT_CORE, 0, 0);
        if (l.memory_bytes > 0) ok = ok && set_limit(RLIMIT_AS, l.memory_bytes, l.memory_bytes);
        if (l.max_processes > 0) ok = ok && set_limit(RLIMIT_NPROC, l.max_processes, l.max_processes);
        if (l.max_file_size_bytes > 0) {
            ok = ok && set_limit(RLIMIT_FSIZE, l.max_file_size_bytes, l.max_file_size_bytes);
        }
        // Soft limit delivers SIGXCPU first, the hard limit SIGKILL a second later.
        if (plan.cpu_seconds > 0) {
            ok = ok && set_limit(RLIMIT_CPU, plan.cpu_seconds, plan.cpu_seconds + 1);
        }
        if (!ok) child_fail(report_fd, ChildStage::Limits);
    }

    if (plan.cwd != nullptr && ::chdir(plan.cwd) != 0) {
        child_fail(report_fd, ChildStage::Chdir);
    }

    int null_fd = ::open("/dev/null", O_RDONLY);
    if (null_fd < 0 || ::dup2(null_fd, STDIN_FILENO) < 0
        || ::dup2(out_fd, STDOUT_FILENO) < 0 || ::dup2(err_fd, STDERR_FILENO) < 0) {
        child_fail(report_fd, ChildStage::Redirect);
    }

    ::execve(plan.executable.c_str(), plan.argv.data(), plan.envp.data());
    child_fail(report_fd, ChildStage::Exec);
}

/**
 * @brief PID 1 of the sandbox namespace: start the program, reap
 *        everything reparented to it, hand the program's status back.
 *
 * Its exit tears down every process left in the namespace.
 */
[[noreturn]] void run_init(const ChildPlan& plan, int out_fd, int err_fd, int report_fd,
                           int status_fd) {
    ::prctl(PR_SET_PDEATHSIG, SIGKILL);
    if (!mount_proc()) child_fail(report_fd, ChildStage::Proc);

    pid_t program = ::fork();
    if (program < 0) child_fail(report_fd, ChildStage::Fork);
    if (program == 0) {
        ::close(status_fd);
        exec_program(plan, out_fd, err_fd, report_fd);
    }
    ::close(out_fd);
    ::close(err_fd);
    ::close(report_fd);

    int program_status = 0;
    while (true) {
        int status = 0;
        pid_t reaped = ::waitpid(-1, &status, 0);
        if (reaped == program) {
            program_status = status;
            break;
        }
        if (reaped < 0 && errno != EINTR) ::_exit(127);
    }

    ssize_t written = ::write(status_fd, &program_status, sizeof(program_status));
    static_cast<void>(written);
    ::_exit(0);
}

void close_from(int first, int max_fd) {
    if (::close_range(static_cast<unsigned>(first), ~0U, 0) == 0) return;
    for (int fd = first; fd < max_fd; ++fd) ::close(fd);
}

/// Renumber the kept fds to 3.. (CLOEXEC) and close every other fd above.
bool compact_fds(int (&fds)[kKeptFds], int max_fd) {
    int highest = STDERR_FILENO;
    for (int fd : fds) highest = std::max(highest, fd);

    int moved[kKeptFds];
    for (int i = 0; i < kKeptFds; ++i) {
        moved[i] = ::fcntl(fds[i], F_DUPFD_CLOEXEC, highest + 1);
        if (moved[i] < 0) return false;
    }
    // moved[j] > 3 + i for every j >= i, so no pending source is clobbered.
    for (int i = 0; i < kKeptFds; ++i) {
        if (::dup3(moved[i], STDERR_FILENO + 1 + i, O_CLOEXEC) < 0) return false;
        fds[i] = STDERR_FILENO + 1 + i;
    }
    close_from(STDERR_FILENO + 1 + kKeptFds, max_fd);
    return true;
}

/// SIGKILL every child listed for this thread; -1 when /proc is unreadable.
int kill_listed_children() {
    int fd = ::open("/proc/thread-self/children", O_RDONLY | O_CLOEXEC);
    if (fd < 0) return -1;

    char buffer[4096];
    int killed = 0;
    pid_t pid = 0;
    ssize_t n = 0;
    while ((n = ::read(fd, buffer, sizeof(buffer))) > 0) {
        for (ssize_t i = 0; i < n; ++i) {
            char c = buffer[i];
            if (c >= '0' && c <= '9') {
                pid = pid * 10 + (c - '0');
            } else if (pid > 0) {
                ::kill(pid, SIGKILL);
                ++killed;
                pid = 0;
            }
        }
    }
    if (pid > 0) {
        ::kill(pid, SIGKILL);
        ++killed;
    }
    ::close(fd);
    return killed;
}

/**
 * @brief Kill and reap everything reparented to this subreaper.
 *
 * Unreaped children stay zombies, so a listed pid cannot be recycled
 * before it is killed.
 */
void reap_orphans() {
    while (true) {
        int listed = kill_listed_children();
        int status = 0;
        pid_t reaped = ::waitpid(-1, &status, listed > 0 ? 0 : WNOHANG);
        if (reaped > 0) continue;
        if (reaped < 0) {
            if (errno == EINTR) continue;
            return;   // ECHILD
        }
        if (listed < 0) return;
        timespec pause{0, 1000000};
        ::nanosleep(&pause, nullptr);
    }
}

/// True when the service asked for a stop with SIGTERM.
bool drain_signals(int signal_fd, pid_t service) {
    bool stop = false;
    signalfd_siginfo info{};
    while (::read(signal_fd, &info, sizeof(info)) == static_cast<ssize_t>(sizeof(info))) {
        if (info.ssi_signo == SIGTERM && static_cast<pid_t>(info.ssi_pid) == service) {
            stop = true;
        }
    }
    return stop;
}

/// Leave with the same status the program ended with.
[[noreturn]] void exit_like(int status) {
    if (WIFSIGNALED(status)) {
        int sig = WTERMSIG(status);
        struct sigaction dfl{};
        dfl.sa_handler = SIG_DFL;
        ::sigaction(sig, &dfl, nullptr);
        sigset_t only;
        ::sigemptyset(&only);
        ::sigaddset(&only, sig);
        ::sigprocmask(SIG_UNBLOCK, &only, nullptr);
        ::kill(::getpid(), sig);
        ::_exit(128 + sig);
    }
    ::_exit(WIFEXITED(status) ? WEXITSTATUS(status) : 127);
}

/**
 * @brief Body of the direct child: own the run from start to teardown.
 */
[[noreturn]] void supervise(const ChildPlan& plan, int out_fd, int err_fd, int report_fd,
                            int lifeline_fd) {
    pid_t service = ::getppid();
    ::setpgid(0, 0);

    sigset_t all;
    ::sigfillset(&all);
    ::sigprocmask(SIG_SETMASK, &all, nullptr);

    if (::prctl(PR_SET_NO_NEW_PRIVS, 1, 0, 0, 0) != 0
        || ::prctl(PR_SET_CHILD_SUBREAPER, 1, 0, 0, 0) != 0
        || !set_limit(RLIMIT_CORE, 0, 0)) {
        child_fail(report_fd, ChildStage::Supervisor);
    }

    int fds[kKeptFds] = {out_fd, err_fd, report_fd, lifeline_fd};
    if (!compact_fds(fds, plan.max_fd)) child_fail(report_fd, ChildStage::Supervisor);
    out_fd = fds[0];
    err_fd = fds[1];
    report_fd = fds[2];
    lifeline_fd = fds[3];

    if (plan.use_namespaces) {
        int stage = enter_namespaces(plan);
        if (stage != 0) child_fail(report_fd, static_cast<ChildStage>(stage));
    }

    sigset_t watched;
    ::sigemptyset(&watched);
    ::sigaddset(&watched, SIGCHLD);
    ::sigaddset(&watched, SIGTERM);
    int signal_fd = ::signalfd(-1, &watched, SFD_CLOEXEC | SFD_NONBLOCK);
    if (signal_fd < 0) child_fail(report_fd, ChildStage::Supervisor);

    int status_pipe[2] = {-1, -1};
    if (plan.use_namespaces && ::pipe2(status_pipe, O_CLOEXEC | O_NONBLOCK) != 0) {
        child_fail(report_fd, ChildStage::Supervisor);
    }

    pid_t supervisor = ::getpid();
    pid_t worker = ::fork();
    if (worker < 0) child_fail(report_fd, ChildStage::Fork);
    if (worker == 0) {
        ::close(lifeline_fd);
        ::close(signal_fd);
        if (plan.use_namespaces) {
            ::close(status_pipe[0]);
            run_init(plan, out_fd, err_fd, report_fd, status_pipe[1]);
        }
        ::setpgid(0, 0);
        ::prctl(PR_SET_PDEATHSIG, SIGKILL);
        if (::getppid() != supervisor) ::_exit(127);
        exec_program(plan, out_fd, err_fd, report_fd);
    }

    if (!plan.use_namespaces) ::setpgid(worker, worker);
    ::close(out_fd);
    ::close(err_fd);
    ::close(report_fd);
    if (plan.use_namespaces) ::close(status_pipe[1]);

    // ── Wait for the program or a stop request ─
    int status = 0;
    bool reaped = false;
    bool stopping = false;
    while (true) {
        pid_t r = ::waitpid(worker, &status, WNOHANG);
        if (r == worker) {
            reaped = true;
            break;
        }
        if (r < 0 && errno != EINTR) break;

        pollfd pfds[2]{};
        nfds_t count = 0;
        pfds[count++] = {signal_fd, POLLIN, 0};
        if (!stopping) pfds[count++] = {lifeline_fd, POLLIN, 0};

        if (::poll(pfds, count, kSupervisePollMs) <= 0) continue;

        bool stop = (pfds[0].revents & POLLIN) != 0 && drain_signals(signal_fd, service);
        if (count > 1 && pfds[1].revents != 0) stop = true;
        if (stop && !stopping) {
            ::kill(-worker, SIGKILL);
            ::kill(worker, SIGKILL);
            stopping = true;
        }
    }

    if (!plan.use_namespaces) {
        ::kill(-worker, SIGKILL);
        reap_orphans();
    }
    if (!reaped) ::_exit(127);

    if (plan.use_namespaces) {
        int program_status = 0;
        if (::read(status_pipe[0], &program_status, sizeof(program_status))
            == static_cast<ssize_t>(sizeof(program_status))) {
            status = program_status;
        }
    }
    exit_like(status);
}

// ── Parent side ─────────────────────────────

void close_fd(int& fd) noexcept {
    if (fd >= 0) {
        ::close(fd);
        fd = -1;
    }
}

Duration to_duration(const timeval& tv) {
    return std::chrono::seconds(tv.tv_sec) + std::chrono::microseconds(tv.tv_usec);
}

}  // anonymous namespace

void kill_process_group(pid_t pgid) noexcept {
    if (pgid > 0) {
        ::kill(-pgid, SIGKILL);
    }
}

void terminate_supervisor(pid_t pid) noexcept {
    if (pid > 0) {
        ::kill(pid, SIGTERM);
    }
}

// ─────────────────────────────────────────────
// run_process
// ─────────────────────────────────────────────

Result<ProcessExit> run_process(const SpawnOptions& options,
                                OutputCapture& capture,
                                SteadyTime deadline,
                                std::stop_token stop,
                                const SpawnObserver& on_spawn) {
    if (options.argv.empty()) {
        return Error{ErrorKind::Internal, "Empty command line"};
    }

    auto executable = resolve_executable(options.argv.front(), options.env);
    if (!executable) {
        return Error{ErrorKind::Provision, "Executable not found: " + options.argv.front()};
    }

    ChildPlan plan;
    plan.argv = to_c_array(options.argv);
    plan.envp = to_c_array(options.env);
    plan.executable = *executable;
    plan.cwd = options.cwd.empty() ? nullptr : options.cwd.c_str();
    plan.apply_limits = options.apply_limits;
    plan.limits = options.limits;
    plan.cpu_seconds = options.cpu_seconds;
    plan.use_namespaces = options.use_namespaces;
    plan.isolate_network = options.use_namespaces && options.isolate_network;
    plan.max_fd = open_file_limit();
    if (plan.use_namespaces) {
        plan.uid_map = identity_map(::getuid());
        plan.gid_map = identity_map(::getgid());
        if (options.readonly_bind) {
            plan.bind_source = options.readonly_bind->source.c_str();
            plan.bind_target = options.readonly_bind->target.c_str();
            plan.remount_flags = MS_BIND | MS_REMOUNT | MS_RDONLY
                               | locked_mount_flags(options.readonly_bind->source);
        }
        if (!options.private_root.empty() && plan.cwd != nullptr) {
            if (options.cwd.parent_path() != options.private_root) {
                return Error{ErrorKind::Internal,
                             "Working directory " + options.cwd.string()
                                 + " is not directly under " + options.private_root.string()};
            }
            plan.private_root = options.private_root.c_str();
        }
        for (const auto& file : options.masked_files) {
            std::error_code ec;
            if (std::filesystem::is_regular_file(file, ec)) {
                plan.masked_files.push_back(file.c_str());
            }
        }
    }

    int out_pipe[2] = {-1, -1};
    int err_pipe[2] = {-1, -1};
    int report_pipe[2] = {-1, -1};
    int lifeline[2] = {-1, -1};
    auto close_all = [&] {
        for (int* p : {out_pipe, err_pipe, report_pipe, lifeline}) {
            close_fd(p[0]);
            close_fd(p[1]);
        }
    };
    if (::pipe2(out_pipe, O_CLOEXEC) != 0 || ::pipe2(err_pipe, O_CLOEXEC) != 0
        || ::pipe2(report_pipe, O_CLOEXEC) != 0 || ::pipe2(lifeline, O_CLOEXEC) != 0) {
        std::string reason = std::strerror(errno);
        close_all();
        return Error{ErrorKind::Provision, "pipe2 failed: " + reason};
    }

    auto started = std::chrono::steady_clock::now();
    pid_t pid = ::fork();
    if (pid < 0) {
        std::string reason = std::strerror(errno);
        close_all();
        return Error{ErrorKind::Provision, "fork failed: " + reason};
    }

    if (pid == 0) {
        ::close(out_pipe[0]);
        ::close(err_pipe[0]);
        ::close(report_pipe[0]);
        ::close(lifeline[1]);
        supervise(plan, out_pipe[1], err_pipe[1], report_pipe[1], lifeline[0]);
    }

    // Both sides call setpgid so the group exists before any kill(-pid).
    ::setpgid(pid, pid);
    close_fd(out_pipe[1]);
    close_fd(err_pipe[1]);
    close_fd(report_pipe[1]);
    close_fd(lifeline[0]);
    if (on_spawn) on_spawn(pid);

    ChildFailure failure{};
    ssize_t got = 0;
    do {
        got = ::read(report_pipe[0], &failure, sizeof(failure));
    } while (got < 0 && errno == EINTR);
    close_fd(report_pipe[0]);

    if (got == static_cast<ssize_t>(sizeof(failure))) {
        close_fd(out_pipe[0]);
        close_fd(err_pipe[0]);
        close_fd(lifeline[1]);
        int status = 0;
        while (::waitpid(pid, &status, 0) < 0 && errno == EINTR) {}
        return Error{ErrorKind::Provision,
                     "Sandbox " + std::string(stage_name(failure.stage)) + " failed for "
                         + options.argv.front() + ": " + std::strerror(failure.error)};
    }

    ProcessExit result;
    std::optional<SteadyTime> killed_at;

    // Closing the lifeline makes the supervisor kill the whole tree.
    auto check_termination = [&](SteadyTime now) {
        if (killed_at) return;
        if (stop.stop_requested()) {
            result.cancelled = true;
        } else if (now >= deadline) {
            result.timed_out = true;
        } else {
            return;
        }
        close_fd(lifeline[1]);
        killed_at = now;
    };

    // ── Drain stdout / stderr ───────────────
    int fds[2] = {out_pipe[0], err_pipe[0]};
    const Stream streams[2] = {Stream::Stdout, Stream::Stderr};
    char buffer[8192];

    while (fds[0] >= 0 || fds[1] >= 0) {
        auto now = std::chrono::steady_clock::now();
        check_termination(now);
        if (killed_at && now - *killed_at > kDrainGrace) break;

        int wait_ms = kPollSliceMs;
        if (!killed_at) {
            auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now);
            wait_ms = static_cast<int>(std::clamp<int64_t>(remaining.count() + 1, 1, kPollSliceMs));
        }

        pollfd pfds[2]{};
        nfds_t count = 0;
        int index[2] = {-1, -1};
        for (int i = 0; i < 2; ++i) {
            if (fds[i] < 0) continue;
            pfds[count].fd = fds[i];
            pfds[count].events = POLLIN;
            index[count] = i;
            ++count;
        }

        int ready = ::poll(pfds, count, wait_ms);
        if (ready < 0) {
            if (errno == EINTR) continue;
            break;
        }
        if (ready == 0) continue;

        for (nfds_t k = 0; k < count; ++k) {
            if ((pfds[k].revents & (POLLIN | POLLHUP | POLLERR)) == 0) continue;
            int i = index[k];
            ssize_t n = ::read(fds[i], buffer, sizeof(buffer));
            if (n > 0) {
                capture.append(streams[i], std::string_view(buffer, static_cast<size_t>(n)));
            } else if (n == 0 || (errno != EINTR && errno != EAGAIN)) {
                close_fd(fds[i]);
            }
        }
    }
    close_fd(fds[0]);
    close_fd(fds[1]);

    // ── Wait for the supervisor without reaping ─
    // Keeping it a zombie pins the pgid until stragglers are killed. A
    // supervisor that ignores the lifeline past the grace period is killed.
    bool escalated = false;
    while (true) {
        siginfo_t info{};
        int rc = ::waitid(P_PID, static_cast<id_t>(pid), &info, WEXITED | WNOHANG | WNOWAIT);
        if (rc == 0 && info.si_pid == pid) break;
        if (rc < 0 && errno != EINTR) break;
        auto now = std::chrono::steady_clock::now();
        check_termination(now);
        if (killed_at && !escalated && now - *killed_at > kDrainGrace) {
            kill_process_group(pid);
            escalated = true;
        }
        std::this_thread::sleep_for(kReapPoll);
    }
    close_fd(lifeline[1]);
    kill_process_group(pid);

    int status = 0;
    rusage usage{};
    pid_t reaped = 0;
    do {
        reaped = ::wait4(pid, &status, 0, &usage);
    } while (reaped < 0 && errno == EINTR);

    result.usage.wall_time = std::chrono::duration_cast<Duration>(
        std::chrono::steady_clock::now() - started);
    if (reaped == pid) {
        if (WIFEXITED(status)) {
            result.exit_code = WEXITSTATUS(status);
        } else if (WIFSIGNALED(status)) {
            result.term_signal = WTERMSIG(status);
        }
        result.usage.cpu_time = to_duration(usage.ru_utime) + to_duration(usage.ru_stime);
        result.usage.peak_memory_bytes = static_cast<uint64_t>(usage.ru_maxrss) * 1024;
    }
    return result;
}

// ─────────────────────────────────────────────
// Namespace support
// ─────────────────────────────────────────────

bool namespaces_available(bool with_network) {
    ChildPlan plan;
    plan.isolate_network = with_network;
    plan.uid_map = identity_map(::getuid());
    plan.gid_map = identity_map(::getgid());

    pid_t pid = ::fork();
    if (pid < 0) return false;
    if (pid == 0) {
        if (enter_namespaces(plan) != 0) ::_exit(1);
        pid_t init = ::fork();
        if (init < 0) ::_exit(1);
        if (init == 0) ::_exit(mount_proc() ? 0 : 1);
        int status = 0;
        while (::waitpid(init, &status, 0) < 0) {
            if (errno != EINTR) ::_exit(1);
        }
        ::_exit(WIFEXITED(status) && WEXITSTATUS(status) == 0 ? 0 : 1);
    }

    int status = 0;
    while (::waitpid(pid, &status, 0) < 0) {
        if (errno != EINTR) return false;
    }
    return WIFEXITED(status) && WEXITSTATUS(status) == 0;
}

}  // namespace sandbox_runner
