/*
 * HalBox C++17 - Process Runner Implementation
 *
 * fork/execve with pipes for stdout and stderr. Everything the child needs
 * (argv, envp, resolved program path) is prepared in the parent so the
 * child only makes async-signal-safe calls before exec.
 */
#include <halbox/sandbox/process_runner.hpp>
#include <halbox/sandbox/filesystem_jail.hpp>
#include <halbox/core/logger.hpp>
#include <halbox/core/utils.hpp>

#include <chrono>
#include <cerrno>
#include <csignal>
#include <cstdio>
#include <cstring>
#include <fcntl.h>
#include <poll.h>
#include <unistd.h>
#include <sys/prctl.h>
#include <sys/resource.h>
#include <sys/stat.h>
#include <sys/types.h>
#include <sys/wait.h>

extern char** environ;

namespace halbox {

// ============================================================================
// TempArtifact
// ============================================================================

TempArtifact::TempArtifact(const std::string& dir, const std::string& prefix,
                           const std::string& content, const std::string& suffix) {
    path_ = join_path(dir, prefix + "_" + generate_uuid() + suffix);

    int fd = open(path_.c_str(), O_WRONLY | O_CREAT | O_EXCL | O_CLOEXEC, 0600);
    if (fd < 0) {
        std::string err = "cannot create " + path_ + ": " + strerror(errno);
        path_.clear();
        throw StorageError(err);
    }

    size_t written = 0;
    while (written < content.size()) {
        ssize_t n = write(fd, content.data() + written, content.size() - written);
        if (n < 0) {
            if (errno == EINTR) continue;
            std::string err = "cannot write " + path_ + ": " + strerror(errno);
            close(fd);
            remove();
            throw StorageError(err);
        }
        written += static_cast<size_t>(n);
    }

    if (close(fd) != 0) {
        std::string err = "cannot close " + path_ + ": " + strerror(errno);
        remove();
        throw StorageError(err);
    }
    LOG_DEBUG("[TempArtifact] Created %s (%zu bytes)", path_.c_str(), content.size());
}

TempArtifact::~TempArtifact() {
    remove();
}

void TempArtifact::remove() {
    if (path_.empty()) return;
    if (unlink(path_.c_str()) != 0 && errno != ENOENT) {
        LOG_WARN("[TempArtifact] Failed to remove %s: %s", path_.c_str(), strerror(errno));
    } else {
        LOG_DEBUG("[TempArtifact] Removed %s", path_.c_str());
    }
    path_.clear();
}

// ============================================================================
// Helpers
// ============================================================================

namespace {

const char* DEFAULT_PATH = "/usr/local/bin:/usr/bin:/bin";

// Keeps the descriptor pair closed on every exit path
struct Pipe {
    int fds[2];

    Pipe() { fds[0] = fds[1] = -1; }
    ~Pipe() { close_read(); close_write(); }

    bool open() { return pipe2(fds, O_CLOEXEC) == 0; }
    void close_read() { if (fds[0] >= 0) { close(fds[0]); fds[0] = -1; } }
    void close_write() { if (fds[1] >= 0) { close(fds[1]); fds[1] = -1; } }
};

std::vector<char*> to_c_array(const std::vector<std::string>& items) {
    std::vector<char*> out;
    out.reserve(items.size() + 1);
    for (const auto& s : items) {
        out.push_back(const_cast<char*>(s.c_str()));
    }
    out.push_back(nullptr);
    return out;
}

// Appends up to cap bytes; returns false once data had to be dropped
bool append_capped(std::string& dst, const char* data, size_t n, size_t cap) {
    if (dst.size() >= cap) return n == 0;
    size_t room = cap - dst.size();
    if (n <= room) {
        dst.append(data, n);
        return true;
    }
    dst.append(data, room);
    return false;
}

// Reads whatever is available. Returns false when the stream is finished.
bool read_available(int& fd, std::string& dst, size_t cap, bool& truncated) {
    char buffer[4096];
    for (;;) {
        ssize_t n = read(fd, buffer, sizeof(buffer));
        if (n > 0) {
            if (!append_capped(dst, buffer, static_cast<size_t>(n), cap)) {
                truncated = true;
            }
            continue;
        }
        if (n == 0) {
            close(fd);
            fd = -1;
            return false;
        }
        if (errno == EINTR) continue;
        if (errno == EAGAIN || errno == EWOULDBLOCK) return true;
        LOG_DEBUG("[ProcessRunner] read failed: %s", strerror(errno));
        close(fd);
        fd = -1;
        return false;
    }
}

void child_fail(const char* msg, int code) {
    // write(2) only: we are between fork and exec
    ssize_t ignored = write(STDERR_FILENO, msg, strlen(msg));
    (void)ignored;
    _exit(code);
}

} // anonymous namespace

// ============================================================================
// ProcessRunner
// ============================================================================

std::vector<std::string> ProcessRunner::minimal_environment() {
    std::vector<std::string> env;
    bool has_path = false;

    for (char** e = environ; e && *e; ++e) {
        std::string entry(*e);
        if (starts_with(entry, "PATH=")) {
            has_path = true;
            env.push_back(entry);
        } else if (starts_with(entry, "HOME=") || starts_with(entry, "LANG=") ||
                   starts_with(entry, "LC_")) {
            env.push_back(entry);
        }
    }
    if (!has_path) {
        env.push_back(std::string("PATH=") + DEFAULT_PATH);
    }
    env.push_back("PYTHONUNBUFFERED=1");
    env.push_back("PYTHONDONTWRITEBYTECODE=1");
    return env;
}

std::string ProcessRunner::resolve_program(const std::string& program, const std::string& search_path) {
    if (program.empty()) return "";

    auto executable = [](const std::string& candidate) {
        struct stat st;
        return stat(candidate.c_str(), &st) == 0 && S_ISREG(st.st_mode) &&
               access(candidate.c_str(), X_OK) == 0;
    };

    if (program.find('/') != std::string::npos) {
        return executable(program) ? program : "";
    }
    for (const auto& dir : split(search_path.empty() ? DEFAULT_PATH : search_path, ':')) {
        if (dir.empty()) continue;
        std::string candidate = join_path(dir, program);
        if (executable(candidate)) {
            return candidate;
        }
    }
    return "";
}

std::string ProcessRunner::format_seconds(int timeout_ms) {
    char buf[32];
    if (timeout_ms % 1000 == 0) {
        snprintf(buf, sizeof(buf), "%d", timeout_ms / 1000);
    } else {
        snprintf(buf, sizeof(buf), "%g", timeout_ms / 1000.0);
    }
    return buf;
}

RawRunResult ProcessRunner::execute(const RunSpec& spec) const {
    RawRunResult result;
    auto started = std::chrono::steady_clock::now();
    auto elapsed_ms = [&started]() {
        return static_cast<int64_t>(std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - started).count());
    };

    // ---- Everything the child needs, built before fork ----
    std::vector<std::string> env = minimal_environment();
    std::string search_path = DEFAULT_PATH;
    for (const auto& e : env) {
        if (starts_with(e, "PATH=")) search_path = e.substr(5);
    }

    std::string program = resolve_program(spec.program, search_path);
    if (program.empty()) {
        result.return_code = EXEC_FAILED_EXIT_CODE;
        result.stderr_text = "Interpreter not found: " + spec.program;
        LOG_ERROR("[ProcessRunner] %s (PATH=%s)", result.stderr_text.c_str(), search_path.c_str());
        return result;
    }

    std::vector<std::string> argv_storage;
    argv_storage.push_back(program);
    argv_storage.insert(argv_storage.end(), spec.args.begin(), spec.args.end());
    std::vector<char*> argv = to_c_array(argv_storage);
    std::vector<char*> envp = to_c_array(env);

    Pipe out_pipe, err_pipe;
    if (!out_pipe.open() || !err_pipe.open()) {
        result.return_code = 1;
        result.stderr_text = std::string("Failed to create pipes: ") + strerror(errno);
        LOG_ERROR("[ProcessRunner] %s", result.stderr_text.c_str());
        return result;
    }

    int timeout_ms = spec.timeout_ms > 0 ? spec.timeout_ms : 1;
    pid_t parent_pid = getpid();

    LOG_DEBUG("[ProcessRunner] exec %s (%zu args, timeout %d ms, mem %llu bytes, cpu %d s)",
              program.c_str(), spec.args.size(), timeout_ms,
              static_cast<unsigned long long>(spec.limits.memory_bytes), spec.limits.cpu_seconds);

    pid_t pid = fork();
    if (pid < 0) {
        result.return_code = 1;
        result.stderr_text = std::string("Failed to fork: ") + strerror(errno);
        LOG_ERROR("[ProcessRunner] %s", result.stderr_text.c_str());
        return result;
    }

    if (pid == 0) {
        // ---- Child ----
        setpgid(0, 0);
        prctl(PR_SET_PDEATHSIG, SIGKILL);
        if (getppid() != parent_pid) {
            _exit(EXEC_FAILED_EXIT_CODE);
        }

        sigset_t none;
        sigemptyset(&none);
        sigprocmask(SIG_SETMASK, &none, nullptr);
        signal(SIGPIPE, SIG_DFL);
        signal(SIGCHLD, SIG_DFL);

        int devnull = open("/dev/null", O_RDONLY);
        if (devnull < 0 || dup2(devnull, STDIN_FILENO) < 0) {
            child_fail("halbox: cannot open /dev/null\n", EXEC_FAILED_EXIT_CODE);
        }
        if (devnull != STDIN_FILENO) close(devnull);

        if (dup2(out_pipe.fds[1], STDOUT_FILENO) < 0 || dup2(err_pipe.fds[1], STDERR_FILENO) < 0) {
            _exit(EXEC_FAILED_EXIT_CODE);
        }

        if (!spec.working_dir.empty() && chdir(spec.working_dir.c_str()) != 0) {
            child_fail("halbox: cannot enter working directory\n", EXEC_FAILED_EXIT_CODE);
        }

        struct rlimit rl;
        rl.rlim_cur = rl.rlim_max = 0;
        setrlimit(RLIMIT_CORE, &rl);

        if (spec.limits.memory_bytes > 0) {
            rl.rlim_cur = rl.rlim_max = static_cast<rlim_t>(spec.limits.memory_bytes);
            if (setrlimit(RLIMIT_AS, &rl) != 0) {
                child_fail("halbox: cannot apply memory ceiling\n", EXEC_FAILED_EXIT_CODE);
            }
        }
        if (spec.limits.cpu_seconds > 0) {
            // SIGXCPU at the soft limit, SIGKILL one second later
            rl.rlim_cur = static_cast<rlim_t>(spec.limits.cpu_seconds);
            rl.rlim_max = rl.rlim_cur + 1;
            if (setrlimit(RLIMIT_CPU, &rl) != 0) {
                child_fail("halbox: cannot apply cpu ceiling\n", EXEC_FAILED_EXIT_CODE);
            }
        }

        if (spec.jail && spec.jail->is_prepared() && !spec.jail->enforce()) {
            child_fail("halbox: filesystem jail could not be enforced\n", EXEC_FAILED_EXIT_CODE);
        }

        execve(program.c_str(), argv.data(), envp.data());
        child_fail("halbox: execve failed\n", EXEC_FAILED_EXIT_CODE);
    }

    // ---- Parent ----
    // Also set from this side so kill(-pid) works even if the child hasn't run yet
    if (setpgid(pid, pid) != 0 && errno != EACCES && errno != ESRCH) {
        LOG_DEBUG("[ProcessRunner] setpgid(%d) failed: %s", static_cast<int>(pid), strerror(errno));
    }

    out_pipe.close_write();
    err_pipe.close_write();
    int out_fd = out_pipe.fds[0];
    int err_fd = err_pipe.fds[0];
    out_pipe.fds[0] = -1;
    err_pipe.fds[0] = -1;
    fcntl(out_fd, F_SETFL, fcntl(out_fd, F_GETFL) | O_NONBLOCK);
    fcntl(err_fd, F_SETFL, fcntl(err_fd, F_GETFL) | O_NONBLOCK);

    auto deadline = started + std::chrono::milliseconds(timeout_ms);
    int status = 0;
    bool exited = false;
    bool reaped = false;

    while (!exited) {
        auto now = std::chrono::steady_clock::now();
        if (now >= deadline) {
            result.timed_out = true;
            break;
        }
        int remaining = static_cast<int>(
            std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now).count());
        int wait_ms = remaining < 50 ? remaining + 1 : 50;

        struct pollfd pfds[2];
        int nfds = 0;
        if (out_fd >= 0) { pfds[nfds].fd = out_fd; pfds[nfds].events = POLLIN; pfds[nfds].revents = 0; ++nfds; }
        if (err_fd >= 0) { pfds[nfds].fd = err_fd; pfds[nfds].events = POLLIN; pfds[nfds].revents = 0; ++nfds; }

        int rc = poll(nfds > 0 ? pfds : nullptr, static_cast<nfds_t>(nfds), wait_ms);
        if (rc < 0 && errno != EINTR) {
            LOG_ERROR("[ProcessRunner] poll failed: %s", strerror(errno));
            break;
        }
        if (out_fd >= 0) read_available(out_fd, result.stdout_text, spec.max_output_bytes, result.stdout_truncated);
        if (err_fd >= 0) read_available(err_fd, result.stderr_text, spec.max_output_bytes, result.stderr_truncated);

        pid_t w = waitpid(pid, &status, WNOHANG);
        if (w == pid) {
            exited = true;
            reaped = true;
        } else if (w < 0 && errno != EINTR) {
            LOG_ERROR("[ProcessRunner] waitpid failed: %s", strerror(errno));
            break;
        }
    }

    // Kill the whole group: on timeout the child itself, otherwise any
    // background processes it left holding the pipes
    if (kill(-pid, SIGKILL) != 0 && errno != ESRCH) {
        LOG_DEBUG("[ProcessRunner] kill(-%d) failed: %s", static_cast<int>(pid), strerror(errno));
    }
    if (!exited) {
        if (kill(pid, SIGKILL) != 0 && errno != ESRCH) {
            LOG_DEBUG("[ProcessRunner] kill(%d) failed: %s", static_cast<int>(pid), strerror(errno));
        }
        for (;;) {
            if (waitpid(pid, &status, 0) == pid) {
                reaped = true;
                break;
            }
            if (errno != EINTR) {
                LOG_ERROR("[ProcessRunner] waitpid failed: %s", strerror(errno));
                break;
            }
        }
    }

    // Drain what was already written; writers are gone so this ends at EOF
    // or EAGAIN
    if (out_fd >= 0 && read_available(out_fd, result.stdout_text, spec.max_output_bytes, result.stdout_truncated)) {
        close(out_fd);
    }
    if (err_fd >= 0 && read_available(err_fd, result.stderr_text, spec.max_output_bytes, result.stderr_truncated)) {
        close(err_fd);
    }

    result.duration_ms = elapsed_ms();

    if (result.timed_out) {
        result.return_code = TIMEOUT_EXIT_CODE;
        if (!result.stderr_text.empty() && result.stderr_text.back() != '\n') {
            result.stderr_text += '\n';
        }
        result.stderr_text += "Timeout after " + format_seconds(timeout_ms) + "s";
        LOG_WARN("[ProcessRunner] pid %d killed after %d ms", static_cast<int>(pid), timeout_ms);
    } else if (!reaped) {
        // e.g. the host ignores SIGCHLD and the kernel reaped the child
        result.return_code = 1;
        if (!result.stderr_text.empty() && result.stderr_text.back() != '\n') {
            result.stderr_text += '\n';
        }
        result.stderr_text += "halbox: could not collect exit status of the child process";
        LOG_ERROR("[ProcessRunner] Exit status of pid %d was lost", static_cast<int>(pid));
    } else if (WIFEXITED(status)) {
        result.return_code = WEXITSTATUS(status);
    } else if (WIFSIGNALED(status)) {
        result.term_signal = WTERMSIG(status);
        result.return_code = 128 + result.term_signal;
        LOG_INFO("[ProcessRunner] pid %d terminated by signal %d", static_cast<int>(pid), result.term_signal);
    } else {
        result.return_code = 1;
    }

    if (result.stdout_truncated || result.stderr_truncated) {
        LOG_WARN("[ProcessRunner] Output capped at %zu bytes per stream", spec.max_output_bytes);
    }

    LOG_DEBUG("[ProcessRunner] pid %d rc=%d in %lld ms (stdout %zu, stderr %zu bytes)",
              static_cast<int>(pid), result.return_code, static_cast<long long>(result.duration_ms),
              result.stdout_text.size(), result.stderr_text.size());
    return result;
}

} // namespace halbox
