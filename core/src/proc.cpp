#include "gauntlet/proc.h"

#include <algorithm>
#include <cerrno>
#include <chrono>
#include <csignal>
#include <cstdlib>
#include <cstring>
#include <mutex>

#include <unistd.h>
#include <fcntl.h>
#include <poll.h>
#include <sys/stat.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <sys/resource.h>
#ifdef __linux__
  #include <sys/prctl.h>
#endif

namespace gauntlet {

std::vector<std::string> split_argv_quoted(const std::string& cmd) {
    std::vector<std::string> out;
    std::string cur;
    enum { NORM, SQ, DQ } st = NORM;
    bool esc = false;
    bool have_token = false;

    auto flush = [&]() {
        if (have_token) {
            out.push_back(cur);
            cur.clear();
            have_token = false;
        }
    };

    for (size_t i = 0; i < cmd.size(); i++) {
        char c = cmd[i];
        if (st == NORM) {
            if (c == ' ' || c == '\t' || c == '\n' || c == '\r') {
                flush();
                continue;
            }
            have_token = true;
            if (c == '\'') { st = SQ; continue; }
            if (c == '"') { st = DQ; esc = false; continue; }
            cur.push_back(c);
        } else if (st == SQ) {
            if (c == '\'') { st = NORM; continue; }
            cur.push_back(c);
        } else { // DQ
            if (esc) {
                cur.push_back(c);
                esc = false;
                continue;
            }
            if (c == '\\') { esc = true; continue; }
            if (c == '"') { st = NORM; continue; }
            cur.push_back(c);
        }
    }
    if (st != NORM) return {};
    flush();
    return out;
}

static void set_rlimit(int resource, rlim_t soft, rlim_t hard) {
    struct rlimit rl;
    rl.rlim_cur = soft;
    rl.rlim_max = hard;
    (void)setrlimit(resource, &rl);
}

static void set_nonblocking(int fd) {
    int flags = fcntl(fd, F_GETFL, 0);
    if (flags >= 0) (void)fcntl(fd, F_SETFL, flags | O_NONBLOCK);
}

static void close_fd(int& fd) {
    if (fd >= 0) {
        close(fd);
        fd = -1;
    }
}

// A child that exits without draining stdin must not take the runner down.
static void ignore_sigpipe_once() {
    static std::once_flag once;
    std::call_once(once, [] { (void)std::signal(SIGPIPE, SIG_IGN); });
}

// Child side of proc_run_capture. Never returns.
[[noreturn]] static void exec_child(const std::vector<std::string>& argv,
                                    const std::string& cwd,
                                    const EnvOverlay& env,
                                    const ProcLimits& lim,
                                    int in_fd, int out_fd, int err_fd, int status_fd) {
    auto report_and_exit = [status_fd](int e) {
        ssize_t n = write(status_fd, &e, sizeof(e));
        (void)n;
        _exit(127);
    };

    (void)dup2(in_fd, STDIN_FILENO);
    (void)dup2(out_fd, STDOUT_FILENO);
    (void)dup2(err_fd, STDERR_FILENO);

    // isolate process group so timeout can kill the whole subtree
    (void)setpgid(0, 0);

    // close inherited fds beyond stdin/stdout/stderr, keep the exec status pipe
    long maxfd = sysconf(_SC_OPEN_MAX);
    if (maxfd < 256) maxfd = 256;
    if (maxfd > 65536) maxfd = 65536;
    for (int fd = 3; fd < maxfd; fd++) {
        if (fd != status_fd) (void)close(fd);
    }

    if (!cwd.empty() && chdir(cwd.c_str()) != 0) {
        report_and_exit(errno);
    }

    for (const auto& kv : env) {
        (void)setenv(kv.first.c_str(), kv.second.c_str(), 1);
    }

#ifdef __linux__
    if (lim.no_new_privs) {
        (void)prctl(PR_SET_NO_NEW_PRIVS, 1, 0, 0, 0);
    }
    (void)prctl(PR_SET_PDEATHSIG, SIGKILL);
#endif

    if (lim.rlimit_cpu_sec > 0) {
        set_rlimit(RLIMIT_CPU, (rlim_t)lim.rlimit_cpu_sec, (rlim_t)lim.rlimit_cpu_sec);
    }
    if (lim.rlimit_as_mb > 0) {
        rlim_t bytes = (rlim_t)lim.rlimit_as_mb * 1024ULL * 1024ULL;
        set_rlimit(RLIMIT_AS, bytes, bytes);
    }
    if (lim.rlimit_fsize_mb > 0) {
        rlim_t bytes = (rlim_t)lim.rlimit_fsize_mb * 1024ULL * 1024ULL;
        set_rlimit(RLIMIT_FSIZE, bytes, bytes);
    }
    if (lim.rlimit_nofile > 0) {
        set_rlimit(RLIMIT_NOFILE, (rlim_t)lim.rlimit_nofile, (rlim_t)lim.rlimit_nofile);
    }
#ifdef RLIMIT_NPROC
    if (lim.rlimit_nproc > 0) {
        set_rlimit(RLIMIT_NPROC, (rlim_t)lim.rlimit_nproc, (rlim_t)lim.rlimit_nproc);
    }
#endif

    (void)signal(SIGPIPE, SIG_DFL);

    std::vector<char*> cargv;
    cargv.reserve(argv.size() + 1);
    for (const auto& s : argv) cargv.push_back(const_cast<char*>(s.c_str()));
    cargv.push_back(nullptr);

    execvp(cargv[0], cargv.data());
    report_and_exit(errno);
    _exit(127);
}

bool proc_run_capture(const std::vector<std::string>& argv,
                      const std::string& cwd,
                      const std::string& stdin_data,
                      const EnvOverlay& env,
                      const ProcLimits& lim,
                      ProcResult* res) {
    if (!res) return false;
    *res = ProcResult{};

    if (argv.empty() || argv[0].empty()) {
        res->error = "empty argv";
        return false;
    }

    ignore_sigpipe_once();

    // in/out/err data pipes plus a close-on-exec status pipe that carries the
    // errno of a failed chdir/execvp back to the parent.
    int in_pipe[2] = {-1, -1};
    int out_pipe[2] = {-1, -1};
    int err_pipe[2] = {-1, -1};
    int st_pipe[2] = {-1, -1};
    auto close_all = [&]() {
        close_fd(in_pipe[0]); close_fd(in_pipe[1]);
        close_fd(out_pipe[0]); close_fd(out_pipe[1]);
        close_fd(err_pipe[0]); close_fd(err_pipe[1]);
        close_fd(st_pipe[0]); close_fd(st_pipe[1]);
    };

    if (pipe2(in_pipe, O_CLOEXEC) != 0 || pipe2(out_pipe, O_CLOEXEC) != 0 ||
        pipe2(err_pipe, O_CLOEXEC) != 0 || pipe2(st_pipe, O_CLOEXEC) != 0) {
        res->error = std::string("pipe failed: ") + std::strerror(errno);
        close_all();
        return false;
    }

    auto start = std::chrono::steady_clock::now();
    auto elapsed_ms = [&start]() {
        return (int)std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - start).count();
    };

    pid_t pid = fork();
    if (pid < 0) {
        res->error = std::string("fork failed: ") + std::strerror(errno);
        close_all();
        return false;
    }

    if (pid == 0) {
        exec_child(argv, cwd, env, lim, in_pipe[0], out_pipe[1], err_pipe[1], st_pipe[1]);
    }

    // parent
    (void)setpgid(pid, pid);
    close_fd(in_pipe[0]);
    close_fd(out_pipe[1]);
    close_fd(err_pipe[1]);
    close_fd(st_pipe[1]);

    // EOF on the status pipe means execvp succeeded (CLOEXEC closed it).
    int child_errno = 0;
    {
        ssize_t n;
        do {
            n = read(st_pipe[0], &child_errno, sizeof(child_errno));
        } while (n < 0 && errno == EINTR);
        if (n != (ssize_t)sizeof(child_errno)) child_errno = 0;
        close_fd(st_pipe[0]);
    }
    if (child_errno != 0) {
        int status = 0;
        (void)waitpid(pid, &status, 0);
        close_all();
        res->elapsed_ms = elapsed_ms();
        res->error = "cannot execute '" + argv[0] + "': " + std::strerror(child_errno);
        return false;
    }
    res->launched = true;

    int in_fd = in_pipe[1];
    in_pipe[1] = -1;
    if (stdin_data.empty()) {
        close_fd(in_fd);
    } else {
        set_nonblocking(in_fd);
    }
    set_nonblocking(out_pipe[0]);
    set_nonblocking(err_pipe[0]);
    size_t write_off = 0;

    auto append_capped = [](std::string& dst, size_t cap, bool& truncated, const char* buf, ssize_t n) {
        size_t can = cap > dst.size() ? (cap - dst.size()) : 0;
        if (can > 0) {
            size_t take = (size_t)n;
            if (take > can) { take = can; truncated = true; }
            dst.append(buf, buf + take);
        } else {
            truncated = true;
        }
    };

    // Drains one read end; returns false once it reached EOF.
    auto drain = [&](int fd, bool is_out) -> bool {
        char buf[4096];
        while (true) {
            ssize_t n = read(fd, buf, sizeof(buf));
            if (n > 0) {
                if (is_out) append_capped(res->out, lim.stdout_max_bytes, res->stdout_truncated, buf, n);
                else append_capped(res->err, lim.stderr_max_bytes, res->stderr_truncated, buf, n);
                continue;
            }
            if (n == 0) return false;
            if (errno == EINTR) continue;
            if (errno == EAGAIN || errno == EWOULDBLOCK) return true;
            return false;
        }
    };

    bool out_open = true;
    bool err_open = true;
    bool child_exited = false;
    int status = 0;

    while (true) {
        struct pollfd fds[3];
        int nfds = 0;
        int in_idx = -1, out_idx = -1, err_idx = -1;
        if (in_fd >= 0) {
            in_idx = nfds;
            fds[nfds].fd = in_fd;
            fds[nfds].events = POLLOUT;
            fds[nfds].revents = 0;
            nfds++;
        }
        if (out_open) {
            out_idx = nfds;
            fds[nfds].fd = out_pipe[0];
            fds[nfds].events = POLLIN;
            fds[nfds].revents = 0;
            nfds++;
        }
        if (err_open) {
            err_idx = nfds;
            fds[nfds].fd = err_pipe[0];
            fds[nfds].events = POLLIN;
            fds[nfds].revents = 0;
            nfds++;
        }

        int slice = 50;
        if (lim.timeout_ms > 0) {
            int remaining = lim.timeout_ms - elapsed_ms();
            if (remaining <= 0) {
                res->timed_out = true;
                // kill process group first, then the direct pid
                (void)kill(-pid, SIGKILL);
                (void)kill(pid, SIGKILL);
                (void)waitpid(pid, &status, 0);
                child_exited = true;
                break;
            }
            if (remaining < slice) slice = remaining;
        }

        int pr = poll(nfds > 0 ? fds : nullptr, (nfds_t)nfds, slice);
        if (pr < 0 && errno != EINTR) {
            res->error = std::string("poll failed: ") + std::strerror(errno);
        }

        if (pr > 0) {
            if (in_idx >= 0 && (fds[in_idx].revents & (POLLOUT | POLLERR | POLLHUP))) {
                while (write_off < stdin_data.size()) {
                    ssize_t n = write(in_fd, stdin_data.data() + write_off, stdin_data.size() - write_off);
                    if (n > 0) { write_off += (size_t)n; continue; }
                    if (n == -1 && errno == EINTR) continue;
                    if (n == -1 && (errno == EAGAIN || errno == EWOULDBLOCK)) break;
                    write_off = stdin_data.size(); // EPIPE: child stopped reading
                    break;
                }
                if (write_off >= stdin_data.size()) close_fd(in_fd);
            }
            if (out_idx >= 0 && (fds[out_idx].revents & (POLLIN | POLLERR | POLLHUP))) {
                out_open = drain(out_pipe[0], true);
            }
            if (err_idx >= 0 && (fds[err_idx].revents & (POLLIN | POLLERR | POLLHUP))) {
                err_open = drain(err_pipe[0], false);
            }
        }

        pid_t w = waitpid(pid, &status, WNOHANG);
        if (w == pid) {
            child_exited = true;
            break;
        }
    }

    close_fd(in_fd);

    // Collect whatever the child wrote before it exited.
    if (out_open) (void)drain(out_pipe[0], true);
    if (err_open) (void)drain(err_pipe[0], false);
    close_all();

    res->elapsed_ms = elapsed_ms();
    if (!child_exited) {
        res->exit_code = 128;
        res->error = "child did not exit";
        return true;
    }

    if (WIFEXITED(status)) res->exit_code = WEXITSTATUS(status);
    else if (WIFSIGNALED(status)) res->exit_code = 128 + WTERMSIG(status);
    else res->exit_code = 128;

    return true;
}

} // namespace gauntlet
