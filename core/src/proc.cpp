#include "gauntlet/proc.h"

#include <algorithm>
#include <cerrno>
#include <chrono>
#include <csignal>
#include <cstdlib>
#include <cstring>

#ifndef _WIN32
  #include <unistd.h>
  #include <fcntl.h>
  #include <sys/stat.h>
  #include <sys/types.h>
  #include <sys/wait.h>
  #include <poll.h>
  #ifdef __linux__
    #include <sys/prctl.h>
  #endif
#endif

namespace gauntlet {

std::vector<std::string> split_argv_quoted(const std::string& cmd) {
    std::vector<std::string> out;
    std::string cur;
    enum { NORM, SQ, DQ } st = NORM;
    bool esc = false;

    auto flush = [&]() {
        if (!cur.empty()) {
            out.push_back(cur);
            cur.clear();
        }
    };

    for (size_t i = 0; i < cmd.size(); i++) {
        char c = cmd[i];
        if (st == NORM) {
            if (c == ' ' || c == '\t' || c == '\n' || c == '\r') {
                flush();
                continue;
            }
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

#ifndef _WIN32

namespace {

void set_nonblock(int fd) {
    int flags = fcntl(fd, F_GETFL, 0);
    if (flags >= 0) (void)fcntl(fd, F_SETFL, flags | O_NONBLOCK);
}

void append_capped(std::string& out, const char* buf, size_t n, size_t cap, bool& truncated) {
    size_t can = cap > out.size() ? (cap - out.size()) : 0;
    if (can == 0) { truncated = true; return; }
    size_t take = n;
    if (take > can) { take = can; truncated = true; }
    out.append(buf, buf + take);
}

// Read whatever is available. Returns true once EOF (or a hard error) is seen.
bool drain_fd(int fd, std::string& out, size_t cap, bool& truncated) {
    char buf[4096];
    while (true) {
        ssize_t n = read(fd, buf, sizeof(buf));
        if (n > 0) { append_capped(out, buf, (size_t)n, cap, truncated); continue; }
        if (n == 0) return true;
        if (errno == EINTR) continue;
        if (errno == EAGAIN || errno == EWOULDBLOCK) return false;
        return true;
    }
}

void kill_group(pid_t pid, int* status) {
    // process group first (the child called setpgid), then the direct pid
    (void)kill(-pid, SIGKILL);
    (void)kill(pid, SIGKILL);
    (void)waitpid(pid, status, 0);
}

void close_pair(int p[2]) {
    if (p[0] >= 0) close(p[0]);
    if (p[1] >= 0) close(p[1]);
}

bool run_impl(const std::vector<std::string>& argv,
              const std::string& cwd,
              const std::string* stdin_data,
              const ProcLimits& lim,
              ProcResult* res) {
    if (argv.empty() || argv[0].empty()) {
        res->error = "empty argv";
        return false;
    }

    int out_pipe[2] = {-1, -1};
    int err_pipe[2] = {-1, -1};
    int in_pipe[2] = {-1, -1};

    if (pipe(out_pipe) != 0) {
        res->error = std::string("pipe(out) failed: ") + std::strerror(errno);
        return false;
    }
    if (!lim.merge_stderr && pipe(err_pipe) != 0) {
        close_pair(out_pipe);
        res->error = std::string("pipe(err) failed: ") + std::strerror(errno);
        return false;
    }
    if (stdin_data && pipe(in_pipe) != 0) {
        close_pair(out_pipe);
        close_pair(err_pipe);
        res->error = std::string("pipe(in) failed: ") + std::strerror(errno);
        return false;
    }

    pid_t pid = fork();
    if (pid < 0) {
        close_pair(out_pipe);
        close_pair(err_pipe);
        close_pair(in_pipe);
        res->error = std::string("fork failed: ") + std::strerror(errno);
        return false;
    }

    if (pid == 0) {
        // child
        if (stdin_data) {
            (void)dup2(in_pipe[0], STDIN_FILENO);
        } else {
            int devnull = open("/dev/null", O_RDONLY);
            if (devnull >= 0) (void)dup2(devnull, STDIN_FILENO);
        }
        (void)dup2(out_pipe[1], STDOUT_FILENO);
        (void)dup2(lim.merge_stderr ? out_pipe[1] : err_pipe[1], STDERR_FILENO);

        // isolate process group so timeout/cancel can kill the whole subtree
        (void)setpgid(0, 0);

        long maxfd = sysconf(_SC_OPEN_MAX);
        if (maxfd < 256) maxfd = 256;
        for (int fd = 3; fd < maxfd; fd++) {
            (void)close(fd);
        }

        if (!cwd.empty() && chdir(cwd.c_str()) != 0) {
            _exit(126);
        }

        unsetenv("LD_PRELOAD");
        unsetenv("LD_LIBRARY_PATH");

#ifdef __linux__
        if (lim.no_new_privs) {
            (void)prctl(PR_SET_NO_NEW_PRIVS, 1, 0, 0, 0);
        }
        (void)prctl(PR_SET_PDEATHSIG, SIGKILL);
#endif

        std::vector<char*> cargv;
        cargv.reserve(argv.size() + 1);
        for (const auto& s : argv) cargv.push_back(const_cast<char*>(s.c_str()));
        cargv.push_back(nullptr);

        execvp(cargv[0], cargv.data());
        _exit(127);
    }

    // parent
    (void)setpgid(pid, pid);
    close(out_pipe[1]);
    if (err_pipe[1] >= 0) close(err_pipe[1]);
    if (in_pipe[0] >= 0) close(in_pipe[0]);

    int out_fd = out_pipe[0];
    int err_fd = err_pipe[0];
    int in_fd = in_pipe[1];
    set_nonblock(out_fd);
    if (err_fd >= 0) set_nonblock(err_fd);
    if (in_fd >= 0) {
        if (stdin_data->empty()) {
            close(in_fd);
            in_fd = -1;
        } else {
            set_nonblock(in_fd);
        }
    }
    size_t write_off = 0;

    auto start = std::chrono::steady_clock::now();
    std::string out, err;
    out.reserve(std::min<size_t>(lim.stdout_max_bytes, 64 * 1024));
    bool out_open = true;
    bool err_open = err_fd >= 0;

    bool child_exited = false;
    int status = 0;

    while (true) {
        if (lim.cancel_flag && lim.cancel_flag->load()) {
            res->cancelled = true;
            kill_group(pid, &status);
            child_exited = true;
            break;
        }

        int elapsed_ms = (int)std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - start).count();
        int slice = 50;
        if (lim.timeout_ms > 0) {
            int remaining = lim.timeout_ms - elapsed_ms;
            if (remaining <= 0) {
                res->timed_out = true;
                kill_group(pid, &status);
                child_exited = true;
                break;
            }
            if (remaining < slice) slice = remaining;
        }

        struct pollfd fds[3];
        nfds_t nfds = 0;
        int in_idx = -1, out_idx = -1, err_idx = -1;
        if (in_fd >= 0) {
            in_idx = (int)nfds;
            fds[nfds].fd = in_fd; fds[nfds].events = POLLOUT; fds[nfds].revents = 0; nfds++;
        }
        if (out_open) {
            out_idx = (int)nfds;
            fds[nfds].fd = out_fd; fds[nfds].events = POLLIN; fds[nfds].revents = 0; nfds++;
        }
        if (err_open) {
            err_idx = (int)nfds;
            fds[nfds].fd = err_fd; fds[nfds].events = POLLIN; fds[nfds].revents = 0; nfds++;
        }

        int pr = poll(nfds ? fds : nullptr, nfds, slice);
        if (pr < 0 && errno == EINTR) continue;

        if (in_idx >= 0 && (fds[in_idx].revents & (POLLOUT | POLLERR | POLLHUP))) {
            while (write_off < stdin_data->size()) {
                ssize_t n = write(in_fd, stdin_data->data() + write_off, stdin_data->size() - write_off);
                if (n > 0) { write_off += (size_t)n; continue; }
                if (n == -1 && errno == EINTR) continue;
                if (n == -1 && (errno == EAGAIN || errno == EWOULDBLOCK)) break;
                write_off = stdin_data->size(); // reader went away: stop writing
                break;
            }
            if (write_off >= stdin_data->size()) {
                close(in_fd);
                in_fd = -1;
            }
        }
        if (out_idx >= 0 && (fds[out_idx].revents & (POLLIN | POLLERR | POLLHUP))) {
            if (drain_fd(out_fd, out, lim.stdout_max_bytes, res->output_truncated)) out_open = false;
        }
        if (err_idx >= 0 && (fds[err_idx].revents & (POLLIN | POLLERR | POLLHUP))) {
            if (drain_fd(err_fd, err, lim.stderr_max_bytes, res->output_truncated)) err_open = false;
        }

        pid_t w = waitpid(pid, &status, WNOHANG);
        if (w == pid) {
            child_exited = true;
            break;
        }
    }

    if (in_fd >= 0) close(in_fd);

    // drain what the child left in the pipes; grandchildren holding the
    // write end open must not keep us here, so no blocking reads
    (void)drain_fd(out_fd, out, lim.stdout_max_bytes, res->output_truncated);
    if (err_fd >= 0) (void)drain_fd(err_fd, err, lim.stderr_max_bytes, res->output_truncated);
    close(out_fd);
    if (err_fd >= 0) close(err_fd);

    res->output = std::move(out);
    res->err_output = std::move(err);
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

} // namespace

#endif

bool proc_run_capture(const std::vector<std::string>& argv,
                      const std::string& cwd,
                      const ProcLimits& lim,
                      ProcResult* res) {
    if (!res) return false;
    *res = ProcResult{};
#ifdef _WIN32
    (void)argv; (void)cwd; (void)lim;
    res->error = "proc_run_capture: not supported on Windows";
    return false;
#else
    return run_impl(argv, cwd, nullptr, lim, res);
#endif
}

bool proc_run_capture_stdin(const std::vector<std::string>& argv,
                            const std::string& cwd,
                            const std::string& stdin_data,
                            const ProcLimits& lim,
                            ProcResult* res) {
    if (!res) return false;
    *res = ProcResult{};
#ifdef _WIN32
    (void)argv; (void)cwd; (void)stdin_data; (void)lim;
    res->error = "proc_run_capture_stdin: not supported on Windows";
    return false;
#else
    return run_impl(argv, cwd, &stdin_data, lim, res);
#endif
}

} // namespace gauntlet
