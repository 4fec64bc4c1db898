#include "caproute/proc.h"

#include <algorithm>
#include <cerrno>
#include <chrono>
#include <cctype>
#include <csignal>
#include <cstdlib>
#include <cstring>

#include <fcntl.h>
#include <poll.h>
#include <sys/resource.h>
#include <sys/stat.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>
#ifdef __linux__
  #include <sys/prctl.h>
#endif

extern char** environ;

namespace caproute {

std::vector<std::string> split_argv_quoted(const std::string& cmd) {
    std::vector<std::string> out;
    std::string cur;
    bool have_token = false;
    enum { NORM, SQ, DQ } st = NORM;
    bool esc = false;

    auto flush = [&]() {
        if (have_token) {
            out.push_back(cur);
            cur.clear();
            have_token = false;
        }
    };

    for (char c : cmd) {
        if (st == NORM) {
            if (c == ' ' || c == '\t' || c == '\n' || c == '\r') {
                flush();
                continue;
            }
            if (c == '\'') { st = SQ; have_token = true; continue; }
            if (c == '"') { st = DQ; esc = false; have_token = true; continue; }
            cur.push_back(c);
            have_token = true;
        } else if (st == SQ) {
            if (c == '\'') { st = NORM; continue; }
            cur.push_back(c);
        } else {
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

static void set_rlimit(int resource, rlim_t v) {
    struct rlimit rl;
    rl.rlim_cur = v;
    rl.rlim_max = v;
    (void)setrlimit(resource, &rl);
}

static bool env_true(const char* key) {
    const char* v = std::getenv(key);
    if (!v) return false;
    std::string s = v;
    for (auto& c : s) c = (char)std::tolower((unsigned char)c);
    return s == "1" || s == "true" || s == "yes" || s == "on";
}

// Parent-side environment for the child: loader variables dropped, extras appended.
static std::vector<std::string> build_env(const std::map<std::string, std::string>& extra) {
    std::vector<std::string> out;
    for (char** e = environ; e && *e; e++) {
        std::string kv = *e;
        std::string key = kv.substr(0, kv.find('='));
        if (key == "LD_PRELOAD" || key == "LD_LIBRARY_PATH" || key == "LD_AUDIT") continue;
        if (extra.count(key)) continue;
        out.push_back(std::move(kv));
    }
    for (const auto& [k, v] : extra) out.push_back(k + "=" + v);
    return out;
}

static void kill_group(pid_t pid, int* status) {
    (void)kill(-pid, SIGKILL);
    (void)kill(pid, SIGKILL);
    (void)waitpid(pid, status, 0);
}

bool proc_run(const ProcSpec& spec, const ProcLimits& lim, ProcResult* res) {
    if (!res) return false;
    *res = ProcResult{};

    if (spec.argv.empty() || spec.argv[0].empty()) {
        res->error = "empty argv";
        return false;
    }

    // Optional operator-provided wrapper (e.g., nsjail/firejail/bwrap).
    std::vector<std::string> eff_argv = spec.argv;
    if (env_true("CAPROUTE_PROC_WRAPPER_ENABLE")) {
        if (const char* w = std::getenv("CAPROUTE_PROC_WRAPPER")) {
            auto toks = split_argv_quoted(w);
            if (!toks.empty()) eff_argv.insert(eff_argv.begin(), toks.begin(), toks.end());
        }
    }

    // Everything the child needs is prepared before fork().
    std::vector<std::string> env_strs = build_env(spec.env);
    std::vector<char*> cenv;
    cenv.reserve(env_strs.size() + 1);
    for (auto& s : env_strs) cenv.push_back(const_cast<char*>(s.c_str()));
    cenv.push_back(nullptr);
    std::vector<char*> cargv;
    cargv.reserve(eff_argv.size() + 1);
    for (const auto& s : eff_argv) cargv.push_back(const_cast<char*>(s.c_str()));
    cargv.push_back(nullptr);

    int out_pipe[2];
    if (pipe(out_pipe) != 0) {
        res->error = std::string("pipe(out) failed: ") + std::strerror(errno);
        return false;
    }
    int in_pipe[2];
    if (pipe(in_pipe) != 0) {
        close(out_pipe[0]); close(out_pipe[1]);
        res->error = std::string("pipe(in) failed: ") + std::strerror(errno);
        return false;
    }

    int flags = fcntl(out_pipe[0], F_GETFL, 0);
    if (flags >= 0) (void)fcntl(out_pipe[0], F_SETFL, flags | O_NONBLOCK);

    auto start = std::chrono::steady_clock::now();
    pid_t pid = fork();
    if (pid < 0) {
        close(out_pipe[0]); close(out_pipe[1]);
        close(in_pipe[0]); close(in_pipe[1]);
        res->error = std::string("fork failed: ") + std::strerror(errno);
        return false;
    }

    if (pid == 0) {
        // child
        (void)dup2(in_pipe[0], STDIN_FILENO);
        (void)dup2(out_pipe[1], STDOUT_FILENO);
        (void)dup2(out_pipe[1], STDERR_FILENO);
        close(out_pipe[0]); close(out_pipe[1]);
        close(in_pipe[0]); close(in_pipe[1]);

        // own process group so timeout/cancel can kill the whole subtree
        (void)setpgid(0, 0);
        (void)umask(077);

        long maxfd = sysconf(_SC_OPEN_MAX);
        if (maxfd < 256) maxfd = 256;
        for (int fd = 3; fd < maxfd; fd++) (void)close(fd);

        if (!spec.cwd.empty() && chdir(spec.cwd.c_str()) != 0) _exit(126);

#ifdef __linux__
        if (lim.no_new_privs) (void)prctl(PR_SET_NO_NEW_PRIVS, 1, 0, 0, 0);
        (void)prctl(PR_SET_PDEATHSIG, SIGKILL);
#endif
        if (lim.rlimit_cpu_sec > 0) set_rlimit(RLIMIT_CPU, (rlim_t)lim.rlimit_cpu_sec);
        if (lim.rlimit_as_mb > 0) set_rlimit(RLIMIT_AS, (rlim_t)lim.rlimit_as_mb * 1024ULL * 1024ULL);
        if (lim.rlimit_fsize_mb > 0) set_rlimit(RLIMIT_FSIZE, (rlim_t)lim.rlimit_fsize_mb * 1024ULL * 1024ULL);
        if (lim.rlimit_nofile > 0) set_rlimit(RLIMIT_NOFILE, (rlim_t)lim.rlimit_nofile);

        environ = cenv.data();
        execvp(cargv[0], cargv.data());
        _exit(127);
    }

    // parent
    (void)setpgid(pid, pid);
    close(out_pipe[1]);
    close(in_pipe[0]);

    // stdin is fed from the same poll loop that drains output so neither side can deadlock.
    int in_fd = in_pipe[1];
    if (!spec.stdin_data.empty()) {
        int fl = fcntl(in_fd, F_GETFL, 0);
        if (fl >= 0) (void)fcntl(in_fd, F_SETFL, fl | O_NONBLOCK);
    } else {
        close(in_fd);
        in_fd = -1;
    }
    size_t write_off = 0;

    std::string out;
    out.reserve(std::min<size_t>(lim.output_max_bytes, 64 * 1024));
    auto append_output = [&](const char* buf, ssize_t n) {
        size_t can = lim.output_max_bytes > out.size() ? (lim.output_max_bytes - out.size()) : 0;
        size_t take = (size_t)n;
        if (take > can) {
            take = can;
            res->output_truncated = true;
        }
        out.append(buf, buf + take);
    };
    auto drain = [&]() {
        char buf[4096];
        while (true) {
            ssize_t n = read(out_pipe[0], buf, sizeof(buf));
            if (n > 0) { append_output(buf, n); continue; }
            if (n == -1 && errno == EINTR) continue;
            break;
        }
    };

    bool child_exited = false;
    int status = 0;

    while (true) {
        const int64_t elapsed_ms = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - start).count();
        if (lim.cancel && lim.cancel->load()) {
            res->cancelled = true;
            kill_group(pid, &status);
            child_exited = true;
            break;
        }
        int slice = 50;
        if (lim.timeout_ms > 0) {
            const int64_t remaining = lim.timeout_ms - elapsed_ms;
            if (remaining <= 0) {
                res->timed_out = true;
                kill_group(pid, &status);
                child_exited = true;
                break;
            }
            if (remaining < slice) slice = (int)std::max<int64_t>(1, remaining);
        }

        struct pollfd fds[2];
        nfds_t nfds = 0;
        int in_idx = -1;
        if (in_fd >= 0) {
            in_idx = (int)nfds;
            fds[nfds].fd = in_fd;
            fds[nfds].events = POLLOUT;
            fds[nfds].revents = 0;
            nfds++;
        }
        const int out_idx = (int)nfds;
        fds[nfds].fd = out_pipe[0];
        fds[nfds].events = POLLIN;
        fds[nfds].revents = 0;
        nfds++;

        int pr = poll(fds, nfds, slice);
        if (pr < 0 && errno == EINTR) continue;

        if (in_idx >= 0 && (fds[in_idx].revents & (POLLOUT | POLLERR | POLLHUP))) {
            while (write_off < spec.stdin_data.size()) {
                ssize_t n = write(in_fd, spec.stdin_data.data() + write_off, spec.stdin_data.size() - write_off);
                if (n > 0) { write_off += (size_t)n; continue; }
                if (n == -1 && errno == EINTR) continue;
                if (n == -1 && (errno == EAGAIN || errno == EWOULDBLOCK)) break;
                write_off = spec.stdin_data.size();  // child closed stdin
                break;
            }
            if (write_off >= spec.stdin_data.size()) {
                close(in_fd);
                in_fd = -1;
            }
        }

        if (fds[out_idx].revents & (POLLIN | POLLERR | POLLHUP)) drain();

        pid_t w = waitpid(pid, &status, WNOHANG);
        if (w == pid) {
            child_exited = true;
            break;
        }
    }

    if (in_fd >= 0) close(in_fd);
    drain();
    close(out_pipe[0]);

    res->duration_ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start).count();
    res->output = std::move(out);
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

} // namespace caproute
