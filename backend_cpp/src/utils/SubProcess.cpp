#include "utils/SubProcess.hpp"

#include <algorithm>
#include <cerrno>
#include <csignal>
#include <cstring>
#include <mutex>
#include <stdexcept>

#include <fcntl.h>
#include <poll.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

namespace data_agent {

namespace {

void set_nonblocking(int fd) {
    int flags = fcntl(fd, F_GETFL, 0);
    if (flags >= 0) fcntl(fd, F_SETFL, flags | O_NONBLOCK);
}

void close_fd(int& fd) {
    if (fd >= 0) {
        ::close(fd);
        fd = -1;
    }
}

int decode_status(int status) {
    if (WIFEXITED(status)) return WEXITSTATUS(status);
    if (WIFSIGNALED(status)) return 128 + WTERMSIG(status);
    return -1;
}

// Writes to a child that already exited must come back as EPIPE instead of
// killing the whole server.
void ignore_sigpipe_once() {
    static std::once_flag flag;
    std::call_once(flag, []() { std::signal(SIGPIPE, SIG_IGN); });
}

void append_capped(ProcessResult& res, const char* buf, size_t n, size_t cap) {
    size_t room = cap > res.output.size() ? cap - res.output.size() : 0;
    if (n > room) {
        res.truncated = true;
        n = room;
    }
    res.output.append(buf, n);
}

// Reads until EAGAIN. Returns false once the write end is closed.
bool drain(int fd, ProcessResult& res, size_t cap) {
    char buf[8192];
    while (true) {
        ssize_t n = ::read(fd, buf, sizeof(buf));
        if (n > 0) {
            append_capped(res, buf, static_cast<size_t>(n), cap);
            continue;
        }
        if (n == 0) return false;
        if (errno == EINTR) continue;
        if (errno == EAGAIN || errno == EWOULDBLOCK) return true;
        return false;
    }
}

}

std::string SubProcess::describe(const std::vector<std::string>& argv) {
    std::string out;
    for (const auto& a : argv) {
        if (!out.empty()) out += ' ';
        if (a.find_first_of(" \t\n\"'") != std::string::npos) out += "'" + a + "'";
        else out += a;
    }
    return out;
}

ProcessResult SubProcess::run(const std::vector<std::string>& argv, const ProcessOptions& options) {
    if (argv.empty() || argv[0].empty()) throw std::runtime_error("SubProcess: empty argv");
    ignore_sigpipe_once();

    int out_pipe[2] = {-1, -1};
    int in_pipe[2] = {-1, -1};
    int err_pipe[2] = {-1, -1};   // exec errno reporting
    // All three are CLOEXEC so children forked by other threads never hold
    // our stdin write end open. dup2 clears the flag on the child's 0/1/2.
    if (pipe2(out_pipe, O_CLOEXEC) != 0 || pipe2(in_pipe, O_CLOEXEC) != 0 || pipe2(err_pipe, O_CLOEXEC) != 0) {
        std::string why = std::strerror(errno);
        for (int* p : {out_pipe, in_pipe, err_pipe}) { close_fd(p[0]); close_fd(p[1]); }
        throw std::runtime_error("SubProcess: pipe() failed: " + why);
    }

    std::vector<char*> cargv;
    cargv.reserve(argv.size() + 1);
    for (const auto& s : argv) cargv.push_back(const_cast<char*>(s.c_str()));
    cargv.push_back(nullptr);

    pid_t pid = fork();
    if (pid < 0) {
        std::string why = std::strerror(errno);
        for (int* p : {out_pipe, in_pipe, err_pipe}) { close_fd(p[0]); close_fd(p[1]); }
        throw std::runtime_error("SubProcess: fork() failed: " + why);
    }

    if (pid == 0) {
        setpgid(0, 0);
        dup2(in_pipe[0], STDIN_FILENO);
        dup2(out_pipe[1], STDOUT_FILENO);
        dup2(out_pipe[1], STDERR_FILENO);
        ::close(in_pipe[0]); ::close(in_pipe[1]);
        ::close(out_pipe[0]); ::close(out_pipe[1]);
        ::close(err_pipe[0]);
        std::signal(SIGPIPE, SIG_DFL);
        execvp(cargv[0], cargv.data());
        int e = errno;
        ssize_t ignored = ::write(err_pipe[1], &e, sizeof(e));
        (void)ignored;
        _exit(127);
    }

    setpgid(pid, pid);
    close_fd(in_pipe[0]);
    close_fd(out_pipe[1]);
    close_fd(err_pipe[1]);

    int exec_errno = 0;
    ssize_t got;
    do { got = ::read(err_pipe[0], &exec_errno, sizeof(exec_errno)); } while (got < 0 && errno == EINTR);
    close_fd(err_pipe[0]);
    if (got == static_cast<ssize_t>(sizeof(exec_errno))) {
        int status = 0;
        waitpid(pid, &status, 0);
        close_fd(in_pipe[1]);
        close_fd(out_pipe[0]);
        throw std::runtime_error("SubProcess: cannot exec '" + argv[0] + "': " + std::strerror(exec_errno));
    }

    int out_fd = out_pipe[0];
    int in_fd = in_pipe[1];
    set_nonblocking(out_fd);
    set_nonblocking(in_fd);
    if (options.stdin_data.empty()) close_fd(in_fd);

    ProcessResult res;
    const auto start = std::chrono::steady_clock::now();
    const bool has_timeout = options.timeout.count() > 0;
    const auto deadline = start + options.timeout;
    size_t written = 0;
    bool out_open = true;
    bool exited = false;
    int status = 0;

    while (true) {
        if (!exited) {
            pid_t w = waitpid(pid, &status, WNOHANG);
            if (w == pid) exited = true;
        }
        if (exited) {
            // Whatever the child wrote before exiting is still in the pipe.
            if (out_open) drain(out_fd, res, options.max_output_bytes);
            break;
        }

        int wait_ms = 50;
        if (has_timeout) {
            auto left = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - std::chrono::steady_clock::now());
            if (left.count() <= 0) {
                res.timed_out = true;
                kill(-pid, SIGKILL);
                kill(pid, SIGKILL);
                waitpid(pid, &status, 0);
                exited = true;
                if (out_open) drain(out_fd, res, options.max_output_bytes);
                break;
            }
            wait_ms = static_cast<int>(std::min<long long>(wait_ms, left.count()));
        }

        pollfd fds[2];
        nfds_t nfds = 0;
        int out_idx = -1, in_idx = -1;
        if (out_open) { out_idx = static_cast<int>(nfds); fds[nfds++] = {out_fd, POLLIN, 0}; }
        if (in_fd >= 0) { in_idx = static_cast<int>(nfds); fds[nfds++] = {in_fd, POLLOUT, 0}; }

        int pr = poll(nfds ? fds : nullptr, nfds, wait_ms);
        if (pr < 0) {
            if (errno == EINTR) continue;
            break;
        }

        if (out_idx >= 0 && (fds[out_idx].revents & (POLLIN | POLLHUP | POLLERR))) {
            if (!drain(out_fd, res, options.max_output_bytes)) out_open = false;
        }
        if (in_idx >= 0 && (fds[in_idx].revents & (POLLOUT | POLLERR | POLLHUP))) {
            const std::string& data = options.stdin_data;
            ssize_t n = ::write(in_fd, data.data() + written, data.size() - written);
            if (n > 0) written += static_cast<size_t>(n);
            if (written >= data.size() || (n < 0 && errno != EAGAIN && errno != EINTR)) close_fd(in_fd);
        }
    }

    close_fd(in_fd);
    close_fd(out_fd);
    if (!exited) {
        kill(-pid, SIGKILL);
        waitpid(pid, &status, 0);
    }

    res.exit_code = decode_status(status);
    if (res.timed_out) res.exit_code = 128 + SIGKILL;
    res.success = !res.timed_out && res.exit_code == 0;
    return res;
}

}
