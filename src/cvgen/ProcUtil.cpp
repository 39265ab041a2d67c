#include "cvgen/ProcUtil.hpp"

#include <cerrno>
#include <csignal>
#include <cstring>
#include <thread>

#include <fcntl.h>
#include <poll.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

namespace cvgen::procutil {

using Clock = std::chrono::steady_clock;

static void close_fd(int& fd) {
    if (fd >= 0) {
        ::close(fd);
        fd = -1;
    }
}

static int decode_status(int status) {
    if (WIFEXITED(status)) return WEXITSTATUS(status);
    if (WIFSIGNALED(status)) return 128 + WTERMSIG(status);
    return -1;
}

static void kill_group(pid_t pid) {
    if (::kill(-pid, SIGKILL) != 0) ::kill(pid, SIGKILL);
}

// Appends whatever is readable right now. Returns false at EOF or on error.
static bool drain(int fd, std::string& out) {
    char buf[4096];
    while (true) {
        const ssize_t n = ::read(fd, buf, sizeof(buf));
        if (n > 0) {
            out.append(buf, buf + n);
            continue;
        }
        if (n == 0) return false;
        if (errno == EINTR) continue;
        return errno == EAGAIN || errno == EWOULDBLOCK;
    }
}

ProcResult run_capture_output(const std::vector<std::string>& argv, std::chrono::milliseconds timeout) {
    ProcResult res;

    if (argv.empty()) {
        res.error = "empty command";
        return res;
    }

    int out_pipe[2] = {-1, -1};
    int err_pipe[2] = {-1, -1};  // reports exec failure; closed by exec on success

    if (::pipe(out_pipe) != 0) {
        res.error = std::string("pipe failed: ") + std::strerror(errno);
        return res;
    }
    if (::pipe(err_pipe) != 0) {
        res.error = std::string("pipe failed: ") + std::strerror(errno);
        close_fd(out_pipe[0]);
        close_fd(out_pipe[1]);
        return res;
    }
    ::fcntl(err_pipe[1], F_SETFD, FD_CLOEXEC);

    std::vector<char*> cargv;
    cargv.reserve(argv.size() + 1);
    for (const auto& a : argv) cargv.push_back(const_cast<char*>(a.c_str()));
    cargv.push_back(nullptr);

    const pid_t pid = ::fork();
    if (pid < 0) {
        res.error = std::string("fork failed: ") + std::strerror(errno);
        close_fd(out_pipe[0]);
        close_fd(out_pipe[1]);
        close_fd(err_pipe[0]);
        close_fd(err_pipe[1]);
        return res;
    }

    if (pid == 0) {
        // Child: only async-signal-safe calls from here on.
        // Own process group, so a timeout reaches anything the command spawns.
        ::setpgid(0, 0);
        ::close(out_pipe[0]);
        ::close(err_pipe[0]);
        ::dup2(out_pipe[1], STDOUT_FILENO);
        ::dup2(out_pipe[1], STDERR_FILENO);
        ::close(out_pipe[1]);

        const int devnull = ::open("/dev/null", O_RDONLY);
        if (devnull >= 0) {
            ::dup2(devnull, STDIN_FILENO);
            ::close(devnull);
        }

        ::execvp(cargv[0], cargv.data());

        const int e = errno;
        ssize_t ignored = ::write(err_pipe[1], &e, sizeof(e));
        (void)ignored;
        ::_exit(127);
    }

    // Also set from the parent so the group exists before any kill below.
    // EACCES here means the child already exec'd after doing it itself.
    ::setpgid(pid, pid);

    close_fd(out_pipe[1]);
    close_fd(err_pipe[1]);

    int exec_errno = 0;
    ssize_t n;
    do {
        n = ::read(err_pipe[0], &exec_errno, sizeof(exec_errno));
    } while (n < 0 && errno == EINTR);
    close_fd(err_pipe[0]);

    if (n == static_cast<ssize_t>(sizeof(exec_errno))) {
        int status = 0;
        ::waitpid(pid, &status, 0);
        close_fd(out_pipe[0]);
        res.error = "failed to launch " + argv[0] + ": " + std::strerror(exec_errno);
        return res;
    }

    res.started = true;
    ::fcntl(out_pipe[0], F_SETFL, ::fcntl(out_pipe[0], F_GETFL) | O_NONBLOCK);

    const auto deadline = Clock::now() + timeout;
    bool eof = false;
    bool exited = false;
    int status = 0;

    while (!(eof && exited)) {
        if (!exited) {
            const pid_t r = ::waitpid(pid, &status, WNOHANG);
            if (r == pid) exited = true;
        }

        if (exited && !eof) {
            // Grandchildren may hold the pipe open; take what is there and stop.
            drain(out_pipe[0], res.output);
            break;
        }

        const auto now = Clock::now();
        if (now >= deadline) {
            kill_group(pid);
            ::waitpid(pid, &status, 0);
            if (!eof) drain(out_pipe[0], res.output);
            res.timed_out = true;
            close_fd(out_pipe[0]);
            return res;
        }

        const auto left = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now).count();
        const int wait_ms = static_cast<int>(left < 50 ? left : 50);

        if (eof) {
            std::this_thread::sleep_for(std::chrono::milliseconds(wait_ms));
            continue;
        }

        pollfd pfd{};
        pfd.fd = out_pipe[0];
        pfd.events = POLLIN;
        const int pr = ::poll(&pfd, 1, wait_ms);
        if (pr > 0) {
            if (!drain(out_pipe[0], res.output)) eof = true;
        } else if (pr < 0 && errno != EINTR) {
            eof = true;
        }
    }

    close_fd(out_pipe[0]);
    res.exit_code = decode_status(status);
    return res;
}

} // namespace cvgen::procutil
