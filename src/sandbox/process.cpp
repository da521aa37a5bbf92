/*
 * Child process runner - GLSFS
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#include <glsfs/sandbox/process.hpp>
#include <unistd.h>
#include <fcntl.h>
#include <poll.h>
#include <sys/wait.h>
#include <csignal>
#include <cerrno>
#include <algorithm>
#include <cstring>
#include <system_error>
#include <thread>

extern char **environ;

namespace glsfs {

namespace {

using Clock = std::chrono::steady_clock;

void close_fd(int& fd) { if (fd>=0) { ::close(fd); fd = -1; } }

struct Pipe {
    int fd[2] = {-1, -1};
    Pipe() {
        if (::pipe(fd)==-1) throw std::system_error(errno, std::generic_category(), "pipe");
    }
    ~Pipe() { close_fd(fd[0]); close_fd(fd[1]); }
    Pipe(const Pipe&) = delete;
    Pipe& operator=(const Pipe&) = delete;
};

void set_nonblocking(int fd) {
    int flags = fcntl(fd, F_GETFL, 0);
    if (flags!=-1) fcntl(fd, F_SETFL, flags | O_NONBLOCK);
}

int decode_status(int status) {
    if (WIFEXITED(status)) return WEXITSTATUS(status);
    if (WIFSIGNALED(status)) return 128 + WTERMSIG(status);
    return -1;
}

// Captured output beyond this is read and discarded.
constexpr std::size_t kMaxCapture = 4 * 1024 * 1024;

// Read what is available (bounded per call so a chatty child cannot starve
// the deadline check); returns false on EOF.
bool drain(int fd, std::string& into) {
    char buf[4096];
    for (int round=0; round<16; ++round) {
        ssize_t n = ::read(fd, buf, sizeof(buf));
        if (n>0) {
            if (into.size()<kMaxCapture) into.append(buf, std::min(static_cast<std::size_t>(n), kMaxCapture-into.size()));
            continue;
        }
        if (n==0) return false;
        if (errno==EINTR) continue;
        return errno==EAGAIN || errno==EWOULDBLOCK;
    }
    return true;
}

// Only async-signal-safe calls from here on: argv/envp are built before fork.
[[noreturn]] void exec_child(const ProcessRequest& req, char** argv, char** envp,
                             Pipe& out, Pipe& err, Pipe& exec_err) {
    setpgid(0, 0);
    int devnull = ::open("/dev/null", O_RDONLY);
    if (devnull>=0) { dup2(devnull, STDIN_FILENO); ::close(devnull); }
    if (dup2(out.fd[1], STDOUT_FILENO)==-1 || dup2(err.fd[1], STDERR_FILENO)==-1) _exit(127);
    ::close(out.fd[0]); ::close(out.fd[1]);
    ::close(err.fd[0]); ::close(err.fd[1]);
    ::close(exec_err.fd[0]);

    int code = 0;
    if (!req.cwd.empty() && ::chdir(req.cwd.c_str())==-1) code = errno;
    if (code==0) {
        if (envp) environ = envp;
        execvp(argv[0], argv);
        code = errno;
    }
    ssize_t ignored = ::write(exec_err.fd[1], &code, sizeof(code));
    (void)ignored;
    _exit(127);
}

} // namespace

ProcessResult run_process(const ProcessRequest& req) {
    ProcessResult res;
    if (req.argv.empty()) { res.exit_code = 127; res.stderr_text = "empty argv"; return res; }

    std::vector<char*> argv;
    argv.reserve(req.argv.size()+1);
    for (auto &a : req.argv) argv.push_back(const_cast<char*>(a.c_str()));
    argv.push_back(nullptr);
    std::vector<char*> envp;
    if (req.env) {
        for (auto &e : *req.env) envp.push_back(const_cast<char*>(e.c_str()));
        envp.push_back(nullptr);
    }

    Pipe out, err, exec_err;
    fcntl(exec_err.fd[1], F_SETFD, FD_CLOEXEC);

    pid_t pid = fork();
    if (pid<0) throw std::system_error(errno, std::generic_category(), "fork");
    if (pid==0) exec_child(req, argv.data(), req.env ? envp.data() : nullptr, out, err, exec_err);

    setpgid(pid, pid); // also set in the child; whichever runs first wins
    close_fd(out.fd[1]);
    close_fd(err.fd[1]);
    close_fd(exec_err.fd[1]);

    int exec_errno = 0;
    ssize_t n;
    do { n = ::read(exec_err.fd[0], &exec_errno, sizeof(exec_errno)); } while (n<0 && errno==EINTR);
    if (n==static_cast<ssize_t>(sizeof(exec_errno))) {
        int status = 0;
        while (waitpid(pid, &status, 0)<0 && errno==EINTR) {}
        res.exit_code = 127;
        res.stderr_text = req.argv[0] + ": " + std::strerror(exec_errno);
        return res;
    }

    set_nonblocking(out.fd[0]);
    set_nonblocking(err.fd[0]);
    const bool bounded = req.timeout.count()>0;
    const auto deadline = Clock::now() + req.timeout;
    auto remaining_ms = [&]() -> int {
        if (!bounded) return -1;
        auto left = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - Clock::now()).count();
        return left>0 ? static_cast<int>(left) : 0;
    };
    auto kill_group = [&]() {
        ::kill(-pid, SIGKILL);
        ::kill(pid, SIGKILL);
        res.timed_out = true;
    };

    bool out_open = true, err_open = true;
    while (out_open || err_open) {
        pollfd fds[2];
        nfds_t count = 0;
        if (out_open) fds[count++] = pollfd{out.fd[0], POLLIN, 0};
        if (err_open) fds[count++] = pollfd{err.fd[0], POLLIN, 0};
        int timeout = remaining_ms();
        if (bounded && timeout==0) { kill_group(); break; }
        int rc = ::poll(fds, count, timeout);
        if (rc<0) {
            if (errno==EINTR) continue;
            int err_no = errno;
            kill_group();
            int status = 0;
            while (waitpid(pid, &status, 0)<0 && errno==EINTR) {}
            throw std::system_error(err_no, std::generic_category(), "poll");
        }
        if (rc==0) continue;
        for (nfds_t i=0;i<count;++i) {
            if (!(fds[i].revents & (POLLIN | POLLHUP | POLLERR))) continue;
            if (fds[i].fd==out.fd[0]) out_open = drain(out.fd[0], res.stdout_text);
            else err_open = drain(err.fd[0], res.stderr_text);
        }
    }

    // Both streams closed (or timed out): reap, still honoring the deadline.
    int status = 0;
    for (;;) {
        pid_t r = waitpid(pid, &status, res.timed_out ? 0 : WNOHANG);
        if (r==pid) break;
        if (r<0) {
            if (errno==EINTR) continue;
            throw std::system_error(errno, std::generic_category(), "waitpid");
        }
        if (bounded && remaining_ms()==0) { kill_group(); continue; }
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }
    if (res.timed_out) {
        drain(out.fd[0], res.stdout_text);
        drain(err.fd[0], res.stderr_text);
    }
    res.exit_code = decode_status(status);
    return res;
}

} // namespace glsfs
