// ChildProcess.cpp
#include "apps/host/ChildProcess.hpp"
#include "os/rtos.hpp"

#include <fcntl.h>
#include <signal.h>
#include <sys/stat.h>
#include <sys/wait.h>
#include <unistd.h>
#include <errno.h>
#include <string.h>

#include <cstdlib>
#include <iostream>

namespace {

static void closeFd(int& fd) {
    if (fd >= 0) {
        ::close(fd);
        fd = -1;
    }
}

// Wire one child stdio slot according to the requested mode.
static void redirectChild(host::ChildProcess::Stdio mode, int pipe_write_end, int target_fd) {
    switch (mode) {
        case host::ChildProcess::Stdio::PIPE:
            ::dup2(pipe_write_end, target_fd);
            break;
        case host::ChildProcess::Stdio::DEVNULL: {
            const int fd = ::open("/dev/null", O_WRONLY);
            if (fd >= 0) {
                ::dup2(fd, target_fd);
                ::close(fd);
            }
            break;
        }
        case host::ChildProcess::Stdio::INHERIT:
        default:
            break;
    }
}

} // anonymous namespace

namespace host {

ChildProcess::~ChildProcess() {
    if (m_pid > 0) (void)Terminate();
    closePipes();
}

bool ChildProcess::Spawn(const std::vector<std::string>& argv, Stdio out, Stdio err) {
    if (m_pid > 0) return fail(Status::ALREADY_RUNNING);
    if (argv.empty()) return fail(Status::BAD_ARGS);

    m_status = Status::OK;
    m_errno  = 0;
    m_exit_code = -1;
    m_stopped_by_us = false;

    int out_pipe[2] = {-1, -1};
    int err_pipe[2] = {-1, -1};
    int exec_pipe[2] = {-1, -1};   // child reports exec errno here; EOF = exec ok

    if ((out == Stdio::PIPE && ::pipe2(out_pipe, O_CLOEXEC) != 0) ||
        (err == Stdio::PIPE && ::pipe2(err_pipe, O_CLOEXEC) != 0) ||
        ::pipe2(exec_pipe, O_CLOEXEC) != 0) {
        fail(Status::PIPE_FAIL);
        for (int fd : {out_pipe[0], out_pipe[1], err_pipe[0], err_pipe[1], exec_pipe[0], exec_pipe[1]}) {
            if (fd >= 0) ::close(fd);
        }
        return false;
    }

    // Build argv before fork; nothing but async-signal-safe calls after it.
    std::vector<char*> cargv;
    cargv.reserve(argv.size() + 1);
    for (const auto& a : argv) cargv.push_back(const_cast<char*>(a.c_str()));
    cargv.push_back(nullptr);

    const pid_t pid = ::fork();
    if (pid < 0) {
        fail(Status::FORK_FAIL);
        for (int fd : {out_pipe[0], out_pipe[1], err_pipe[0], err_pipe[1], exec_pipe[0], exec_pipe[1]}) {
            if (fd >= 0) ::close(fd);
        }
        return false;
    }

    if (pid == 0) {
        // child
        redirectChild(out, out_pipe[1], STDOUT_FILENO);
        redirectChild(err, err_pipe[1], STDERR_FILENO);
        ::execvp(cargv[0], cargv.data());

        const int e = errno;
        (void)!::write(exec_pipe[1], &e, sizeof(e));
        ::_exit(127);
    }

    // parent
    ::close(exec_pipe[1]);
    if (out_pipe[1] >= 0) ::close(out_pipe[1]);
    if (err_pipe[1] >= 0) ::close(err_pipe[1]);
    m_out_fd = out_pipe[0];
    m_err_fd = err_pipe[0];
    m_pid = pid;

    int child_errno = 0;
    ssize_t n;
    do { n = ::read(exec_pipe[0], &child_errno, sizeof(child_errno)); }
    while (n < 0 && errno == EINTR);
    ::close(exec_pipe[0]);

    if (n == static_cast<ssize_t>(sizeof(child_errno))) {
        (void)reap(true);
        m_pid = -1;
        closePipes();
        errno = child_errno;
        std::cerr << "[DECODER] exec " << argv[0] << " failed: " << ::strerror(child_errno) << "\n";
        return fail(Status::EXEC_FAIL);
    }
    return true;
}

bool ChildProcess::ReadExact(uint8_t* dst, std::size_t n, std::size_t& got) {
    got = 0;
    if (m_out_fd < 0) return fail(Status::NOT_RUNNING);

    while (got < n) {
        const ssize_t r = ::read(m_out_fd, dst + got, n - got);
        if (r > 0) {
            got += static_cast<std::size_t>(r);
            continue;
        }
        if (r == 0) return false;              // EOF: end of stream
        if (errno == EINTR) continue;
        return fail(Status::READ_FAIL);
    }
    return true;
}

std::string ChildProcess::DrainStderr() {
    std::string text;
    if (m_err_fd < 0) return text;

    char buf[1024];
    while (true) {
        const ssize_t r = ::read(m_err_fd, buf, sizeof(buf));
        if (r > 0) { text.append(buf, static_cast<std::size_t>(r)); continue; }
        if (r < 0 && errno == EINTR) continue;
        break;
    }
    return text;
}

bool ChildProcess::Running() {
    if (m_pid <= 0) return false;
    return !reap(false);
}

int ChildProcess::Terminate(int grace_ms) {
    if (m_pid <= 0) return m_exit_code;

    if (reap(false)) return m_exit_code;   // already gone on its own

    m_stopped_by_us = true;
    (void)::kill(m_pid, SIGTERM);

    const uint32_t deadline = Rtos::NowMs() + static_cast<uint32_t>(grace_ms > 0 ? grace_ms : 0);
    while (static_cast<int32_t>(deadline - Rtos::NowMs()) > 0) {
        if (reap(false)) return m_exit_code;
        Rtos::SleepMs(10);
    }

    std::cerr << "[DECODER] pid " << m_pid << " ignored SIGTERM, killing\n";
    (void)::kill(m_pid, SIGKILL);
    (void)reap(true);
    return m_exit_code;
}

bool ChildProcess::FindInPath(const std::string& exe) {
    if (exe.empty()) return false;
    if (exe.find('/') != std::string::npos) return ::access(exe.c_str(), X_OK) == 0;

    const char* path = std::getenv("PATH");
    if (!path) return false;

    const std::string p(path);
    std::size_t start = 0;
    while (start <= p.size()) {
        std::size_t end = p.find(':', start);
        if (end == std::string::npos) end = p.size();

        std::string dir = p.substr(start, end - start);
        if (dir.empty()) dir = ".";
        const std::string full = dir + "/" + exe;

        struct stat st{};
        if (::stat(full.c_str(), &st) == 0 && S_ISREG(st.st_mode) && ::access(full.c_str(), X_OK) == 0) {
            return true;
        }
        start = end + 1;
    }
    return false;
}

// -------------------- private helpers --------------------

// Collect the child if it has exited. True once reaped.
bool ChildProcess::reap(bool block) {
    if (m_pid <= 0) return true;

    int status = 0;
    pid_t r;
    do { r = ::waitpid(m_pid, &status, block ? 0 : WNOHANG); }
    while (r < 0 && errno == EINTR);

    if (r == 0) return false;   // still running
    if (r < 0) {
        m_pid = -1;
        return true;
    }

    if (m_stopped_by_us) {
        m_exit_code = 0;   // whatever it reports on SIGTERM is our doing
    } else if (WIFEXITED(status)) {
        m_exit_code = WEXITSTATUS(status);
    } else if (WIFSIGNALED(status)) {
        m_exit_code = 128 + WTERMSIG(status);
    }
    m_pid = -1;
    return true;
}

void ChildProcess::closePipes() {
    closeFd(m_out_fd);
    closeFd(m_err_fd);
}

// FDIR

bool ChildProcess::fail(Status s) {
    m_status = s;

    switch (s) {
        case Status::PIPE_FAIL:
        case Status::FORK_FAIL:
        case Status::EXEC_FAIL:
        case Status::READ_FAIL:
            m_errno = errno;
            break;

        default:
            m_errno = 0;   // logic failure
            break;
    }
    return false;
}

const char* ChildProcess::StatusStr(ChildProcess::Status s) {
    switch (s) {
        case ChildProcess::Status::OK:              return "OK";
        case ChildProcess::Status::PIPE_FAIL:       return "PIPE_FAIL";
        case ChildProcess::Status::FORK_FAIL:       return "FORK_FAIL";
        case ChildProcess::Status::EXEC_FAIL:       return "EXEC_FAIL";
        case ChildProcess::Status::READ_FAIL:       return "READ_FAIL";
        case ChildProcess::Status::ALREADY_RUNNING: return "ALREADY_RUNNING";
        case ChildProcess::Status::NOT_RUNNING:     return "NOT_RUNNING";
        case ChildProcess::Status::BAD_ARGS:        return "BAD_ARGS";
        default:                                    return "UNKNOWN";
    }
}

} // namespace host
