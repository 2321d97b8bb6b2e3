#pragma once
#include <cstdint>
#include <cstddef>
#include <string>
#include <vector>

#include <sys/types.h>

namespace host {

// ---------------------------------------------------------------------------
// ChildProcess: fork/exec with optional stdout/stderr pipes.
// Teardown is terminate -> wait up to a grace period -> kill.
// ---------------------------------------------------------------------------
class ChildProcess {
public:
    enum class Stdio : uint8_t {
        INHERIT = 0,
        PIPE,
        DEVNULL,
    };

    static constexpr int TERMINATE_GRACE_MS = 2000;

    ChildProcess() = default;
    ~ChildProcess();

    ChildProcess(const ChildProcess&) = delete;
    ChildProcess& operator=(const ChildProcess&) = delete;

    // argv[0] is looked up in PATH.
    bool Spawn(const std::vector<std::string>& argv, Stdio out, Stdio err);

    // Read exactly n bytes from the child's stdout. False on EOF or error
    // before n bytes; `got` reports how many arrived.
    bool ReadExact(uint8_t* dst, std::size_t n, std::size_t& got);

    // Everything left on the child's stderr pipe (blocks until EOF).
    std::string DrainStderr();

    bool Running();

    // Ask the child to stop, escalate to SIGKILL after grace_ms.
    // Returns the exit code (see exitCode()).
    int Terminate(int grace_ms = TERMINATE_GRACE_MS);

    // Exit status, 128+signal for a signalled child, 0 if we stopped it
    // ourselves, -1 while unknown.
    int exitCode() const { return m_exit_code; }
    pid_t pid() const { return m_pid; }

    // True if `exe` resolves to an executable through PATH.
    static bool FindInPath(const std::string& exe);

    enum class Status : uint8_t {
        OK = 0,
        // SYSCALL FAILS
        PIPE_FAIL,
        FORK_FAIL,
        EXEC_FAIL,
        READ_FAIL,

        // LOGIC FAILS
        ALREADY_RUNNING,
        NOT_RUNNING,
        BAD_ARGS,
    };

    static const char* StatusStr(Status s);

    Status lastStatus() const { return m_status; }
    int    lastErrno()  const { return m_errno; }

private:
    pid_t m_pid = -1;
    int   m_out_fd = -1;
    int   m_err_fd = -1;
    int   m_exit_code = -1;
    bool  m_stopped_by_us = false;

    Status m_status = Status::OK;
    int    m_errno  = 0;

    bool reap(bool block);
    void closePipes();
    bool fail(Status s);
};

} // namespace host
