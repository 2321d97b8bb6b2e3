// test/host_childprocess_test.cpp
//
// Child process plumbing with /bin/sh as the stand-in decoder, and the raw
// file frame source.

#include <stdio.h>
#include <stdlib.h>
#include <unistd.h>

#include <iostream>
#include <string>
#include <vector>

#include "apps/host/ChildProcess.hpp"
#include "apps/host/FrameSource.hpp"
#include "os/rtos.hpp"

static int g_failures = 0;

static void check(bool ok, int line, const char* what) {
    if (ok) return;
    std::cout << "  FAIL " << line << ": " << what << "\n";
    ++g_failures;
}

using host::ChildProcess;

// Poll until the child has been reaped.
static bool waitExit(ChildProcess& p, int timeout_ms) {
    for (int waited = 0; waited < timeout_ms; waited += 5) {
        if (!p.Running()) return true;
        Rtos::SleepMs(5);
    }
    return !p.Running();
}

static void testReadAndExit() {
    std::cout << "-- stdout pipe and exit code\n";
    ChildProcess p;
    check(p.Spawn({"sh", "-c", "printf abcdef; printf oops >&2; exit 3"},
                  ChildProcess::Stdio::PIPE, ChildProcess::Stdio::PIPE), __LINE__, "spawn sh printf/exit 3");
    check(p.pid() > 0, __LINE__, "p.pid() > 0");

    uint8_t buf[4] = {};
    std::size_t got = 0;
    check(p.ReadExact(buf, 4, got), __LINE__, "p.ReadExact(buf, 4, got)");
    check(got == 4, __LINE__, "got == 4");
    check(buf[0] == 'a' && buf[3] == 'd', __LINE__, "buf[0] == 'a' && buf[3] == 'd'");

    // Short read at EOF.
    check(!p.ReadExact(buf, 4, got), __LINE__, "!p.ReadExact(buf, 4, got)");
    check(got == 2, __LINE__, "got == 2");
    check(p.lastStatus() == ChildProcess::Status::OK, __LINE__, "p.lastStatus() == ChildProcess::Status::OK");

    check(p.DrainStderr() == "oops", __LINE__, "p.DrainStderr() == \"oops\"");
    check(waitExit(p, 2000), __LINE__, "waitExit(p, 2000)");
    check(p.exitCode() == 3, __LINE__, "p.exitCode() == 3");
    check(p.Terminate() == 3, __LINE__, "p.Terminate() == 3");
}

static void testExecFailure() {
    std::cout << "-- missing executable\n";
    ChildProcess p;
    check(!p.Spawn({"definitely-not-a-real-binary-4711"},
                   ChildProcess::Stdio::PIPE, ChildProcess::Stdio::DEVNULL), __LINE__, "spawn of a missing binary fails");
    check(p.lastStatus() == ChildProcess::Status::EXEC_FAIL, __LINE__, "p.lastStatus() == ChildProcess::Status::EXEC_FAIL");
    check(p.pid() < 0, __LINE__, "p.pid() < 0");

    check(!p.Spawn({}, ChildProcess::Stdio::INHERIT, ChildProcess::Stdio::INHERIT), __LINE__, "!p.Spawn({}, ChildProcess::Stdio::INHERIT, ChildProcess::Stdio::INHERIT)");
    check(p.lastStatus() == ChildProcess::Status::BAD_ARGS, __LINE__, "p.lastStatus() == ChildProcess::Status::BAD_ARGS");

    uint8_t b = 0;
    std::size_t got = 0;
    check(!p.ReadExact(&b, 1, got), __LINE__, "!p.ReadExact(&b, 1, got)");
    check(p.lastStatus() == ChildProcess::Status::NOT_RUNNING, __LINE__, "p.lastStatus() == ChildProcess::Status::NOT_RUNNING");
}

static void testTerminate() {
    std::cout << "-- terminate a running child\n";
    ChildProcess p;
    check(p.Spawn({"sleep", "10"}, ChildProcess::Stdio::DEVNULL, ChildProcess::Stdio::DEVNULL), __LINE__, "p.Spawn({\"sleep\", \"10\"}, ChildProcess::Stdio::DEVNULL, ChildProcess::Stdio::DEVNULL)");
    check(p.Running(), __LINE__, "p.Running()");

    check(!p.Spawn({"sleep", "1"}, ChildProcess::Stdio::DEVNULL, ChildProcess::Stdio::DEVNULL), __LINE__, "!p.Spawn({\"sleep\", \"1\"}, ChildProcess::Stdio::DEVNULL, ChildProcess::Stdio::DEVNULL)");
    check(p.lastStatus() == ChildProcess::Status::ALREADY_RUNNING, __LINE__, "p.lastStatus() == ChildProcess::Status::ALREADY_RUNNING");

    const uint32_t t0 = Rtos::NowMs();
    check(p.Terminate(2000) == 0, __LINE__, "p.Terminate(2000) == 0");
    check(Rtos::NowMs() - t0 < 2000, __LINE__, "Rtos::NowMs() - t0 < 2000");
    check(!p.Running(), __LINE__, "!p.Running()");

    // A child that ignores SIGTERM is killed after the grace period.
    ChildProcess stubborn;
    check(stubborn.Spawn({"sh", "-c", "trap '' TERM; sleep 10"},
                         ChildProcess::Stdio::DEVNULL, ChildProcess::Stdio::DEVNULL), __LINE__, "spawn sh ignoring TERM");
    Rtos::SleepMs(100);   // let the trap install
    check(stubborn.Terminate(100) == 0, __LINE__, "stubborn.Terminate(100) == 0");
    check(!stubborn.Running(), __LINE__, "!stubborn.Running()");
}

static void testFindInPath() {
    std::cout << "-- PATH lookup\n";
    check(ChildProcess::FindInPath("sh"), __LINE__, "ChildProcess::FindInPath(\"sh\")");
    check(ChildProcess::FindInPath("/bin/sh"), __LINE__, "ChildProcess::FindInPath(\"/bin/sh\")");
    check(!ChildProcess::FindInPath("definitely-not-a-real-binary-4711"), __LINE__, "!ChildProcess::FindInPath(\"definitely-not-a-real-binary-4711\")");
    check(!ChildProcess::FindInPath(""), __LINE__, "!ChildProcess::FindInPath(\"\")");
}

static void testRawSource() {
    std::cout << "-- raw frame file\n";
    char path[] = "/tmp/pagestream_rawXXXXXX";
    const int fd = ::mkstemp(path);
    check(fd >= 0, __LINE__, "fd >= 0");
    if (fd < 0) return;

    // Two whole frames of 8 bytes plus a partial third.
    std::vector<uint8_t> data(20);
    for (std::size_t i = 0; i < data.size(); ++i) data[i] = static_cast<uint8_t>(i);
    check(::write(fd, data.data(), data.size()) == static_cast<ssize_t>(data.size()), __LINE__, "::write(fd, data.data(), data.size()) == static_cast<ssize_t>(data.size())");
    ::close(fd);

    host::RawStreamSource src(path);
    check(src.Open(), __LINE__, "src.Open()");

    uint8_t frame[8] = {};
    check(src.ReadFrame(frame, sizeof(frame)), __LINE__, "src.ReadFrame(frame, sizeof(frame))");
    check(frame[0] == 0 && frame[7] == 7, __LINE__, "frame[0] == 0 && frame[7] == 7");
    check(src.ReadFrame(frame, sizeof(frame)), __LINE__, "src.ReadFrame(frame, sizeof(frame))");
    check(frame[0] == 8, __LINE__, "frame[0] == 8");
    check(!src.ReadFrame(frame, sizeof(frame)), __LINE__, "!src.ReadFrame(frame, sizeof(frame))");

    ::unlink(path);

    host::RawStreamSource missing("/nonexistent/dir/frames.raw");
    check(!missing.Open(), __LINE__, "!missing.Open()");
    check(missing.lastErrno() != 0, __LINE__, "missing.lastErrno() != 0");
    check(!missing.ReadFrame(frame, sizeof(frame)), __LINE__, "!missing.ReadFrame(frame, sizeof(frame))");
}

int main() {
    std::cout << "=== HOST CHILD PROCESS TEST ===\n";
    testReadAndExit();
    testExecFailure();
    testTerminate();
    testFindInPath();
    testRawSource();

    std::cout << (g_failures == 0 ? "PASS" : "FAIL") << "\n";
    return g_failures == 0 ? 0 : 1;
}
