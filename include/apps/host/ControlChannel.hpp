#pragma once
#include <atomic>
#include <cstdint>
#include <cstdio>
#include <string>

#include "apps/host/SerialLink.hpp"
#include "apps/imgproc/ImageProcessor.hpp"
#include "msg/Commands.hpp"
#include "os/rtos.hpp"

namespace host {

// ---------------------------------------------------------------------------
// Interactive control: one reader task splits stdin into
//   "@key value"  -> host queue   (ProcessingConfig edits, never sent)
//   anything else -> device queue (forwarded verbatim, "!" added if missing)
// The pacing loop drains both queues between frames, never waiting on them.
// ---------------------------------------------------------------------------
class ControlChannel {
public:
    static constexpr std::size_t QUEUE_DEPTH = 64;

    using HostQueue   = Rtos::Queue<msg::HostConfigCommand, QUEUE_DEPTH>;
    using DeviceQueue = Rtos::Queue<std::string, QUEUE_DEPTH>;

    enum class Route : uint8_t {
        IGNORED = 0,   // blank or sigil-only
        HOST,
        DEVICE,
    };

    // Reader wake-up period while idle or waiting on a full queue.
    static constexpr int POLL_MS = 50;

    explicit ControlChannel(const imgproc::ProcessingConfig& defaults);
    ~ControlChannel();

    ControlChannel(const ControlChannel&) = delete;
    ControlChannel& operator=(const ControlChannel&) = delete;

    // Spawn the reader task on `in` (stdin by default). The task reads the
    // underlying descriptor directly, so `in` must not be read elsewhere.
    bool Start(std::FILE* in = stdin);

    // Ask the reader task to finish and join it. The input stream is left
    // open. Called by the destructor.
    void Stop();

    // What the reader task does with one input line. Blocks while the
    // target queue is full, until Stop(); a line dropped that way is IGNORED.
    Route Submit(const std::string& raw);

    // Apply every queued host edit to cfg. Returns the number applied.
    std::size_t DrainHost(imgproc::ProcessingConfig& cfg);

    // Forward every queued device line. False on the first failed write.
    bool DrainDevice(SerialLink& link);

    // Name -> setter table plus "reset" and "help". Validates before
    // touching cfg; cfg is unchanged on any error.
    imgproc::ConfigStatus Apply(const msg::HostConfigCommand& cmd, imgproc::ProcessingConfig& cfg) const;

    static void PrintHelp();

    // Reader task context, passed through Rtos::Task's void*.
    struct TaskCtx {
        ControlChannel* self;
    };
    static void TaskEntry(void* arg);

    const imgproc::ProcessingConfig& defaults() const { return m_defaults; }
    bool inputClosed() const { return m_closed.load(); }
    bool readerRunning() const { return m_task.Running(); }

private:
    const imgproc::ProcessingConfig m_defaults;

    HostQueue   m_host_q;
    DeviceQueue m_device_q;

    Rtos::Task  m_task;
    std::FILE*  m_in = nullptr;
    std::atomic<bool> m_closed{false};
    std::atomic<bool> m_stop{false};

    TaskCtx m_ctx{this};

    void readerLoop();
};

} // namespace host
