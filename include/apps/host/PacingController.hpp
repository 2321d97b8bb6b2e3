#pragma once
#include <cstdint>
#include <vector>

#include "apps/host/ControlChannel.hpp"
#include "apps/host/FrameSource.hpp"
#include "apps/host/SerialLink.hpp"
#include "apps/imgproc/ImageProcessor.hpp"
#include "msg/PackedFrame.hpp"
#include "os/rtos.hpp"

namespace host {

struct PacingConfig {
    float    fps         = 15.0f;
    bool     realtime    = true;    // false: send as fast as possible
    bool     drop_frames = false;   // skip input to catch up (realtime only)
    uint32_t max_frames  = 0;       // 0 = until end of stream

    // Clock, replaceable for tests.
    uint64_t (*now_us)() = &Rtos::NowUs;
    void     (*sleep_until_us)(uint64_t deadline_us) = &Rtos::SleepUntilUs;

    // Called right before the first frame is written (preview launch).
    void (*on_first_frame)(void* ctx) = nullptr;
    void* hook_ctx = nullptr;
};

// ---------------------------------------------------------------------------
// Real-time frame scheduler.
//
// Per tick: drain control queues -> optional catch-up drop -> read one raw
// frame -> process -> send -> sleep until start + index/fps.
// The schedule starts when the first frame is written, not at construction.
// ---------------------------------------------------------------------------
class PacingController {
public:
    enum class Status : uint8_t {
        FRAME_SENT = 0,   // keep going
        END_OF_STREAM,
        LIMIT_REACHED,
        SHAPE_FAIL,       // fatal
        TRANSPORT_FAIL,   // fatal
    };

    PacingController(IFrameSource& source,
                     imgproc::ImageProcessor& processor,
                     SerialLink& link,
                     imgproc::ProcessingConfig& proc_cfg,
                     const PacingConfig& cfg,
                     ControlChannel* control = nullptr);

    Status Tick();

    // Tick until anything but FRAME_SENT.
    Status Run();

    uint32_t frameIndex()    const { return m_frame_index; }
    uint32_t framesSent()    const { return m_sent; }
    uint32_t framesDropped() const { return m_dropped; }
    bool     started()       const { return m_started; }
    uint64_t startUs()       const { return m_start_us; }

    static const char* StatusStr(Status s);
    static bool IsFatal(Status s) { return s == Status::SHAPE_FAIL || s == Status::TRANSPORT_FAIL; }

private:
    IFrameSource&              m_source;
    imgproc::ImageProcessor&   m_proc;
    SerialLink&                m_link;
    imgproc::ProcessingConfig& m_proc_cfg;
    PacingConfig               m_cfg{};
    ControlChannel*            m_control = nullptr;

    std::vector<uint8_t> m_raw;
    msg::PackedFrame     m_packed;

    bool     m_started     = false;
    uint64_t m_start_us    = 0;
    uint32_t m_frame_index = 0;   // raw frames consumed (sent + dropped)
    uint32_t m_sent        = 0;
    uint32_t m_dropped     = 0;
    uint32_t m_progress_every = 1;

    // False on end of stream during the catch-up skip.
    bool catchUp();
};

} // namespace host
