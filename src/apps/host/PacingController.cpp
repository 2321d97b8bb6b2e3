// PacingController.cpp
#include "apps/host/PacingController.hpp"

#include <algorithm>
#include <cmath>
#include <iostream>

namespace host {

static inline PacingConfig sanitise(const PacingConfig& in) {
    PacingConfig cfg = in;
    if (!(cfg.fps > 0.0f) || !std::isfinite(cfg.fps)) cfg.fps = 15.0f;
    if (!cfg.now_us)         cfg.now_us = &Rtos::NowUs;
    if (!cfg.sleep_until_us) cfg.sleep_until_us = &Rtos::SleepUntilUs;
    if (!cfg.realtime)       cfg.drop_frames = false;   // nothing to catch up with
    return cfg;
}

PacingController::PacingController(IFrameSource& source,
                                   imgproc::ImageProcessor& processor,
                                   SerialLink& link,
                                   imgproc::ProcessingConfig& proc_cfg,
                                   const PacingConfig& cfg,
                                   ControlChannel* control)
: m_source(source)
, m_proc(processor)
, m_link(link)
, m_proc_cfg(proc_cfg)
, m_cfg(sanitise(cfg))
, m_control(control) {
    m_raw.resize(m_proc.geometry().rawBytes());
    m_packed.bytes.reserve(m_proc.geometry().packedBytes());
    m_progress_every = static_cast<uint32_t>(std::max(1.0f, m_cfg.fps * 5.0f));
}

PacingController::Status PacingController::Tick() {
    // ---- control channel ----
    if (m_control) {
        (void)m_control->DrainHost(m_proc_cfg);
        if (!m_control->DrainDevice(m_link)) return Status::TRANSPORT_FAIL;
    }

    // ---- catch-up ----
    if (m_cfg.realtime && m_cfg.drop_frames && !catchUp()) {
        return Status::END_OF_STREAM;
    }

    // ---- next frame ----
    if (!m_source.ReadFrame(m_raw.data(), m_raw.size())) return Status::END_OF_STREAM;

    msg::RawFrame raw{};
    raw.data        = m_raw.data();
    raw.size        = m_raw.size();
    raw.geometry    = m_proc.geometry();
    raw.frame_index = m_frame_index;
    ++m_frame_index;

    if (!m_proc.Process(raw, m_proc_cfg, m_packed)) {
        std::cerr << "[STREAM] frame " << raw.frame_index << " not processed: "
                  << imgproc::ImageProcessor::StatusStr(m_proc.lastStatus()) << "\n";
        return Status::SHAPE_FAIL;
    }

    // ---- send ----
    if (!m_started) {
        if (m_cfg.on_first_frame) m_cfg.on_first_frame(m_cfg.hook_ctx);
        m_start_us = m_cfg.now_us();
        m_started = true;
    }

    if (!m_link.SendFrame(m_packed)) {
        std::cerr << "[STREAM] send failed: " << SerialLink::StatusStr(m_link.lastStatus()) << "\n";
        return m_link.lastStatus() == SerialLink::Status::SHAPE_MISMATCH ? Status::SHAPE_FAIL
                                                                        : Status::TRANSPORT_FAIL;
    }
    ++m_sent;

    // ---- pace ----
    if (m_cfg.realtime) {
        const uint64_t due = m_start_us +
            static_cast<uint64_t>(double(m_frame_index) * 1e6 / double(m_cfg.fps));
        if (due > m_cfg.now_us()) m_cfg.sleep_until_us(due);
    }

    if (m_sent % m_progress_every == 0) {
        std::cerr << "[STREAM] frames sent: " << m_sent << " (dropped: " << m_dropped << ")\n";
    }

    if (m_cfg.max_frames && m_sent >= m_cfg.max_frames) return Status::LIMIT_REACHED;
    return Status::FRAME_SENT;
}

PacingController::Status PacingController::Run() {
    Status st;
    do { st = Tick(); } while (st == Status::FRAME_SENT);
    return st;
}

// -------------------- private helpers --------------------

bool PacingController::catchUp() {
    if (!m_started) return true;   // no baseline yet

    const uint64_t now = m_cfg.now_us();
    const uint64_t elapsed = now > m_start_us ? now - m_start_us : 0;
    const int64_t should_have = static_cast<int64_t>(double(elapsed) * double(m_cfg.fps) / 1e6);
    const int64_t behind = should_have - static_cast<int64_t>(m_frame_index);
    if (behind <= 1) return true;

    // Keep one frame to send, never skip more than ~2 s of video at once.
    const int64_t cap  = static_cast<int64_t>(m_cfg.fps * 2.0f);
    const int64_t drop = std::min(behind - 1, cap);

    for (int64_t i = 0; i < drop; ++i) {
        if (!m_source.ReadFrame(m_raw.data(), m_raw.size())) return false;
        ++m_frame_index;
        ++m_dropped;
    }
    return true;
}

const char* PacingController::StatusStr(PacingController::Status s) {
    switch (s) {
        case PacingController::Status::FRAME_SENT:     return "FRAME_SENT";
        case PacingController::Status::END_OF_STREAM:  return "END_OF_STREAM";
        case PacingController::Status::LIMIT_REACHED:  return "LIMIT_REACHED";
        case PacingController::Status::SHAPE_FAIL:     return "SHAPE_FAIL";
        case PacingController::Status::TRANSPORT_FAIL: return "TRANSPORT_FAIL";
        default:                                       return "UNKNOWN";
    }
}

} // namespace host
