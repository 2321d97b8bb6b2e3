// DeviceApp.cpp
#include "apps/fw/DeviceApp.hpp"
#include "os/rtos.hpp"

#include <iostream>

namespace fw {

static inline DeviceAppConfig sanitise(const DeviceAppConfig& in) {
    DeviceAppConfig cfg = in;
    if (cfg.poll_timeout_ms < 1)  cfg.poll_timeout_ms = 1;
    if (cfg.poll_timeout_ms > 50) cfg.poll_timeout_ms = 50;
    if (cfg.boot_flash_ms < 0)    cfg.boot_flash_ms = 0;
    return cfg;
}

DeviceApp::DeviceApp(platform::ISerialPort& port,
                     DeviceController& ctl,
                     CommandInterpreter& interp,
                     FeedbackLoop& feedback,
                     const DeviceAppConfig& cfg)
: m_port(port)
, m_ctl(ctl)
, m_interp(interp)
, m_feedback(feedback)
, m_cfg(sanitise(cfg)) {
    m_line.reserve(2048);
}

bool DeviceApp::Boot() {
    m_status = Status::OK;

    m_ctl.Begin();
    m_feedback.Begin(Rtos::NowMs());

    const msg::DeviceState& st = m_ctl.state();
    St7567Driver& lcd = m_ctl.lcd();

    if (!lcd.Init(st.contrast, st.reg_ratio, st.bias_1_7, st.invert)) {
        return stop(Status::LCD_INIT_FAIL);
    }

    // Visible sign of life before the first frame arrives.
    if (!lcd.Fill(true)) return stop(Status::LCD_INIT_FAIL);
    Rtos::SleepMs(m_cfg.boot_flash_ms);
    if (!lcd.Fill(false)) return stop(Status::LCD_INIT_FAIL);

    std::cerr << "[FW] ready: " << lcd.geometry().width << "x" << lcd.geometry().height
              << " contrast=" << st.contrast << " backlight=" << st.backlight << "\n";
    return true;
}

bool DeviceApp::Step() {
    m_feedback.Service(Rtos::NowMs());

    const platform::ReadResult r = m_port.readLine(m_line, m_cfg.poll_timeout_ms);
    switch (r) {
        case platform::ReadResult::LINE:
            break;

        case platform::ReadResult::TIMEOUT:
            return true;

        case platform::ReadResult::CLOSED:
            if (m_cfg.exit_on_eof) return stop(Status::INPUT_CLOSED);
            if (!m_eof_logged) {
                std::cerr << "[SERIAL] input closed, waiting for commands\n";
                m_eof_logged = true;
            }
            // Nothing will arrive; keep the panel controls alive without spinning.
            Rtos::SleepMs(m_cfg.poll_timeout_ms);
            return true;

        case platform::ReadResult::ERROR:
        default:
            return stop(Status::INPUT_FAIL);
    }

    m_outcome = m_interp.HandleLine(m_line, m_frame);
    switch (m_outcome) {
        case CommandInterpreter::Outcome::FRAME:
            if (m_ctl.lcd().Show(m_frame)) {
                ++m_frames;
                m_feedback.FrameRendered();
            } else {
                std::cerr << "[LCD] show failed: "
                          << St7567Driver::StatusStr(m_ctl.lcd().lastStatus()) << "\n";
            }
            break;

        case CommandInterpreter::Outcome::QUIT:
            return stop(Status::QUIT);

        default:
            break;
    }
    return true;
}

// FDIR

bool DeviceApp::stop(Status s) {
    m_status = s;
    return false;
}

const char* DeviceApp::StatusStr(DeviceApp::Status s) {
    switch (s) {
        case DeviceApp::Status::OK:            return "OK";
        case DeviceApp::Status::LCD_INIT_FAIL: return "LCD_INIT_FAIL";
        case DeviceApp::Status::QUIT:          return "QUIT";
        case DeviceApp::Status::INPUT_CLOSED:  return "INPUT_CLOSED";
        case DeviceApp::Status::INPUT_FAIL:    return "INPUT_FAIL";
        default:                               return "UNKNOWN";
    }
}

} // namespace fw
