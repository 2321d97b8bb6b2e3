#pragma once
#include <cstdint>
#include <string>

#include "apps/fw/CommandInterpreter.hpp"
#include "apps/fw/DeviceController.hpp"
#include "apps/fw/FeedbackLoop.hpp"
#include "msg/PackedFrame.hpp"
#include "platform/ISerialPort.hpp"

namespace fw {

struct DeviceAppConfig {
    int  poll_timeout_ms = 20;     // max time one iteration waits for a line
    int  boot_flash_ms   = 150;    // full-panel fill shown at boot
    bool exit_on_eof     = false;  // stop when the input side hangs up
};

// ---------------------------------------------------------------------------
// Cooperative firmware loop. Each Step():
//   buttons/health -> one line (bounded wait) -> command or frame -> render
// ---------------------------------------------------------------------------
class DeviceApp {
public:
    DeviceApp(platform::ISerialPort& port,
              DeviceController& ctl,
              CommandInterpreter& interp,
              FeedbackLoop& feedback,
              const DeviceAppConfig& cfg);

    // Backlight and LEDs, buttons, panel init, boot flash.
    bool Boot();

    // One loop iteration. False once the loop should end (see lastStatus()).
    bool Step();

    const msg::PackedFrame& lastFrame() const { return m_frame; }
    uint32_t framesRendered() const { return m_frames; }
    // What the interpreter made of the most recent line (IDLE before any).
    CommandInterpreter::Outcome lastOutcome() const { return m_outcome; }

    enum class Status : uint8_t {
        OK = 0,
        LCD_INIT_FAIL,
        QUIT,            // quit/exit command
        INPUT_CLOSED,    // peer hung up with exit_on_eof set
        INPUT_FAIL,
    };

    static const char* StatusStr(Status s);
    Status lastStatus() const { return m_status; }

private:
    platform::ISerialPort& m_port;
    DeviceController&      m_ctl;
    CommandInterpreter&    m_interp;
    FeedbackLoop&          m_feedback;
    DeviceAppConfig        m_cfg{};

    std::string      m_line;
    msg::PackedFrame m_frame;
    uint32_t         m_frames = 0;
    bool             m_eof_logged = false;
    CommandInterpreter::Outcome m_outcome = CommandInterpreter::Outcome::IDLE;

    Status m_status = Status::OK;

    bool stop(Status s);
};

} // namespace fw
