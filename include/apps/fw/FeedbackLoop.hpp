#pragma once
#include <array>
#include <cstdint>

#include "apps/fw/BoardConfig.hpp"
#include "apps/fw/DeviceController.hpp"
#include "platform/IGpio.hpp"

namespace fw {

// ---------------------------------------------------------------------------
// Polled front-panel buttons and the frame-rate health LEDs.
//
//   UP / DOWN     contrast +1 / -1
//   BACK / BOOT   backlight -step / +step
//   OK            toggle invert
//   OK + UP/DOWN  regulation ratio +1 / -1
//   OK + BACK     toggle bias 1/7 <-> 1/9
//
// Buttons are active-low and act on the released -> pressed edge only.
// ---------------------------------------------------------------------------
class FeedbackLoop {
public:
    static constexpr uint32_t SCAN_PERIOD_MS   = 60;
    static constexpr uint32_t HEALTH_PERIOD_MS = 1000;
    static constexpr int      FPS_SLACK        = 3;

    FeedbackLoop(DeviceController& ctl, platform::IGpio& gpio, const BoardConfig& board);

    // Configure button inputs and start both timers at now_ms.
    void Begin(uint32_t now_ms);

    // Run whichever of the button scan / health check is due.
    void Service(uint32_t now_ms);

    // Call once per frame actually shown on the panel.
    void FrameRendered() { ++m_frames_window; }

    uint32_t framesInWindow() const { return m_frames_window; }
    bool     healthy() const { return m_healthy; }

private:
    enum Button : uint8_t { UP = 0, DOWN, OK, BACK, BOOTSEL, BUTTON_COUNT };

    DeviceController& m_ctl;
    platform::IGpio&  m_gpio;

    std::array<int, BUTTON_COUNT>  m_pins{};
    std::array<bool, BUTTON_COUNT> m_prev{};   // last sampled level, true = released

    uint32_t m_btn_last_ms    = 0;
    uint32_t m_health_last_ms = 0;
    uint32_t m_frames_window  = 0;
    bool     m_healthy        = false;

    void scanButtons();
    void onPress(Button b);
    void checkHealth();

    bool pressed(Button b) { return !m_gpio.read(m_pins[b]); }
};

} // namespace fw
