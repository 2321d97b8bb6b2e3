// FeedbackLoop.cpp
#include "apps/fw/FeedbackLoop.hpp"
#include "apps/fw/DeviceRules.hpp"

#include <algorithm>
#include <iostream>

namespace {

// Wrap-safe "at least period ms since last".
static bool due(uint32_t now_ms, uint32_t last_ms, uint32_t period_ms) {
    return static_cast<int32_t>(now_ms - last_ms) >= static_cast<int32_t>(period_ms);
}

} // anonymous namespace

namespace fw {

FeedbackLoop::FeedbackLoop(DeviceController& ctl, platform::IGpio& gpio, const BoardConfig& board)
: m_ctl(ctl)
, m_gpio(gpio) {
    m_pins[UP]      = board.pin_btn_up;
    m_pins[DOWN]    = board.pin_btn_down;
    m_pins[OK]      = board.pin_btn_ok;
    m_pins[BACK]    = board.pin_btn_back;
    m_pins[BOOTSEL] = board.pin_btn_bootsel;
    m_prev.fill(true);
}

void FeedbackLoop::Begin(uint32_t now_ms) {
    for (int pin : m_pins) {
        if (!m_gpio.setMode(pin, platform::PinMode::INPUT_PULLUP)) {
            std::cerr << "[BTN] pin " << pin << " unavailable\n";
        }
    }
    m_prev.fill(true);
    m_btn_last_ms    = now_ms;
    m_health_last_ms = now_ms;
    m_frames_window  = 0;
}

void FeedbackLoop::Service(uint32_t now_ms) {
    if (due(now_ms, m_btn_last_ms, SCAN_PERIOD_MS)) {
        m_btn_last_ms = now_ms;
        scanButtons();
    }
    if (due(now_ms, m_health_last_ms, HEALTH_PERIOD_MS)) {
        m_health_last_ms = now_ms;
        checkHealth();
    }
}

// -------------------- private helpers --------------------

void FeedbackLoop::scanButtons() {
    for (uint8_t i = 0; i < BUTTON_COUNT; ++i) {
        const bool level = m_gpio.read(m_pins[i]);
        if (m_prev[i] && !level) {
            onPress(static_cast<Button>(i));
        }
        m_prev[i] = level;
    }
}

void FeedbackLoop::onPress(Button b) {
    msg::DeviceState next = m_ctl.state();
    EffectList fx;

    switch (b) {
        case UP:      setContrast(next, next.contrast + 1, fx);                 break;
        case DOWN:    setContrast(next, next.contrast - 1, fx);                 break;
        case BACK:    setBacklight(next, next.backlight - BACKLIGHT_STEP, fx);  break;
        case BOOTSEL: setBacklight(next, next.backlight + BACKLIGHT_STEP, fx);  break;

        case OK:
            // Modifier: the first held partner button wins.
            if (pressed(UP))        setRegRatio(next, next.reg_ratio + 1, fx);
            else if (pressed(DOWN)) setRegRatio(next, next.reg_ratio - 1, fx);
            else if (pressed(BACK)) setBias(next, !next.bias_1_7, fx);
            else                    setInvert(next, !next.invert, fx);
            break;

        default:
            return;
    }

    m_ctl.Commit(next, fx);
}

void FeedbackLoop::checkHealth() {
    const int target = m_ctl.state().target_fps;
    const uint32_t need = static_cast<uint32_t>(std::max(1, target - FPS_SLACK));

    m_healthy = m_frames_window >= need;
    m_ctl.ShowHealth(m_healthy);
    m_frames_window = 0;
}

} // namespace fw
