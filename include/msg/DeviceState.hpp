#pragma once
#include <cstdint>

namespace msg {

static constexpr int CONTRAST_MAX   = 0x3F;
static constexpr int REG_RATIO_MAX  = 7;
static constexpr int BACKLIGHT_MAX  = 65535;

// No status LED bound to a slot.
static constexpr int PIN_NONE = -1;

// Everything the firmware knows about the panel and its peripherals.
// Mutated only through fw::DeviceController::Commit().
struct DeviceState {
    int      contrast      = 0x2A;   // 0..63
    int      reg_ratio     = 3;      // 0..7
    bool     bias_1_7      = true;   // false = 1/9
    bool     invert        = false;
    int      backlight     = 25000;  // PWM duty 0..65535
    int      target_fps    = 60;

    // Status LEDs (D2 = healthy, D3 = behind). PIN_NONE disables a slot.
    int      led_d2_pin    = 2;
    int      led_d3_pin    = 3;
    bool     led_active_low = true;
};

} // namespace msg
