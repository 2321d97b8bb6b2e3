#pragma once
#include <cstdint>
#include <vector>

#include "msg/DeviceState.hpp"

namespace fw {

// Hardware side effect requested by a state update. Applied in order by
// DeviceController::Commit() after the new state has been adopted.
enum class EffectType : uint8_t {
    SET_CONTRAST = 0,   // a = contrast
    SET_REG_RATIO,      // a = ratio
    SET_BIAS,           // a = 1 for 1/7
    SET_INVERT,         // a = 0/1
    SET_BACKLIGHT,      // a = duty
    BIND_LED,           // a = LedSlot, b = pin (PIN_NONE disables); flashes once
    SET_LED_POLARITY,   // a = active_low
    PROBE_PIN,          // a = pin, b = active_low, c = pulse ms
    QUIT,
};

struct Effect {
    EffectType type;
    int a = 0;
    int b = 0;
    int c = 0;
};

using EffectList = std::vector<Effect>;

// Button steps and pulse limits
static constexpr int BACKLIGHT_STEP   = 4000;
static constexpr int LED_FLASH_MS     = 80;
static constexpr int PROBE_DEFAULT_MS = 120;
static constexpr int PROBE_MIN_MS     = 10;
static constexpr int PROBE_MAX_MS     = 2000;

// ---- state update rules ----
// Each rule clamps its input, writes `next` and appends the matching effect.
// Shared by the command interpreter and the button loop.
void setContrast(msg::DeviceState& next, int v, EffectList& fx);
void setRegRatio(msg::DeviceState& next, int v, EffectList& fx);
void setBias(msg::DeviceState& next, bool bias_1_7, EffectList& fx);
void setInvert(msg::DeviceState& next, bool invert, EffectList& fx);
void setBacklight(msg::DeviceState& next, int duty, EffectList& fx);

} // namespace fw
