#pragma once
#include <cstdint>

#include "apps/fw/Backlight.hpp"
#include "apps/fw/DeviceRules.hpp"
#include "apps/fw/St7567Driver.hpp"
#include "apps/fw/StatusLeds.hpp"
#include "msg/DeviceState.hpp"
#include "platform/IGpio.hpp"

namespace fw {

// ---------------------------------------------------------------------------
// Single owner of msg::DeviceState. Handlers compute a candidate state plus
// effects; Commit() adopts the state and drives the hardware to match.
// ---------------------------------------------------------------------------
class DeviceController {
public:
    DeviceController(St7567Driver& lcd,
                     Backlight& backlight,
                     StatusLeds& leds,
                     platform::IGpio& gpio,
                     const msg::DeviceState& initial);

    // Apply boot state to backlight and LEDs (LEDs off).
    void Begin();

    void Commit(const msg::DeviceState& next, const EffectList& fx);

    // Health indicator: D2 when keeping up, D3 when behind.
    void ShowHealth(bool healthy);

    const msg::DeviceState& state() const { return m_state; }
    bool quitRequested() const { return m_quit; }

    St7567Driver& lcd() { return m_lcd; }

private:
    St7567Driver&    m_lcd;
    Backlight&       m_backlight;
    StatusLeds&      m_leds;
    platform::IGpio& m_gpio;

    msg::DeviceState m_state{};
    bool m_quit = false;

    void apply(const Effect& e);
    void probe(int pin, bool active_low, int ms);
};

} // namespace fw
