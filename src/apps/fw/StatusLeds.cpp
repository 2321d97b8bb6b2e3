// StatusLeds.cpp
#include "apps/fw/StatusLeds.hpp"
#include "os/rtos.hpp"

namespace fw {

void StatusLeds::bind(LedSlot slot, int pin, bool active_low) {
    m_active_low = active_low;
    m_pins[idx(slot)] = pin < 0 ? msg::PIN_NONE : pin;
    if (pin < 0) return;

    (void)m_gpio.setMode(pin, platform::PinMode::OUTPUT);
    set(slot, false);
}

void StatusLeds::set(LedSlot slot, bool on) {
    const int pin = m_pins[idx(slot)];
    if (pin < 0) return;
    (void)m_gpio.write(pin, levelFor(on, m_active_low));
}

void StatusLeds::flash(LedSlot slot, int ms) {
    if (m_pins[idx(slot)] < 0) return;
    set(slot, true);
    Rtos::SleepMs(ms);
    set(slot, false);
}

} // namespace fw
