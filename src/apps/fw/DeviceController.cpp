// DeviceController.cpp
#include "apps/fw/DeviceController.hpp"
#include "os/rtos.hpp"

#include <iostream>

namespace fw {

DeviceController::DeviceController(St7567Driver& lcd,
                                   Backlight& backlight,
                                   StatusLeds& leds,
                                   platform::IGpio& gpio,
                                   const msg::DeviceState& initial)
: m_lcd(lcd)
, m_backlight(backlight)
, m_leds(leds)
, m_gpio(gpio)
, m_state(initial) {}

void DeviceController::Begin() {
    if (!m_backlight.set(m_state.backlight)) {
        std::cerr << "[PWM] backlight write failed\n";
    }
    m_leds.bind(LedSlot::D2, m_state.led_d2_pin, m_state.led_active_low);
    m_leds.bind(LedSlot::D3, m_state.led_d3_pin, m_state.led_active_low);
}

void DeviceController::Commit(const msg::DeviceState& next, const EffectList& fx) {
    m_state = next;
    for (const Effect& e : fx) {
        apply(e);
    }
}

void DeviceController::ShowHealth(bool healthy) {
    m_leds.set(LedSlot::D2, healthy);
    m_leds.set(LedSlot::D3, !healthy);
}

// -------------------- private helpers --------------------

void DeviceController::apply(const Effect& e) {
    bool ok = true;

    switch (e.type) {
        case EffectType::SET_CONTRAST:  ok = m_lcd.setContrast(e.a);        break;
        case EffectType::SET_REG_RATIO: ok = m_lcd.setRegulationRatio(e.a); break;
        case EffectType::SET_BIAS:      ok = m_lcd.setBias(e.a != 0);       break;
        case EffectType::SET_INVERT:    ok = m_lcd.setInvert(e.a != 0);     break;
        case EffectType::SET_BACKLIGHT:
            if (!m_backlight.set(e.a)) std::cerr << "[PWM] backlight write failed\n";
            break;

        case EffectType::BIND_LED: {
            const LedSlot slot = static_cast<LedSlot>(e.a);
            m_leds.bind(slot, e.b, m_state.led_active_low);
            m_leds.flash(slot, LED_FLASH_MS);
            break;
        }

        case EffectType::SET_LED_POLARITY:
            m_leds.setActiveLow(e.a != 0);
            break;

        case EffectType::PROBE_PIN:
            probe(e.a, e.b != 0, e.c);
            break;

        case EffectType::QUIT:
            m_quit = true;
            break;
    }

    if (!ok) {
        std::cerr << "[LCD] register write failed: "
                  << St7567Driver::StatusStr(m_lcd.lastStatus()) << "\n";
    }
}

void DeviceController::probe(int pin, bool active_low, int ms) {
    if (!m_gpio.setMode(pin, platform::PinMode::OUTPUT)) {
        std::cerr << "[GPIO] probe: pin " << pin << " not usable\n";
        return;
    }
    (void)m_gpio.write(pin, StatusLeds::levelFor(true, active_low));
    Rtos::SleepMs(ms);
    (void)m_gpio.write(pin, StatusLeds::levelFor(false, active_low));
    (void)m_gpio.setMode(pin, platform::PinMode::INPUT);
}

} // namespace fw
