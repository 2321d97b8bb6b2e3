// Backlight.cpp
#include "apps/fw/Backlight.hpp"
#include "msg/DeviceState.hpp"

#include <algorithm>
#include <iostream>

namespace fw {

bool PwmBacklight::set(int level) {
    return pwm && pwm->setDutyU16(static_cast<uint16_t>(level));
}

bool DigitalBacklight::set(int level) {
    return gpio && gpio->write(pin, level > 0);
}

Backlight Backlight::Attach(platform::IPwm* pwm, platform::IGpio& gpio, int pin, uint32_t freq_hz) {
    if (pwm && pwm->init(pin, freq_hz)) {
        std::cerr << "[PWM] backlight on pin " << pin << " @ " << freq_hz << " Hz\n";
        return Backlight(PwmBacklight{pwm});
    }

    std::cerr << "[PWM] pin " << pin << " has no PWM, backlight is on/off only\n";
    (void)gpio.setMode(pin, platform::PinMode::OUTPUT);
    return Backlight(DigitalBacklight{&gpio, pin});
}

bool Backlight::set(int level) {
    m_level = std::clamp(level, 0, msg::BACKLIGHT_MAX);
    return std::visit([this](auto& impl) { return impl.set(m_level); }, m_impl);
}

} // namespace fw
