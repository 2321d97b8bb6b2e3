#pragma once
#include <cstdint>
#include <variant>

#include "platform/IGpio.hpp"
#include "platform/IPwm.hpp"

namespace fw {

// Backlight on a PWM-capable pin: level is the 16-bit duty.
struct PwmBacklight {
    platform::IPwm* pwm = nullptr;
    bool set(int level);
};

// Fallback for pins without PWM: on for any level > 0.
struct DigitalBacklight {
    platform::IGpio* gpio = nullptr;
    int pin = -1;
    bool set(int level);
};

// ---------------------------------------------------------------------------
// Backlight output, PWM when the pin supports it and plain on/off otherwise.
// The variant is chosen once at boot.
// ---------------------------------------------------------------------------
class Backlight {
public:
    // Try PWM at freq_hz on `pin`; fall back to a digital output.
    static Backlight Attach(platform::IPwm* pwm, platform::IGpio& gpio, int pin, uint32_t freq_hz);

    // 0..65535; out-of-range values are clamped.
    bool set(int level);

    bool isPwm() const { return std::holds_alternative<PwmBacklight>(m_impl); }
    int  level() const { return m_level; }

private:
    explicit Backlight(std::variant<PwmBacklight, DigitalBacklight> impl) : m_impl(impl) {}

    std::variant<PwmBacklight, DigitalBacklight> m_impl;
    int m_level = 0;
};

} // namespace fw
