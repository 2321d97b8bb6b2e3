#pragma once
#include <cstdint>

namespace platform {

// Single PWM output.
class IPwm {
public:
    // Bind to a pin and start at 0 duty. False if the pin has no PWM.
    virtual bool init(int pin, uint32_t freq_hz) = 0;
    virtual bool setDutyU16(uint16_t duty) = 0;   // 0..65535
    virtual ~IPwm() = default;
};

} // namespace platform
