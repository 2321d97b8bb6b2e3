#pragma once
#include <cstdint>

namespace platform {

enum class PinMode : uint8_t {
    INPUT = 0,
    INPUT_PULLUP,
    OUTPUT,
};

// Digital pins addressed by their board GPIO number.
class IGpio {
public:
    virtual bool setMode(int pin, PinMode mode) = 0;
    virtual bool write(int pin, bool high) = 0;
    virtual bool read(int pin) = 0;           // true = high
    virtual ~IGpio() = default;
};

} // namespace platform
