#pragma once
#include <array>
#include <cstdint>

#include "msg/DeviceState.hpp"
#include "platform/IGpio.hpp"

namespace fw {

enum class LedSlot : uint8_t {
    D2 = 0,   // healthy
    D3 = 1,   // behind
};

// Two status LEDs sharing one polarity. A slot bound to msg::PIN_NONE is
// silently ignored.
class StatusLeds {
public:
    explicit StatusLeds(platform::IGpio& gpio) : m_gpio(gpio) {}

    // Configure `pin` as an output for `slot` and switch it off.
    void bind(LedSlot slot, int pin, bool active_low);

    void set(LedSlot slot, bool on);

    // Takes effect on the next write; current levels are left alone.
    void setActiveLow(bool active_low) { m_active_low = active_low; }

    // on -> sleep ms -> off
    void flash(LedSlot slot, int ms);

    // Level written for `on` under the given polarity.
    static bool levelFor(bool on, bool active_low) { return on != active_low; }

    int  pin(LedSlot slot) const { return m_pins[idx(slot)]; }
    bool activeLow() const { return m_active_low; }

private:
    static std::size_t idx(LedSlot s) { return static_cast<std::size_t>(s); }

    platform::IGpio& m_gpio;
    std::array<int, 2> m_pins{{msg::PIN_NONE, msg::PIN_NONE}};
    bool m_active_low = true;
};

} // namespace fw
