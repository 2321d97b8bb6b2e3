#pragma once
#include <cstdint>

#include "msg/DeviceState.hpp"
#include "msg/FrameGeometry.hpp"

namespace fw {

// ---------------------------------------------------------------------------
// Board wiring and boot-time defaults for the ST7567 handheld.
// ---------------------------------------------------------------------------
struct BoardConfig {
    // LCD SPI
    int      pin_sck  = 10;
    int      pin_mosi = 11;
    int      pin_miso = 12;       // unused by the LCD
    int      pin_cs   = 13;
    int      pin_dc   = 9;
    int      pin_rst  = 8;
    uint32_t spi_hz   = 20000000;

    // Backlight
    int      pin_backlight = 6;
    uint32_t backlight_pwm_hz = 2000;

    // Buttons (active-low, pulled up)
    int      pin_btn_up      = 7;
    int      pin_btn_down    = 0;
    int      pin_btn_ok      = 5;
    int      pin_btn_back    = 16;
    int      pin_btn_bootsel = 17;

    // Panel addressing
    msg::FrameGeometry geometry{};
    uint8_t  col_offset      = 0;
    uint8_t  line_offset     = 0;
    bool     com_reverse     = true;
    bool     segment_reverse = false;

    // Power-on state (contrast, bias, backlight, LEDs...)
    msg::DeviceState boot_state{};
};

} // namespace fw
