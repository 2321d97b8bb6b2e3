// test/fw_st7567driver_test.cpp
//
// ST7567 driver against the simulated SPI bus: init sequence, frame
// streaming layout, control-line timing and register clamping.

#include <iostream>
#include <vector>

#include "apps/fw/St7567Driver.hpp"
#include "platform/sim/SimBoard.hpp"

static int g_failures = 0;

static void check(bool ok, int line, const char* what) {
    if (ok) return;
    std::cout << "  FAIL " << line << ": " << what << "\n";
    ++g_failures;
}

using platform::sim::SimGpio;
using platform::sim::SimSpiBus;

static void testInit() {
    std::cout << "-- init sequence\n";
    SimGpio gpio;
    fw::St7567Config cfg;
    SimSpiBus spi(gpio, cfg.cs_pin, cfg.dc_pin);
    fw::St7567Driver lcd(spi, gpio, cfg);

    check(lcd.Init(0x2A, 3, true, false), __LINE__, "lcd.Init(0x2A, 3, true, false)");

    const std::vector<uint8_t> expect = {
        0xE2, 0xAE, 0xA3, 0xA0, 0xC8, 0x40, 0x2F, 0x23, 0x81, 0x2A, 0xA6, 0xA4, 0xAF,
    };
    check(spi.commandBytes() == expect, __LINE__, "spi.commandBytes() == expect");
    check(spi.transfers().size() == expect.size(), __LINE__, "spi.transfers().size() == expect.size()");
    for (const auto& x : spi.transfers()) {
        check(!x.cs_high, __LINE__, "!x.cs_high");
        check(!x.dc_high, __LINE__, "!x.dc_high");
        check(x.bytes.size() == 1, __LINE__, "x.bytes.size() == 1");
    }

    // Control pins configured, CS released, reset line ends high.
    check(gpio.mode(cfg.cs_pin) == platform::PinMode::OUTPUT, __LINE__, "gpio.mode(cfg.cs_pin) == platform::PinMode::OUTPUT");
    check(gpio.mode(cfg.rst_pin) == platform::PinMode::OUTPUT, __LINE__, "gpio.mode(cfg.rst_pin) == platform::PinMode::OUTPUT");
    check(gpio.level(cfg.cs_pin), __LINE__, "gpio.level(cfg.cs_pin)");
    check(gpio.level(cfg.rst_pin), __LINE__, "gpio.level(cfg.rst_pin)");

    // RST pulsed low once.
    int rst_lows = 0;
    for (const auto& e : gpio.events()) {
        if (e.pin == cfg.rst_pin && !e.high) ++rst_lows;
    }
    check(rst_lows == 1, __LINE__, "rst_lows == 1");
}

static void testInitVariants() {
    std::cout << "-- init variants and clamping\n";
    SimGpio gpio;
    fw::St7567Config cfg;
    cfg.com_reverse = false;
    cfg.segment_reverse = true;
    cfg.line_offset = 90;    // clamped to 63
    SimSpiBus spi(gpio, cfg.cs_pin, cfg.dc_pin);
    fw::St7567Driver lcd(spi, gpio, cfg);

    check(lcd.Init(200, 12, false, true), __LINE__, "lcd.Init(200, 12, false, true)");
    const std::vector<uint8_t> expect = {
        0xE2, 0xAE, 0xA2, 0xA1, 0xC0, 0x7F, 0x2F, 0x27, 0x81, 0x3F, 0xA7, 0xA4, 0xAF,
    };
    check(spi.commandBytes() == expect, __LINE__, "spi.commandBytes() == expect");
}

static void testShow() {
    std::cout << "-- show streams eight pages\n";
    SimGpio gpio;
    fw::St7567Config cfg;
    SimSpiBus spi(gpio, cfg.cs_pin, cfg.dc_pin);
    fw::St7567Driver lcd(spi, gpio, cfg);

    msg::PackedFrame frame;
    frame.geometry = msg::PANEL_GEOMETRY;
    frame.bytes.resize(1024);
    for (std::size_t i = 0; i < frame.bytes.size(); ++i) frame.bytes[i] = static_cast<uint8_t>(i / 128 + 1);

    check(lcd.Show(frame), __LINE__, "lcd.Show(frame)");
    const auto& xs = spi.transfers();
    check(xs.size() == 16, __LINE__, "xs.size() == 16");

    for (uint32_t p = 0; p < 8 && xs.size() == 16; ++p) {
        const auto& c = xs[2 * p];
        const auto& d = xs[2 * p + 1];

        check(!c.cs_high && !d.cs_high, __LINE__, "!c.cs_high && !d.cs_high");
        check(!c.dc_high, __LINE__, "!c.dc_high");
        check(d.dc_high, __LINE__, "d.dc_high");

        check(c.bytes.size() == 3, __LINE__, "c.bytes.size() == 3");
        check(c.bytes[0] == (0xB0 | p), __LINE__, "c.bytes[0] == (0xB0 | p)");
        check(c.bytes[1] == 0x10, __LINE__, "c.bytes[1] == 0x10");
        check(c.bytes[2] == 0x00, __LINE__, "c.bytes[2] == 0x00");

        check(d.bytes.size() == 128, __LINE__, "d.bytes.size() == 128");
        check(d.bytes.front() == p + 1 && d.bytes.back() == p + 1, __LINE__, "d.bytes.front() == p + 1 && d.bytes.back() == p + 1");
    }

    // CS asserted once for the whole frame.
    int cs_lows = 0;
    for (const auto& e : gpio.events()) {
        if (e.pin == cfg.cs_pin && !e.high) ++cs_lows;
    }
    check(cs_lows == 1, __LINE__, "cs_lows == 1");
    check(gpio.level(cfg.cs_pin), __LINE__, "gpio.level(cfg.cs_pin)");
}

static void testShowRejectsBadSize() {
    std::cout << "-- wrong-size frame\n";
    SimGpio gpio;
    fw::St7567Config cfg;
    SimSpiBus spi(gpio, cfg.cs_pin, cfg.dc_pin);
    fw::St7567Driver lcd(spi, gpio, cfg);

    const std::vector<uint8_t> small(1000, 0xAA);
    check(!lcd.Show(small.data(), small.size()), __LINE__, "!lcd.Show(small.data(), small.size())");
    check(lcd.lastStatus() == fw::St7567Driver::Status::BAD_FRAME_SIZE, __LINE__, "lcd.lastStatus() == fw::St7567Driver::Status::BAD_FRAME_SIZE");
    check(spi.transfers().empty(), __LINE__, "spi.transfers().empty()");
    check(!lcd.Show(nullptr, 1024), __LINE__, "!lcd.Show(nullptr, 1024)");
}

static void testColumnOffset() {
    std::cout << "-- column offset\n";
    SimGpio gpio;
    fw::St7567Config cfg;
    cfg.col_offset = 200;    // clamped to 132 - 128
    SimSpiBus spi(gpio, cfg.cs_pin, cfg.dc_pin);
    fw::St7567Driver lcd(spi, gpio, cfg);

    check(lcd.Fill(true), __LINE__, "lcd.Fill(true)");
    const auto& xs = spi.transfers();
    check(xs.size() == 16, __LINE__, "xs.size() == 16");
    if (xs.size() == 16) {
        check(xs[0].bytes[1] == 0x10, __LINE__, "xs[0].bytes[1] == 0x10");
        check(xs[0].bytes[2] == 0x04, __LINE__, "xs[0].bytes[2] == 0x04");
        check(xs[1].bytes.size() == 128, __LINE__, "xs[1].bytes.size() == 128");
        check(xs[1].bytes[0] == 0xFF, __LINE__, "xs[1].bytes[0] == 0xFF");
        check(xs[15].bytes[127] == 0xFF, __LINE__, "xs[15].bytes[127] == 0xFF");
        check(xs[14].bytes[0] == 0xB7, __LINE__, "xs[14].bytes[0] == 0xB7");
    }

    // A fill is one frame: CS asserted once, released at the end.
    int cs_lows = 0;
    for (const auto& e : gpio.events()) {
        if (e.pin == cfg.cs_pin && !e.high) ++cs_lows;
    }
    check(cs_lows == 1, __LINE__, "cs_lows == 1");
    check(gpio.level(cfg.cs_pin), __LINE__, "gpio.level(cfg.cs_pin)");

    spi.clear();
    gpio.clearEvents();
    check(lcd.Fill(false), __LINE__, "lcd.Fill(false)");
    check(spi.transfers().size() == 16, __LINE__, "spi.transfers().size() == 16");
    for (const auto& x : spi.transfers()) check(!x.cs_high, __LINE__, "!x.cs_high");
    if (spi.transfers().size() == 16) check(spi.transfers()[15].bytes[0] == 0x00, __LINE__, "spi.transfers()[15].bytes[0] == 0x00");
}

static void testSetters() {
    std::cout << "-- runtime setters clamp\n";
    SimGpio gpio;
    fw::St7567Config cfg;
    SimSpiBus spi(gpio, cfg.cs_pin, cfg.dc_pin);
    fw::St7567Driver lcd(spi, gpio, cfg);

    check(lcd.setContrast(100), __LINE__, "lcd.setContrast(100)");
    check(lcd.setContrast(-3), __LINE__, "lcd.setContrast(-3)");
    check(lcd.setRegulationRatio(9), __LINE__, "lcd.setRegulationRatio(9)");
    check(lcd.setBias(false), __LINE__, "lcd.setBias(false)");
    check(lcd.setInvert(true), __LINE__, "lcd.setInvert(true)");
    check(lcd.setInvert(false), __LINE__, "lcd.setInvert(false)");

    const std::vector<uint8_t> expect = {0x81, 0x3F, 0x81, 0x00, 0x27, 0xA2, 0xA7, 0xA6};
    check(spi.commandBytes() == expect, __LINE__, "spi.commandBytes() == expect");
}

int main() {
    std::cout << "=== FW ST7567 DRIVER TEST ===\n";
    testInit();
    testInitVariants();
    testShow();
    testShowRejectsBadSize();
    testColumnOffset();
    testSetters();

    std::cout << (g_failures == 0 ? "PASS" : "FAIL") << "\n";
    return g_failures == 0 ? 0 : 1;
}
