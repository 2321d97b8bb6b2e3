// test/fw_deviceapp_test.cpp
//
// Firmware main loop over a scripted serial link: boot sequence, frame
// rendering, commands in the stream, quit and end of input.

#include <iostream>
#include <string>

#include "apps/fw/Backlight.hpp"
#include "apps/fw/BoardConfig.hpp"
#include "apps/fw/CommandInterpreter.hpp"
#include "apps/fw/DeviceApp.hpp"
#include "apps/fw/DeviceController.hpp"
#include "apps/fw/FeedbackLoop.hpp"
#include "apps/fw/St7567Driver.hpp"
#include "apps/fw/StatusLeds.hpp"
#include "apps/wire/LineCodec.hpp"
#include "platform/sim/SimBoard.hpp"

static int g_failures = 0;

static void check(bool ok, int line, const char* what) {
    if (ok) return;
    std::cout << "  FAIL " << line << ": " << what << "\n";
    ++g_failures;
}

using platform::sim::SimGpio;
using platform::sim::SimPwm;
using platform::sim::SimSerialPort;
using platform::sim::SimSpiBus;

namespace {

fw::DeviceAppConfig quickConfig(bool exit_on_eof) {
    fw::DeviceAppConfig cfg;
    cfg.poll_timeout_ms = 1;
    cfg.boot_flash_ms   = 0;
    cfg.exit_on_eof     = exit_on_eof;
    return cfg;
}

struct Rig {
    fw::BoardConfig board;
    SimGpio gpio;
    SimPwm  pwm;
    SimSerialPort port;
    fw::St7567Config lcd_cfg;
    SimSpiBus spi{gpio, lcd_cfg.cs_pin, lcd_cfg.dc_pin};
    fw::St7567Driver lcd{spi, gpio, lcd_cfg};
    fw::Backlight backlight = fw::Backlight::Attach(&pwm, gpio, board.pin_backlight, board.backlight_pwm_hz);
    fw::StatusLeds leds{gpio};
    fw::DeviceController ctl{lcd, backlight, leds, gpio, board.boot_state};
    fw::CommandInterpreter interp{ctl, board.geometry};
    fw::FeedbackLoop feedback{ctl, gpio, board};
    fw::DeviceApp app;

    explicit Rig(bool exit_on_eof = false)
    : app(port, ctl, interp, feedback, quickConfig(exit_on_eof)) {}
};

std::string frameLine(uint8_t fill) {
    msg::PackedFrame f;
    f.geometry = msg::PANEL_GEOMETRY;
    f.bytes.assign(f.geometry.packedBytes(), fill);
    std::string line;
    wire::EncodeFrameLine(f, line);
    return line.substr(0, line.size() - 1);   // SimSerialPort lines carry no '\n'
}

} // anonymous namespace

using Outcome = fw::CommandInterpreter::Outcome;

static void testBoot() {
    std::cout << "-- boot: init, fill on, fill off\n";
    Rig r;
    check(r.app.Boot(), __LINE__, "r.app.Boot()");
    check(r.app.lastStatus() == fw::DeviceApp::Status::OK, __LINE__, "r.app.lastStatus() == fw::DeviceApp::Status::OK");

    const auto& xs = r.spi.transfers();
    check(xs.size() == 13 + 16 + 16, __LINE__, "xs.size() == 13 + 16 + 16");
    if (xs.size() == 45) {
        check(xs[0].bytes[0] == 0xE2, __LINE__, "xs[0].bytes[0] == 0xE2");
        check(xs[12].bytes[0] == 0xAF, __LINE__, "xs[12].bytes[0] == 0xAF");
        check(xs[14].dc_high && xs[14].bytes[0] == 0xFF, __LINE__, "xs[14].dc_high && xs[14].bytes[0] == 0xFF");
        check(xs[44].dc_high && xs[44].bytes[127] == 0x00, __LINE__, "xs[44].dc_high && xs[44].bytes[127] == 0x00");
    }

    check(r.pwm.duty() == r.board.boot_state.backlight, __LINE__, "r.pwm.duty() == r.board.boot_state.backlight");
    check(r.gpio.mode(r.board.pin_btn_ok) == platform::PinMode::INPUT_PULLUP, __LINE__, "r.gpio.mode(r.board.pin_btn_ok) == platform::PinMode::INPUT_PULLUP");
}

static void testFrames() {
    std::cout << "-- frames and commands from the stream\n";
    Rig r;
    check(r.app.Boot(), __LINE__, "r.app.Boot()");
    r.spi.clear();

    check(r.app.Step(), __LINE__, "r.app.Step()");   // nothing queued
    check(r.app.framesRendered() == 0, __LINE__, "r.app.framesRendered() == 0");
    check(r.app.lastOutcome() == Outcome::IDLE, __LINE__, "r.app.lastOutcome() == Outcome::IDLE");

    r.port.pushLine(frameLine(0x81));
    check(r.app.Step(), __LINE__, "r.app.Step()");
    check(r.app.framesRendered() == 1, __LINE__, "r.app.framesRendered() == 1");
    check(r.app.lastFrame().bytes.size() == 1024, __LINE__, "r.app.lastFrame().bytes.size() == 1024");
    check(r.app.lastFrame().bytes[500] == 0x81, __LINE__, "r.app.lastFrame().bytes[500] == 0x81");
    check(r.spi.transfers().size() == 16, __LINE__, "r.spi.transfers().size() == 16");
    check(r.app.lastOutcome() == Outcome::FRAME, __LINE__, "r.app.lastOutcome() == Outcome::FRAME");

    r.port.pushLine("!contrast 10");
    check(r.app.Step(), __LINE__, "r.app.Step()");
    check(r.ctl.state().contrast == 10, __LINE__, "r.ctl.state().contrast == 10");
    check(r.app.lastOutcome() == Outcome::COMMAND, __LINE__, "r.app.lastOutcome() == Outcome::COMMAND");

    // Garbage is dropped and the loop carries on.
    r.port.pushLine("QUJD");
    r.port.pushLine("!contrast");
    check(r.app.Step(), __LINE__, "r.app.Step()");
    check(r.app.Step(), __LINE__, "r.app.Step()");
    check(r.app.framesRendered() == 1, __LINE__, "r.app.framesRendered() == 1");
    check(r.interp.linesRejected() == 2, __LINE__, "r.interp.linesRejected() == 2");
    check(std::string(fw::CommandInterpreter::OutcomeStr(r.app.lastOutcome())) == "REJECTED",
          __LINE__, "OutcomeStr(lastOutcome()) == REJECTED");

    r.port.pushLine(frameLine(0x00) + "\r");
    check(r.app.Step(), __LINE__, "r.app.Step()");
    check(r.app.framesRendered() == 2, __LINE__, "r.app.framesRendered() == 2");
    check(r.feedback.framesInWindow() == 2, __LINE__, "r.feedback.framesInWindow() == 2");
}

static void testQuit() {
    std::cout << "-- quit ends the loop\n";
    Rig r;
    check(r.app.Boot(), __LINE__, "r.app.Boot()");
    r.port.pushLine("!quit");
    r.port.pushLine(frameLine(0xFF));
    check(!r.app.Step(), __LINE__, "!r.app.Step()");
    check(r.app.lastStatus() == fw::DeviceApp::Status::QUIT, __LINE__, "r.app.lastStatus() == fw::DeviceApp::Status::QUIT");
    check(r.app.framesRendered() == 0, __LINE__, "r.app.framesRendered() == 0");
    check(std::string(fw::CommandInterpreter::OutcomeStr(r.app.lastOutcome())) == "QUIT",
          __LINE__, "OutcomeStr(lastOutcome()) == QUIT");
}

static void testEndOfInput() {
    std::cout << "-- end of input\n";
    Rig keep;
    check(keep.app.Boot(), __LINE__, "keep.app.Boot()");
    keep.port.closeInput();
    check(keep.app.Step(), __LINE__, "keep.app.Step()");
    check(keep.app.Step(), __LINE__, "keep.app.Step()");
    check(keep.app.lastStatus() == fw::DeviceApp::Status::OK, __LINE__, "keep.app.lastStatus() == fw::DeviceApp::Status::OK");

    Rig leave(true);
    check(leave.app.Boot(), __LINE__, "leave.app.Boot()");
    leave.port.pushLine(frameLine(0x0F));
    leave.port.closeInput();
    check(leave.app.Step(), __LINE__, "leave.app.Step()");
    check(leave.app.framesRendered() == 1, __LINE__, "leave.app.framesRendered() == 1");
    check(!leave.app.Step(), __LINE__, "!leave.app.Step()");
    check(leave.app.lastStatus() == fw::DeviceApp::Status::INPUT_CLOSED, __LINE__, "leave.app.lastStatus() == fw::DeviceApp::Status::INPUT_CLOSED");
}

int main() {
    std::cout << "=== FW DEVICE APP TEST ===\n";
    testBoot();
    testFrames();
    testQuit();
    testEndOfInput();

    std::cout << (g_failures == 0 ? "PASS" : "FAIL") << "\n";
    return g_failures == 0 ? 0 : 1;
}
