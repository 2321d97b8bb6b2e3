// pagestream_fw: display-board firmware loop on a Linux host.
// Talks to the panel through spidev + sysfs GPIO/PWM, or runs against the
// simulated board with --sim.
#include <getopt.h>
#include <unistd.h>

#include <cstdlib>
#include <iostream>
#include <memory>
#include <string>

#include <opencv2/core.hpp>
#include <opencv2/imgcodecs.hpp>

#include "apps/fw/Backlight.hpp"
#include "apps/fw/BoardConfig.hpp"
#include "apps/fw/CommandInterpreter.hpp"
#include "apps/fw/DeviceApp.hpp"
#include "apps/fw/DeviceController.hpp"
#include "apps/fw/FeedbackLoop.hpp"
#include "apps/fw/St7567Driver.hpp"
#include "apps/fw/StatusLeds.hpp"
#include "apps/imgproc/ImageProcessor.hpp"
#include "os/rtos.hpp"
#include "platform/linux/LinuxBoard.hpp"
#include "platform/linux/PosixSerialPort.hpp"
#include "platform/sim/SimBoard.hpp"

namespace {

struct RunnerConfig {
    std::string port          = "-";
    bool        sim           = false;
    std::string spidev        = "/dev/spidev0.0";
    int         gpiochip_base = 0;
    int         pwmchip       = 0;
    std::string snapshot;                // PNG path, --sim only
    bool        exit_on_eof   = false;
};

static void PrintUsage(const char* prog) {
    std::cerr <<
        "usage: " << prog << " [options]\n"
        "\n"
        "  --port PATH|-          serial device, or - for stdin (default -)\n"
        "  --sim                  simulated board, no hardware access\n"
        "  --spidev DEV           SPI device (default /dev/spidev0.0)\n"
        "  --gpiochip-base N      sysfs GPIO number of board pin 0 (default 0)\n"
        "  --pwmchip N            sysfs pwmchip driving the backlight (default 0)\n"
        "  --snapshot PNG         with --sim: write the panel to PNG once per second\n"
        "  --exit-on-eof          stop when the input side closes\n";
}

static bool ParseArgs(int argc, char** argv, RunnerConfig& cfg) {
    enum : int { O_PORT = 1000, O_SIM, O_SPIDEV, O_GPIO_BASE, O_PWMCHIP, O_SNAPSHOT, O_EOF, O_HELP };
    static const option opts[] = {
        {"port",          required_argument, nullptr, O_PORT},
        {"sim",           no_argument,       nullptr, O_SIM},
        {"spidev",        required_argument, nullptr, O_SPIDEV},
        {"gpiochip-base", required_argument, nullptr, O_GPIO_BASE},
        {"pwmchip",       required_argument, nullptr, O_PWMCHIP},
        {"snapshot",      required_argument, nullptr, O_SNAPSHOT},
        {"exit-on-eof",   no_argument,       nullptr, O_EOF},
        {"help",          no_argument,       nullptr, O_HELP},
        {nullptr,         0,                 nullptr, 0},
    };

    int c;
    while ((c = ::getopt_long(argc, argv, "", opts, nullptr)) != -1) {
        switch (c) {
            case O_PORT:      cfg.port = optarg; break;
            case O_SIM:       cfg.sim = true; break;
            case O_SPIDEV:    cfg.spidev = optarg; break;
            case O_GPIO_BASE: cfg.gpiochip_base = std::atoi(optarg); break;
            case O_PWMCHIP:   cfg.pwmchip = std::atoi(optarg); break;
            case O_SNAPSHOT:  cfg.snapshot = optarg; break;
            case O_EOF:       cfg.exit_on_eof = true; break;
            default:          return false;
        }
    }
    return optind == argc;
}

// Panel contents as the eye sees them: set pixels dark unless inverted.
static bool WriteSnapshot(const std::string& path, const msg::PackedFrame& frame, bool invert) {
    cv::Mat mask;
    imgproc::ImageProcessor::Unpack(frame, mask);
    cv::Mat img;
    if (invert) img = mask;
    else        cv::bitwise_not(mask, img);
    return cv::imwrite(path, img);
}

} // anonymous namespace

int main(int argc, char** argv) {
    RunnerConfig rc;
    if (!ParseArgs(argc, argv, rc)) {
        PrintUsage(argv[0]);
        return 2;
    }
    if (!rc.snapshot.empty() && !rc.sim) {
        std::cerr << "[FW] --snapshot needs --sim\n";
        return 2;
    }

    const fw::BoardConfig board{};

    // ---- platform ----
    std::unique_ptr<platform::IGpio>   gpio;
    std::unique_ptr<platform::ISpiBus> spi;
    std::unique_ptr<platform::IPwm>    pwm;

    if (rc.sim) {
        auto sim_gpio = std::make_unique<platform::sim::SimGpio>();
        spi  = std::make_unique<platform::sim::SimSpiBus>(*sim_gpio, board.pin_cs, board.pin_dc);
        pwm  = std::make_unique<platform::sim::SimPwm>(true);
        gpio = std::move(sim_gpio);
        std::cerr << "[FW] simulated board\n";
    } else {
        platform::posix::SpidevConfig spi_cfg;
        spi_cfg.dev      = rc.spidev.c_str();
        spi_cfg.speed_hz = board.spi_hz;
        auto bus = std::make_unique<platform::posix::SpidevBus>(spi_cfg);
        if (!bus->Open()) return 1;
        spi = std::move(bus);

        gpio = std::make_unique<platform::posix::SysfsGpio>(rc.gpiochip_base);

        platform::posix::SysfsPwmConfig pwm_cfg;
        pwm_cfg.chip = rc.pwmchip;
        pwm = std::make_unique<platform::posix::SysfsPwm>(pwm_cfg);
    }

    // ---- serial ----
    std::unique_ptr<platform::posix::PosixSerialPort> port;
    if (rc.port == "-") {
        port = std::make_unique<platform::posix::PosixSerialPort>(STDIN_FILENO, STDOUT_FILENO);
    } else {
        platform::posix::SerialPortConfig port_cfg;
        port_cfg.path = rc.port.c_str();
        port = std::make_unique<platform::posix::PosixSerialPort>(port_cfg);
        if (!port->Open()) {
            std::cerr << "[SERIAL] cannot open " << rc.port << ": "
                      << platform::posix::PosixSerialPort::StatusStr(port->lastStatus()) << "\n";
            return 1;
        }
    }

    // ---- firmware ----
    fw::Backlight backlight = fw::Backlight::Attach(pwm.get(), *gpio, board.pin_backlight, board.backlight_pwm_hz);
    fw::StatusLeds leds(*gpio);

    fw::St7567Config lcd_cfg;
    lcd_cfg.cs_pin          = board.pin_cs;
    lcd_cfg.dc_pin          = board.pin_dc;
    lcd_cfg.rst_pin         = board.pin_rst;
    lcd_cfg.geometry        = board.geometry;
    lcd_cfg.col_offset      = board.col_offset;
    lcd_cfg.line_offset     = board.line_offset;
    lcd_cfg.com_reverse     = board.com_reverse;
    lcd_cfg.segment_reverse = board.segment_reverse;
    fw::St7567Driver lcd(*spi, *gpio, lcd_cfg);

    fw::DeviceController ctl(lcd, backlight, leds, *gpio, board.boot_state);
    fw::CommandInterpreter interp(ctl, board.geometry);
    fw::FeedbackLoop feedback(ctl, *gpio, board);

    fw::DeviceAppConfig app_cfg;
    app_cfg.exit_on_eof = rc.exit_on_eof;
    fw::DeviceApp app(*port, ctl, interp, feedback, app_cfg);

    if (!app.Boot()) {
        std::cerr << "[FW] boot failed: " << fw::DeviceApp::StatusStr(app.lastStatus()) << "\n";
        return 1;
    }

    uint32_t last_snap_ms = Rtos::NowMs();
    uint32_t last_snap_frames = 0;

    while (app.Step()) {
        if (rc.snapshot.empty()) continue;

        const uint32_t now = Rtos::NowMs();
        if (static_cast<int32_t>(now - last_snap_ms) < 1000) continue;
        last_snap_ms = now;

        if (app.framesRendered() == last_snap_frames) continue;
        last_snap_frames = app.framesRendered();

        if (!WriteSnapshot(rc.snapshot, app.lastFrame(), ctl.state().invert)) {
            std::cerr << "[FW] snapshot write to " << rc.snapshot << " failed\n";
        }
    }

    std::cerr << "[FW] stopped: " << fw::DeviceApp::StatusStr(app.lastStatus())
              << ", frames rendered: " << app.framesRendered()
              << ", lines rejected: " << interp.linesRejected()
              << ", last line: " << fw::CommandInterpreter::OutcomeStr(app.lastOutcome()) << "\n";

    return app.lastStatus() == fw::DeviceApp::Status::INPUT_FAIL ? 1 : 0;
}
