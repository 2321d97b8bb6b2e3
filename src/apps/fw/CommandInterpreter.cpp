// CommandInterpreter.cpp
#include "apps/fw/CommandInterpreter.hpp"
#include "apps/fw/StatusLeds.hpp"
#include "apps/wire/LineCodec.hpp"

#include <algorithm>
#include <cerrno>
#include <climits>
#include <cmath>
#include <cstdlib>
#include <iostream>

namespace {

using fw::CmdStatus;
using fw::EffectList;
using fw::EffectType;

// Argument i as an int; false when absent or not a number.
static bool intArg(const msg::ControlCommand& cmd, std::size_t i, int& out) {
    const std::string* a = cmd.arg(i);
    return a && fw::CommandInterpreter::ParseInt(*a, out);
}

// ---- handlers ----

static CmdStatus onQuit(const msg::ControlCommand&, msg::DeviceState&, EffectList& fx) {
    fx.push_back({EffectType::QUIT});
    return CmdStatus::OK;
}

static CmdStatus onContrast(const msg::ControlCommand& cmd, msg::DeviceState& next, EffectList& fx) {
    int v = 0;
    if (!intArg(cmd, 0, v)) return CmdStatus::BAD_ARGS;
    fw::setContrast(next, v, fx);
    return CmdStatus::OK;
}

static CmdStatus onRatio(const msg::ControlCommand& cmd, msg::DeviceState& next, EffectList& fx) {
    int v = 0;
    if (!intArg(cmd, 0, v)) return CmdStatus::BAD_ARGS;
    fw::setRegRatio(next, v, fx);
    return CmdStatus::OK;
}

static CmdStatus onBias(const msg::ControlCommand& cmd, msg::DeviceState& next, EffectList& fx) {
    int v = 0;
    if (!intArg(cmd, 0, v)) return CmdStatus::BAD_ARGS;
    fw::setBias(next, v != 0, fx);
    return CmdStatus::OK;
}

static CmdStatus onInvert(const msg::ControlCommand& cmd, msg::DeviceState& next, EffectList& fx) {
    int v = 0;
    if (!intArg(cmd, 0, v)) return CmdStatus::BAD_ARGS;
    fw::setInvert(next, v != 0, fx);
    return CmdStatus::OK;
}

static CmdStatus onBacklight(const msg::ControlCommand& cmd, msg::DeviceState& next, EffectList& fx) {
    const std::string* a = cmd.arg(0);
    int duty = 0;
    if (!a || !fw::CommandInterpreter::ParseBacklight(*a, duty)) return CmdStatus::BAD_ARGS;
    fw::setBacklight(next, duty, fx);
    return CmdStatus::OK;
}

// led2/led3 share everything but the slot.
static CmdStatus bindLed(fw::LedSlot slot, const msg::ControlCommand& cmd,
                         msg::DeviceState& next, EffectList& fx) {
    int pin = 0;
    if (!intArg(cmd, 0, pin)) return CmdStatus::BAD_ARGS;

    int active_low = 0;
    const bool has_pol = cmd.arg(1) != nullptr;
    if (has_pol && !intArg(cmd, 1, active_low)) return CmdStatus::BAD_ARGS;

    if (pin < 0) pin = msg::PIN_NONE;
    if (slot == fw::LedSlot::D2) next.led_d2_pin = pin;
    else                         next.led_d3_pin = pin;

    if (has_pol) {
        next.led_active_low = active_low != 0;
        fx.push_back({EffectType::SET_LED_POLARITY, next.led_active_low ? 1 : 0});
    }
    fx.push_back({EffectType::BIND_LED, static_cast<int>(slot), pin});
    return CmdStatus::OK;
}

static CmdStatus onLed2(const msg::ControlCommand& cmd, msg::DeviceState& next, EffectList& fx) {
    return bindLed(fw::LedSlot::D2, cmd, next, fx);
}

static CmdStatus onLed3(const msg::ControlCommand& cmd, msg::DeviceState& next, EffectList& fx) {
    return bindLed(fw::LedSlot::D3, cmd, next, fx);
}

static CmdStatus onLedPolarity(const msg::ControlCommand& cmd, msg::DeviceState& next, EffectList& fx) {
    int v = 0;
    if (!intArg(cmd, 0, v)) return CmdStatus::BAD_ARGS;
    next.led_active_low = v != 0;
    fx.push_back({EffectType::SET_LED_POLARITY, next.led_active_low ? 1 : 0});
    return CmdStatus::OK;
}

static CmdStatus onProbe(const msg::ControlCommand& cmd, msg::DeviceState&, EffectList& fx) {
    int pin = 0;
    if (!intArg(cmd, 0, pin) || pin < 0) return CmdStatus::BAD_ARGS;

    int active_low = 1;
    if (cmd.arg(1) && !intArg(cmd, 1, active_low)) return CmdStatus::BAD_ARGS;

    int ms = fw::PROBE_DEFAULT_MS;
    if (cmd.arg(2) && !intArg(cmd, 2, ms)) return CmdStatus::BAD_ARGS;
    ms = std::clamp(ms, fw::PROBE_MIN_MS, fw::PROBE_MAX_MS);

    fx.push_back({EffectType::PROBE_PIN, pin, active_low != 0 ? 1 : 0, ms});
    return CmdStatus::OK;
}

static CmdStatus onTargetFps(const msg::ControlCommand& cmd, msg::DeviceState& next, EffectList&) {
    int v = 0;
    if (!intArg(cmd, 0, v)) return CmdStatus::BAD_ARGS;
    next.target_fps = v;
    return CmdStatus::OK;
}

struct CmdEntry {
    const char*    name;
    const char*    alias;
    fw::CmdHandler fn;
};

static const CmdEntry kCommands[] = {
    {"quit",      "exit",         onQuit},
    {"contrast",  "c",            onContrast},
    {"ratio",     "reg",          onRatio},
    {"bias",      nullptr,        onBias},
    {"invert",    "inv",          onInvert},
    {"backlight", "bl",           onBacklight},
    {"led2",      "d2",           onLed2},
    {"led3",      "d3",           onLed3},
    {"ledpol",    "led_polarity", onLedPolarity},
    {"probe",     "blinkpin",     onProbe},
    {"targetfps", "fps",          onTargetFps},
};

} // anonymous namespace

namespace fw {

CommandInterpreter::CommandInterpreter(DeviceController& ctl, const msg::FrameGeometry& geometry)
: m_ctl(ctl)
, m_geometry(geometry) {
    m_fx.reserve(4);
}

CommandInterpreter::Outcome CommandInterpreter::HandleLine(const std::string& line, msg::PackedFrame& frame) {
    const std::string trimmed = wire::Trim(line);

    switch (wire::Classify(trimmed)) {
        case wire::LineKind::EMPTY:
            return Outcome::IDLE;

        case wire::LineKind::DEVICE_COMMAND: {
            msg::ControlCommand cmd;
            if (!wire::ParseCommandLine(trimmed, cmd)) return Outcome::IDLE;

            msg::DeviceState next = m_ctl.state();
            m_fx.clear();

            const CmdStatus st = Dispatch(cmd, next, m_fx);
            if (st != CmdStatus::OK) {
                ++m_rejected;
                std::cerr << "[FW] '" << cmd.name << "' dropped: " << CmdStatusStr(st) << "\n";
                return Outcome::REJECTED;
            }

            m_ctl.Commit(next, m_fx);
            ++m_applied;
            return m_ctl.quitRequested() ? Outcome::QUIT : Outcome::COMMAND;
        }

        case wire::LineKind::HOST_CONFIG:   // never meant for us; fails as a frame
        case wire::LineKind::PAYLOAD:
            break;
    }

    if (!wire::DecodeFrameLine(trimmed, m_geometry, frame)) {
        ++m_rejected;
        return Outcome::REJECTED;
    }
    return Outcome::FRAME;
}

CmdStatus CommandInterpreter::Dispatch(const msg::ControlCommand& cmd, msg::DeviceState& next, EffectList& fx) {
    for (const CmdEntry& e : kCommands) {
        if (cmd.name == e.name || (e.alias && cmd.name == e.alias)) {
            return e.fn(cmd, next, fx);
        }
    }
    return CmdStatus::UNKNOWN_COMMAND;
}

bool CommandInterpreter::ParseInt(const std::string& s, int& out) {
    if (s.empty()) return false;

    errno = 0;
    char* end = nullptr;
    const long v = std::strtol(s.c_str(), &end, 10);
    if (end == s.c_str() || *end != '\0' || errno == ERANGE) return false;
    if (v < INT_MIN || v > INT_MAX) return false;

    out = static_cast<int>(v);
    return true;
}

bool CommandInterpreter::ParseBacklight(const std::string& s, int& duty) {
    if (s.find('.') != std::string::npos) {
        char* end = nullptr;
        const double r = std::strtod(s.c_str(), &end);
        if (end == s.c_str() || *end != '\0' || !std::isfinite(r)) return false;

        const double scaled = r * double(msg::BACKLIGHT_MAX);
        if (scaled <= 0.0)                       duty = 0;
        else if (scaled >= msg::BACKLIGHT_MAX)   duty = msg::BACKLIGHT_MAX;
        else                                     duty = static_cast<int>(scaled);   // truncates
        return true;
    }

    int v = 0;
    if (!ParseInt(s, v)) return false;

    // 0..100 reads as a percentage; anything else is a raw duty value.
    if (v >= 0 && v <= 100) v = v * msg::BACKLIGHT_MAX / 100;
    duty = std::clamp(v, 0, msg::BACKLIGHT_MAX);
    return true;
}

const char* CmdStatusStr(CmdStatus s) {
    switch (s) {
        case CmdStatus::OK:              return "OK";
        case CmdStatus::BAD_ARGS:        return "BAD_ARGS";
        case CmdStatus::UNKNOWN_COMMAND: return "UNKNOWN_COMMAND";
        default:                         return "UNKNOWN";
    }
}

const char* CommandInterpreter::OutcomeStr(Outcome o) {
    switch (o) {
        case Outcome::IDLE:     return "IDLE";
        case Outcome::COMMAND:  return "COMMAND";
        case Outcome::FRAME:    return "FRAME";
        case Outcome::REJECTED: return "REJECTED";
        case Outcome::QUIT:     return "QUIT";
        default:                return "UNKNOWN";
    }
}

} // namespace fw
