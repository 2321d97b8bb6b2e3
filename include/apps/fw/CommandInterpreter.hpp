#pragma once
#include <cstdint>
#include <string>

#include "apps/fw/DeviceController.hpp"
#include "apps/fw/DeviceRules.hpp"
#include "msg/Commands.hpp"
#include "msg/DeviceState.hpp"
#include "msg/FrameGeometry.hpp"
#include "msg/PackedFrame.hpp"

namespace fw {

enum class CmdStatus : uint8_t {
    OK = 0,
    BAD_ARGS,          // missing or non-numeric argument
    UNKNOWN_COMMAND,
};

const char* CmdStatusStr(CmdStatus s);

// Pure command handler: edits the candidate state and lists effects.
using CmdHandler = CmdStatus (*)(const msg::ControlCommand& cmd,
                                 msg::DeviceState& next,
                                 EffectList& fx);

// ---------------------------------------------------------------------------
// Device side of the line protocol. One call per received line:
//   "!name args" -> dispatch table, state commit, hardware effects
//   base64       -> packed frame, returned to the caller to render
// Malformed lines of either kind are dropped; nothing here is fatal.
// ---------------------------------------------------------------------------
class CommandInterpreter {
public:
    enum class Outcome : uint8_t {
        IDLE = 0,     // empty or sigil-only line
        COMMAND,      // command applied
        FRAME,        // `frame` holds a packed frame to render
        REJECTED,     // malformed command or frame line, dropped
        QUIT,         // quit/exit received
    };

    CommandInterpreter(DeviceController& ctl, const msg::FrameGeometry& geometry);

    Outcome HandleLine(const std::string& line, msg::PackedFrame& frame);

    // Look up and run the handler for `cmd` against `next`. No hardware access.
    static CmdStatus Dispatch(const msg::ControlCommand& cmd, msg::DeviceState& next, EffectList& fx);

    // Backlight argument: "0.25" ratio, "0..100" percent, else raw duty.
    // Result is clamped to 0..65535.
    static bool ParseBacklight(const std::string& s, int& duty);

    // Whole-token base-10 integer.
    static bool ParseInt(const std::string& s, int& out);

    uint32_t commandsApplied() const { return m_applied; }
    uint32_t linesRejected() const { return m_rejected; }

    static const char* OutcomeStr(Outcome o);

private:
    DeviceController&  m_ctl;
    msg::FrameGeometry m_geometry{};

    EffectList m_fx;   // reused between commands

    uint32_t m_applied  = 0;
    uint32_t m_rejected = 0;
};

} // namespace fw
