#pragma once
#include <array>
#include <cstdint>
#include <string>

namespace msg {

// Line sigils
static constexpr char DEVICE_SIGIL = '!';
static constexpr char HOST_SIGIL   = '@';

static constexpr std::size_t MAX_CMD_ARGS = 3;

// Device-bound command, exists on the wire as "!name arg1 arg2 arg3\n".
struct ControlCommand {
    std::string name;                                 // lower-cased
    std::array<std::string, MAX_CMD_ARGS> args{};
    uint8_t argc = 0;

    const std::string* arg(std::size_t i) const { return i < argc ? &args[i] : nullptr; }
};

// Host-only reconfiguration, "@key value". Never transmitted.
struct HostConfigCommand {
    std::string key;     // lower-cased
    std::string value;   // may be empty
};

} // namespace msg
