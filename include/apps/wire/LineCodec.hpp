#pragma once
#include <cstdint>
#include <string>
#include <vector>

#include "msg/Commands.hpp"
#include "msg/FrameGeometry.hpp"
#include "msg/PackedFrame.hpp"

namespace wire {

// Wire grammar shared by host and device:
//   frame line   : base64(packed frame) "\n"
//   command line : "!" name (" " arg)* "\n"       (device-bound)
//   host line    : "@" name (" " value)?          (host-only, never sent)

enum class LineKind : uint8_t {
    EMPTY = 0,
    DEVICE_COMMAND,
    HOST_CONFIG,
    PAYLOAD,        // anything else: a candidate frame
};

// Strip leading/trailing ASCII whitespace (incl. '\r').
std::string Trim(const std::string& s);

void ToLowerInPlace(std::string& s);

// Classify an already trimmed line by its first character.
LineKind Classify(const std::string& trimmed);

// out = base64(frame.bytes) + "\n". out is overwritten, capacity is reused.
void EncodeFrameLine(const msg::PackedFrame& frame, std::string& out);

// "!" + name + (" " + arg)* + "\n"
std::string EncodeCommandLine(const msg::ControlCommand& cmd);

// Parse a trimmed "!name a b c" line. Name is lower-cased; tokens past the
// third argument are ignored. False for a missing sigil or a bare "!".
bool ParseCommandLine(const std::string& trimmed, msg::ControlCommand& out);

// Parse a trimmed "@key value" line. Key is lower-cased, value is the
// second token (empty when absent). False for a missing sigil or bare "@".
bool ParseHostLine(const std::string& trimmed, msg::HostConfigCommand& out);

// Decode a frame line. Succeeds only if the payload is valid base64 and
// decodes to exactly geometry.packedBytes() bytes.
bool DecodeFrameLine(const std::string& trimmed, const msg::FrameGeometry& geometry,
                     msg::PackedFrame& out);

} // namespace wire
