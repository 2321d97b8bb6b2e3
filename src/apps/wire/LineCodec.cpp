#include "apps/wire/LineCodec.hpp"
#include "apps/wire/Base64.hpp"

#include <cctype>

namespace {

static bool isSpace(char c) {
    return c == ' ' || c == '\t' || c == '\r' || c == '\n' || c == '\v' || c == '\f';
}

// Split on runs of whitespace, starting after the sigil.
static std::vector<std::string> tokenize(const std::string& s, std::size_t from) {
    std::vector<std::string> parts;
    std::size_t i = from;
    while (i < s.size()) {
        while (i < s.size() && isSpace(s[i])) ++i;
        if (i >= s.size()) break;
        std::size_t j = i;
        while (j < s.size() && !isSpace(s[j])) ++j;
        parts.emplace_back(s, i, j - i);
        i = j;
    }
    return parts;
}

} // anonymous namespace

namespace wire {

std::string Trim(const std::string& s) {
    std::size_t b = 0;
    std::size_t e = s.size();
    while (b < e && isSpace(s[b])) ++b;
    while (e > b && isSpace(s[e - 1])) --e;
    return s.substr(b, e - b);
}

void ToLowerInPlace(std::string& s) {
    for (auto& c : s) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
}

LineKind Classify(const std::string& trimmed) {
    if (trimmed.empty()) return LineKind::EMPTY;
    if (trimmed[0] == msg::DEVICE_SIGIL) return LineKind::DEVICE_COMMAND;
    if (trimmed[0] == msg::HOST_SIGIL) return LineKind::HOST_CONFIG;
    return LineKind::PAYLOAD;
}

void EncodeFrameLine(const msg::PackedFrame& frame, std::string& out) {
    out.clear();
    Base64EncodeAppend(frame.bytes.data(), frame.bytes.size(), out);
    out.push_back('\n');
}

std::string EncodeCommandLine(const msg::ControlCommand& cmd) {
    std::string line(1, msg::DEVICE_SIGIL);
    line += cmd.name;
    for (uint8_t i = 0; i < cmd.argc && i < msg::MAX_CMD_ARGS; ++i) {
        line.push_back(' ');
        line += cmd.args[i];
    }
    line.push_back('\n');
    return line;
}

bool ParseCommandLine(const std::string& trimmed, msg::ControlCommand& out) {
    if (Classify(trimmed) != LineKind::DEVICE_COMMAND) return false;

    std::vector<std::string> parts = tokenize(trimmed, 1);
    if (parts.empty()) return false;

    out = msg::ControlCommand{};
    out.name = parts[0];
    ToLowerInPlace(out.name);

    for (std::size_t i = 1; i < parts.size() && out.argc < msg::MAX_CMD_ARGS; ++i) {
        out.args[out.argc++] = parts[i];
    }
    return true;
}

bool ParseHostLine(const std::string& trimmed, msg::HostConfigCommand& out) {
    if (Classify(trimmed) != LineKind::HOST_CONFIG) return false;

    std::vector<std::string> parts = tokenize(trimmed, 1);
    if (parts.empty()) return false;

    out.key = parts[0];
    ToLowerInPlace(out.key);
    out.value = parts.size() > 1 ? parts[1] : std::string();
    return true;
}

bool DecodeFrameLine(const std::string& trimmed, const msg::FrameGeometry& geometry,
                     msg::PackedFrame& out) {
    // Cheap size gate before decoding: a correct frame has a fixed encoded length.
    if (trimmed.size() != Base64EncodedSize(geometry.packedBytes())) return false;

    if (!Base64Decode(trimmed.data(), trimmed.size(), out.bytes)) return false;

    out.geometry = geometry;
    return out.shapeOk();
}

} // namespace wire
