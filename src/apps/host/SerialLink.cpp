// SerialLink.cpp
#include "apps/host/SerialLink.hpp"
#include "apps/wire/Base64.hpp"
#include "apps/wire/LineCodec.hpp"

#include <iostream>

namespace host {

SerialLink::SerialLink(platform::ISerialPort& port, int write_timeout_ms)
: m_port(port)
, m_timeout_ms(write_timeout_ms > 0 ? write_timeout_ms : WRITE_TIMEOUT_MS) {
    m_line.reserve(wire::Base64EncodedSize(msg::PANEL_GEOMETRY.packedBytes()) + 1);
}

bool SerialLink::SendFrame(const msg::PackedFrame& frame) {
    if (!frame.shapeOk()) return fail(Status::SHAPE_MISMATCH);
    wire::EncodeFrameLine(frame, m_line);
    return write(m_line);
}

bool SerialLink::SendCommand(const msg::ControlCommand& cmd) {
    return write(wire::EncodeCommandLine(cmd));
}

bool SerialLink::SendLine(const std::string& line) {
    if (!line.empty() && line.back() == '\n') return write(line);
    return write(line + "\n");
}

// -------------------- private helpers --------------------

bool SerialLink::write(const std::string& line) {
    const auto* data = reinterpret_cast<const uint8_t*>(line.data());

    switch (m_port.writeAll(data, line.size(), m_timeout_ms)) {
        case platform::WriteResult::OK:
            m_bytes += line.size();
            return true;
        case platform::WriteResult::TIMEOUT:
            std::cerr << "[LINK] write timed out after " << m_timeout_ms << " ms\n";
            return fail(Status::WRITE_TIMEOUT);
        case platform::WriteResult::ERROR:
        default:
            std::cerr << "[LINK] write failed\n";
            return fail(Status::WRITE_FAIL);
    }
}

// FDIR

bool SerialLink::fail(Status s) {
    m_status = s;
    return false;
}

const char* SerialLink::StatusStr(SerialLink::Status s) {
    switch (s) {
        case SerialLink::Status::OK:             return "OK";
        case SerialLink::Status::SHAPE_MISMATCH: return "SHAPE_MISMATCH";
        case SerialLink::Status::WRITE_TIMEOUT:  return "WRITE_TIMEOUT";
        case SerialLink::Status::WRITE_FAIL:     return "WRITE_FAIL";
        default:                                 return "UNKNOWN";
    }
}

} // namespace host
