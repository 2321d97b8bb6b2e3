#pragma once
#include <cstdint>
#include <string>

#include "msg/Commands.hpp"
#include "msg/PackedFrame.hpp"
#include "platform/ISerialPort.hpp"

namespace host {

// ---------------------------------------------------------------------------
// Host end of the line protocol. The only writer to the serial port: frame
// lines from the pacing loop and forwarded command lines share one ordered
// stream. Any failed write is fatal for the session; there is no retry.
// ---------------------------------------------------------------------------
class SerialLink {
public:
    static constexpr int WRITE_TIMEOUT_MS = 5000;

    explicit SerialLink(platform::ISerialPort& port, int write_timeout_ms = WRITE_TIMEOUT_MS);

    bool SendFrame(const msg::PackedFrame& frame);
    bool SendCommand(const msg::ControlCommand& cmd);

    // Raw line; '\n' is appended when missing.
    bool SendLine(const std::string& line);

    uint64_t bytesWritten() const { return m_bytes; }

    enum class Status : uint8_t {
        OK = 0,
        SHAPE_MISMATCH,   // frame is not geometry.packedBytes() long
        WRITE_TIMEOUT,
        WRITE_FAIL,
    };

    static const char* StatusStr(Status s);
    Status lastStatus() const { return m_status; }

private:
    platform::ISerialPort& m_port;
    int m_timeout_ms = WRITE_TIMEOUT_MS;

    std::string m_line;   // encode buffer, capacity reused per frame
    uint64_t m_bytes = 0;

    Status m_status = Status::OK;

    bool write(const std::string& line);
    bool fail(Status s);
};

} // namespace host
