#pragma once
#include <cstdint>
#include <cstddef>
#include <string>

namespace platform {

enum class ReadResult : uint8_t {
    LINE = 0,     // one complete line (without '\n') returned
    TIMEOUT,      // nothing complete within the timeout
    CLOSED,       // peer hung up / end of input
    ERROR,
};

enum class WriteResult : uint8_t {
    OK = 0,
    TIMEOUT,      // not fully written within the timeout
    ERROR,
};

// Byte-oriented, line-framed serial link. Exactly one writer per side.
class ISerialPort {
public:
    // Write all bytes or fail. TIMEOUT once the whole write has not completed
    // within timeout_ms.
    virtual WriteResult writeAll(const uint8_t* data, std::size_t len, int timeout_ms) = 0;

    // Wait at most timeout_ms for a complete line.
    virtual ReadResult readLine(std::string& line, int timeout_ms) = 0;

    // Discard anything already received.
    virtual void flushInput() {}

    virtual ~ISerialPort() = default;
};

} // namespace platform
