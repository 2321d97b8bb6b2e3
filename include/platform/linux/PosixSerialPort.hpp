#pragma once
#include <cstdint>
#include <string>

#include "platform/ISerialPort.hpp"

namespace platform::posix {

struct SerialPortConfig {
    const char* path = nullptr;     // e.g. /dev/ttyACM0
    uint32_t    baud = 500000;      // USB CDC ignores it, real UARTs do not
};

// ------------------------------
// PosixSerialPort: termios tty in raw 8N1 mode, or a pair of already-open
// descriptors (stdin/stdout) used as-is.
// Reads and writes are non-blocking underneath and bounded with poll().
// ------------------------------
class PosixSerialPort : public ISerialPort {
public:
    explicit PosixSerialPort(const SerialPortConfig& cfg);

    // Adopt descriptors without touching their terminal settings.
    // Not closed on destruction.
    PosixSerialPort(int read_fd, int write_fd);

    ~PosixSerialPort() override;

    PosixSerialPort(const PosixSerialPort&) = delete;
    PosixSerialPort& operator=(const PosixSerialPort&) = delete;

    // Open and configure the tty. No-op for adopted descriptors.
    bool Open();
    void Close();
    bool IsOpen() const { return m_rfd >= 0 && m_wfd >= 0; }

    WriteResult writeAll(const uint8_t* data, std::size_t len, int timeout_ms) override;
    ReadResult readLine(std::string& line, int timeout_ms) override;
    void flushInput() override;

    enum class Status : uint8_t {
        OK = 0,
        // SYSCALL FAILS
        OPEN_FAIL,
        TCGETATTR_FAIL,
        TCSETATTR_FAIL,
        WRITE_FAIL,
        READ_FAIL,

        // LOGIC FAILS
        NOT_OPEN,
        BAD_BAUD,
        WRITE_TIMEOUT,
        LINE_OVERFLOW,
    };

    static const char* StatusStr(Status s);

    Status lastStatus() const { return m_status; }
    int    lastErrno()  const { return m_errno; }

private:
    // Longest line accepted before the receive buffer is dropped.
    static constexpr std::size_t MAX_LINE = 64 * 1024;

    SerialPortConfig m_cfg{};
    int  m_rfd = -1;
    int  m_wfd = -1;
    bool m_owns_fds = false;

    std::string m_rx;   // bytes received but not yet returned as a line

    Status m_status = Status::OK;
    int    m_errno  = 0;

    bool configureTty();
    bool takeLine(std::string& line);
    bool fail(Status s);
};

} // namespace platform::posix
