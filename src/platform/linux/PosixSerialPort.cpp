// PosixSerialPort.cpp
#include "platform/linux/PosixSerialPort.hpp"
#include "os/rtos.hpp"

#include <fcntl.h>
#include <poll.h>
#include <termios.h>
#include <unistd.h>
#include <errno.h>

#include <iostream>

namespace {

static bool baudToSpeed(uint32_t baud, speed_t& out) {
    switch (baud) {
        case 9600:    out = B9600;    return true;
        case 19200:   out = B19200;   return true;
        case 38400:   out = B38400;   return true;
        case 57600:   out = B57600;   return true;
        case 115200:  out = B115200;  return true;
        case 230400:  out = B230400;  return true;
        case 460800:  out = B460800;  return true;
        case 500000:  out = B500000;  return true;
        case 921600:  out = B921600;  return true;
        case 1000000: out = B1000000; return true;
        case 2000000: out = B2000000; return true;
        default:      return false;
    }
}

// Milliseconds left until deadline, never negative.
static int remainingMs(uint32_t deadline_ms) {
    const uint32_t now = Rtos::NowMs();
    const int32_t left = static_cast<int32_t>(deadline_ms - now);
    return left > 0 ? left : 0;
}

static void setNonBlocking(int fd) {
    const int flags = ::fcntl(fd, F_GETFL, 0);
    if (flags >= 0) (void)::fcntl(fd, F_SETFL, flags | O_NONBLOCK);
}

} // anonymous namespace

namespace platform::posix {

PosixSerialPort::PosixSerialPort(const SerialPortConfig& cfg)
: m_cfg(cfg) {
    m_status = Status::OK;
    m_errno  = 0;
}

PosixSerialPort::PosixSerialPort(int read_fd, int write_fd)
: m_rfd(read_fd)
, m_wfd(write_fd)
, m_owns_fds(false) {
    m_status = Status::OK;
    m_errno  = 0;
}

PosixSerialPort::~PosixSerialPort() {
    Close();
}

bool PosixSerialPort::Open() {
    if (IsOpen()) return true;
    if (!m_cfg.path) return fail(Status::OPEN_FAIL);

    const int fd = ::open(m_cfg.path, O_RDWR | O_NOCTTY | O_NONBLOCK | O_CLOEXEC);
    if (fd < 0) return fail(Status::OPEN_FAIL);

    m_rfd = m_wfd = fd;
    m_owns_fds = true;

    if (!configureTty()) {
        Close();
        return false;
    }

    m_rx.clear();
    std::cerr << "[SERIAL] opened " << m_cfg.path << " @ " << m_cfg.baud << "\n";
    return true;
}

void PosixSerialPort::Close() {
    if (m_owns_fds && m_rfd >= 0) {
        ::close(m_rfd);
    }
    if (m_owns_fds) {
        m_rfd = -1;
        m_wfd = -1;
    }
}

WriteResult PosixSerialPort::writeAll(const uint8_t* data, std::size_t len, int timeout_ms) {
    if (!IsOpen()) {
        fail(Status::NOT_OPEN);
        return WriteResult::ERROR;
    }

    const uint32_t deadline = Rtos::NowMs() + static_cast<uint32_t>(timeout_ms);

    while (len > 0) {
        const ssize_t w = ::write(m_wfd, data, len);
        if (w > 0) {
            data += w;
            len  -= static_cast<std::size_t>(w);
            continue;
        }
        if (w < 0 && errno != EAGAIN && errno != EWOULDBLOCK && errno != EINTR) {
            fail(Status::WRITE_FAIL);
            return WriteResult::ERROR;
        }

        // Output buffer full: wait for room, bounded by the overall deadline.
        const int left = remainingMs(deadline);
        if (left == 0) {
            fail(Status::WRITE_TIMEOUT);
            return WriteResult::TIMEOUT;
        }

        pollfd p{};
        p.fd = m_wfd;
        p.events = POLLOUT;
        const int r = ::poll(&p, 1, left);
        if ((r < 0 && errno != EINTR) || (r > 0 && (p.revents & (POLLERR | POLLHUP)))) {
            fail(Status::WRITE_FAIL);
            return WriteResult::ERROR;
        }
    }
    return WriteResult::OK;
}

ReadResult PosixSerialPort::readLine(std::string& line, int timeout_ms) {
    if (!IsOpen()) {
        fail(Status::NOT_OPEN);
        return ReadResult::ERROR;
    }

    // A previous read may already hold a complete line.
    if (takeLine(line)) return ReadResult::LINE;

    const uint32_t deadline = Rtos::NowMs() + static_cast<uint32_t>(timeout_ms);

    while (true) {
        pollfd p{};
        p.fd = m_rfd;
        p.events = POLLIN;
        const int r = ::poll(&p, 1, remainingMs(deadline));
        if (r < 0) {
            if (errno == EINTR) continue;
            fail(Status::READ_FAIL);
            return ReadResult::ERROR;
        }
        if (r == 0) return ReadResult::TIMEOUT;

        char buf[4096];
        const ssize_t n = ::read(m_rfd, buf, sizeof(buf));
        if (n == 0) return ReadResult::CLOSED;
        if (n < 0) {
            if (errno == EAGAIN || errno == EWOULDBLOCK || errno == EINTR) {
                if (remainingMs(deadline) == 0) return ReadResult::TIMEOUT;
                continue;
            }
            fail(Status::READ_FAIL);
            return ReadResult::ERROR;
        }

        m_rx.append(buf, static_cast<std::size_t>(n));
        if (takeLine(line)) return ReadResult::LINE;

        if (m_rx.size() > MAX_LINE) {
            // Garbage without newlines; resynchronise on the next one.
            m_rx.clear();
            fail(Status::LINE_OVERFLOW);
        }
        if (remainingMs(deadline) == 0) return ReadResult::TIMEOUT;
    }
}

void PosixSerialPort::flushInput() {
    m_rx.clear();
    if (m_rfd >= 0 && m_owns_fds) {
        (void)::tcflush(m_rfd, TCIFLUSH);
    }
}

// -------------------- private helpers --------------------

bool PosixSerialPort::configureTty() {
    speed_t speed{};
    if (!baudToSpeed(m_cfg.baud, speed)) return fail(Status::BAD_BAUD);

    termios tio{};
    if (::tcgetattr(m_rfd, &tio) != 0) {
        // Not a tty (e.g. a FIFO used for testing): usable as a raw byte stream.
        if (errno == ENOTTY) return true;
        return fail(Status::TCGETATTR_FAIL);
    }

    ::cfmakeraw(&tio);
    tio.c_cflag |= (CLOCAL | CREAD);
    tio.c_cflag &= ~CSTOPB;
    tio.c_cflag &= ~CRTSCTS;
    tio.c_cc[VMIN]  = 0;
    tio.c_cc[VTIME] = 0;
    ::cfsetispeed(&tio, speed);
    ::cfsetospeed(&tio, speed);

    if (::tcsetattr(m_rfd, TCSANOW, &tio) != 0) return fail(Status::TCSETATTR_FAIL);
    setNonBlocking(m_rfd);
    return true;
}

bool PosixSerialPort::takeLine(std::string& line) {
    const std::size_t nl = m_rx.find('\n');
    if (nl == std::string::npos) return false;
    line.assign(m_rx, 0, nl);
    m_rx.erase(0, nl + 1);
    return true;
}

// FDIR

bool PosixSerialPort::fail(Status s) {
    m_status = s;

    switch (s) {
        case Status::OPEN_FAIL:
        case Status::TCGETATTR_FAIL:
        case Status::TCSETATTR_FAIL:
        case Status::WRITE_FAIL:
        case Status::READ_FAIL:
            m_errno = errno;
            break;

        default:
            m_errno = 0;   // logic failure
            break;
    }
    return false;
}

const char* PosixSerialPort::StatusStr(PosixSerialPort::Status s) {
    switch (s) {
        case PosixSerialPort::Status::OK:             return "OK";
        case PosixSerialPort::Status::OPEN_FAIL:      return "OPEN_FAIL";
        case PosixSerialPort::Status::TCGETATTR_FAIL: return "TCGETATTR_FAIL";
        case PosixSerialPort::Status::TCSETATTR_FAIL: return "TCSETATTR_FAIL";
        case PosixSerialPort::Status::WRITE_FAIL:     return "WRITE_FAIL";
        case PosixSerialPort::Status::READ_FAIL:      return "READ_FAIL";
        case PosixSerialPort::Status::NOT_OPEN:       return "NOT_OPEN";
        case PosixSerialPort::Status::BAD_BAUD:       return "BAD_BAUD";
        case PosixSerialPort::Status::WRITE_TIMEOUT:  return "WRITE_TIMEOUT";
        case PosixSerialPort::Status::LINE_OVERFLOW:  return "LINE_OVERFLOW";
        default:                                      return "UNKNOWN";
    }
}

} // namespace platform::posix
