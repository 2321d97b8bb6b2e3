// LinuxBoard.cpp
#include "platform/linux/LinuxBoard.hpp"

#include <linux/spi/spidev.h>
#include <fcntl.h>
#include <unistd.h>
#include <sys/ioctl.h>
#include <errno.h>
#include <string.h>

#include <iostream>
#include <string>

namespace {

// Retry ioctl if interrupted by a signal.
static int xioctl(int fd, unsigned long req, void* arg) {
    int r;
    do { r = ::ioctl(fd, req, arg); }
    while (r == -1 && errno == EINTR);
    return r;
}

// Write a short string to a sysfs attribute.
static bool writeAttr(const std::string& path, const std::string& value) {
    const int fd = ::open(path.c_str(), O_WRONLY | O_CLOEXEC);
    if (fd < 0) return false;
    const ssize_t n = ::write(fd, value.data(), value.size());
    const int saved = errno;
    ::close(fd);
    errno = saved;
    return n == static_cast<ssize_t>(value.size());
}

static bool pathExists(const std::string& path) {
    return ::access(path.c_str(), F_OK) == 0;
}

} // anonymous namespace

namespace platform::posix {

// =======================
// SpidevBus
// =======================

SpidevBus::SpidevBus(const SpidevConfig& cfg)
: m_cfg(cfg) {}

SpidevBus::~SpidevBus() {
    Close();
}

bool SpidevBus::Open() {
    if (m_fd >= 0) return true;

    m_fd = ::open(m_cfg.dev, O_RDWR | O_CLOEXEC);
    if (m_fd < 0) {
        m_errno = errno;
        std::cerr << "[SPI] open " << m_cfg.dev << " failed errno=" << m_errno
                  << " " << ::strerror(m_errno) << "\n";
        return false;
    }

    uint8_t mode = SPI_MODE_0;
    uint8_t bits = 8;
    uint32_t speed = m_cfg.speed_hz;

    if (xioctl(m_fd, SPI_IOC_WR_MODE, &mode) == -1 ||
        xioctl(m_fd, SPI_IOC_WR_BITS_PER_WORD, &bits) == -1 ||
        xioctl(m_fd, SPI_IOC_WR_MAX_SPEED_HZ, &speed) == -1) {
        m_errno = errno;
        std::cerr << "[SPI] configure failed errno=" << m_errno << "\n";
        Close();
        return false;
    }
    return true;
}

void SpidevBus::Close() {
    if (m_fd >= 0) {
        ::close(m_fd);
        m_fd = -1;
    }
}

bool SpidevBus::write(const uint8_t* data, std::size_t len) {
    if (m_fd < 0) return false;

    while (len > 0) {
        const std::size_t n = len > MAX_XFER ? MAX_XFER : len;

        spi_ioc_transfer xfer{};
        xfer.tx_buf        = reinterpret_cast<uintptr_t>(data);
        xfer.len           = static_cast<uint32_t>(n);
        xfer.speed_hz      = m_cfg.speed_hz;
        xfer.bits_per_word = 8;

        if (xioctl(m_fd, SPI_IOC_MESSAGE(1), &xfer) < 0) {
            m_errno = errno;
            return false;
        }
        data += n;
        len  -= n;
    }
    return true;
}

// =======================
// SysfsGpio
// =======================

SysfsGpio::SysfsGpio(int chip_base)
: m_base(chip_base) {}

SysfsGpio::~SysfsGpio() {
    for (auto& kv : m_value_fds) {
        ::close(kv.second);
    }
}

bool SysfsGpio::setMode(int pin, PinMode mode) {
    if (!exportPin(pin)) return false;

    const std::string dir = "/sys/class/gpio/gpio" + std::to_string(m_base + pin) + "/direction";
    switch (mode) {
        case PinMode::OUTPUT:
            // "high"/"low" would glitch; start low, callers set the level right after.
            return writeAttr(dir, "out");
        case PinMode::INPUT_PULLUP:
            // sysfs has no bias control; the board is expected to pull up.
        case PinMode::INPUT:
            return writeAttr(dir, "in");
        default:
            return false;
    }
}

bool SysfsGpio::write(int pin, bool high) {
    const int fd = valueFd(pin);
    if (fd < 0) return false;
    const char c = high ? '1' : '0';
    return ::pwrite(fd, &c, 1, 0) == 1;
}

bool SysfsGpio::read(int pin) {
    const int fd = valueFd(pin);
    if (fd < 0) return true;   // reads as released (inputs are active-low)
    char c = '1';
    if (::pread(fd, &c, 1, 0) != 1) return true;
    return c != '0';
}

bool SysfsGpio::exportPin(int pin) {
    const std::string line = std::to_string(m_base + pin);
    if (pathExists("/sys/class/gpio/gpio" + line)) return true;
    if (!writeAttr("/sys/class/gpio/export", line)) {
        std::cerr << "[GPIO] export " << line << " failed errno=" << errno << "\n";
        return false;
    }
    return true;
}

int SysfsGpio::valueFd(int pin) {
    auto it = m_value_fds.find(pin);
    if (it != m_value_fds.end()) return it->second;

    const std::string path = "/sys/class/gpio/gpio" + std::to_string(m_base + pin) + "/value";
    const int fd = ::open(path.c_str(), O_RDWR | O_CLOEXEC);
    if (fd < 0) return -1;
    m_value_fds[pin] = fd;
    return fd;
}

// =======================
// SysfsPwm
// =======================

SysfsPwm::SysfsPwm(const SysfsPwmConfig& cfg)
: m_cfg(cfg) {
    m_dir = "/sys/class/pwm/pwmchip" + std::to_string(m_cfg.chip) + "/pwm" + std::to_string(m_cfg.channel);
}

SysfsPwm::~SysfsPwm() {
    if (m_ready) (void)writeAttr(m_dir + "/enable", "0");
}

bool SysfsPwm::init(int pin, uint32_t freq_hz) {
    if (freq_hz == 0) return false;

    if (!pathExists(m_dir)) {
        const std::string chip = "/sys/class/pwm/pwmchip" + std::to_string(m_cfg.chip);
        if (!writeAttr(chip + "/export", std::to_string(m_cfg.channel))) {
            std::cerr << "[PWM] no pwmchip" << m_cfg.chip << "/pwm" << m_cfg.channel
                      << " for pin " << pin << "\n";
            return false;
        }
    }

    m_period_ns = 1000000000ull / freq_hz;
    if (!writeAttr(m_dir + "/duty_cycle", "0")) return false;
    if (!writeAttr(m_dir + "/period", std::to_string(m_period_ns))) return false;
    if (!writeAttr(m_dir + "/enable", "1")) return false;

    m_ready = true;
    return true;
}

bool SysfsPwm::setDutyU16(uint16_t duty) {
    if (!m_ready) return false;
    const uint64_t ns = (m_period_ns * duty) / 65535ull;
    return writeAttr(m_dir + "/duty_cycle", std::to_string(ns));
}

} // namespace platform::posix
