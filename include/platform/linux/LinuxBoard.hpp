#pragma once
#include <cstdint>
#include <map>
#include <string>

#include "platform/IGpio.hpp"
#include "platform/IPwm.hpp"
#include "platform/ISpiBus.hpp"

namespace platform::posix {

// ------------------------------
// spidev master (/dev/spidevB.C), mode 0, 8 bits, MSB first.
// ------------------------------
struct SpidevConfig {
    const char* dev      = "/dev/spidev0.0";
    uint32_t    speed_hz = 20000000;
};

class SpidevBus : public ISpiBus {
public:
    explicit SpidevBus(const SpidevConfig& cfg);
    ~SpidevBus() override;

    SpidevBus(const SpidevBus&) = delete;
    SpidevBus& operator=(const SpidevBus&) = delete;

    bool Open();
    void Close();

    bool write(const uint8_t* data, std::size_t len) override;

    int lastErrno() const { return m_errno; }

private:
    // Kernel default bufsiz for spidev; longer writes are split.
    static constexpr std::size_t MAX_XFER = 4096;

    SpidevConfig m_cfg{};
    int m_fd = -1;
    int m_errno = 0;
};

// ------------------------------
// Legacy sysfs GPIO (/sys/class/gpio). Board pin N maps to global
// line base+N. Value files stay open for the life of the object.
// ------------------------------
class SysfsGpio : public IGpio {
public:
    explicit SysfsGpio(int chip_base = 0);
    ~SysfsGpio() override;

    SysfsGpio(const SysfsGpio&) = delete;
    SysfsGpio& operator=(const SysfsGpio&) = delete;

    bool setMode(int pin, PinMode mode) override;
    bool write(int pin, bool high) override;
    bool read(int pin) override;

private:
    int m_base = 0;
    std::map<int, int> m_value_fds;   // pin -> open value fd

    bool exportPin(int pin);
    int  valueFd(int pin);
};

// ------------------------------
// sysfs PWM (/sys/class/pwm/pwmchipN/pwmM). The board pin is only recorded;
// the pinmux routing the channel to it is set up outside this program.
// ------------------------------
struct SysfsPwmConfig {
    int chip    = 0;
    int channel = 0;
};

class SysfsPwm : public IPwm {
public:
    explicit SysfsPwm(const SysfsPwmConfig& cfg);
    ~SysfsPwm() override;

    bool init(int pin, uint32_t freq_hz) override;
    bool setDutyU16(uint16_t duty) override;

private:
    SysfsPwmConfig m_cfg{};
    std::string m_dir;
    uint64_t m_period_ns = 0;
    bool m_ready = false;
};

} // namespace platform::posix
