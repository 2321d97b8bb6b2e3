#pragma once
#include <cstdint>
#include <deque>
#include <map>
#include <string>
#include <vector>

#include "platform/IGpio.hpp"
#include "platform/IPwm.hpp"
#include "platform/ISerialPort.hpp"
#include "platform/ISpiBus.hpp"

namespace platform::sim {

// ------------------------------
// In-memory board used by the desktop runner and the tests.
// Every peripheral records what was done to it, in order.
// ------------------------------

struct GpioEvent {
    int  pin;
    bool high;
};

class SimGpio : public IGpio {
public:
    bool setMode(int pin, PinMode mode) override;
    bool write(int pin, bool high) override;
    bool read(int pin) override;

    // Drive an input externally (button press = false on active-low lines).
    void setInput(int pin, bool high);

    bool level(int pin) const;          // last level written or injected
    PinMode mode(int pin) const;        // INPUT if never configured
    bool configured(int pin) const;

    const std::vector<GpioEvent>& events() const { return m_events; }
    void clearEvents() { m_events.clear(); }

private:
    std::map<int, bool>    m_levels;
    std::map<int, PinMode> m_modes;
    std::vector<GpioEvent> m_events;
};

// One SPI write together with the control lines sampled at that moment.
struct SpiTransfer {
    bool dc_high;   // false = command, true = data
    bool cs_high;   // false = selected
    std::vector<uint8_t> bytes;
};

class SimSpiBus : public ISpiBus {
public:
    SimSpiBus(SimGpio& gpio, int cs_pin, int dc_pin);

    bool write(const uint8_t* data, std::size_t len) override;

    const std::vector<SpiTransfer>& transfers() const { return m_xfers; }
    void clear() { m_xfers.clear(); }

    // All bytes sent with D/C low, in order.
    std::vector<uint8_t> commandBytes() const;

private:
    SimGpio& m_gpio;
    int m_cs = -1;
    int m_dc = -1;
    std::vector<SpiTransfer> m_xfers;
};

class SimPwm : public IPwm {
public:
    explicit SimPwm(bool available = true) : m_available(available) {}

    bool init(int pin, uint32_t freq_hz) override;
    bool setDutyU16(uint16_t duty) override;

    int      pin()  const { return m_pin; }
    uint32_t freq() const { return m_freq; }
    uint16_t duty() const { return m_duty; }

private:
    bool     m_available = true;
    int      m_pin = -1;
    uint32_t m_freq = 0;
    uint16_t m_duty = 0;
};

// Scripted serial link: queued input lines, captured output bytes.
class SimSerialPort : public ISerialPort {
public:
    WriteResult writeAll(const uint8_t* data, std::size_t len, int timeout_ms) override;
    ReadResult readLine(std::string& line, int timeout_ms) override;
    void flushInput() override { m_rx.clear(); }

    void pushLine(const std::string& line) { m_rx.push_back(line); }
    void closeInput() { m_closed = true; }

    // Every write from now on returns `r` (OK restores normal operation).
    void failWrites(WriteResult r) { m_write_result = r; }

    const std::string& written() const { return m_tx; }
    std::vector<std::string> writtenLines() const;
    void clearWritten() { m_tx.clear(); }

private:
    std::deque<std::string> m_rx;
    std::string m_tx;
    bool m_closed = false;
    WriteResult m_write_result = WriteResult::OK;
};

} // namespace platform::sim
