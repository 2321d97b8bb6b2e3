// SimBoard.cpp
#include "platform/sim/SimBoard.hpp"

namespace platform::sim {

// =======================
// SimGpio
// =======================

bool SimGpio::setMode(int pin, PinMode mode) {
    if (pin < 0) return false;
    m_modes[pin] = mode;
    return true;
}

bool SimGpio::write(int pin, bool high) {
    if (pin < 0) return false;
    m_levels[pin] = high;
    m_events.push_back({pin, high});
    return true;
}

bool SimGpio::read(int pin) {
    auto it = m_levels.find(pin);
    // Undriven lines read high, as with the board's pull-ups.
    return it == m_levels.end() ? true : it->second;
}

void SimGpio::setInput(int pin, bool high) {
    m_levels[pin] = high;
}

bool SimGpio::level(int pin) const {
    auto it = m_levels.find(pin);
    return it == m_levels.end() ? false : it->second;
}

PinMode SimGpio::mode(int pin) const {
    auto it = m_modes.find(pin);
    return it == m_modes.end() ? PinMode::INPUT : it->second;
}

bool SimGpio::configured(int pin) const {
    return m_modes.find(pin) != m_modes.end();
}

// =======================
// SimSpiBus
// =======================

SimSpiBus::SimSpiBus(SimGpio& gpio, int cs_pin, int dc_pin)
: m_gpio(gpio)
, m_cs(cs_pin)
, m_dc(dc_pin) {}

bool SimSpiBus::write(const uint8_t* data, std::size_t len) {
    SpiTransfer x{};
    x.dc_high = m_gpio.level(m_dc);
    x.cs_high = m_gpio.level(m_cs);
    x.bytes.assign(data, data + len);
    m_xfers.push_back(std::move(x));
    return true;
}

std::vector<uint8_t> SimSpiBus::commandBytes() const {
    std::vector<uint8_t> out;
    for (const auto& x : m_xfers) {
        if (!x.dc_high) out.insert(out.end(), x.bytes.begin(), x.bytes.end());
    }
    return out;
}

// =======================
// SimPwm
// =======================

bool SimPwm::init(int pin, uint32_t freq_hz) {
    if (!m_available) return false;
    m_pin  = pin;
    m_freq = freq_hz;
    m_duty = 0;
    return true;
}

bool SimPwm::setDutyU16(uint16_t duty) {
    if (!m_available || m_pin < 0) return false;
    m_duty = duty;
    return true;
}

// =======================
// SimSerialPort
// =======================

WriteResult SimSerialPort::writeAll(const uint8_t* data, std::size_t len, int /*timeout_ms*/) {
    if (m_write_result != WriteResult::OK) return m_write_result;
    m_tx.append(reinterpret_cast<const char*>(data), len);
    return WriteResult::OK;
}

ReadResult SimSerialPort::readLine(std::string& line, int /*timeout_ms*/) {
    if (!m_rx.empty()) {
        line = m_rx.front();
        m_rx.pop_front();
        return ReadResult::LINE;
    }
    return m_closed ? ReadResult::CLOSED : ReadResult::TIMEOUT;
}

std::vector<std::string> SimSerialPort::writtenLines() const {
    std::vector<std::string> lines;
    std::size_t start = 0;
    while (start < m_tx.size()) {
        const std::size_t nl = m_tx.find('\n', start);
        if (nl == std::string::npos) {
            lines.emplace_back(m_tx, start, std::string::npos);
            break;
        }
        lines.emplace_back(m_tx, start, nl - start);
        start = nl + 1;
    }
    return lines;
}

} // namespace platform::sim
