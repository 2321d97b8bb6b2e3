// St7567Driver.cpp
#include "apps/fw/St7567Driver.hpp"
#include "msg/DeviceState.hpp"
#include "os/rtos.hpp"

#include <algorithm>
#include <iostream>

namespace fw {

static inline St7567Config sanitise(const St7567Config& in) {
    St7567Config cfg = in;

    if (!cfg.geometry.valid()) cfg.geometry = msg::PANEL_GEOMETRY;

    // 6-bit start line register
    if (cfg.line_offset > 63) cfg.line_offset = 63;

    // Controller RAM is 132 columns wide.
    const uint32_t max_off = cfg.geometry.width < 132 ? 132 - cfg.geometry.width : 0;
    if (cfg.col_offset > max_off) cfg.col_offset = static_cast<uint8_t>(max_off);

    return cfg;
}

St7567Driver::St7567Driver(platform::ISpiBus& spi, platform::IGpio& gpio, const St7567Config& cfg)
: m_spi(spi)
, m_gpio(gpio)
, m_cfg(sanitise(cfg)) {
    m_fill_buf.assign(m_cfg.geometry.packedBytes(), 0x00);
}

bool St7567Driver::Init(int contrast, int reg_ratio, bool bias_1_7, bool invert) {
    m_status = Status::OK;

    (void)m_gpio.setMode(m_cfg.cs_pin, platform::PinMode::OUTPUT);
    (void)m_gpio.setMode(m_cfg.dc_pin, platform::PinMode::OUTPUT);
    (void)m_gpio.setMode(m_cfg.rst_pin, platform::PinMode::OUTPUT);
    (void)m_gpio.write(m_cfg.cs_pin, true);
    (void)m_gpio.write(m_cfg.dc_pin, false);
    (void)m_gpio.write(m_cfg.rst_pin, true);

    hwReset();

    contrast  = std::clamp(contrast, 0, msg::CONTRAST_MAX);
    reg_ratio = std::clamp(reg_ratio, 0, msg::REG_RATIO_MAX);

    const uint8_t seq[] = {
        CMD_RESET,
        CMD_DISPLAY_OFF,
        static_cast<uint8_t>(CMD_BIAS    | (bias_1_7 ? 1 : 0)),
        static_cast<uint8_t>(CMD_SEG_DIR | (m_cfg.segment_reverse ? 1 : 0)),
        static_cast<uint8_t>(CMD_COM_DIR | (m_cfg.com_reverse ? 0x08 : 0x00)),
        static_cast<uint8_t>(CMD_START_LINE | (m_cfg.line_offset & 0x3F)),
        CMD_POWER_ALL_ON,
        static_cast<uint8_t>(CMD_REG_RATIO | (reg_ratio & 0x07)),
        CMD_SET_CONTRAST,
        static_cast<uint8_t>(contrast & 0x3F),
        invert ? CMD_INVERSE : CMD_NORMAL,
        CMD_ALL_PTS_NORMAL,
        CMD_DISPLAY_ON,
    };

    for (uint8_t b : seq) {
        if (!cmd(b)) {
            std::cerr << "[LCD] init failed: " << StatusStr(m_status) << "\n";
            return false;
        }
    }
    return true;
}

bool St7567Driver::Show(const uint8_t* frame, std::size_t len) {
    const msg::FrameGeometry& g = m_cfg.geometry;
    if (!frame || len != g.packedBytes()) return fail(Status::BAD_FRAME_SIZE);

    const uint8_t col = m_cfg.col_offset;
    bool ok = true;

    // One CS assertion for the whole frame, D/C flips per page.
    (void)m_gpio.write(m_cfg.cs_pin, false);
    for (uint32_t p = 0; p < g.pages() && ok; ++p) {
        m_page_cmd[0] = static_cast<uint8_t>(CMD_PAGE_ADDR | (p & 0x0F));
        m_page_cmd[1] = static_cast<uint8_t>(CMD_COL_HI | (col >> 4));
        m_page_cmd[2] = static_cast<uint8_t>(CMD_COL_LO | (col & 0x0F));

        (void)m_gpio.write(m_cfg.dc_pin, false);
        ok = m_spi.write(m_page_cmd.data(), m_page_cmd.size());
        if (!ok) break;

        (void)m_gpio.write(m_cfg.dc_pin, true);
        ok = m_spi.write(frame + std::size_t(p) * g.width, g.width);
    }
    (void)m_gpio.write(m_cfg.cs_pin, true);

    if (!ok) return fail(Status::SPI_FAIL);
    return true;
}

bool St7567Driver::Fill(bool on) {
    std::fill(m_fill_buf.begin(), m_fill_buf.end(), on ? 0xFF : 0x00);
    return Show(m_fill_buf.data(), m_fill_buf.size());
}

bool St7567Driver::setContrast(int contrast) {
    contrast = std::clamp(contrast, 0, msg::CONTRAST_MAX);
    return cmd(CMD_SET_CONTRAST) && cmd(static_cast<uint8_t>(contrast));
}

bool St7567Driver::setRegulationRatio(int ratio) {
    ratio = std::clamp(ratio, 0, msg::REG_RATIO_MAX);
    return cmd(static_cast<uint8_t>(CMD_REG_RATIO | ratio));
}

bool St7567Driver::setBias(bool bias_1_7) {
    return cmd(static_cast<uint8_t>(CMD_BIAS | (bias_1_7 ? 1 : 0)));
}

bool St7567Driver::setInvert(bool invert) {
    return cmd(invert ? CMD_INVERSE : CMD_NORMAL);
}

// -------------------- private helpers --------------------

void St7567Driver::hwReset() {
    (void)m_gpio.write(m_cfg.rst_pin, false);
    Rtos::SleepMs(50);
    (void)m_gpio.write(m_cfg.rst_pin, true);
    Rtos::SleepMs(50);
}

bool St7567Driver::cmd(uint8_t b) {
    (void)m_gpio.write(m_cfg.cs_pin, false);
    (void)m_gpio.write(m_cfg.dc_pin, false);
    const bool ok = m_spi.write(&b, 1);
    (void)m_gpio.write(m_cfg.cs_pin, true);
    return ok ? true : fail(Status::SPI_FAIL);
}

// FDIR

bool St7567Driver::fail(Status s) {
    m_status = s;
    return false;
}

const char* St7567Driver::StatusStr(St7567Driver::Status s) {
    switch (s) {
        case St7567Driver::Status::OK:             return "OK";
        case St7567Driver::Status::SPI_FAIL:       return "SPI_FAIL";
        case St7567Driver::Status::BAD_FRAME_SIZE: return "BAD_FRAME_SIZE";
        default:                                   return "UNKNOWN";
    }
}

} // namespace fw
