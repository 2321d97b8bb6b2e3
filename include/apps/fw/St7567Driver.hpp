#pragma once
#include <array>
#include <cstdint>
#include <cstddef>
#include <vector>

#include "msg/FrameGeometry.hpp"
#include "msg/PackedFrame.hpp"
#include "platform/IGpio.hpp"
#include "platform/ISpiBus.hpp"

namespace fw {

struct St7567Config {
    int cs_pin  = 13;
    int dc_pin  = 9;
    int rst_pin = 8;

    msg::FrameGeometry geometry{};

    uint8_t col_offset      = 0;      // first visible column in controller RAM
    uint8_t line_offset     = 0;      // display start line 0..63
    bool    com_reverse     = true;
    bool    segment_reverse = false;
};

// ---------------------------------------------------------------------------
// ST7567 page-addressed 1-bit LCD controller on a write-only SPI bus.
// CS is asserted per command, and once for a whole frame in Show().
// D/C low = command, high = data.
// ---------------------------------------------------------------------------
class St7567Driver {
public:
    // Controller opcodes
    static constexpr uint8_t CMD_RESET         = 0xE2;
    static constexpr uint8_t CMD_DISPLAY_OFF   = 0xAE;
    static constexpr uint8_t CMD_DISPLAY_ON    = 0xAF;
    static constexpr uint8_t CMD_BIAS          = 0xA2;   // | 1 for 1/7
    static constexpr uint8_t CMD_SEG_DIR       = 0xA0;   // | 1 for reverse
    static constexpr uint8_t CMD_COM_DIR       = 0xC0;   // | 0x08 for reverse
    static constexpr uint8_t CMD_START_LINE    = 0x40;   // | line
    static constexpr uint8_t CMD_POWER_ALL_ON  = 0x2F;   // booster+regulator+follower
    static constexpr uint8_t CMD_REG_RATIO     = 0x20;   // | ratio
    static constexpr uint8_t CMD_SET_CONTRAST  = 0x81;   // followed by 0..63
    static constexpr uint8_t CMD_NORMAL        = 0xA6;
    static constexpr uint8_t CMD_INVERSE       = 0xA7;
    static constexpr uint8_t CMD_ALL_PTS_NORMAL = 0xA4;
    static constexpr uint8_t CMD_PAGE_ADDR     = 0xB0;   // | page
    static constexpr uint8_t CMD_COL_HI        = 0x10;   // | col >> 4
    static constexpr uint8_t CMD_COL_LO        = 0x00;   // | col & 0x0F

    St7567Driver(platform::ISpiBus& spi, platform::IGpio& gpio, const St7567Config& cfg);

    // Configure control pins, pulse RST, run the init sequence.
    bool Init(int contrast, int reg_ratio, bool bias_1_7, bool invert);

    // Stream one packed frame (geometry.packedBytes() bytes, page-major).
    bool Show(const uint8_t* frame, std::size_t len);
    bool Show(const msg::PackedFrame& frame) { return Show(frame.bytes.data(), frame.bytes.size()); }

    // All pixels set (true) or clear (false), sent as one full frame.
    bool Fill(bool on);

    // Runtime adjustments; each value is clamped to its register range.
    bool setContrast(int contrast);
    bool setRegulationRatio(int ratio);
    bool setBias(bool bias_1_7);
    bool setInvert(bool invert);

    const msg::FrameGeometry& geometry() const { return m_cfg.geometry; }

    enum class Status : uint8_t {
        OK = 0,
        SPI_FAIL,
        BAD_FRAME_SIZE,
    };

    static const char* StatusStr(Status s);
    Status lastStatus() const { return m_status; }

private:
    platform::ISpiBus& m_spi;
    platform::IGpio&   m_gpio;
    St7567Config       m_cfg{};

    // Page select + column address, rewritten per page.
    std::array<uint8_t, 3> m_page_cmd{};
    std::vector<uint8_t>   m_fill_buf;

    Status m_status = Status::OK;

    void hwReset();
    bool cmd(uint8_t b);
    bool fail(Status s);
};

} // namespace fw
