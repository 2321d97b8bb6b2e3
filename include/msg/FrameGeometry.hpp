#pragma once
#include <cstdint>
#include <cstddef>

namespace msg {

// Display geometry shared by host and device.
// Height must be a multiple of 8: the controller addresses the panel in
// 8-pixel-tall pages.
struct FrameGeometry {
    uint32_t width  = 128;   // pixels (columns)
    uint32_t height = 64;    // pixels (rows)

    constexpr uint32_t pages() const { return height / 8; }

    // 8-bit grayscale, row-major
    constexpr std::size_t rawBytes() const { return std::size_t(width) * height; }

    // 1 bit per pixel, page-major
    constexpr std::size_t packedBytes() const { return std::size_t(width) * pages(); }

    constexpr bool valid() const { return width > 0 && height > 0 && (height % 8) == 0; }
};

// ST7567 128x64 panel
constexpr FrameGeometry PANEL_GEOMETRY{};

} // namespace msg
