#pragma once
#include <cstdint>
#include <cstddef>
#include <vector>

#include "msg/FrameGeometry.hpp"

namespace msg {

// Device-ready 1-bit frame in page-major layout:
//   byte p*width + x holds the 8 vertical pixels of page p, column x,
//   bit 0 = topmost row of the page. A set bit is a set (dark) pixel.
struct PackedFrame {
    std::vector<uint8_t> bytes;
    FrameGeometry geometry{};

    bool shapeOk() const { return bytes.size() == geometry.packedBytes(); }

    const uint8_t* page(uint32_t p) const { return bytes.data() + std::size_t(p) * geometry.width; }
};

} // namespace msg
