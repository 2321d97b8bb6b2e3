#pragma once
#include <cstdint>
#include <cstddef>

#include "msg/FrameGeometry.hpp"

namespace msg {

struct RawFrame {
    // Non-owning pointer to width*height GRAY8 samples, row-major, no padding.
    const uint8_t* data = nullptr;

    // Bytes actually available at data. Must equal geometry.rawBytes().
    std::size_t size = 0;

    FrameGeometry geometry{};

    uint32_t frame_index = 0;   // position in the decoder stream (0-based)
};

} // namespace msg
