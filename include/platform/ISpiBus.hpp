#pragma once
#include <cstdint>
#include <cstddef>

namespace platform {

// Write-only SPI master. Chip select and D/C are plain GPIOs owned by the
// device driver, not by the bus.
class ISpiBus {
public:
    virtual bool write(const uint8_t* data, std::size_t len) = 0;
    virtual ~ISpiBus() = default;
};

} // namespace platform
