#pragma once

#include "gbl/types.hpp"

#include <cstdint>
#include <vector>

namespace gbl {

// A contiguous run of bytes destined for device flash.
struct FlashRegion {
    uint32_t address = 0;
    bool erase = false; // erase the target range before programming
    std::vector<uint8_t> data;
};

// Program and Erase-and-Program payloads of an image, in stream order.
std::vector<FlashRegion> flash_regions(const Image& image);

// Sum of all flash region sizes.
size_t total_flash_bytes(const Image& image);

} // namespace gbl
