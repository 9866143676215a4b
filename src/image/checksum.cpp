#include "gbl/checksum.hpp"
#include "gbl/types.hpp"

#include <zlib.h>

#include <algorithm>
#include <limits>

namespace gbl {

uint32_t compute_crc32(const std::vector<uint8_t>& data) {
    uLong crc = crc32(0L, Z_NULL, 0);
    const Bytef* p = data.data();
    size_t remaining = data.size();
    // crc32() takes a uInt length; feed large buffers in chunks.
    while (remaining > 0) {
        uInt chunk = static_cast<uInt>(
            std::min<size_t>(remaining, std::numeric_limits<uInt>::max()));
        crc = crc32(crc, p, chunk);
        p += chunk;
        remaining -= chunk;
    }
    return static_cast<uint32_t>(crc);
}

bool verify_image_crc(const std::vector<uint8_t>& data) {
    return compute_crc32(data) == VALID_IMAGE_CRC;
}

} // namespace gbl
