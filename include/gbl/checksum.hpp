#pragma once

#include <cstdint>
#include <vector>

namespace gbl {

// CRC-32 (IEEE 802.3 / zlib polynomial) over the whole buffer.
uint32_t compute_crc32(const std::vector<uint8_t>& data);

// An image stores its checksum so that the CRC-32 of the complete buffer,
// stored checksum included, equals VALID_IMAGE_CRC.
bool verify_image_crc(const std::vector<uint8_t>& data);

} // namespace gbl
