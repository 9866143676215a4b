#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <vector>

namespace gbl {

// Fixed-width field readers. Both return std::nullopt when offset + 4 runs
// past the end of the buffer.
std::optional<uint32_t> read_le32(const std::vector<uint8_t>& data, size_t offset);
std::optional<uint32_t> read_be32(const std::vector<uint8_t>& data, size_t offset);

} // namespace gbl
