#include "gbl/byte_reader.hpp"

namespace gbl {

namespace {

bool fits(const std::vector<uint8_t>& data, size_t offset) {
    return offset <= data.size() && data.size() - offset >= 4;
}

} // namespace

std::optional<uint32_t> read_le32(const std::vector<uint8_t>& data, size_t offset) {
    if (!fits(data, offset)) return std::nullopt;
    const uint8_t* p = data.data() + offset;
    return static_cast<uint32_t>(p[0]) | (static_cast<uint32_t>(p[1]) << 8) |
           (static_cast<uint32_t>(p[2]) << 16) | (static_cast<uint32_t>(p[3]) << 24);
}

std::optional<uint32_t> read_be32(const std::vector<uint8_t>& data, size_t offset) {
    if (!fits(data, offset)) return std::nullopt;
    const uint8_t* p = data.data() + offset;
    return (static_cast<uint32_t>(p[0]) << 24) | (static_cast<uint32_t>(p[1]) << 16) |
           (static_cast<uint32_t>(p[2]) << 8) | static_cast<uint32_t>(p[3]);
}

} // namespace gbl
