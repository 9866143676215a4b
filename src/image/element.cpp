#include "gbl/byte_reader.hpp"
#include "gbl/image.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cinttypes>
#include <cstdio>
#include <initializer_list>
#include <string>

namespace gbl {

namespace {

std::string hex32(uint32_t value) {
    char buf[11];
    std::snprintf(buf, sizeof(buf), "0x%" PRIx32, value);
    return buf;
}

ElementParseResult fail(ElementParseResult result, ParseError kind, std::string message) {
    result.ok = false;
    result.error_kind = kind;
    result.error = std::move(message);
    return result;
}

// Byte range handed to the caller for a payload starting at data_start.
// element_end is element start + 8 + declared length and may lie past the buffer.
std::vector<uint8_t> slice_payload(const std::vector<uint8_t>& buffer,
                                   size_t data_start,
                                   uint64_t element_end,
                                   PayloadBounds bounds) {
    uint64_t end = buffer.size();
    if (bounds == PayloadBounds::declared) {
        end = std::min<uint64_t>(end, element_end);
    }
    if (data_start >= end) return {};
    return std::vector<uint8_t>(buffer.begin() + static_cast<ptrdiff_t>(data_start),
                                buffer.begin() + static_cast<ptrdiff_t>(end));
}

// Consecutive big-endian fields starting at offset. False if any of them runs
// past the buffer.
bool read_fields(const std::vector<uint8_t>& buffer, size_t offset,
                 std::initializer_list<uint32_t*> fields) {
    for (uint32_t* field : fields) {
        auto v = read_be32(buffer, offset);
        if (!v) return false;
        *field = *v;
        offset += 4;
    }
    return true;
}

} // namespace

ElementParseResult parse_element(const std::vector<uint8_t>& buffer,
                                 size_t offset,
                                 const ParseOptions& options) {
    ElementParseResult result;
    result.offset = offset;

    auto tag = read_le32(buffer, offset);
    auto len = read_le32(buffer, offset + 4);
    if (!tag || !len) {
        return fail(std::move(result), ParseError::truncated_element,
                    "element prefix truncated at position " + std::to_string(offset));
    }
    result.tag = *tag;

    const size_t fields = offset + ELEMENT_PREFIX_SIZE;
    const uint64_t element_end = static_cast<uint64_t>(offset) + ELEMENT_PREFIX_SIZE + *len;
    const auto bounds = options.payload_bounds;
    bool fields_ok = false;

    switch (*tag) {
        case TAG_APPLICATION: {
            ApplicationElement e;
            e.length = *len;
            fields_ok = read_fields(buffer, fields, {&e.type, &e.version, &e.capabilities});
            if (fields_ok) {
                e.product_id = slice_payload(buffer, fields + 12, element_end, bounds);
                result.element = std::move(e);
            }
            break;
        }
        case TAG_BOOTLOADER: {
            BootloaderElement e;
            e.length = *len;
            fields_ok = read_fields(buffer, fields, {&e.bootloader_version, &e.address});
            if (fields_ok) {
                e.data = slice_payload(buffer, fields + 8, element_end, bounds);
                result.element = std::move(e);
            }
            break;
        }
        case TAG_SE_UPGRADE: {
            SeUpgradeElement e;
            e.length = *len;
            fields_ok = read_fields(buffer, fields, {&e.blob_size, &e.version});
            if (fields_ok) {
                e.data = slice_payload(buffer, fields + 8, element_end, bounds);
                result.element = std::move(e);
            }
            break;
        }
        case TAG_METADATA: {
            MetadataElement e;
            e.length = *len;
            e.metadata = slice_payload(buffer, fields, element_end, bounds);
            result.element = std::move(e);
            fields_ok = true;
            break;
        }
        case TAG_PROG:
        case TAG_ERASE_PROG: {
            ProgramElement e;
            e.length = *len;
            e.erase = (*tag == TAG_ERASE_PROG);
            fields_ok = read_fields(buffer, fields, {&e.flash_start_address});
            if (fields_ok) {
                e.data = slice_payload(buffer, fields + 4, element_end, bounds);
                result.element = std::move(e);
            }
            break;
        }
        case TAG_END: {
            EndElement e;
            e.length = *len;
            fields_ok = read_fields(buffer, fields, {&e.ebl_crc});
            if (fields_ok) {
                result.element = e;
            }
            break;
        }
        default:
            return fail(std::move(result), ParseError::unknown_element_tag,
                        "unknown tag " + hex32(*tag) + " at position " + std::to_string(offset));
    }

    if (!fields_ok) {
        return fail(std::move(result), ParseError::truncated_element,
                    std::string(element_tag_to_string(*tag)) + " element truncated at position " +
                        std::to_string(offset));
    }

    spdlog::debug("gbl: {} element at {} (length {})", element_tag_to_string(*tag), offset, *len);
    result.ok = true;
    return result;
}

} // namespace gbl
