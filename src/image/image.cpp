#include "gbl/image.hpp"
#include "gbl/byte_reader.hpp"
#include "gbl/checksum.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cinttypes>
#include <cstdio>

namespace gbl {

namespace {

constexpr size_t MIN_CANDIDATE_SIZE = 10;

std::string hex32(uint32_t value) {
    char buf[11];
    std::snprintf(buf, sizeof(buf), "0x%08" PRIx32, value);
    return buf;
}

ImageParseResult fail(ParseError kind, std::string message,
                      std::optional<size_t> offset = std::nullopt) {
    spdlog::warn("gbl: parse failed ({}): {}", parse_error_to_string(kind), message);
    ImageParseResult result;
    result.ok = false;
    result.error_kind = kind;
    result.error = std::move(message);
    result.offset = offset;
    return result;
}

} // namespace

bool is_valid(const std::vector<uint8_t>& buffer) noexcept {
    if (buffer.size() < MIN_CANDIDATE_SIZE) {
        return false;
    }
    auto tag = read_le32(buffer, 0);
    return tag && *tag == TAG_HEADER;
}

HeaderParseResult parse_header(const std::vector<uint8_t>& buffer) {
    HeaderParseResult result;

    if (buffer.size() < HEADER_SIZE) {
        result.error_kind = ParseError::malformed_header;
        result.error = "header_too_small";
        return result;
    }

    // Size checked above, the reads cannot fail.
    uint32_t tag = *read_le32(buffer, 0);
    if (tag != TAG_HEADER) {
        result.error_kind = ParseError::malformed_header;
        result.error = "Unknown header tag " + hex32(tag);
        return result;
    }

    result.header.tag = tag;
    result.header.length = *read_le32(buffer, 4);
    result.header.version = *read_be32(buffer, 8);
    result.header.type = *read_be32(buffer, 12);
    result.ok = true;
    return result;
}

ImageParseResult parse(const std::vector<uint8_t>& buffer, const ParseOptions& options) {
    auto header = parse_header(buffer);
    if (!header.ok) {
        return fail(*header.error_kind, header.error, size_t{0});
    }

    // 64-bit cursor: declared lengths are untrusted 32-bit values.
    uint64_t position = ELEMENT_PREFIX_SIZE + static_cast<uint64_t>(header.header.length);
    spdlog::debug("gbl: header version {} type {}, elements start at {}",
                  hex32(header.header.version), header.header.type, position);

    std::vector<Element> elements;
    while (position < buffer.size()) {
        auto parsed = parse_element(buffer, static_cast<size_t>(position), options);
        if (!parsed.ok) {
            auto result = fail(*parsed.error_kind, parsed.error, parsed.offset);
            if (*parsed.error_kind == ParseError::unknown_element_tag) {
                result.tag = parsed.tag;
            }
            return result;
        }

        position += ELEMENT_PREFIX_SIZE + static_cast<uint64_t>(element_length(parsed.element));
        elements.push_back(std::move(parsed.element));

        if (parsed.tag == TAG_END) {
            break;
        }
    }

    if (position != buffer.size()) {
        std::string message = position < buffer.size() ? "Image contains trailing data"
                                                        : "Image is missing data";
        return fail(ParseError::trailing_data,
                    message + " (elements end at " + std::to_string(position) +
                        ", image is " + std::to_string(buffer.size()) + " bytes)",
                    static_cast<size_t>(std::min<uint64_t>(position, buffer.size())));
    }

    if (options.verify_checksum) {
        uint32_t crc = compute_crc32(buffer);
        if (crc != VALID_IMAGE_CRC) {
            return fail(ParseError::checksum_mismatch,
                        "Image CRC-32 is invalid (residue " + hex32(crc) + ", expected " +
                            hex32(VALID_IMAGE_CRC) + ")");
        }
    }

    ImageParseResult result;
    result.ok = true;
    result.image.header = header.header;
    result.image.elements = std::move(elements);
    spdlog::debug("gbl: decoded {} elements", result.image.elements.size());
    return result;
}

} // namespace gbl
