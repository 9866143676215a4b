#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace gbl {

// ============================================================================
// Tags (little-endian on the wire)
// ============================================================================

constexpr uint32_t TAG_HEADER = 0x03a617eb;
constexpr uint32_t TAG_APPLICATION = 0xf40a0af4;
constexpr uint32_t TAG_BOOTLOADER = 0xf50909f5;
constexpr uint32_t TAG_SE_UPGRADE = 0x5ea617eb;
constexpr uint32_t TAG_METADATA = 0xf60808f6;
constexpr uint32_t TAG_PROG = 0xfe0101fe;
constexpr uint32_t TAG_ERASE_PROG = 0xfd0303fd;
constexpr uint32_t TAG_END = 0xfc0404fc;

// CRC-32 over a complete image, stored checksum included.
constexpr uint32_t VALID_IMAGE_CRC = 0x2144df1c;

constexpr size_t HEADER_SIZE = 16;
constexpr size_t ELEMENT_PREFIX_SIZE = 8; // tag + length

// ============================================================================
// Parse Errors
// ============================================================================

enum class ParseError {
    malformed_header,
    unknown_element_tag,
    trailing_data,
    checksum_mismatch,
    truncated_element,
};

inline const char* parse_error_to_string(ParseError e) {
    switch (e) {
        case ParseError::malformed_header: return "malformed_header";
        case ParseError::unknown_element_tag: return "unknown_element_tag";
        case ParseError::trailing_data: return "trailing_data";
        case ParseError::checksum_mismatch: return "checksum_mismatch";
        case ParseError::truncated_element: return "truncated_element";
        default: return "unknown";
    }
}

// ============================================================================
// Parse Options
// ============================================================================

// How far a payload byte range extends.
enum class PayloadBounds {
    declared,      // [data_start, element_start + 8 + length), clamped to the buffer
    to_buffer_end, // [data_start, buffer end)
};

inline const char* payload_bounds_to_string(PayloadBounds b) {
    switch (b) {
        case PayloadBounds::declared: return "declared";
        case PayloadBounds::to_buffer_end: return "to_buffer_end";
        default: return "declared";
    }
}

std::optional<PayloadBounds> parse_payload_bounds(const std::string& s);

struct ParseOptions {
    PayloadBounds payload_bounds = PayloadBounds::declared;
    bool verify_checksum = true;
};

// ============================================================================
// Image Model
// ============================================================================

struct Header {
    uint32_t tag = TAG_HEADER;
    uint32_t length = 0;
    uint32_t version = 0;
    uint32_t type = 0;
};

struct ApplicationElement {
    uint32_t length = 0;
    uint32_t type = 0;
    uint32_t version = 0;
    uint32_t capabilities = 0;
    std::vector<uint8_t> product_id;
};

struct BootloaderElement {
    uint32_t length = 0;
    uint32_t bootloader_version = 0;
    uint32_t address = 0;
    std::vector<uint8_t> data;
};

struct SeUpgradeElement {
    uint32_t length = 0;
    uint32_t blob_size = 0;
    uint32_t version = 0;
    std::vector<uint8_t> data;
};

struct MetadataElement {
    uint32_t length = 0;
    std::vector<uint8_t> metadata;
};

// Program and Erase-and-Program share one layout.
struct ProgramElement {
    uint32_t length = 0;
    bool erase = false;
    uint32_t flash_start_address = 0;
    std::vector<uint8_t> data;
};

struct EndElement {
    uint32_t length = 0;
    uint32_t ebl_crc = 0;
};

using Element = std::variant<ApplicationElement,
                             BootloaderElement,
                             SeUpgradeElement,
                             MetadataElement,
                             ProgramElement,
                             EndElement>;

// Wire tag of an element.
uint32_t element_tag(const Element& element);

// Declared length field of an element.
uint32_t element_length(const Element& element);

// Lowercase snake_case name of a known element tag, "unknown" otherwise.
const char* element_tag_to_string(uint32_t tag);

struct Image {
    Header header;
    std::vector<Element> elements; // stream order

    // The End element, if the image carried one.
    const EndElement* end_element() const;
};

} // namespace gbl
