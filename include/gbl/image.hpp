#pragma once

#include "gbl/types.hpp"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace gbl {

struct HeaderParseResult {
    bool ok = false;
    std::optional<ParseError> error_kind;
    std::string error;
    Header header;
};

struct ElementParseResult {
    bool ok = false;
    std::optional<ParseError> error_kind;
    std::string error;
    uint32_t tag = 0;   // tag found at offset (also set on unknown_element_tag)
    size_t offset = 0;  // element start
    Element element;
};

struct ImageParseResult {
    bool ok = false;
    std::optional<ParseError> error_kind;
    std::string error;
    std::optional<uint32_t> tag;    // unknown_element_tag only
    std::optional<size_t> offset;   // byte position the error refers to
    Image image;                    // valid if ok
};

// Cheap sniff test: at least 10 bytes and the header tag at offset 0.
// Does not look at structure or checksum.
bool is_valid(const std::vector<uint8_t>& buffer) noexcept;

// Decode the fixed 16-byte header at the start of the buffer.
HeaderParseResult parse_header(const std::vector<uint8_t>& buffer);

// Decode one tagged element starting at offset.
ElementParseResult parse_element(const std::vector<uint8_t>& buffer,
                                 size_t offset,
                                 const ParseOptions& options = {});

// Decode a complete image: header, element sequence up to and including the
// End element, then the whole-buffer checksum. Succeeds only when the elements
// account for every byte and the checksum residue matches.
//
// Example:
//
//     auto result = gbl::parse(bytes);
//     if (!result.ok) {
//         std::cerr << gbl::parse_error_to_string(*result.error_kind) << ": "
//                   << result.error << "\n";
//         return 1;
//     }
//     for (const auto& region : gbl::flash_regions(result.image)) { ... }
//
ImageParseResult parse(const std::vector<uint8_t>& buffer, const ParseOptions& options = {});

} // namespace gbl
