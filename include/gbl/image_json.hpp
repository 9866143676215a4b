#pragma once

#include "gbl/types.hpp"

#include <nlohmann/json.hpp>

#include <string>
#include <vector>

namespace gbl {
namespace json {

using json = nlohmann::json;

template<typename T>
struct ParseResult {
    bool ok = false;
    std::string error;
    T value;
    std::vector<std::string> warnings;
};

// Describe a decoded image for reports: header fields, then one object per
// element with its hex tag, kind, declared length, fixed fields and payload size.
json image_to_json(const Image& image);

// Parse decoder options from JSON text:
//
//     { "payload_bounds": "declared" | "to_buffer_end", "verify_checksum": true }
//
// Missing keys keep their defaults. Unknown keys are reported as warnings.
ParseResult<ParseOptions> parse_options_from_json(const std::string& json_str);

} // namespace json
} // namespace gbl
