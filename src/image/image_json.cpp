#include "gbl/image_json.hpp"

#include <cinttypes>
#include <cstdio>
#include <type_traits>

namespace gbl {
namespace json {

namespace {

std::string hex32(uint32_t value) {
    char buf[11];
    std::snprintf(buf, sizeof(buf), "0x%08" PRIx32, value);
    return buf;
}

json element_to_json(const Element& element) {
    uint32_t tag = element_tag(element);

    json j;
    j["tag"] = hex32(tag);
    j["kind"] = element_tag_to_string(tag);
    j["length"] = element_length(element);

    std::visit([&j](const auto& e) {
        using T = std::decay_t<decltype(e)>;
        if constexpr (std::is_same_v<T, ApplicationElement>) {
            j["type"] = e.type;
            j["version"] = hex32(e.version);
            j["capabilities"] = hex32(e.capabilities);
            j["product_id_size"] = e.product_id.size();
        } else if constexpr (std::is_same_v<T, BootloaderElement>) {
            j["bootloader_version"] = hex32(e.bootloader_version);
            j["address"] = hex32(e.address);
            j["size"] = e.data.size();
        } else if constexpr (std::is_same_v<T, SeUpgradeElement>) {
            j["blob_size"] = e.blob_size;
            j["version"] = hex32(e.version);
            j["size"] = e.data.size();
        } else if constexpr (std::is_same_v<T, MetadataElement>) {
            j["size"] = e.metadata.size();
        } else if constexpr (std::is_same_v<T, ProgramElement>) {
            j["flash_start_address"] = hex32(e.flash_start_address);
            j["size"] = e.data.size();
        } else {
            static_assert(std::is_same_v<T, EndElement>, "unhandled element type");
            j["ebl_crc"] = hex32(e.ebl_crc);
        }
    }, element);

    return j;
}

} // namespace

json image_to_json(const Image& image) {
    json j;
    j["header"] = {
        {"tag", hex32(image.header.tag)},
        {"length", image.header.length},
        {"version", hex32(image.header.version)},
        {"type", image.header.type},
    };

    json elements = json::array();
    for (const auto& element : image.elements) {
        elements.push_back(element_to_json(element));
    }
    j["elements"] = std::move(elements);
    return j;
}

ParseResult<ParseOptions> parse_options_from_json(const std::string& json_str) {
    ParseResult<ParseOptions> result;

    json j;
    try {
        j = json::parse(json_str);
    } catch (const json::parse_error& e) {
        result.error = std::string("JSON parse error: ") + e.what();
        return result;
    }

    if (!j.is_object()) {
        result.error = "options must be a JSON object";
        return result;
    }

    for (auto it = j.begin(); it != j.end(); ++it) {
        const auto& key = it.key();
        if (key == "payload_bounds") {
            if (!it->is_string()) {
                result.error = "payload_bounds must be a string";
                return result;
            }
            auto bounds = parse_payload_bounds(it->get<std::string>());
            if (!bounds) {
                result.error = "invalid payload_bounds: " + it->get<std::string>();
                return result;
            }
            result.value.payload_bounds = *bounds;
        } else if (key == "verify_checksum") {
            if (!it->is_boolean()) {
                result.error = "verify_checksum must be a boolean";
                return result;
            }
            result.value.verify_checksum = it->get<bool>();
        } else {
            result.warnings.push_back("unknown_option:" + key);
        }
    }

    result.ok = true;
    return result;
}

} // namespace json
} // namespace gbl
