#include "gbl/types.hpp"

#include <algorithm>
#include <cctype>
#include <type_traits>

namespace gbl {

namespace {

std::string to_lower(const std::string& s) {
    std::string result = s;
    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return result;
}

} // namespace

std::optional<PayloadBounds> parse_payload_bounds(const std::string& s) {
    std::string lower = to_lower(s);
    if (lower == "declared") return PayloadBounds::declared;
    if (lower == "to_buffer_end") return PayloadBounds::to_buffer_end;
    return std::nullopt;
}

uint32_t element_tag(const Element& element) {
    return std::visit([](const auto& e) -> uint32_t {
        using T = std::decay_t<decltype(e)>;
        if constexpr (std::is_same_v<T, ApplicationElement>) {
            return TAG_APPLICATION;
        } else if constexpr (std::is_same_v<T, BootloaderElement>) {
            return TAG_BOOTLOADER;
        } else if constexpr (std::is_same_v<T, SeUpgradeElement>) {
            return TAG_SE_UPGRADE;
        } else if constexpr (std::is_same_v<T, MetadataElement>) {
            return TAG_METADATA;
        } else if constexpr (std::is_same_v<T, ProgramElement>) {
            return e.erase ? TAG_ERASE_PROG : TAG_PROG;
        } else {
            static_assert(std::is_same_v<T, EndElement>, "unhandled element type");
            return TAG_END;
        }
    }, element);
}

uint32_t element_length(const Element& element) {
    return std::visit([](const auto& e) { return e.length; }, element);
}

const char* element_tag_to_string(uint32_t tag) {
    switch (tag) {
        case TAG_APPLICATION: return "application";
        case TAG_BOOTLOADER: return "bootloader";
        case TAG_SE_UPGRADE: return "se_upgrade";
        case TAG_METADATA: return "metadata";
        case TAG_PROG: return "program";
        case TAG_ERASE_PROG: return "erase_program";
        case TAG_END: return "end";
        default: return "unknown";
    }
}

const EndElement* Image::end_element() const {
    for (const auto& element : elements) {
        if (const auto* end = std::get_if<EndElement>(&element)) {
            return end;
        }
    }
    return nullptr;
}

} // namespace gbl
