#include "gbl/flash_regions.hpp"

namespace gbl {

std::vector<FlashRegion> flash_regions(const Image& image) {
    std::vector<FlashRegion> regions;
    for (const auto& element : image.elements) {
        const auto* prog = std::get_if<ProgramElement>(&element);
        if (!prog) continue;

        FlashRegion region;
        region.address = prog->flash_start_address;
        region.erase = prog->erase;
        region.data = prog->data;
        regions.push_back(std::move(region));
    }
    return regions;
}

size_t total_flash_bytes(const Image& image) {
    size_t total = 0;
    for (const auto& element : image.elements) {
        if (const auto* prog = std::get_if<ProgramElement>(&element)) {
            total += prog->data.size();
        }
    }
    return total;
}

} // namespace gbl
