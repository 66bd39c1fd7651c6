#include "arplace/placement/asset_catalog.h"

#include <algorithm>
#include <utility>

namespace arplace {

AssetCatalog::AssetCatalog(const std::vector<AssetDescriptor>& descriptors) {
    slots_.reserve(descriptors.size());
    for (std::size_t i = 0; i < descriptors.size(); ++i) {
        const AssetDescriptor& desc = descriptors[i];
        Slot slot{};
        slot.present = desc.present;
        if (desc.present) {
            slot.asset.index = static_cast<std::uint32_t>(i);
            slot.asset.name = desc.name;
            slot.asset.localScale = desc.localScale;
            slot.asset.localRotation = desc.localRotation;
            slot.asset.pivot = desc.pivot;
        }
        slots_.push_back(std::move(slot));
    }
}

bool AssetCatalog::inRange(std::int32_t index) const noexcept {
    return index >= 0 && static_cast<std::size_t>(index) < slots_.size();
}

const CachedAsset* AssetCatalog::find(std::int32_t index) const noexcept {
    if (!inRange(index)) return nullptr;
    const Slot& slot = slots_[static_cast<std::size_t>(index)];
    return slot.present ? &slot.asset : nullptr;
}

std::size_t AssetCatalog::presentCount() const noexcept {
    return static_cast<std::size_t>(std::count_if(slots_.begin(), slots_.end(), [](const Slot& s) { return s.present; }));
}

} // namespace arplace
