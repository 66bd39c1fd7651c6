#pragma once

#include "arplace/core/types.h"
#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace arplace {

// Load-time description of one placeable asset. `present == false` models an
// unassigned slot in the host's asset list.
struct AssetDescriptor {
    std::string name;
    bool present{true};
    Vec3 localScale{1.0f, 1.0f, 1.0f};
    Quat localRotation{};
    ObjectPivotInfo pivot{};
};

struct CachedAsset {
    std::uint32_t index{0};
    std::string name;
    Vec3 localScale{1.0f, 1.0f, 1.0f};
    Quat localRotation{};
    ObjectPivotInfo pivot{};
};

// Index -> immutable metadata, built once. Instances carry the index they were
// created from, so no lookup by name ever happens.
class AssetCatalog {
public:
    AssetCatalog() = default;
    explicit AssetCatalog(const std::vector<AssetDescriptor>& descriptors);

    // nullptr for out-of-range indices and for empty slots.
    const CachedAsset* find(std::int32_t index) const noexcept;
    bool inRange(std::int32_t index) const noexcept;

    std::size_t size() const noexcept { return slots_.size(); }
    std::size_t presentCount() const noexcept;

private:
    struct Slot {
        bool present{false};
        CachedAsset asset{};
    };
    std::vector<Slot> slots_;
};

} // namespace arplace
