#include "arplace/placement/placement_lock.h"

namespace arplace {

bool PlacementLock::lock(const Vec3& position, const SurfacePose& sourcePose) noexcept {
    if (placement_.locked) return false;
    placement_.position = position;
    placement_.sourcePose = sourcePose;
    placement_.locked = true;
    lockCycle_++;
    return true;
}

void PlacementLock::unlock() noexcept {
    placement_ = LockedPlacement{};
}

void PlacementLock::forceRelock(const Vec3& position, const SurfacePose& sourcePose) noexcept {
    placement_.position = position;
    placement_.sourcePose = sourcePose;
    placement_.locked = true;
    lockCycle_++;
}

Vec3 PlacementLock::resolve(const Vec3& computed) const noexcept {
    return placement_.locked ? placement_.position : computed;
}

const SurfacePose& PlacementLock::resolvePose(const SurfacePose& live) const noexcept {
    return placement_.locked ? placement_.sourcePose : live;
}

} // namespace arplace
