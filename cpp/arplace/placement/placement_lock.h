#pragma once

#include "arplace/core/types.h"
#include <cstdint>

namespace arplace {

enum class LockState : std::uint8_t {
    Unlocked = 0,
    Locked = 1,
};

// Freezes a placement once committed so tracking jitter cannot move a placed object.
//
//   Unlocked --lock()--------> Locked      first successful placement
//   Locked   --unlock()------> Unlocked    clear / explicit unlock
//   Locked   --forceRelock()-> Locked      manual correction from the live pose
class PlacementLock {
public:
    // Captures the position and its source pose. Refused (false) while already locked.
    bool lock(const Vec3& position, const SurfacePose& sourcePose) noexcept;
    void unlock() noexcept;
    // Overwrites the stored placement and (re-)enters Locked.
    void forceRelock(const Vec3& position, const SurfacePose& sourcePose) noexcept;

    // Stored position while locked, otherwise `computed` unchanged.
    Vec3 resolve(const Vec3& computed) const noexcept;
    // Stored source pose while locked, otherwise `live`.
    const SurfacePose& resolvePose(const SurfacePose& live) const noexcept;

    LockState state() const noexcept { return placement_.locked ? LockState::Locked : LockState::Unlocked; }
    bool isLocked() const noexcept { return placement_.locked; }
    const LockedPlacement& placement() const noexcept { return placement_; }
    // Incremented on every Unlocked->Locked transition and every force relock.
    std::uint32_t lockCycle() const noexcept { return lockCycle_; }

private:
    LockedPlacement placement_{};
    std::uint32_t lockCycle_ = 0;
};

} // namespace arplace
