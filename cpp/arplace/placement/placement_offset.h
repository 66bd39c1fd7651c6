#pragma once

#include "arplace/core/types.h"

namespace arplace {

// Final world position for an object resting on `surfacePosition`.
//   surface + forward*F + right*R + up*U   (fixed world axes)
// plus ground compensation from the asset's pivot and bounds when `pivot` is given:
//   localPivotOffsetY < 0          -> up += |localPivotOffsetY|
//   bounds reach below the pivot   -> up += (boundsCenter.y - boundsMin.y) * scaleFactor
Vec3 computePlacementPosition(
    const Vec3& surfacePosition,
    const PlacementOffset& offset,
    const ObjectPivotInfo* pivot,
    float scaleFactor) noexcept;

// Vertical correction alone (the pivot/bounds part of computePlacementPosition).
float computeGroundCompensation(const ObjectPivotInfo& pivot, float scaleFactor) noexcept;

// Object rotation. With faceCamera the object turns to a horizontal-only look vector
// built from object->camera, composed with the preserved asset rotation; the Euler
// rotation offset (degrees) is appended last when non-zero.
Quat computePlacementRotation(
    const Quat& preservedRotation,
    const Vec3& rotationOffsetDeg,
    bool faceCamera,
    const Vec3& objectPosition,
    const Vec3& cameraPosition) noexcept;

} // namespace arplace
