#include "arplace/placement/placement_offset.h"
#include "arplace/core/math.h"

#include <cmath>

namespace arplace {

float computeGroundCompensation(const ObjectPivotInfo& pivot, float scaleFactor) noexcept {
    float up = 0.0f;
    if (pivot.localPivotOffsetY < 0.0f) {
        up += std::fabs(pivot.localPivotOffsetY);
    }
    if (pivot.hasBounds && pivot.boundsMin.y < pivot.pivotWorldY) {
        up += (pivot.boundsCenter.y - pivot.boundsMin.y) * scaleFactor;
    }
    return up;
}

Vec3 computePlacementPosition(
    const Vec3& surfacePosition,
    const PlacementOffset& offset,
    const ObjectPivotInfo* pivot,
    float scaleFactor) noexcept {
    Vec3 displacement{};
    displacement += kWorldForward * offset.forward;
    displacement += kWorldRight * offset.right;
    displacement += kWorldUp * offset.up;

    if (pivot) {
        displacement += kWorldUp * computeGroundCompensation(*pivot, scaleFactor);
    }

    return surfacePosition + displacement;
}

Quat computePlacementRotation(
    const Quat& preservedRotation,
    const Vec3& rotationOffsetDeg,
    bool faceCamera,
    const Vec3& objectPosition,
    const Vec3& cameraPosition) noexcept {
    Quat result = preservedRotation;
    if (faceCamera) {
        Vec3 toCamera = normalized(cameraPosition - objectPosition);
        toCamera.y = 0.0f;
        result = lookRotationHorizontal(toCamera * -1.0f) * preservedRotation;
    }
    if (!isZero(rotationOffsetDeg)) {
        result = result * fromEulerDegrees(rotationOffsetDeg);
    }
    return normalized(result);
}

} // namespace arplace
