#pragma once

#include "arplace/core/types.h"
#include <cstdint>
#include <vector>

namespace arplace {

// Trackable categories a raycast may be filtered to (bitmask).
enum class TrackableFilter : std::uint32_t {
    None = 0,
    PlaneWithinPolygon = 1 << 0,
    PlaneWithinBounds = 1 << 1,
    PlaneEstimated = 1 << 2,
    FeaturePoint = 1 << 3,
};

struct RaycastHit {
    Pose pose{};
    float distance{0.0f};
    std::uint32_t trackableId{0};
};

// Supplied by the AR plugin layer. Hits are ranked nearest first.
class RaycastProvider {
public:
    virtual ~RaycastProvider() = default;
    virtual bool raycast(const Vec2& viewportPoint, TrackableFilter filter, std::vector<RaycastHit>& hits) = 0;
};

} // namespace arplace
