#ifndef ARPLACE_CORE_TYPES_H
#define ARPLACE_CORE_TYPES_H

#include <cstdint>
#include <cstddef>

// Lightweight value types shared by every runtime module.
// Conventions follow the host engine: Y-up, left-handed, +Z forward, +X right.

namespace arplace {

struct Vec2 {
    float x{0.0f};
    float y{0.0f};
};

struct Vec3 {
    float x{0.0f};
    float y{0.0f};
    float z{0.0f};
};

// Unit quaternion, identity by default.
struct Quat {
    float x{0.0f};
    float y{0.0f};
    float z{0.0f};
    float w{1.0f};
};

struct Pose {
    Vec3 position{};
    Quat rotation{};
};

// Fixed world axes. Offsets are applied along these regardless of device heading.
static constexpr Vec3 kWorldForward{0.0f, 0.0f, 1.0f};
static constexpr Vec3 kWorldRight{1.0f, 0.0f, 0.0f};
static constexpr Vec3 kWorldUp{0.0f, 1.0f, 0.0f};

// Hit pose sampled from the tracking collaborator this update.
struct SurfacePose {
    Pose pose{};
    bool valid{false};
};

// World-axis displacement from the surface hit (metres).
struct PlacementOffset {
    float forward{4.0f};
    float right{0.0f};
    float up{0.0f};
};

// Static per-asset metadata cached at load.
struct ObjectPivotInfo {
    float localPivotOffsetY{0.0f};  // asset root local Y; < 0 means origin sits below the visual base
    bool hasBounds{false};
    Vec3 boundsMin{};
    Vec3 boundsCenter{};
    float pivotWorldY{0.0f};        // world Y of the asset root when the bounds were measured
};

struct LockedPlacement {
    Vec3 position{};
    SurfacePose sourcePose{};
    bool locked{false};
};

using ObjectId = std::uint32_t;
static constexpr ObjectId kInvalidObjectId = 0;

// Single slot owned by a placer. The asset index is stored at creation time.
struct PlacedObjectHandle {
    ObjectId id{kInvalidObjectId};
    std::uint32_t assetIndex{0};
    Vec3 targetScale{1.0f, 1.0f, 1.0f};
};

using ScreenId = std::uint32_t;
static constexpr ScreenId kNoScreen = 0;

enum class ArError : std::uint32_t {
    Ok = 0,
    NoValidSurface = 1,
    InvalidIndex = 2,
    NullAsset = 3,
    MissingCollaborator = 4,
    TransitionInProgress = 5,
    InvalidArgument = 6,
    InvalidOperation = 7,
};

const char* arErrorName(ArError error) noexcept;

} // namespace arplace

#endif // ARPLACE_CORE_TYPES_H
