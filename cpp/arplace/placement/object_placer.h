#pragma once

#include "arplace/animation/tween.h"
#include "arplace/core/easing.h"
#include "arplace/core/types.h"
#include "arplace/placement/asset_catalog.h"
#include "arplace/placement/placement_lock.h"

#include <cstdint>
#include <optional>

namespace arplace {

class EventQueue;
class SceneHost;
class SurfaceLocator;

struct PlacerConfig {
    PlacementOffset offset{};
    // Older single-axis settings. Folded into offset.forward / offset.up at construction
    // when those still hold their defaults.
    float legacyViewingDistance{4.0f};
    float legacyYOffset{0.0f};

    float scaleFactor{0.1f};
    float minScaleFactor{0.01f};
    bool faceCamera{true};
    Vec3 rotationOffset{};  // Euler degrees, applied last

    float scaleUpDuration{1.0f};
    EasingCurve scaleUpCurve{};
    float repositionDuration{1.0f};
    float rescaleDuration{0.5f};
    // Camera travel (metres) before a free object re-aims at the camera.
    float cameraRetargetThreshold{0.01f};
};

// Flat marker that previews where the next placement lands.
struct MarkerState {
    bool visible{false};
    Pose pose{};
};

// Owns at most one placed object and the lock that pins its position.
class ObjectPlacer {
public:
    ObjectPlacer(SurfaceLocator& locator, SceneHost* host, AssetCatalog catalog, PlacerConfig config = {}, EventQueue* events = nullptr);
    ~ObjectPlacer();

    ObjectPlacer(const ObjectPlacer&) = delete;
    ObjectPlacer& operator=(const ObjectPlacer&) = delete;

    // ==============================================================================
    // Lifecycle
    // ==============================================================================
    bool place(std::int32_t assetIndex);
    void clear();
    void removeLast() { clear(); }
    void unlock();
    bool forceReposition();
    // Re-aims a free, camera-facing object at the current camera position.
    void refreshCamera();
    void tick(float dt);

    // ==============================================================================
    // Settings
    // ==============================================================================
    void setOffset(float forward, float right, float up);
    void setForwardDistance(float distance);
    void setRightDistance(float distance);
    void setUpDistance(float distance);
    void setViewingDistance(float distance) { setForwardDistance(distance); }
    void setYOffset(float offset) { setUpDistance(offset); }
    void setFaceCamera(bool faceCamera);
    void setRotationOffset(const Vec3& eulerDeg);
    void setScaleFactor(float scaleFactor);

    // ==============================================================================
    // State Query
    // ==============================================================================
    bool isLocked() const noexcept { return lock_.isLocked(); }
    LockState lockState() const noexcept { return lock_.state(); }
    const PlacementLock& lock() const noexcept { return lock_; }
    const PlacementOffset& offset() const noexcept { return config_.offset; }
    bool hasPlacedObject() const noexcept;
    std::optional<PlacedObjectHandle> currentObject() const noexcept { return current_; }
    std::int32_t currentAssetIndex() const noexcept;
    Vec3 lockedPosition() const noexcept { return lock_.placement().position; }
    Vec3 placementPosition() const noexcept;
    Pose placementPose() const noexcept;
    bool isPlacementValid() const noexcept;
    bool faceCamera() const noexcept { return config_.faceCamera; }
    const Vec3& rotationOffset() const noexcept { return config_.rotationOffset; }
    float scaleFactor() const noexcept { return config_.scaleFactor; }
    Vec3 preservedScale(std::int32_t assetIndex) const noexcept;
    Quat preservedRotation(std::int32_t assetIndex) const noexcept;
    const MarkerState& marker() const noexcept { return marker_; }
    const AssetCatalog& catalog() const noexcept { return catalog_; }
    const TweenRunner& tweens() const noexcept { return tweens_; }
    const PlacerConfig& config() const noexcept { return config_; }
    ArError lastError() const noexcept { return lastError_; }

private:
    bool requireHost();
    void fail(ArError error);
    void removeCurrent();
    Vec3 computePosition(const CachedAsset* asset) const noexcept;
    Quat computeRotation(const CachedAsset& asset, const Vec3& position) const noexcept;
    const CachedAsset* currentAsset() const noexcept;
    void onOffsetChanged();
    void repositionCurrent();
    void retargetRotation(bool smooth);
    void updateMarker();
    void emitLockChanged();

    SurfaceLocator& locator_;
    SceneHost* host_;
    AssetCatalog catalog_;
    PlacerConfig config_;
    EventQueue* events_;

    PlacementLock lock_;
    std::optional<PlacedObjectHandle> current_;
    TweenRunner tweens_;
    MarkerState marker_;
    Vec3 lastCameraPosition_{};
    ArError lastError_ = ArError::Ok;
};

} // namespace arplace
