#include "arplace/placement/object_placer.h"
#include "arplace/core/logging.h"
#include "arplace/core/math.h"
#include "arplace/placement/placement_offset.h"
#include "arplace/placement/scene_host.h"
#include "arplace/protocol/event_queue.h"
#include "arplace/tracking/surface_locator.h"

#include <algorithm>
#include <utility>

namespace arplace {

using protocol::ErrorSource;
using protocol::EventType;

namespace {
constexpr float kDefaultForward = 4.0f;
constexpr float kDefaultUp = 0.0f;
} // namespace

ObjectPlacer::ObjectPlacer(SurfaceLocator& locator, SceneHost* host, AssetCatalog catalog, PlacerConfig config, EventQueue* events)
    : locator_(locator), host_(host), catalog_(std::move(catalog)), config_(std::move(config)), events_(events) {
    if (config_.offset.forward == kDefaultForward && config_.legacyViewingDistance != kDefaultForward) {
        config_.offset.forward = config_.legacyViewingDistance;
    }
    if (config_.offset.up == kDefaultUp && config_.legacyYOffset != kDefaultUp) {
        config_.offset.up = config_.legacyYOffset;
    }
    config_.scaleFactor = std::max(config_.minScaleFactor, config_.scaleFactor);
    if (host_) lastCameraPosition_ = host_->cameraPosition();
}

ObjectPlacer::~ObjectPlacer() {
    removeCurrent();
}

bool ObjectPlacer::requireHost() {
    if (host_) return true;
    ARPLACE_LOG_WARN("ObjectPlacer: no scene host attached");
    fail(ArError::MissingCollaborator);
    return false;
}

void ObjectPlacer::fail(ArError error) {
    lastError_ = error;
    if (events_) events_->recordWarning(error, ErrorSource::Placer);
}

void ObjectPlacer::emitLockChanged() {
    if (!events_) return;
    events_->push(EventType::LockChanged, lock_.isLocked() ? 1u : 0u, lock_.lockCycle());
}

bool ObjectPlacer::hasPlacedObject() const noexcept {
    return current_.has_value() && host_ && host_->isAlive(current_->id);
}

std::int32_t ObjectPlacer::currentAssetIndex() const noexcept {
    return current_ ? static_cast<std::int32_t>(current_->assetIndex) : -1;
}

const CachedAsset* ObjectPlacer::currentAsset() const noexcept {
    if (!current_) return nullptr;
    return catalog_.find(static_cast<std::int32_t>(current_->assetIndex));
}

Vec3 ObjectPlacer::computePosition(const CachedAsset* asset) const noexcept {
    return computePlacementPosition(
        locator_.current().pose.position,
        config_.offset,
        asset ? &asset->pivot : nullptr,
        config_.scaleFactor);
}

Quat ObjectPlacer::computeRotation(const CachedAsset& asset, const Vec3& position) const noexcept {
    const Vec3 camera = host_ ? host_->cameraPosition() : Vec3{};
    return computePlacementRotation(asset.localRotation, config_.rotationOffset, config_.faceCamera, position, camera);
}

bool ObjectPlacer::place(std::int32_t assetIndex) {
    if (!requireHost()) return false;

    if (!locator_.isValid() && !lock_.isLocked()) {
        ARPLACE_LOG_WARN("ObjectPlacer: no valid placement surface, point the device at a plane");
        fail(ArError::NoValidSurface);
        return false;
    }
    if (!catalog_.inRange(assetIndex)) {
        ARPLACE_LOG_WARN("ObjectPlacer: invalid asset index %d", assetIndex);
        fail(ArError::InvalidIndex);
        return false;
    }
    const CachedAsset* asset = catalog_.find(assetIndex);
    if (!asset) {
        ARPLACE_LOG_WARN("ObjectPlacer: asset slot %d is empty", assetIndex);
        fail(ArError::NullAsset);
        return false;
    }

    // Single slot: the previous object goes before the next one exists.
    removeCurrent();

    // The lock engages only once the host has produced the object.
    const bool wasLocked = lock_.isLocked();
    const Vec3 position = wasLocked ? lock_.placement().position : computePosition(asset);
    const Quat rotation = computeRotation(*asset, position);
    const ObjectId id = host_->instantiate(asset->index, position, rotation);
    if (id == kInvalidObjectId) {
        ARPLACE_LOG_WARN("ObjectPlacer: host refused to instantiate asset %d", assetIndex);
        fail(ArError::InvalidOperation);
        return false;
    }

    if (!wasLocked) {
        lock_.lock(position, locator_.current());
        ARPLACE_LOG_DEBUG("ObjectPlacer: position locked at (%.3f, %.3f, %.3f)", position.x, position.y, position.z);
        emitLockChanged();
    }

    PlacedObjectHandle handle{};
    handle.id = id;
    handle.assetIndex = asset->index;
    handle.targetScale = asset->localScale * config_.scaleFactor;

    host_->setScale(id, Vec3{});
    host_->configureStatic(id);
    current_ = handle;
    tweens_.start(makeScaleTween(id, Vec3{}, handle.targetScale, config_.scaleUpDuration, config_.scaleUpCurve));
    lastCameraPosition_ = host_->cameraPosition();
    lastError_ = ArError::Ok;

    ARPLACE_LOG_DEBUG("ObjectPlacer: placed '%s' as object %u (scale %.3f, faceCamera %d)",
                      asset->name.c_str(), id, config_.scaleFactor, config_.faceCamera ? 1 : 0);
    if (events_) events_->push(EventType::ObjectPlaced, id, asset->index);
    updateMarker();
    return true;
}

void ObjectPlacer::removeCurrent() {
    if (!current_) return;
    const PlacedObjectHandle handle = *current_;
    current_.reset();
    tweens_.cancelTarget(handle.id);
    if (host_ && host_->isAlive(handle.id)) {
        host_->destroy(handle.id);
    }
    ARPLACE_LOG_DEBUG("ObjectPlacer: removed object %u", handle.id);
    if (events_) events_->push(EventType::ObjectCleared, handle.id, handle.assetIndex);
}

void ObjectPlacer::clear() {
    removeCurrent();
    unlock();
    lastError_ = ArError::Ok;
}

void ObjectPlacer::unlock() {
    if (!lock_.isLocked()) return;
    lock_.unlock();
    ARPLACE_LOG_DEBUG("ObjectPlacer: position unlocked");
    emitLockChanged();
    updateMarker();
}

bool ObjectPlacer::forceReposition() {
    if (!requireHost()) return false;
    if (!hasPlacedObject()) {
        ARPLACE_LOG_WARN("ObjectPlacer: nothing placed to reposition");
        fail(ArError::InvalidOperation);
        return false;
    }
    if (!locator_.isValid()) {
        ARPLACE_LOG_WARN("ObjectPlacer: cannot reposition without a valid surface pose");
        fail(ArError::NoValidSurface);
        return false;
    }

    const CachedAsset* asset = currentAsset();
    const Vec3 position = computePosition(asset);
    lock_.forceRelock(position, locator_.current());
    emitLockChanged();

    const ObjectId id = current_->id;
    tweens_.start(makePositionTween(id, host_->position(id), position, config_.repositionDuration));
    if (asset) {
        tweens_.start(makeRotationTween(id, host_->rotation(id), computeRotation(*asset, position), config_.repositionDuration));
    }
    lastError_ = ArError::Ok;
    ARPLACE_LOG_DEBUG("ObjectPlacer: force-repositioned and re-locked at (%.3f, %.3f, %.3f)", position.x, position.y, position.z);
    updateMarker();
    return true;
}

void ObjectPlacer::repositionCurrent() {
    if (lock_.isLocked() || !hasPlacedObject() || !locator_.isValid()) return;

    const ObjectId id = current_->id;
    const CachedAsset* asset = currentAsset();
    const Vec3 position = computePosition(asset);
    tweens_.start(makePositionTween(id, host_->position(id), position, config_.repositionDuration));
    if (config_.faceCamera && asset) {
        tweens_.start(makeRotationTween(id, host_->rotation(id), computeRotation(*asset, position), config_.repositionDuration));
    }
}

void ObjectPlacer::onOffsetChanged() {
    if (lock_.isLocked()) {
        ARPLACE_LOG_DEBUG("ObjectPlacer: position is locked, new offset applies to the next placement");
        return;
    }
    repositionCurrent();
}

void ObjectPlacer::setOffset(float forward, float right, float up) {
    config_.offset = PlacementOffset{forward, right, up};
    config_.legacyViewingDistance = forward;
    config_.legacyYOffset = up;
    onOffsetChanged();
}

void ObjectPlacer::setForwardDistance(float distance) {
    setOffset(distance, config_.offset.right, config_.offset.up);
}

void ObjectPlacer::setRightDistance(float distance) {
    setOffset(config_.offset.forward, distance, config_.offset.up);
}

void ObjectPlacer::setUpDistance(float distance) {
    setOffset(config_.offset.forward, config_.offset.right, distance);
}

void ObjectPlacer::retargetRotation(bool smooth) {
    if (lock_.isLocked() || !hasPlacedObject()) return;
    const CachedAsset* asset = currentAsset();
    if (!asset) return;

    const ObjectId id = current_->id;
    const Quat target = computeRotation(*asset, host_->position(id));
    if (smooth) {
        tweens_.start(makeRotationTween(id, host_->rotation(id), target, config_.repositionDuration));
    } else if (!tweens_.isAnimating(id, TweenChannel::Rotation)) {
        host_->setRotation(id, target);
    }
}

void ObjectPlacer::setFaceCamera(bool faceCamera) {
    config_.faceCamera = faceCamera;
    retargetRotation(true);
}

void ObjectPlacer::setRotationOffset(const Vec3& eulerDeg) {
    config_.rotationOffset = eulerDeg;
    retargetRotation(true);
}

void ObjectPlacer::setScaleFactor(float scaleFactor) {
    config_.scaleFactor = std::max(config_.minScaleFactor, scaleFactor);
    if (!hasPlacedObject()) return;
    const CachedAsset* asset = currentAsset();
    if (!asset) return;

    const ObjectId id = current_->id;
    current_->targetScale = asset->localScale * config_.scaleFactor;
    tweens_.start(makeScaleTween(id, host_->scale(id), current_->targetScale, config_.rescaleDuration, EasingCurve::linear()));
}

void ObjectPlacer::updateMarker() {
    if (lock_.isLocked() || !locator_.isValid()) {
        marker_.visible = false;
        return;
    }
    marker_.visible = true;
    marker_.pose = locator_.current().pose;
}

void ObjectPlacer::tick(float dt) {
    updateMarker();
    if (!host_) return;

    if (config_.faceCamera && !lock_.isLocked() && hasPlacedObject()) {
        if (distance(host_->cameraPosition(), lastCameraPosition_) > config_.cameraRetargetThreshold) refreshCamera();
    }
    tweens_.tick(dt, *host_);
}

void ObjectPlacer::refreshCamera() {
    if (!host_) return;
    lastCameraPosition_ = host_->cameraPosition();
    if (config_.faceCamera) retargetRotation(false);
}

Vec3 ObjectPlacer::placementPosition() const noexcept {
    const SurfacePose& live = locator_.current();
    return lock_.resolve(live.valid ? computePosition(nullptr) : live.pose.position);
}

Pose ObjectPlacer::placementPose() const noexcept {
    return lock_.resolvePose(locator_.current()).pose;
}

bool ObjectPlacer::isPlacementValid() const noexcept {
    return locator_.isValid() || lock_.isLocked();
}

Vec3 ObjectPlacer::preservedScale(std::int32_t assetIndex) const noexcept {
    const CachedAsset* asset = catalog_.find(assetIndex);
    const Vec3 base = asset ? asset->localScale : Vec3{1.0f, 1.0f, 1.0f};
    return base * config_.scaleFactor;
}

Quat ObjectPlacer::preservedRotation(std::int32_t assetIndex) const noexcept {
    const CachedAsset* asset = catalog_.find(assetIndex);
    return asset ? asset->localRotation : Quat{};
}

} // namespace arplace
