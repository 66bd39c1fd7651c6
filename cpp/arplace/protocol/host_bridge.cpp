#include "arplace/protocol/host_bridge.h"
#include "arplace/core/logging.h"

#include <algorithm>

namespace arplace::protocol {

void HostBridge::emit(HostOp op, std::uint32_t id, std::uint32_t aux, std::initializer_list<float> values) {
    HostCommand cmd{};
    cmd.op = static_cast<std::uint32_t>(op);
    cmd.id = id;
    cmd.aux = aux;
    std::size_t i = 0;
    for (const float v : values) {
        if (i >= 7) break;
        cmd.v[i++] = v;
    }
    commands_.push_back(cmd);
    generation_++;
}

void HostBridge::setSurfaceHit(bool valid, const Pose& pose, float distance, std::uint32_t trackableId) {
    hitValid_ = valid;
    hit_.pose = pose;
    hit_.distance = distance;
    hit_.trackableId = trackableId;
}

void HostBridge::notifyPlanes(const PlaneChange& change) {
    for (const std::uint32_t id : change.added) {
        if (std::find(planes_.begin(), planes_.end(), id) == planes_.end()) planes_.push_back(id);
    }
    for (const std::uint32_t id : change.removed) {
        planes_.erase(std::remove(planes_.begin(), planes_.end(), id), planes_.end());
    }
    // Copy so a callback may unsubscribe while we iterate.
    const auto subscribers = planeSubscribers_;
    for (const auto& entry : subscribers) entry.second(change);
}

void HostBridge::markDestroyed(ObjectId id) {
    objects_.erase(id);
}

CommandBufferMeta HostBridge::commandBufferMeta() const noexcept {
    return CommandBufferMeta{
        generation_,
        static_cast<std::uint32_t>(commands_.size()),
        reinterpret_cast<std::uintptr_t>(commands_.data())};
}

void HostBridge::clearCommands() noexcept {
    commands_.clear();
}

std::size_t HostBridge::liveObjectCount() const noexcept {
    return objects_.size();
}

bool HostBridge::raycast(const Vec2& /*viewportPoint*/, TrackableFilter /*filter*/, std::vector<RaycastHit>& hits) {
    hits.clear();
    if (!hitValid_) return false;
    hits.push_back(hit_);
    return true;
}

ObjectId HostBridge::instantiate(std::uint32_t assetIndex, const Vec3& position, const Quat& rotation) {
    const ObjectId id = nextObjectId_++;
    ObjectState state;
    state.assetIndex = assetIndex;
    state.position = position;
    state.rotation = rotation;
    objects_[id] = state;
    emit(HostOp::Instantiate, id, assetIndex,
         {position.x, position.y, position.z, rotation.x, rotation.y, rotation.z, rotation.w});
    return id;
}

void HostBridge::destroy(ObjectId id) {
    if (objects_.erase(id) == 0) return;
    emit(HostOp::Destroy, id, 0, {});
}

bool HostBridge::isAlive(ObjectId id) const {
    return objects_.find(id) != objects_.end();
}

void HostBridge::setPosition(ObjectId id, const Vec3& position) {
    auto it = objects_.find(id);
    if (it == objects_.end()) return;
    it->second.position = position;
    emit(HostOp::SetPosition, id, 0, {position.x, position.y, position.z});
}

void HostBridge::setRotation(ObjectId id, const Quat& rotation) {
    auto it = objects_.find(id);
    if (it == objects_.end()) return;
    it->second.rotation = rotation;
    emit(HostOp::SetRotation, id, 0, {rotation.x, rotation.y, rotation.z, rotation.w});
}

void HostBridge::setScale(ObjectId id, const Vec3& scale) {
    auto it = objects_.find(id);
    if (it == objects_.end()) return;
    it->second.scale = scale;
    emit(HostOp::SetScale, id, 0, {scale.x, scale.y, scale.z});
}

Vec3 HostBridge::position(ObjectId id) const {
    auto it = objects_.find(id);
    return it == objects_.end() ? Vec3{} : it->second.position;
}

Quat HostBridge::rotation(ObjectId id) const {
    auto it = objects_.find(id);
    return it == objects_.end() ? Quat{} : it->second.rotation;
}

Vec3 HostBridge::scale(ObjectId id) const {
    auto it = objects_.find(id);
    return it == objects_.end() ? Vec3{} : it->second.scale;
}

void HostBridge::configureStatic(ObjectId id) {
    if (!isAlive(id)) return;
    emit(HostOp::ConfigureStatic, id, 0, {});
}

void HostBridge::applyScreenVisual(ScreenId screen, const ScreenVisual& visual) {
    std::uint32_t flags = 0;
    if (visual.interactable) flags |= kScreenInteractable;
    if (visual.blocksRaycasts) flags |= kScreenBlocksRaycasts;
    if (visual.active) flags |= kScreenActive;
    emit(HostOp::ScreenVisual, screen, flags, {visual.alpha});
}

std::uint32_t HostBridge::subscribe(PlaneChangeCallback callback) {
    const std::uint32_t id = nextSubscriptionId_++;
    planeSubscribers_.emplace_back(id, std::move(callback));
    return id;
}

void HostBridge::unsubscribe(std::uint32_t subscriptionId) {
    planeSubscribers_.erase(
        std::remove_if(planeSubscribers_.begin(), planeSubscribers_.end(),
                       [&](const auto& entry) { return entry.first == subscriptionId; }),
        planeSubscribers_.end());
}

std::vector<std::uint32_t> HostBridge::trackedPlanes() const {
    return planes_;
}

void HostBridge::setPlaneVisualsEnabled(std::uint32_t planeId, bool enabled) {
    emit(HostOp::PlaneVisual, planeId, enabled ? 1u : 0u, {});
}

} // namespace arplace::protocol
