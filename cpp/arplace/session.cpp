#include "arplace/session.h"
#include "arplace/core/logging.h"
#include "arplace/core/math.h"
#include "arplace/placement/scene_host.h"

#include <algorithm>
#include <utility>

namespace arplace {

ArSession::ArSession(const std::vector<AssetDescriptor>& assets, SessionCollaborators collaborators, SessionConfig config)
    : events_(config.eventCapacity),
      locator_(collaborators.raycast, &events_),
      scene_(collaborators.scene),
      placer_(locator_, collaborators.scene, AssetCatalog(assets), config.placer, &events_),
      navigator_(config.navigator, collaborators.screens, &events_),
      quiz_(std::move(config.quiz), config.quizCustomization, &events_),
      chat_(config.chat, &events_),
      pinch_(config.pinch),
      rotate_(config.rotate),
      dragRotator_(config.rotate),
      tapDetector_(config.tap) {
    if (config.suppressPlaneVisuals && collaborators.planes && collaborators.planeVisuals) {
        suppressor_ = std::make_unique<PlaneVisibilitySuppressor>(*collaborators.planes, *collaborators.planeVisuals);
    } else if (config.suppressPlaneVisuals) {
        ARPLACE_LOG_DEBUG("ArSession: plane collaborators missing, plane visuals left as-is");
    }
}

ArSession::~ArSession() = default;

void ArSession::tick(float dt) {
    dt = std::max(0.0f, dt);
    time_ += dt;
    locator_.update();
    placer_.tick(dt);
    // A scale tween rewrites the base scale, so the pinch multiplier starts over.
    if (gestureTarget_ != kInvalidObjectId && placer_.tweens().isAnimating(gestureTarget_, TweenChannel::Scale)) {
        gestureScale_ = 1.0f;
    }
    navigator_.tick(dt);
    quiz_.tick(dt);
    chat_.tick(dt);
}

std::optional<Vec2> ArSession::takeTap() noexcept {
    std::optional<Vec2> tap = lastTap_;
    lastTap_.reset();
    return tap;
}

bool ArSession::yawObject(ObjectId id, float yawDeg) {
    if (yawDeg == 0.0f) return false;
    scene_->setRotation(id, applyWorldYaw(scene_->rotation(id), yawDeg));
    return true;
}

bool ArSession::pinchObject(ObjectId id, const TouchSample& a, const TouchSample& b) {
    // The scale tween owns the scale until it settles.
    if (placer_.tweens().isAnimating(id, TweenChannel::Scale)) return false;

    const Vec3 current{gestureScale_, gestureScale_, gestureScale_};
    const Vec3 next = arplace::applyPinch(current, a, b, pinch_);
    if (next.x == gestureScale_) return false;
    gestureScale_ = next.x;
    scene_->setScale(id, placer_.currentObject()->targetScale * gestureScale_);
    return true;
}

bool ArSession::handleTouches(const std::vector<TouchSample>& touches, float dt) {
    if (touches.empty()) return false;

    if (const auto tap = tapDetector_.update(touches.front(), time_)) lastTap_ = tap;

    if (!scene_ || !placer_.hasPlacedObject()) {
        dragRotator_.reset();
        return false;
    }
    const ObjectId id = placer_.currentObject()->id;
    if (id != gestureTarget_) {
        gestureTarget_ = id;
        gestureScale_ = 1.0f;
        dragRotator_.reset();
    }

    if (touches.size() == 1) return yawObject(id, dragRotator_.update(touches.front(), dt));

    dragRotator_.reset();
    if (touches.size() != 2) return false;
    const bool scaled = pinchObject(id, touches[0], touches[1]);
    const bool rotated = yawObject(id, twistYawDelta(touches[0], touches[1], rotate_));
    return scaled || rotated;
}

} // namespace arplace
