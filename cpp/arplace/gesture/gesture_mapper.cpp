#include "arplace/gesture/gesture_mapper.h"
#include "arplace/core/math.h"

#include <algorithm>

namespace arplace {

namespace {
Vec2 previousPosition(const TouchSample& t) noexcept {
    return t.position - t.delta;
}
} // namespace

float pinchDistanceDelta(const TouchSample& a, const TouchSample& b) noexcept {
    const float previous = length(previousPosition(a) - previousPosition(b));
    const float current = length(a.position - b.position);
    return current - previous;
}

Vec3 scaleWithLimits(const Vec3& current, float increment, const PinchConfig& config) noexcept {
    Vec3 next{
        std::clamp(current.x + increment, config.minScale, config.maxScale),
        std::clamp(current.y + increment, config.minScale, config.maxScale),
        std::clamp(current.z + increment, config.minScale, config.maxScale),
    };
    if (current.x <= config.minScale || current.x >= config.maxScale) {
        next = lerp(current, next, 1.0f - config.elasticity);
    }
    return next;
}

Vec3 applyPinch(const Vec3& current, const TouchSample& a, const TouchSample& b, const PinchConfig& config) noexcept {
    return scaleWithLimits(current, pinchDistanceDelta(a, b) * config.sensitivity, config);
}

float twistYawDelta(const TouchSample& a, const TouchSample& b, const RotateConfig& config) noexcept {
    const Vec2 previous = previousPosition(a) - previousPosition(b);
    const Vec2 current = a.position - b.position;
    return -signedAngleDeg(previous, current) * config.twistRate;
}

Quat applyWorldYaw(const Quat& rotation, float yawDeg) noexcept {
    return normalized(axisAngle(kWorldUp, yawDeg * kDegToRad) * rotation);
}

float DragRotator::update(const TouchSample& touch, float dt) noexcept {
    switch (touch.phase) {
        case TouchPhase::Began:
            dragging_ = true;
            lastPosition_ = touch.position;
            return 0.0f;
        case TouchPhase::Moved: {
            if (!dragging_) return 0.0f;
            const float dx = touch.position.x - lastPosition_.x;
            lastPosition_ = touch.position;
            return -dx * config_.dragRate * dt;
        }
        case TouchPhase::Ended:
        case TouchPhase::Canceled:
            dragging_ = false;
            return 0.0f;
        case TouchPhase::Stationary:
            break;
    }
    return 0.0f;
}

std::optional<Vec2> TapDetector::update(const TouchSample& touch, float time) noexcept {
    switch (touch.phase) {
        case TouchPhase::Began:
            touching_ = true;
            startPosition_ = touch.position;
            startTime_ = time;
            break;
        case TouchPhase::Ended: {
            if (!touching_) break;
            touching_ = false;
            const float duration = time - startTime_;
            const float travel = length(touch.position - startPosition_);
            if (duration <= config_.tapThreshold && travel <= config_.dragThreshold) return startPosition_;
            break;
        }
        case TouchPhase::Canceled:
            touching_ = false;
            break;
        case TouchPhase::Moved:
        case TouchPhase::Stationary:
            break;
    }
    return std::nullopt;
}

} // namespace arplace
