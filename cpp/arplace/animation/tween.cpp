#include "arplace/animation/tween.h"
#include "arplace/core/logging.h"
#include "arplace/core/math.h"
#include "arplace/placement/scene_host.h"

#include <algorithm>

namespace arplace {

Tween makeScaleTween(ObjectId target, const Vec3& from, const Vec3& to, float duration, const EasingCurve& curve) {
    Tween t{};
    t.target = target;
    t.channel = TweenChannel::Scale;
    t.duration = duration;
    t.curve = curve;
    t.fromVec = from;
    t.toVec = to;
    return t;
}

Tween makePositionTween(ObjectId target, const Vec3& from, const Vec3& to, float duration) {
    Tween t{};
    t.target = target;
    t.channel = TweenChannel::Position;
    t.duration = duration;
    t.curve = EasingCurve::linear();
    t.fromVec = from;
    t.toVec = to;
    return t;
}

Tween makeRotationTween(ObjectId target, const Quat& from, const Quat& to, float duration) {
    Tween t{};
    t.target = target;
    t.channel = TweenChannel::Rotation;
    t.duration = duration;
    t.curve = EasingCurve::linear();
    t.fromRot = from;
    t.toRot = to;
    return t;
}

namespace {
void applyTween(const Tween& tween, float k, SceneHost& host) {
    switch (tween.channel) {
        case TweenChannel::Scale:
            host.setScale(tween.target, tween.fromVec + (tween.toVec - tween.fromVec) * k);
            break;
        case TweenChannel::Position:
            host.setPosition(tween.target, lerp(tween.fromVec, tween.toVec, k));
            break;
        case TweenChannel::Rotation:
            host.setRotation(tween.target, nlerp(tween.fromRot, tween.toRot, k));
            break;
    }
}
} // namespace

TweenStatus stepTween(Tween& tween, float dt, SceneHost& host) {
    if (!host.isAlive(tween.target)) return TweenStatus::Orphaned;

    tween.elapsed += std::max(0.0f, dt);
    if (tween.duration <= 0.0f || tween.elapsed >= tween.duration) {
        applyTween(tween, 1.0f, host);
        return TweenStatus::Finished;
    }
    applyTween(tween, tween.curve.evaluate(tween.elapsed / tween.duration), host);
    return TweenStatus::Running;
}

void TweenRunner::start(const Tween& tween) {
    tweens_.erase(
        std::remove_if(tweens_.begin(), tweens_.end(), [&](const Tween& t) {
            return t.target == tween.target && t.channel == tween.channel;
        }),
        tweens_.end());
    tweens_.push_back(tween);
}

void TweenRunner::tick(float dt, SceneHost& host) {
    std::size_t write = 0;
    for (std::size_t i = 0; i < tweens_.size(); ++i) {
        Tween& tween = tweens_[i];
        const TweenStatus status = stepTween(tween, dt, host);
        if (status == TweenStatus::Running) {
            if (write != i) tweens_[write] = tween;
            write++;
            continue;
        }
        if (status == TweenStatus::Orphaned) {
            orphanedCount_++;
            ARPLACE_LOG_DEBUG("TweenRunner: target %u gone, dropping tween", tween.target);
        }
    }
    tweens_.resize(write);
}

void TweenRunner::cancelTarget(ObjectId target) {
    tweens_.erase(
        std::remove_if(tweens_.begin(), tweens_.end(), [&](const Tween& t) { return t.target == target; }),
        tweens_.end());
}

bool TweenRunner::isAnimating(ObjectId target, TweenChannel channel) const noexcept {
    return std::any_of(tweens_.begin(), tweens_.end(), [&](const Tween& t) {
        return t.target == target && t.channel == channel;
    });
}

} // namespace arplace
