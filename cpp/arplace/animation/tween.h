#pragma once

#include "arplace/core/easing.h"
#include "arplace/core/types.h"

#include <cstddef>
#include <cstdint>
#include <vector>

namespace arplace {

class SceneHost;

enum class TweenChannel : std::uint8_t {
    Scale = 0,
    Position = 1,
    Rotation = 2,
};

enum class TweenStatus : std::uint8_t {
    Running = 0,
    Finished = 1,
    Orphaned = 2,  // target destroyed before completion
};

// Resumable per-frame stepper. Vector channels use fromVec/toVec, rotation uses fromRot/toRot.
struct Tween {
    ObjectId target{kInvalidObjectId};
    TweenChannel channel{TweenChannel::Scale};
    float duration{1.0f};
    float elapsed{0.0f};
    EasingCurve curve{};
    Vec3 fromVec{};
    Vec3 toVec{};
    Quat fromRot{};
    Quat toRot{};
};

Tween makeScaleTween(ObjectId target, const Vec3& from, const Vec3& to, float duration, const EasingCurve& curve);
Tween makePositionTween(ObjectId target, const Vec3& from, const Vec3& to, float duration);
Tween makeRotationTween(ObjectId target, const Quat& from, const Quat& to, float duration);

// Advances one tick. Checks the target is alive before touching it; the final step
// writes the exact end value.
TweenStatus stepTween(Tween& tween, float dt, SceneHost& host);

class TweenRunner {
public:
    // Replaces any running tween on the same target and channel.
    void start(const Tween& tween);
    void tick(float dt, SceneHost& host);
    void cancelTarget(ObjectId target);
    void clear() noexcept { tweens_.clear(); }

    bool isAnimating(ObjectId target, TweenChannel channel) const noexcept;
    std::size_t activeCount() const noexcept { return tweens_.size(); }
    std::uint32_t orphanedCount() const noexcept { return orphanedCount_; }

private:
    std::vector<Tween> tweens_;
    std::uint32_t orphanedCount_ = 0;
};

} // namespace arplace
