#include <gtest/gtest.h>
#include "arplace/animation/tween.h"
#include "arplace/core/math.h"
#include "tests/test_fakes.h"

using namespace arplace;
using namespace arplace_test;

TEST(TweenTest, ScaleFollowsCurveAndLandsExactly) {
    FakeSceneHost host;
    const ObjectId id = host.instantiate(0, Vec3{}, Quat{});
    Tween tween = makeScaleTween(id, Vec3{}, Vec3{2.0f, 2.0f, 2.0f}, 1.0f, EasingCurve::easeInOut());

    EXPECT_EQ(stepTween(tween, 0.25f, host), TweenStatus::Running);
    EXPECT_NEAR(host.scale(id).x, 2.0f * 0.15625f, 1e-5f);

    EXPECT_EQ(stepTween(tween, 0.9f, host), TweenStatus::Finished);
    expectVecNear(host.scale(id), Vec3{2.0f, 2.0f, 2.0f}, 0.0f);
}

TEST(TweenTest, StopsWhenTargetIsDestroyed) {
    FakeSceneHost host;
    const ObjectId id = host.instantiate(0, Vec3{}, Quat{});
    Tween tween = makePositionTween(id, Vec3{}, Vec3{0.0f, 0.0f, 1.0f}, 1.0f);

    host.destroy(id);
    EXPECT_EQ(stepTween(tween, 0.1f, host), TweenStatus::Orphaned);
    EXPECT_FLOAT_EQ(tween.elapsed, 0.0f);
}

TEST(TweenTest, RotationUsesNormalizedLerp) {
    FakeSceneHost host;
    const ObjectId id = host.instantiate(0, Vec3{}, Quat{});
    const Quat to = fromEulerDegrees(Vec3{0.0f, 90.0f, 0.0f});
    Tween tween = makeRotationTween(id, Quat{}, to, 1.0f);

    stepTween(tween, 0.5f, host);
    EXPECT_TRUE(nearlyEqual(host.rotation(id), nlerp(Quat{}, to, 0.5f)));
    stepTween(tween, 0.5f, host);
    EXPECT_TRUE(nearlyEqual(host.rotation(id), to));
}

TEST(TweenRunnerTest, NewTweenSupersedesSameChannel) {
    FakeSceneHost host;
    const ObjectId id = host.instantiate(0, Vec3{}, Quat{});
    TweenRunner runner;

    runner.start(makePositionTween(id, Vec3{}, Vec3{10.0f, 0.0f, 0.0f}, 1.0f));
    runner.start(makeScaleTween(id, Vec3{}, Vec3{1.0f, 1.0f, 1.0f}, 1.0f, EasingCurve::linear()));
    runner.start(makePositionTween(id, Vec3{}, Vec3{0.0f, 0.0f, 2.0f}, 1.0f));
    EXPECT_EQ(runner.activeCount(), 2u);

    runner.tick(1.0f, host);
    expectVecNear(host.position(id), Vec3{0.0f, 0.0f, 2.0f});
    EXPECT_EQ(runner.activeCount(), 0u);
}

TEST(TweenRunnerTest, DropsOrphansAndCancelsByTarget) {
    FakeSceneHost host;
    const ObjectId a = host.instantiate(0, Vec3{}, Quat{});
    const ObjectId b = host.instantiate(1, Vec3{}, Quat{});
    TweenRunner runner;
    runner.start(makePositionTween(a, Vec3{}, Vec3{1.0f, 0.0f, 0.0f}, 1.0f));
    runner.start(makePositionTween(b, Vec3{}, Vec3{1.0f, 0.0f, 0.0f}, 1.0f));
    runner.start(makeScaleTween(b, Vec3{}, Vec3{1.0f, 1.0f, 1.0f}, 1.0f, EasingCurve::linear()));

    host.destroy(a);
    runner.tick(0.1f, host);
    EXPECT_EQ(runner.orphanedCount(), 1u);
    EXPECT_EQ(runner.activeCount(), 2u);
    EXPECT_TRUE(runner.isAnimating(b, TweenChannel::Scale));

    runner.cancelTarget(b);
    EXPECT_EQ(runner.activeCount(), 0u);
}
