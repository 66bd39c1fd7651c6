#include <gtest/gtest.h>
#include "arplace/core/easing.h"
#include "arplace/core/math.h"
#include "arplace/tracking/surface_locator.h"
#include "tests/test_fakes.h"

using namespace arplace;
using arplace_test::expectVecNear;

TEST(MathTest, EulerYawTurnsForwardToRight) {
    const Quat q = fromEulerDegrees(Vec3{0.0f, 90.0f, 0.0f});
    expectVecNear(rotate(q, kWorldForward), kWorldRight);
}

TEST(MathTest, EulerDecompositionRecoversAngles) {
    const Vec3 euler = toEulerDegrees(fromEulerDegrees(Vec3{30.0f, 45.0f, 60.0f}));
    EXPECT_NEAR(euler.x, 30.0f, 1e-2f);
    EXPECT_NEAR(euler.y, 45.0f, 1e-2f);
    EXPECT_NEAR(euler.z, 60.0f, 1e-2f);

    const Vec3 negative = toEulerDegrees(fromEulerDegrees(Vec3{0.0f, -30.0f, 0.0f}));
    EXPECT_NEAR(negative.y, 330.0f, 1e-2f);
}

TEST(MathTest, FlattenKeepsOnlyRollAboutNormal) {
    const Pose raw{Vec3{1.0f, 2.0f, 3.0f}, fromEulerDegrees(Vec3{10.0f, 20.0f, 30.0f})};
    const Pose flat = flattenHitPose(raw);

    expectVecNear(flat.position, raw.position);
    EXPECT_TRUE(nearlyEqual(flat.rotation, fromEulerDegrees(Vec3{-90.0f, 0.0f, 30.0f})));
}

TEST(MathTest, LookRotationIgnoresHeight) {
    const Quat q = lookRotationHorizontal(Vec3{2.0f, 5.0f, 0.0f});
    expectVecNear(rotate(q, kWorldForward), kWorldRight);

    const Quat straightUp = lookRotationHorizontal(Vec3{0.0f, 3.0f, 0.0f});
    EXPECT_TRUE(nearlyEqual(straightUp, Quat{}));
}

TEST(MathTest, NlerpTakesShortestArc) {
    const Quat q = fromEulerDegrees(Vec3{0.0f, 40.0f, 0.0f});
    const Quat negated{-q.x, -q.y, -q.z, -q.w};
    EXPECT_TRUE(nearlyEqual(nlerp(q, negated, 0.5f), q));
}

TEST(MathTest, SignedAngleIsCounterClockwisePositive) {
    EXPECT_NEAR(signedAngleDeg(Vec2{1.0f, 0.0f}, Vec2{0.0f, 1.0f}), 90.0f, 1e-3f);
    EXPECT_NEAR(signedAngleDeg(Vec2{1.0f, 0.0f}, Vec2{0.0f, -1.0f}), -90.0f, 1e-3f);
    EXPECT_FLOAT_EQ(signedAngleDeg(Vec2{}, Vec2{1.0f, 0.0f}), 0.0f);
}

TEST(EasingTest, EaseInOutIsSymmetricAndClamped) {
    const EasingCurve curve = EasingCurve::easeInOut();
    EXPECT_FLOAT_EQ(curve.evaluate(0.0f), 0.0f);
    EXPECT_FLOAT_EQ(curve.evaluate(0.5f), 0.5f);
    EXPECT_FLOAT_EQ(curve.evaluate(0.25f), 0.15625f);
    EXPECT_FLOAT_EQ(curve.evaluate(2.0f), 1.0f);
    EXPECT_FLOAT_EQ(curve.evaluate(-1.0f), 0.0f);
}

TEST(EasingTest, LinearAndConstant) {
    EXPECT_FLOAT_EQ(EasingCurve::linear().evaluate(0.3f), 0.3f);
    const EasingCurve hold{EasingKind::Constant, 0.0f, 2.0f};
    EXPECT_FLOAT_EQ(hold.evaluate(0.1f), 2.0f);
}

TEST(ErrorTest, NamesEveryError) {
    EXPECT_STREQ(arErrorName(ArError::Ok), "Ok");
    EXPECT_STREQ(arErrorName(ArError::NoValidSurface), "NoValidSurface");
    EXPECT_STREQ(arErrorName(ArError::TransitionInProgress), "TransitionInProgress");
}
