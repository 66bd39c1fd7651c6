#include <gtest/gtest.h>
#include "arplace/core/math.h"
#include "arplace/placement/placement_offset.h"
#include "tests/test_fakes.h"

using namespace arplace;
using arplace_test::expectVecNear;

TEST(PlacementOffsetTest, NegativePivotLiftsObjectOntoSurface) {
    const Vec3 surface{1.0f, 0.2f, -3.0f};
    ObjectPivotInfo pivot;
    pivot.localPivotOffsetY = -0.5f;

    const Vec3 result = computePlacementPosition(surface, PlacementOffset{4.0f, 0.0f, 0.0f}, &pivot, 0.1f);
    expectVecNear(result, surface + kWorldForward * 4.0f + kWorldUp * 0.5f);
}

TEST(PlacementOffsetTest, OffsetsUseFixedWorldAxes) {
    const Vec3 result = computePlacementPosition(Vec3{}, PlacementOffset{2.0f, -1.0f, 0.25f}, nullptr, 1.0f);
    expectVecNear(result, Vec3{-1.0f, 0.25f, 2.0f});
}

TEST(PlacementOffsetTest, BoundsBelowPivotAddScaledHalfHeight) {
    ObjectPivotInfo pivot;
    pivot.hasBounds = true;
    pivot.boundsMin = Vec3{0.0f, -2.0f, 0.0f};
    pivot.boundsCenter = Vec3{0.0f, 1.0f, 0.0f};
    pivot.pivotWorldY = 0.0f;

    EXPECT_FLOAT_EQ(computeGroundCompensation(pivot, 0.1f), 0.3f);

    pivot.boundsMin.y = 0.5f;
    EXPECT_FLOAT_EQ(computeGroundCompensation(pivot, 0.1f), 0.0f);
}

TEST(PlacementOffsetTest, PositivePivotNeedsNoCompensation) {
    ObjectPivotInfo pivot;
    pivot.localPivotOffsetY = 0.4f;
    EXPECT_FLOAT_EQ(computeGroundCompensation(pivot, 1.0f), 0.0f);
}

TEST(PlacementOffsetTest, FaceCameraTurnsAwayFromCameraHorizontally) {
    // Camera sits at -Z with some height; the object looks along +Z.
    const Quat q = computePlacementRotation(Quat{}, Vec3{}, true, Vec3{0.0f, 0.0f, 4.0f}, Vec3{0.0f, 1.5f, 0.0f});
    expectVecNear(rotate(q, kWorldForward), kWorldForward);

    const Quat side = computePlacementRotation(Quat{}, Vec3{}, true, Vec3{}, Vec3{-3.0f, 0.0f, 0.0f});
    expectVecNear(rotate(side, kWorldForward), kWorldRight);
}

TEST(PlacementOffsetTest, RotationOffsetAppliesLast) {
    const Quat preserved = fromEulerDegrees(Vec3{-90.0f, 0.0f, 0.0f});
    const Quat q = computePlacementRotation(preserved, Vec3{0.0f, 0.0f, 90.0f}, false, Vec3{}, Vec3{});
    EXPECT_TRUE(nearlyEqual(q, preserved * fromEulerDegrees(Vec3{0.0f, 0.0f, 90.0f})));

    const Quat untouched = computePlacementRotation(preserved, Vec3{}, false, Vec3{}, Vec3{});
    EXPECT_TRUE(nearlyEqual(untouched, preserved));
}
