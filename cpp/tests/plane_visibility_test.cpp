#include <gtest/gtest.h>
#include "arplace/tracking/plane_visibility.h"
#include "tests/test_fakes.h"

using namespace arplace;
using namespace arplace_test;

TEST(PlaneVisibilityTest, HidesTrackedAndNewPlanes) {
    FakePlaneSource source;
    source.tracked = {1, 2};
    FakePlaneVisualSink sink;

    PlaneVisibilitySuppressor suppressor(source, sink);
    EXPECT_TRUE(suppressor.subscribed());
    EXPECT_EQ(sink.planes.size(), 2u);
    EXPECT_FALSE(sink.planes[1]);

    PlaneChange change;
    change.added = {3};
    change.updated = {1};
    source.fire(change);

    EXPECT_FALSE(sink.planes[3]);
    EXPECT_EQ(suppressor.hiddenCount(), 4u);
}

TEST(PlaneVisibilityTest, UnsubscribesOnDestruction) {
    FakePlaneSource source;
    FakePlaneVisualSink sink;
    {
        PlaneVisibilitySuppressor suppressor(source, sink);
        EXPECT_EQ(source.subscribers.size(), 1u);
    }
    EXPECT_TRUE(source.subscribers.empty());
    EXPECT_EQ(source.unsubscribeCount, 1);
}

TEST(PlaneVisibilityTest, SubscriptionMoveTransfersOwnership) {
    FakePlaneSource source;
    PlaneSubscription a(source, [](const PlaneChange&) {});
    const std::uint32_t id = a.id();

    PlaneSubscription b(std::move(a));
    EXPECT_FALSE(a.active());
    EXPECT_TRUE(b.active());
    EXPECT_EQ(b.id(), id);

    b.release();
    EXPECT_FALSE(b.active());
    EXPECT_TRUE(source.subscribers.empty());
    EXPECT_EQ(source.unsubscribeCount, 1);
}
