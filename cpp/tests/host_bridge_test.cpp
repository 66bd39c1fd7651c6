#include <gtest/gtest.h>
#include "arplace/protocol/host_bridge.h"
#include "arplace/tracking/plane_visibility.h"
#include "tests/test_fakes.h"

using namespace arplace;
using namespace arplace::protocol;
using namespace arplace_test;

namespace {
const HostCommand& lastCommand(const HostBridge& bridge) {
    return bridge.commands().back();
}

std::uint32_t op(HostOp value) {
    return static_cast<std::uint32_t>(value);
}
} // namespace

TEST(HostBridgeTest, RaycastReflectsLatestHit) {
    HostBridge bridge;
    std::vector<RaycastHit> hits;
    EXPECT_FALSE(bridge.raycast(Vec2{0.5f, 0.5f}, TrackableFilter::PlaneWithinPolygon, hits));
    EXPECT_TRUE(hits.empty());

    bridge.setSurfaceHit(true, Pose{Vec3{0.0f, -1.0f, 2.0f}, Quat{}}, 2.2f, 7);
    ASSERT_TRUE(bridge.raycast(Vec2{0.5f, 0.5f}, TrackableFilter::PlaneWithinPolygon, hits));
    ASSERT_EQ(hits.size(), 1u);
    expectVecNear(hits[0].pose.position, Vec3{0.0f, -1.0f, 2.0f});
    EXPECT_FLOAT_EQ(hits[0].distance, 2.2f);
    EXPECT_EQ(hits[0].trackableId, 7u);

    bridge.setSurfaceHit(false, Pose{});
    EXPECT_FALSE(bridge.raycast(Vec2{0.5f, 0.5f}, TrackableFilter::PlaneWithinPolygon, hits));
    EXPECT_TRUE(hits.empty());
}

TEST(HostBridgeTest, InstantiateRecordsCommand) {
    HostBridge bridge;
    const ObjectId id = bridge.instantiate(2, Vec3{1.0f, 2.0f, 3.0f}, Quat{0.0f, 0.0f, 0.0f, 1.0f});
    EXPECT_EQ(id, 1u);
    EXPECT_TRUE(bridge.isAlive(id));
    EXPECT_EQ(bridge.liveObjectCount(), 1u);

    const HostCommand& cmd = lastCommand(bridge);
    EXPECT_EQ(cmd.op, op(HostOp::Instantiate));
    EXPECT_EQ(cmd.id, id);
    EXPECT_EQ(cmd.aux, 2u);
    EXPECT_FLOAT_EQ(cmd.v[0], 1.0f);
    EXPECT_FLOAT_EQ(cmd.v[2], 3.0f);
    EXPECT_FLOAT_EQ(cmd.v[6], 1.0f);

    EXPECT_EQ(bridge.instantiate(0, Vec3{}, Quat{}), 2u);
}

TEST(HostBridgeTest, TransformSettersTrackState) {
    HostBridge bridge;
    const ObjectId id = bridge.instantiate(0, Vec3{}, Quat{});
    bridge.setPosition(id, Vec3{0.0f, 1.0f, 0.0f});
    bridge.setScale(id, Vec3{0.5f, 0.5f, 0.5f});
    bridge.configureStatic(id);

    expectVecNear(bridge.position(id), Vec3{0.0f, 1.0f, 0.0f});
    expectVecNear(bridge.scale(id), Vec3{0.5f, 0.5f, 0.5f});
    ASSERT_EQ(bridge.commands().size(), 4u);
    EXPECT_EQ(bridge.commands()[1].op, op(HostOp::SetPosition));
    EXPECT_EQ(bridge.commands()[2].op, op(HostOp::SetScale));
    EXPECT_EQ(bridge.commands()[3].op, op(HostOp::ConfigureStatic));
}

TEST(HostBridgeTest, DeadObjectsEmitNothing) {
    HostBridge bridge;
    const ObjectId id = bridge.instantiate(0, Vec3{}, Quat{});
    bridge.clearCommands();

    bridge.markDestroyed(id);
    EXPECT_FALSE(bridge.isAlive(id));
    bridge.setPosition(id, Vec3{1.0f, 0.0f, 0.0f});
    bridge.setRotation(id, Quat{});
    bridge.configureStatic(id);
    bridge.destroy(id);
    EXPECT_TRUE(bridge.commands().empty());
    expectVecNear(bridge.position(id), Vec3{});
}

TEST(HostBridgeTest, DestroyRemovesLiveObject) {
    HostBridge bridge;
    const ObjectId id = bridge.instantiate(0, Vec3{}, Quat{});
    bridge.destroy(id);
    EXPECT_FALSE(bridge.isAlive(id));
    EXPECT_EQ(bridge.liveObjectCount(), 0u);
    EXPECT_EQ(lastCommand(bridge).op, op(HostOp::Destroy));
}

TEST(HostBridgeTest, BufferMetaTracksGeneration) {
    HostBridge bridge;
    const CommandBufferMeta empty = bridge.commandBufferMeta();
    EXPECT_EQ(empty.count, 0u);

    bridge.instantiate(0, Vec3{}, Quat{});
    bridge.applyScreenVisual(4, ScreenVisual{0.25f, true, false, true});
    const CommandBufferMeta meta = bridge.commandBufferMeta();
    EXPECT_EQ(meta.count, 2u);
    EXPECT_EQ(meta.generation, empty.generation + 2);

    const auto* cmds = reinterpret_cast<const HostCommand*>(meta.ptr);
    ASSERT_NE(cmds, nullptr);
    EXPECT_EQ(cmds[1].op, op(HostOp::ScreenVisual));
    EXPECT_EQ(cmds[1].id, 4u);
    EXPECT_EQ(cmds[1].aux, static_cast<std::uint32_t>(kScreenInteractable | kScreenActive));
    EXPECT_FLOAT_EQ(cmds[1].v[0], 0.25f);

    bridge.clearCommands();
    EXPECT_EQ(bridge.commandBufferMeta().count, 0u);
    EXPECT_EQ(bridge.commandBufferMeta().generation, meta.generation);
}

TEST(HostBridgeTest, PlaneNotificationsReachSubscribers) {
    HostBridge bridge;
    std::vector<std::uint32_t> seen;
    const std::uint32_t sub = bridge.subscribe([&](const PlaneChange& change) {
        seen.insert(seen.end(), change.added.begin(), change.added.end());
    });

    PlaneChange change;
    change.added = {3, 5};
    bridge.notifyPlanes(change);
    EXPECT_EQ(seen, (std::vector<std::uint32_t>{3, 5}));
    EXPECT_EQ(bridge.trackedPlanes(), (std::vector<std::uint32_t>{3, 5}));

    PlaneChange removal;
    removal.removed = {3};
    bridge.notifyPlanes(removal);
    EXPECT_EQ(bridge.trackedPlanes(), (std::vector<std::uint32_t>{5}));

    bridge.unsubscribe(sub);
    change.added = {9};
    bridge.notifyPlanes(change);
    EXPECT_EQ(seen.size(), 2u);
}

TEST(HostBridgeTest, SuppressorHidesPlanesThroughCommands) {
    HostBridge bridge;
    PlaneChange change;
    change.added = {11};
    bridge.notifyPlanes(change);

    PlaneVisibilitySuppressor suppressor(bridge, bridge);
    ASSERT_FALSE(bridge.commands().empty());
    EXPECT_EQ(lastCommand(bridge).op, op(HostOp::PlaneVisual));
    EXPECT_EQ(lastCommand(bridge).id, 11u);
    EXPECT_EQ(lastCommand(bridge).aux, 0u);

    change.added = {12};
    bridge.notifyPlanes(change);
    EXPECT_EQ(lastCommand(bridge).id, 12u);
    EXPECT_EQ(suppressor.hiddenCount(), 2u);
}
