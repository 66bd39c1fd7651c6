#pragma once

#include "arplace/core/types.h"
#include "arplace/navigation/screen_sink.h"
#include "arplace/placement/scene_host.h"
#include "arplace/tracking/plane_visibility.h"
#include "arplace/tracking/raycast_provider.h"

#include <cstddef>
#include <cstdint>
#include <initializer_list>
#include <unordered_map>
#include <utility>
#include <vector>

namespace arplace::protocol {

enum class HostOp : std::uint32_t {
    Instantiate = 1,      // aux = asset index, v = position xyz, rotation xyzw
    Destroy = 2,
    SetPosition = 3,      // v = xyz
    SetRotation = 4,      // v = xyzw
    SetScale = 5,         // v = xyz
    ConfigureStatic = 6,
    ScreenVisual = 7,     // id = screen, aux = ScreenVisualFlags, v0 = alpha
    PlaneVisual = 8,      // id = plane, aux = 1 enabled / 0 hidden
};

enum ScreenVisualFlags : std::uint32_t {
    kScreenInteractable = 1u << 0,
    kScreenBlocksRaycasts = 1u << 1,
    kScreenActive = 1u << 2,
};

// POD command read by the host from the command buffer after each tick.
struct HostCommand {
    std::uint32_t op;
    std::uint32_t id;
    std::uint32_t aux;
    float v[7];
};

struct CommandBufferMeta {
    std::uint32_t generation;
    std::uint32_t count;
    std::uintptr_t ptr;
};

// Buffered implementation of every collaborator for hosts that cannot call back into
// C++ synchronously. Inputs are pushed in before tick(); scene and visual mutations
// accumulate as HostCommands and are drained by the host afterwards.
class HostBridge final
    : public RaycastProvider,
      public SceneHost,
      public ScreenSink,
      public PlaneEventSource,
      public PlaneVisualSink {
public:
    // ==============================================================================
    // Host input
    // ==============================================================================
    void setSurfaceHit(bool valid, const Pose& pose, float distance = 0.0f, std::uint32_t trackableId = 0);
    void setCameraPosition(const Vec3& position) noexcept { camera_ = position; }
    void notifyPlanes(const PlaneChange& change);
    // Host-side destruction (scene unload); the object stops being alive immediately.
    void markDestroyed(ObjectId id);

    // ==============================================================================
    // Command buffer
    // ==============================================================================
    CommandBufferMeta commandBufferMeta() const noexcept;
    const std::vector<HostCommand>& commands() const noexcept { return commands_; }
    void clearCommands() noexcept;
    std::size_t liveObjectCount() const noexcept;

    // RaycastProvider
    bool raycast(const Vec2& viewportPoint, TrackableFilter filter, std::vector<RaycastHit>& hits) override;

    // SceneHost
    ObjectId instantiate(std::uint32_t assetIndex, const Vec3& position, const Quat& rotation) override;
    void destroy(ObjectId id) override;
    bool isAlive(ObjectId id) const override;
    void setPosition(ObjectId id, const Vec3& position) override;
    void setRotation(ObjectId id, const Quat& rotation) override;
    void setScale(ObjectId id, const Vec3& scale) override;
    Vec3 position(ObjectId id) const override;
    Quat rotation(ObjectId id) const override;
    Vec3 scale(ObjectId id) const override;
    void configureStatic(ObjectId id) override;
    Vec3 cameraPosition() const override { return camera_; }

    // ScreenSink
    void applyScreenVisual(ScreenId screen, const ScreenVisual& visual) override;

    // PlaneEventSource
    std::uint32_t subscribe(PlaneChangeCallback callback) override;
    void unsubscribe(std::uint32_t subscriptionId) override;
    std::vector<std::uint32_t> trackedPlanes() const override;

    // PlaneVisualSink
    void setPlaneVisualsEnabled(std::uint32_t planeId, bool enabled) override;

private:
    struct ObjectState {
        std::uint32_t assetIndex = 0;
        Vec3 position{};
        Quat rotation{};
        Vec3 scale{1.0f, 1.0f, 1.0f};
    };

    void emit(HostOp op, std::uint32_t id, std::uint32_t aux, std::initializer_list<float> values);

    bool hitValid_ = false;
    RaycastHit hit_{};
    Vec3 camera_{};

    std::unordered_map<ObjectId, ObjectState> objects_;
    ObjectId nextObjectId_ = 1;

    std::vector<std::pair<std::uint32_t, PlaneChangeCallback>> planeSubscribers_;
    std::uint32_t nextSubscriptionId_ = 1;
    std::vector<std::uint32_t> planes_;

    std::vector<HostCommand> commands_;
    std::uint32_t generation_ = 0;
};

} // namespace arplace::protocol
