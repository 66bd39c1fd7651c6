#pragma once

#include "arplace/chat/chat_log.h"
#include "arplace/gesture/gesture_mapper.h"
#include "arplace/navigation/screen_navigator.h"
#include "arplace/placement/asset_catalog.h"
#include "arplace/placement/object_placer.h"
#include "arplace/protocol/event_queue.h"
#include "arplace/quiz/quiz_session.h"
#include "arplace/tracking/plane_visibility.h"
#include "arplace/tracking/surface_locator.h"

#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <vector>

namespace arplace {

// External collaborators. Any of them may be null; the affected operations then
// report MissingCollaborator.
struct SessionCollaborators {
    RaycastProvider* raycast = nullptr;
    SceneHost* scene = nullptr;
    ScreenSink* screens = nullptr;
    PlaneEventSource* planes = nullptr;
    PlaneVisualSink* planeVisuals = nullptr;
};

struct SessionConfig {
    PlacerConfig placer{};
    NavigatorConfig navigator{};
    QuizData quiz = defaultQuizData();
    QuizCustomization quizCustomization{};
    ChatConfig chat{};
    PinchConfig pinch{};
    RotateConfig rotate{};
    TapConfig tap{};
    std::size_t eventCapacity = EventQueue::kDefaultCapacity;
    bool suppressPlaneVisuals = true;
};

// Composes every runtime component over one event stream and advances them from a single tick.
class ArSession {
public:
    ArSession(const std::vector<AssetDescriptor>& assets, SessionCollaborators collaborators, SessionConfig config = {});
    ~ArSession();

    ArSession(const ArSession&) = delete;
    ArSession& operator=(const ArSession&) = delete;

    // Samples the surface pose, then steps placement, screen fades, quiz and chat.
    void tick(float dt);

    // Maps this frame's touches onto the placed object. Returns true when the object changed.
    bool handleTouches(const std::vector<TouchSample>& touches, float dt);
    // Position of the last completed tap, cleared by the call.
    std::optional<Vec2> takeTap() noexcept;

    protocol::EventBufferMeta pollEvents(std::uint32_t maxEvents) { return events_.poll(maxEvents); }
    void ackResync(std::uint32_t generation) { events_.ackResync(generation); }

    SurfaceLocator& locator() noexcept { return locator_; }
    ObjectPlacer& placer() noexcept { return placer_; }
    ScreenNavigator& navigator() noexcept { return navigator_; }
    QuizSession& quiz() noexcept { return quiz_; }
    ChatLog& chat() noexcept { return chat_; }
    EventQueue& events() noexcept { return events_; }
    const ObjectPlacer& placer() const noexcept { return placer_; }
    const ScreenNavigator& navigator() const noexcept { return navigator_; }
    bool planeVisualsSuppressed() const noexcept { return suppressor_ != nullptr; }
    float gestureScale() const noexcept { return gestureScale_; }
    float elapsedTime() const noexcept { return time_; }

private:
    bool yawObject(ObjectId id, float yawDeg);
    bool pinchObject(ObjectId id, const TouchSample& a, const TouchSample& b);

    EventQueue events_;
    SurfaceLocator locator_;
    SceneHost* scene_;
    ObjectPlacer placer_;
    ScreenNavigator navigator_;
    QuizSession quiz_;
    ChatLog chat_;
    std::unique_ptr<PlaneVisibilitySuppressor> suppressor_;

    PinchConfig pinch_;
    RotateConfig rotate_;
    DragRotator dragRotator_;
    TapDetector tapDetector_;
    std::optional<Vec2> lastTap_;
    ObjectId gestureTarget_ = kInvalidObjectId;
    float gestureScale_ = 1.0f;
    float time_ = 0.0f;
};

} // namespace arplace
