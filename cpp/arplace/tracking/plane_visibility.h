#pragma once

#include <cstdint>
#include <functional>
#include <vector>

namespace arplace {

struct PlaneChange {
    std::vector<std::uint32_t> added;
    std::vector<std::uint32_t> updated;
    std::vector<std::uint32_t> removed;
};

using PlaneChangeCallback = std::function<void(const PlaneChange&)>;

// Plane-detection event stream from the AR plugin.
class PlaneEventSource {
public:
    virtual ~PlaneEventSource() = default;
    virtual std::uint32_t subscribe(PlaneChangeCallback callback) = 0;
    virtual void unsubscribe(std::uint32_t subscriptionId) = 0;
    virtual std::vector<std::uint32_t> trackedPlanes() const = 0;
};

// Toggles a plane's mesh and outline renderers.
class PlaneVisualSink {
public:
    virtual ~PlaneVisualSink() = default;
    virtual void setPlaneVisualsEnabled(std::uint32_t planeId, bool enabled) = 0;
};

// Move-only registration handle; unsubscribes when released or destroyed.
class PlaneSubscription {
public:
    PlaneSubscription() = default;
    PlaneSubscription(PlaneEventSource& source, PlaneChangeCallback callback);
    ~PlaneSubscription();

    PlaneSubscription(const PlaneSubscription&) = delete;
    PlaneSubscription& operator=(const PlaneSubscription&) = delete;
    PlaneSubscription(PlaneSubscription&& other) noexcept;
    PlaneSubscription& operator=(PlaneSubscription&& other) noexcept;

    void release();
    bool active() const noexcept { return source_ != nullptr; }
    std::uint32_t id() const noexcept { return id_; }

private:
    PlaneEventSource* source_ = nullptr;
    std::uint32_t id_ = 0;
};

// Keeps detection running while hiding every detected plane's visuals.
class PlaneVisibilitySuppressor {
public:
    PlaneVisibilitySuppressor(PlaneEventSource& source, PlaneVisualSink& sink);

    PlaneVisibilitySuppressor(const PlaneVisibilitySuppressor&) = delete;
    PlaneVisibilitySuppressor& operator=(const PlaneVisibilitySuppressor&) = delete;

    std::uint32_t hiddenCount() const noexcept { return hiddenCount_; }
    bool subscribed() const noexcept { return subscription_.active(); }

private:
    void hide(std::uint32_t planeId);
    void onPlanesChanged(const PlaneChange& change);

    PlaneVisualSink& sink_;
    std::uint32_t hiddenCount_ = 0;
    PlaneSubscription subscription_;
};

} // namespace arplace
