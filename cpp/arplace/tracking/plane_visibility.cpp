#include "arplace/tracking/plane_visibility.h"
#include "arplace/core/logging.h"

#include <utility>

namespace arplace {

PlaneSubscription::PlaneSubscription(PlaneEventSource& source, PlaneChangeCallback callback)
    : source_(&source), id_(source.subscribe(std::move(callback))) {}

PlaneSubscription::~PlaneSubscription() {
    release();
}

PlaneSubscription::PlaneSubscription(PlaneSubscription&& other) noexcept
    : source_(other.source_), id_(other.id_) {
    other.source_ = nullptr;
    other.id_ = 0;
}

PlaneSubscription& PlaneSubscription::operator=(PlaneSubscription&& other) noexcept {
    if (this != &other) {
        release();
        source_ = other.source_;
        id_ = other.id_;
        other.source_ = nullptr;
        other.id_ = 0;
    }
    return *this;
}

void PlaneSubscription::release() {
    if (!source_) return;
    source_->unsubscribe(id_);
    source_ = nullptr;
    id_ = 0;
}

PlaneVisibilitySuppressor::PlaneVisibilitySuppressor(PlaneEventSource& source, PlaneVisualSink& sink)
    : sink_(sink) {
    for (const std::uint32_t planeId : source.trackedPlanes()) {
        hide(planeId);
    }
    subscription_ = PlaneSubscription(source, [this](const PlaneChange& change) { onPlanesChanged(change); });
}

void PlaneVisibilitySuppressor::hide(std::uint32_t planeId) {
    sink_.setPlaneVisualsEnabled(planeId, false);
    hiddenCount_++;
}

void PlaneVisibilitySuppressor::onPlanesChanged(const PlaneChange& change) {
    for (const std::uint32_t planeId : change.added) hide(planeId);
    for (const std::uint32_t planeId : change.updated) hide(planeId);
    ARPLACE_LOG_DEBUG("PlaneVisibilitySuppressor: hid %zu added, %zu updated planes",
                      change.added.size(), change.updated.size());
}

} // namespace arplace
