#include "arplace/tracking/surface_locator.h"
#include "arplace/core/logging.h"
#include "arplace/core/math.h"
#include "arplace/protocol/event_queue.h"

namespace arplace {

Pose flattenHitPose(const Pose& raw) noexcept {
    const Vec3 euler = toEulerDegrees(raw.rotation);
    return Pose{raw.position, fromEulerDegrees(Vec3{-90.0f, 0.0f, euler.z})};
}

SurfaceLocator::SurfaceLocator(RaycastProvider* provider, EventQueue* events)
    : provider_(provider), events_(events) {}

void SurfaceLocator::setProvider(RaycastProvider* provider) noexcept {
    provider_ = provider;
    reportedMissingProvider_ = false;
}

bool SurfaceLocator::update() {
    sampleCount_++;
    if (!provider_) {
        current_.valid = false;
        lastError_ = ArError::MissingCollaborator;
        if (!reportedMissingProvider_) {
            reportedMissingProvider_ = true;
            ARPLACE_LOG_WARN("SurfaceLocator: no raycast provider attached, surface pose stays invalid");
            if (events_) events_->recordWarning(lastError_, protocol::ErrorSource::SurfaceLocator);
        }
        return false;
    }

    lastError_ = ArError::Ok;
    hits_.clear();
    if (!provider_->raycast(kViewportCenter, TrackableFilter::PlaneWithinPolygon, hits_) || hits_.empty()) {
        current_.valid = false;
        return false;
    }

    current_.pose = flattenHitPose(hits_.front().pose);
    current_.valid = true;
    return true;
}

} // namespace arplace
