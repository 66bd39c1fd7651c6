#pragma once

#include "arplace/core/types.h"
#include "arplace/tracking/raycast_provider.h"
#include <vector>

namespace arplace {

class EventQueue;

// Lays a raw hit rotation flat on the surface: Euler(-90, 0, rawZ).
// Only the roll about the surface normal survives.
Pose flattenHitPose(const Pose& raw) noexcept;

class SurfaceLocator {
public:
    static constexpr Vec2 kViewportCenter{0.5f, 0.5f};

    explicit SurfaceLocator(RaycastProvider* provider = nullptr, EventQueue* events = nullptr);

    void setProvider(RaycastProvider* provider) noexcept;

    // Samples the collaborator once. Returns the validity of the new pose.
    bool update();

    const SurfacePose& current() const noexcept { return current_; }
    bool isValid() const noexcept { return current_.valid; }
    ArError lastError() const noexcept { return lastError_; }
    std::uint32_t sampleCount() const noexcept { return sampleCount_; }

private:
    RaycastProvider* provider_;
    EventQueue* events_;
    std::vector<RaycastHit> hits_;
    SurfacePose current_{};
    ArError lastError_ = ArError::Ok;
    bool reportedMissingProvider_ = false;
    std::uint32_t sampleCount_ = 0;
};

} // namespace arplace
