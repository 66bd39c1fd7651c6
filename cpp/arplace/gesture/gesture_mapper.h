#pragma once

#include "arplace/core/types.h"

#include <cstdint>
#include <optional>

namespace arplace {

enum class TouchPhase : std::uint8_t {
    Began = 0,
    Moved = 1,
    Stationary = 2,
    Ended = 3,
    Canceled = 4,
};

// One touch point in screen pixels. `delta` is the movement since the previous frame.
struct TouchSample {
    Vec2 position{};
    Vec2 delta{};
    TouchPhase phase{TouchPhase::Began};
};

struct PinchConfig {
    float minScale{0.3f};
    float maxScale{3.0f};
    float sensitivity{0.01f};
    float elasticity{0.1f};  // damping while the scale sits at a limit
};

struct RotateConfig {
    float dragRate{100.0f};  // degrees per pixel-second for one-finger drag
    float twistRate{2.0f};
};

struct TapConfig {
    float tapThreshold{0.1f};   // seconds
    float dragThreshold{50.0f}; // pixels
};

// Change in finger separation (pixels) between the previous and current frame.
float pinchDistanceDelta(const TouchSample& a, const TouchSample& b) noexcept;

// Uniform increment clamped per axis, damped when the current scale is at a limit.
Vec3 scaleWithLimits(const Vec3& current, float increment, const PinchConfig& config) noexcept;
Vec3 applyPinch(const Vec3& current, const TouchSample& a, const TouchSample& b, const PinchConfig& config) noexcept;

// Yaw in degrees from two-finger rotation.
float twistYawDelta(const TouchSample& a, const TouchSample& b, const RotateConfig& config) noexcept;

// World-space rotation about +Y.
Quat applyWorldYaw(const Quat& rotation, float yawDeg) noexcept;

// One-finger drag to yaw. Tracks the finger between Began and Ended.
class DragRotator {
public:
    explicit DragRotator(RotateConfig config = {}) : config_(config) {}

    // Returns the yaw in degrees to apply this frame.
    float update(const TouchSample& touch, float dt) noexcept;
    void reset() noexcept { dragging_ = false; }
    bool isDragging() const noexcept { return dragging_; }

private:
    RotateConfig config_;
    bool dragging_ = false;
    Vec2 lastPosition_{};
};

// Short, nearly stationary touch. Times are in seconds.
class TapDetector {
public:
    explicit TapDetector(TapConfig config = {}) : config_(config) {}

    // Returns the touch-down position when the sample completes a tap.
    std::optional<Vec2> update(const TouchSample& touch, float time) noexcept;
    bool isTouching() const noexcept { return touching_; }

private:
    TapConfig config_;
    bool touching_ = false;
    Vec2 startPosition_{};
    float startTime_ = 0.0f;
};

} // namespace arplace
