#pragma once

#include <cstdint>

namespace arplace {

enum class EasingKind : std::uint8_t {
    Linear = 0,
    EaseInOut = 1,  // cubic Hermite, zero end tangents
    EaseOut = 2,
    Constant = 3,   // holds the end value
};

// Animation curve from (0, start) to (1, end). Input time is clamped to [0, 1].
struct EasingCurve {
    EasingKind kind{EasingKind::EaseInOut};
    float start{0.0f};
    float end{1.0f};

    float evaluate(float t) const noexcept;

    static EasingCurve linear() noexcept { return EasingCurve{EasingKind::Linear, 0.0f, 1.0f}; }
    static EasingCurve easeInOut() noexcept { return EasingCurve{EasingKind::EaseInOut, 0.0f, 1.0f}; }
};

} // namespace arplace
