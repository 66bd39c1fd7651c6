#include "arplace/core/easing.h"

#include <algorithm>

namespace arplace {

float EasingCurve::evaluate(float t) const noexcept {
    const float x = std::min(1.0f, std::max(0.0f, t));
    float k = x;
    switch (kind) {
        case EasingKind::Linear:
            k = x;
            break;
        case EasingKind::EaseInOut:
            k = x * x * (3.0f - 2.0f * x);
            break;
        case EasingKind::EaseOut: {
            const float inv = 1.0f - x;
            k = 1.0f - inv * inv;
            break;
        }
        case EasingKind::Constant:
            k = 1.0f;
            break;
    }
    return start + (end - start) * k;
}

} // namespace arplace
