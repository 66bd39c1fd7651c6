#include "arplace/core/math.h"

#include <algorithm>
#include <cmath>

namespace arplace {

float length(const Vec3& v) noexcept {
    return std::sqrt(v.x * v.x + v.y * v.y + v.z * v.z);
}

float length(const Vec2& v) noexcept {
    return std::sqrt(v.x * v.x + v.y * v.y);
}

float distance(const Vec3& a, const Vec3& b) noexcept {
    return length(a - b);
}

Vec3 normalized(const Vec3& v) noexcept {
    const float len = length(v);
    if (len < kEpsilon) return Vec3{};
    return v * (1.0f / len);
}

bool isZero(const Vec3& v) noexcept {
    return v.x == 0.0f && v.y == 0.0f && v.z == 0.0f;
}

bool nearlyEqual(const Vec3& a, const Vec3& b, float eps) noexcept {
    return std::fabs(a.x - b.x) <= eps && std::fabs(a.y - b.y) <= eps && std::fabs(a.z - b.z) <= eps;
}

float clamp01(float t) noexcept {
    return std::min(1.0f, std::max(0.0f, t));
}

Vec3 lerp(const Vec3& a, const Vec3& b, float t) noexcept {
    const float k = clamp01(t);
    return {a.x + (b.x - a.x) * k, a.y + (b.y - a.y) * k, a.z + (b.z - a.z) * k};
}

float lerp(float a, float b, float t) noexcept {
    return a + (b - a) * clamp01(t);
}

float signedAngleDeg(const Vec2& from, const Vec2& to) noexcept {
    const float cross = from.x * to.y - from.y * to.x;
    const float d = from.x * to.x + from.y * to.y;
    if (std::fabs(cross) < 1e-12f && std::fabs(d) < 1e-12f) return 0.0f;
    return std::atan2(cross, d) * kRadToDeg;
}

Quat operator*(const Quat& a, const Quat& b) noexcept {
    return {
        a.w * b.x + a.x * b.w + a.y * b.z - a.z * b.y,
        a.w * b.y - a.x * b.z + a.y * b.w + a.z * b.x,
        a.w * b.z + a.x * b.y - a.y * b.x + a.z * b.w,
        a.w * b.w - a.x * b.x - a.y * b.y - a.z * b.z,
    };
}

Vec3 rotate(const Quat& q, const Vec3& v) noexcept {
    // q * v * q^{-1}, expanded
    const Vec3 qv{q.x, q.y, q.z};
    const Vec3 t{
        2.0f * (qv.y * v.z - qv.z * v.y),
        2.0f * (qv.z * v.x - qv.x * v.z),
        2.0f * (qv.x * v.y - qv.y * v.x),
    };
    return {
        v.x + q.w * t.x + (qv.y * t.z - qv.z * t.y),
        v.y + q.w * t.y + (qv.z * t.x - qv.x * t.z),
        v.z + q.w * t.z + (qv.x * t.y - qv.y * t.x),
    };
}

float dot(const Quat& a, const Quat& b) noexcept {
    return a.x * b.x + a.y * b.y + a.z * b.z + a.w * b.w;
}

Quat normalized(const Quat& q) noexcept {
    const float len2 = dot(q, q);
    if (len2 < 1e-12f) return Quat{};
    const float inv = 1.0f / std::sqrt(len2);
    return {q.x * inv, q.y * inv, q.z * inv, q.w * inv};
}

bool nearlyEqual(const Quat& a, const Quat& b, float eps) noexcept {
    // q and -q are the same rotation
    return std::fabs(std::fabs(dot(normalized(a), normalized(b))) - 1.0f) <= eps;
}

Quat axisAngle(const Vec3& axisIn, float angleRad) noexcept {
    const Vec3 axis = normalized(axisIn);
    if (isZero(axis)) return Quat{};
    const float half = angleRad * 0.5f;
    const float s = std::sin(half);
    return {axis.x * s, axis.y * s, axis.z * s, std::cos(half)};
}

Quat fromEulerDegrees(const Vec3& eulerDeg) noexcept {
    const Quat qx = axisAngle(kWorldRight, eulerDeg.x * kDegToRad);
    const Quat qy = axisAngle(kWorldUp, eulerDeg.y * kDegToRad);
    const Quat qz = axisAngle(kWorldForward, eulerDeg.z * kDegToRad);
    return qy * qx * qz;
}

namespace {
float wrapDegrees(float deg) noexcept {
    float d = std::fmod(deg, 360.0f);
    if (d < 0.0f) d += 360.0f;
    if (d >= 360.0f) d -= 360.0f;
    return d;
}
} // namespace

Vec3 toEulerDegrees(const Quat& qIn) noexcept {
    const Quat q = normalized(qIn);
    // Matrix terms of R = Ry * Rx * Rz
    const float m02 = 2.0f * (q.x * q.z + q.w * q.y);
    const float m22 = 1.0f - 2.0f * (q.x * q.x + q.y * q.y);
    const float m10 = 2.0f * (q.x * q.y + q.w * q.z);
    const float m11 = 1.0f - 2.0f * (q.x * q.x + q.z * q.z);
    const float m12 = 2.0f * (q.y * q.z - q.w * q.x);

    const float sx = std::max(-1.0f, std::min(1.0f, -m12));
    const float x = std::asin(sx);
    float y = 0.0f;
    float z = 0.0f;
    if (std::fabs(sx) < 0.9999f) {
        y = std::atan2(m02, m22);
        z = std::atan2(m10, m11);
    } else {
        // Gimbal lock: fold the remaining freedom into Y.
        const float m00 = 1.0f - 2.0f * (q.y * q.y + q.z * q.z);
        const float m20 = 2.0f * (q.x * q.z - q.w * q.y);
        y = std::atan2(-m20, m00);
    }
    return {wrapDegrees(x * kRadToDeg), wrapDegrees(y * kRadToDeg), wrapDegrees(z * kRadToDeg)};
}

Quat lookRotationHorizontal(const Vec3& forward) noexcept {
    const Vec3 flat{forward.x, 0.0f, forward.z};
    if (length(flat) < kEpsilon) return Quat{};
    return axisAngle(kWorldUp, std::atan2(flat.x, flat.z));
}

Quat nlerp(const Quat& a, const Quat& b, float t) noexcept {
    const float k = clamp01(t);
    const float sign = dot(a, b) < 0.0f ? -1.0f : 1.0f;
    return normalized(Quat{
        a.x + (sign * b.x - a.x) * k,
        a.y + (sign * b.y - a.y) * k,
        a.z + (sign * b.z - a.z) * k,
        a.w + (sign * b.w - a.w) * k,
    });
}

} // namespace arplace
