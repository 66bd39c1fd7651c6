#pragma once

#include "arplace/core/types.h"

namespace arplace {

static constexpr float kDegToRad = 0.017453292519943295f;
static constexpr float kRadToDeg = 57.29577951308232f;
static constexpr float kEpsilon = 1e-5f;

inline Vec3 operator+(const Vec3& a, const Vec3& b) noexcept { return {a.x + b.x, a.y + b.y, a.z + b.z}; }
inline Vec3 operator-(const Vec3& a, const Vec3& b) noexcept { return {a.x - b.x, a.y - b.y, a.z - b.z}; }
inline Vec3 operator*(const Vec3& v, float s) noexcept { return {v.x * s, v.y * s, v.z * s}; }
inline Vec3 operator*(float s, const Vec3& v) noexcept { return {v.x * s, v.y * s, v.z * s}; }
inline Vec3& operator+=(Vec3& a, const Vec3& b) noexcept {
    a.x += b.x;
    a.y += b.y;
    a.z += b.z;
    return a;
}

inline Vec2 operator-(const Vec2& a, const Vec2& b) noexcept { return {a.x - b.x, a.y - b.y}; }

float length(const Vec3& v) noexcept;
float length(const Vec2& v) noexcept;
float distance(const Vec3& a, const Vec3& b) noexcept;
Vec3 normalized(const Vec3& v) noexcept;
bool isZero(const Vec3& v) noexcept;
bool nearlyEqual(const Vec3& a, const Vec3& b, float eps = kEpsilon) noexcept;
Vec3 lerp(const Vec3& a, const Vec3& b, float t) noexcept;
float lerp(float a, float b, float t) noexcept;
float clamp01(float t) noexcept;

// Signed angle in degrees from `from` to `to`, counter-clockwise positive.
float signedAngleDeg(const Vec2& from, const Vec2& to) noexcept;

Quat operator*(const Quat& a, const Quat& b) noexcept;
Vec3 rotate(const Quat& q, const Vec3& v) noexcept;
Quat normalized(const Quat& q) noexcept;
Quat axisAngle(const Vec3& axis, float angleRad) noexcept;

// Host engine Euler convention: Z applied first, then X, then Y (degrees).
Quat fromEulerDegrees(const Vec3& eulerDeg) noexcept;
// Inverse of fromEulerDegrees, each component wrapped to [0, 360).
Vec3 toEulerDegrees(const Quat& q) noexcept;

// Rotation mapping +Z onto the horizontal projection of `forward` with +Y up.
// A zero projection yields identity.
Quat lookRotationHorizontal(const Vec3& forward) noexcept;

// Normalized lerp along the shortest arc.
Quat nlerp(const Quat& a, const Quat& b, float t) noexcept;

float dot(const Quat& a, const Quat& b) noexcept;
bool nearlyEqual(const Quat& a, const Quat& b, float eps = 1e-4f) noexcept;

} // namespace arplace
