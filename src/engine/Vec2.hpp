#pragma once

#include <cmath>

namespace ghostwatch {

/// 2D vector for positions, velocities and bounce offsets.
/// Carries both cartesian and polar views of the same (x, y) pair.
struct Vec2 {
    float x = 0.0f;
    float y = 0.0f;

    constexpr Vec2() = default;
    constexpr Vec2(float x, float y) : x(x), y(y) {}

    /// Build a vector from an angle (radians) and a length.
    static Vec2 fromPolar(float angle, float length) {
        return {std::cos(angle) * length, std::sin(angle) * length};
    }

    // Arithmetic operators (pure)
    Vec2 operator+(const Vec2& other) const { return {x + other.x, y + other.y}; }
    Vec2 operator-(const Vec2& other) const { return {x - other.x, y - other.y}; }
    Vec2 operator*(float scalar) const { return {x * scalar, y * scalar}; }
    Vec2 operator/(float scalar) const { return {x / scalar, y / scalar}; }

    // In-place variants
    Vec2& operator+=(const Vec2& other) { x += other.x; y += other.y; return *this; }
    Vec2& operator-=(const Vec2& other) { x -= other.x; y -= other.y; return *this; }
    Vec2& operator*=(float scalar) { x *= scalar; y *= scalar; return *this; }
    Vec2& operator/=(float scalar) { x /= scalar; y /= scalar; return *this; }

    bool operator==(const Vec2& other) const { return x == other.x && y == other.y; }
    bool operator!=(const Vec2& other) const { return !(*this == other); }

    // Polar accessors
    float length() const { return std::sqrt(x * x + y * y); }
    float lengthSquared() const { return x * x + y * y; }

    /// atan2(y, x), in (-pi, pi]. A zero vector reports 0.
    float angle() const { return std::atan2(y, x); }

    /// Rotate to `angle` keeping the current length.
    void setAngle(float angle) {
        float len = length();
        x = std::cos(angle) * len;
        y = std::sin(angle) * len;
    }

    /// Scale to `length` keeping the current angle. A zero vector
    /// points along +x afterwards.
    void setLength(float length) {
        float a = angle();
        x = std::cos(a) * length;
        y = std::sin(a) * length;
    }

    Vec2 normalized() const {
        float len = length();
        return len > 0.0f ? Vec2(x / len, y / len) : Vec2();
    }
    static float dot(const Vec2& a, const Vec2& b) { return a.x * b.x + a.y * b.y; }
    static float distance(const Vec2& a, const Vec2& b) { return (b - a).length(); }
};

} // namespace ghostwatch
