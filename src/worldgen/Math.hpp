// src/worldgen/Math.hpp
#pragma once
#include <algorithm> // clamp
#include <cmath>

namespace fractal::worldgen {

inline constexpr float kPi = 3.14159265358979323846f;

inline constexpr float lerp(float a, float b, float t) noexcept {
    return a + (b - a) * t;
}

inline constexpr float radians(float deg) noexcept { return deg * (kPi / 180.0f); }

inline float clamp01(float v) noexcept { return std::clamp(v, 0.0f, 1.0f); }

struct Vec2 {
    float x = 0.0f;
    float y = 0.0f;
};

struct Vec3 {
    float x = 0.0f;
    float y = 0.0f;
    float z = 0.0f;

    friend constexpr Vec3 operator+(Vec3 a, Vec3 b) noexcept { return {a.x + b.x, a.y + b.y, a.z + b.z}; }
    friend constexpr Vec3 operator-(Vec3 a, Vec3 b) noexcept { return {a.x - b.x, a.y - b.y, a.z - b.z}; }
    friend constexpr Vec3 operator*(Vec3 a, float s) noexcept { return {a.x * s, a.y * s, a.z * s}; }
    friend constexpr bool operator==(Vec3 a, Vec3 b) noexcept { return a.x == b.x && a.y == b.y && a.z == b.z; }
};

inline float length(Vec3 v) noexcept { return std::sqrt(v.x * v.x + v.y * v.y + v.z * v.z); }

} // namespace fractal::worldgen
