// src/eco/Movement.cpp
#include "eco/Movement.hpp"
#include "core/Random.hpp"

#include <algorithm>
#include <cmath>

namespace fractal::eco {

using worldgen::Vec2;
using worldgen::kPi;

namespace {
Vec2 polar(float angle, float len) noexcept { return Vec2{std::cos(angle) * len, std::sin(angle) * len}; }
}

Vec2 patternStep(MovementPattern pattern, int tick, float phase, core::SeededRandomStream& rng) noexcept
{
    const float t = static_cast<float>(tick);
    switch (pattern) {
    case MovementPattern::Circular:
        return polar(phase + t * 0.3f, 1.0f);

    case MovementPattern::Spiral: {
        // Radius of the orbit grows over a 50-tick cycle, then resets.
        const float cycle = static_cast<float>(tick % 50) / 50.0f;
        return polar(phase + t * 0.3f, 0.5f + cycle);
    }

    case MovementPattern::Zigzag: {
        const float sign = ((tick / 5) % 2 == 0) ? 1.0f : -1.0f;
        return polar(phase + sign * (kPi / 3.0f), 1.0f);
    }

    case MovementPattern::Wave: {
        const Vec2 fwd = polar(phase, 1.0f);
        const float side = std::sin(t * 0.5f);
        return Vec2{fwd.x - fwd.y * side, fwd.y + fwd.x * side};
    }

    case MovementPattern::RandomWalk:
        return polar(rng.uniform(0.0f, 2.0f * kPi), 1.0f);

    case MovementPattern::LevyFlight: {
        // Pareto-distributed step length (alpha 1.5), capped.
        const float angle = rng.uniform(0.0f, 2.0f * kPi);
        const float u = rng.uniform01();
        const float len = std::min(10.0f, std::pow(1.0f - u, -1.0f / 1.5f));
        return polar(angle, len);
    }
    }
    return Vec2{};
}

} // namespace fractal::eco
