// src/eco/Movement.hpp
#pragma once
#include "eco/Species.hpp"
#include "worldgen/Math.hpp"

namespace fractal::core { class SeededRandomStream; }

namespace fractal::eco {

// One tick of pattern-driven displacement, roughly unit length (Levy flights
// occasionally much longer). `phase` is a per-creature angle in radians.
worldgen::Vec2 patternStep(MovementPattern pattern, int tick, float phase,
                           core::SeededRandomStream& rng) noexcept;

} // namespace fractal::eco
