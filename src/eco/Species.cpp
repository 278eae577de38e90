// src/eco/Species.cpp
#include "eco/Species.hpp"

namespace fractal::eco {

std::string_view speciesName(Species s) noexcept
{
    return speciesInfo(s).name;
}

std::string_view movementPatternName(MovementPattern m) noexcept
{
    switch (m) {
    case MovementPattern::Circular:   return "circular";
    case MovementPattern::Spiral:     return "spiral";
    case MovementPattern::Zigzag:     return "zigzag";
    case MovementPattern::Wave:       return "wave";
    case MovementPattern::RandomWalk: return "random_walk";
    case MovementPattern::LevyFlight: return "levy_flight";
    }
    return "unknown";
}

std::optional<Species> speciesFromName(std::string_view name) noexcept
{
    for (int i = 0; i < kSpeciesCount; ++i) {
        const auto s = static_cast<Species>(i);
        if (speciesName(s) == name)
            return s;
    }
    return std::nullopt;
}

} // namespace fractal::eco
