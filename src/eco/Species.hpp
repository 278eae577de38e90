// src/eco/Species.hpp
#pragma once
#include <array>
#include <cstdint>
#include <optional>
#include <string_view>

#include "eco/Traits.hpp"
#include "worldgen/Biomes.hpp"

namespace fractal::eco {

enum class Species : std::uint8_t {
    FractalDragon = 0, GeometricWolf, SpiralSerpent, CrystalSpider, PatternBird, GoldenBear
};
inline constexpr int kSpeciesCount = 6;

enum class MovementPattern : std::uint8_t {
    Circular = 0, Spiral, Zigzag, Wave, RandomWalk, LevyFlight
};

[[nodiscard]] constexpr std::uint8_t habitatBit(worldgen::Biome b) noexcept {
    return static_cast<std::uint8_t>(1u << static_cast<unsigned>(b));
}

struct SpeciesInfo {
    std::string_view name;
    Traits           baseline;
    float            agility;        // [0, 1], lowers the odds of being caught
    float            speed;          // movement multiplier
    int              lifespan;       // ticks
    std::uint8_t     habitats;       // biome bitmask, see habitatBit()
    MovementPattern  movement;
    int              regionCapacity; // per 32x32 region
};

namespace detail {
using worldgen::Biome;
inline constexpr std::array<SpeciesInfo, kSpeciesCount> kSpeciesTable = {{
    {"Fractal Dragon",  {0.8f, 0.9f, 0.3f, 0.9f, 1.0f, 0.0f}, 0.5f, 1.3f, 2000,
     static_cast<std::uint8_t>(habitatBit(Biome::Mountains) | habitatBit(Biome::MagicalGrove) | habitatBit(Biome::Tundra)),
     MovementPattern::LevyFlight, 1},
    {"Geometric Wolf",  {0.6f, 0.7f, 0.8f, 0.6f, 0.9f, 0.2f}, 0.6f, 1.2f, 600,
     static_cast<std::uint8_t>(habitatBit(Biome::Forest) | habitatBit(Biome::Plains) | habitatBit(Biome::Tundra)),
     MovementPattern::Zigzag, 6},
    {"Spiral Serpent",  {0.5f, 0.5f, 0.2f, 0.4f, 0.7f, 0.4f}, 0.5f, 0.8f, 500,
     static_cast<std::uint8_t>(habitatBit(Biome::Swamp) | habitatBit(Biome::Desert) | habitatBit(Biome::Forest)),
     MovementPattern::Wave, 5},
    {"Crystal Spider",  {0.4f, 0.6f, 0.1f, 0.7f, 0.6f, 0.5f}, 0.7f, 0.9f, 300,
     static_cast<std::uint8_t>(habitatBit(Biome::MagicalGrove) | habitatBit(Biome::Mountains) | habitatBit(Biome::Forest)),
     MovementPattern::Circular, 8},
    {"Pattern Bird",    {0.2f, 0.7f, 0.9f, 0.3f, 0.3f, 0.8f}, 0.9f, 1.4f, 400,
     static_cast<std::uint8_t>(habitatBit(Biome::Plains) | habitatBit(Biome::Forest) | habitatBit(Biome::MagicalGrove)),
     MovementPattern::Spiral, 12},
    {"Golden Bear",     {0.7f, 0.6f, 0.4f, 0.8f, 0.8f, 0.3f}, 0.3f, 0.8f, 900,
     static_cast<std::uint8_t>(habitatBit(Biome::Forest) | habitatBit(Biome::Mountains) | habitatBit(Biome::Tundra)),
     MovementPattern::RandomWalk, 3},
}};
} // namespace detail

[[nodiscard]] constexpr const SpeciesInfo& speciesInfo(Species s) noexcept {
    return detail::kSpeciesTable[static_cast<std::size_t>(s)];
}

[[nodiscard]] constexpr bool livesIn(Species s, worldgen::Biome b) noexcept {
    return (speciesInfo(s).habitats & habitatBit(b)) != 0;
}

// A species hunts by temperament when its predator affinity dominates.
[[nodiscard]] constexpr bool isPredatorSpecies(Species s) noexcept {
    return speciesInfo(s).baseline.predator > speciesInfo(s).baseline.prey;
}

// Fixed predation table derived from the species baselines:
//   hunter may take prey  <=>  different species,
//   predator(hunter) - predator(prey) >= 0.15 and prey(prey) >= 0.2.
inline constexpr float kPredatorMargin = 0.15f;
inline constexpr float kMinPreyAffinity = 0.2f;

namespace detail {
constexpr std::array<std::array<bool, kSpeciesCount>, kSpeciesCount> buildPredationTable() noexcept {
    std::array<std::array<bool, kSpeciesCount>, kSpeciesCount> t{};
    for (std::size_t h = 0; h < kSpeciesCount; ++h)
        for (std::size_t p = 0; p < kSpeciesCount; ++p) {
            const Traits& H = kSpeciesTable[h].baseline;
            const Traits& P = kSpeciesTable[p].baseline;
            t[h][p] = h != p && (H.predator - P.predator) >= kPredatorMargin && P.prey >= kMinPreyAffinity;
        }
    return t;
}
inline constexpr auto kPredationTable = buildPredationTable();
} // namespace detail

[[nodiscard]] constexpr bool canHunt(Species hunter, Species prey) noexcept {
    return detail::kPredationTable[static_cast<std::size_t>(hunter)][static_cast<std::size_t>(prey)];
}

static_assert(canHunt(Species::FractalDragon, Species::PatternBird));
static_assert(!canHunt(Species::PatternBird, Species::FractalDragon));
static_assert(!canHunt(Species::GeometricWolf, Species::GeometricWolf));

[[nodiscard]] std::string_view speciesName(Species s) noexcept;
[[nodiscard]] std::string_view movementPatternName(MovementPattern m) noexcept;
[[nodiscard]] std::optional<Species> speciesFromName(std::string_view name) noexcept;

} // namespace fractal::eco
