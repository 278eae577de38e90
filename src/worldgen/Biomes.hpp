#pragma once
// -----------------------------------------------------------------------------
// src/worldgen/Biomes.hpp
// Height + moisture classification into the eight world biomes.
//
// Thresholds are not hand-tuned constants: they are calibrated per world from
// quantiles of the height and moisture grids, so the coverage of each biome
// lands on its target share (up to ties between equal samples).
// -----------------------------------------------------------------------------

#include <array>
#include <cstdint>
#include <optional>
#include <string_view>

#include "worldgen/Grid2D.hpp"

namespace fractal::worldgen {

enum class Biome : std::uint8_t {
    Forest = 0, Mountains, Plains, Desert, Swamp, Tundra, MagicalGrove, Water
};

inline constexpr int kBiomeCount = 8;

using BiomeGrid = Grid2D<Biome>;

[[nodiscard]] constexpr int biomeIndex(Biome b) noexcept { return static_cast<int>(b); }
[[nodiscard]] std::string_view biomeName(Biome b) noexcept;
[[nodiscard]] std::optional<Biome> biomeFromName(std::string_view name) noexcept;

// Coverage targets as fractions of the grid, indexed by biomeIndex().
struct BiomeTargets {
    std::array<float, kBiomeCount> share{};

    // Reference shares at water_level 0.15; land shares scale by (1 - w) / 0.85.
    static BiomeTargets forWaterLevel(float waterLevel) noexcept;
};

// Ordered table, first match wins:
//   Water (h < waterMax), Mountains (h >= mountainMin), Tundra (h >= tundraMin),
//   Desert (m < desertMax), Plains (m < plainsMax), Forest (m < forestMax),
//   MagicalGrove (m < groveMax), otherwise Swamp.
struct BiomeThresholdTable {
    float waterMax    = 0.15f;
    float mountainMin = 0.92f;
    float tundraMin   = 0.89f;
    float desertMax   = 0.03f;
    float plainsMax   = 0.54f;
    float forestMax   = 0.93f;
    float groveMax    = 0.96f;
};

[[nodiscard]] Biome classify(float height, float moisture, const BiomeThresholdTable& t) noexcept;

// Derives the thresholds that make the given grids hit `targets`.
[[nodiscard]] BiomeThresholdTable calibrateThresholds(const HeightField& height,
                                                      const Grid2D<float>& moisture,
                                                      const BiomeTargets& targets);

struct BiomeClassification {
    BiomeGrid grid;
    BiomeThresholdTable table;
    std::array<float, kBiomeCount> coverage{}; // percent of cells, indexed by biomeIndex()
};

[[nodiscard]] std::array<float, kBiomeCount> biomeCoverage(const BiomeGrid& grid);

// Calibrates against `targets`, then classifies every cell.
[[nodiscard]] BiomeClassification classifyGrid(const HeightField& height,
                                               const Grid2D<float>& moisture,
                                               const BiomeTargets& targets);

} // namespace fractal::worldgen
