// src/worldgen/Vegetation.hpp
#pragma once
#include <cstddef>
#include <cstdint>
#include <memory>
#include <vector>

#include "worldgen/Biomes.hpp"
#include "worldgen/Grid2D.hpp"
#include "worldgen/LSystem.hpp"

namespace fractal::core {
struct WorldConfig;
class SeededRandomStream;
struct GenerationReport;
}

namespace fractal::worldgen {

struct VegetationParams {
    int         minIterations    = 3;
    int         maxIterations    = 4;
    std::size_t maxSymbols       = 50000;
    int         minTreesPerPatch = 5;
    int         maxTreesPerPatch = 15;
    float       minTreeHeight    = 3.0f;
    float       maxTreeHeight    = 12.0f;
    float       minFoliage       = 0.6f;
    float       maxFoliage       = 1.0f;
    float       riverFoliageBoost = 1.1f;
    float       patchRadius      = 6.0f;
};

struct Tree {
    float x = 0.0f;
    float y = 0.0f;
    float height = 0.0f;
    float foliageDensity = 0.0f;
    bool  magic = false;
    std::size_t ruleIndex = 0;
    std::shared_ptr<const TreeSkeleton> skeleton; // shared, never mutated
};

struct Forest {
    int   centerX = 0;
    int   centerY = 0;
    Biome biome = Biome::Forest;
    std::vector<Tree> trees;
};

// Places forest patches on Forest and MagicalGrove cells. `riverMask` may be
// empty when hydrology has not run; the riverbank foliage boost is then skipped.
std::vector<Forest> generateForests(const core::WorldConfig& cfg,
                                    const BiomeGrid& biomes,
                                    const Grid2D<std::uint8_t>& riverMask,
                                    const VegetationParams& params,
                                    const core::SeededRandomStream& root,
                                    core::GenerationReport& report);

} // namespace fractal::worldgen
