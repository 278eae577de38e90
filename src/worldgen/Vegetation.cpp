// src/worldgen/Vegetation.cpp
#include "worldgen/Vegetation.hpp"
#include "worldgen/Hydrology.hpp"
#include "core/Config.h"
#include "core/Errors.h"
#include "core/Random.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cmath>
#include <string>

namespace fractal::worldgen {

namespace {
struct Cell { int x, y; };
}

std::vector<Forest> generateForests(const core::WorldConfig& cfg,
                                    const BiomeGrid& biomes,
                                    const Grid2D<std::uint8_t>& riverMask,
                                    const VegetationParams& params,
                                    const core::SeededRandomStream& root,
                                    core::GenerationReport& report)
{
    std::vector<Cell> candidates;
    for (int y = 0; y < biomes.height(); ++y)
        for (int x = 0; x < biomes.width(); ++x) {
            const Biome b = biomes.at(x, y);
            if (b == Biome::Forest || b == Biome::MagicalGrove)
                candidates.push_back(Cell{x, y});
        }

    std::vector<Forest> forests;
    if (candidates.empty() || cfg.treeDensity <= 0.0f)
        return forests;

    const double area = static_cast<double>(biomes.width()) * static_cast<double>(biomes.height());
    const int patches = std::max(1, static_cast<int>(std::lround(cfg.treeDensity * area / 4096.0)));

    const int minIt = std::max(0, std::min(params.minIterations, params.maxIterations));
    const int maxIt = std::max(params.minIterations, params.maxIterations);
    const int rules = static_cast<int>(ruleCatalogue().size());
    const bool haveRivers = riverMask.width() == biomes.width() && riverMask.height() == biomes.height();

    SkeletonCache cache(params.maxSymbols);
    auto rng = root.substream("vegetation");

    const float maxX = static_cast<float>(biomes.width() - 1);
    const float maxY = static_cast<float>(biomes.height() - 1);

    forests.reserve(static_cast<std::size_t>(patches));
    for (int p = 0; p < patches; ++p) {
        const Cell c = candidates[static_cast<std::size_t>(rng.rangeInt(0, static_cast<int>(candidates.size()) - 1))];

        Forest f;
        f.centerX = c.x;
        f.centerY = c.y;
        f.biome = biomes.at(c.x, c.y);

        const int count = rng.rangeInt(params.minTreesPerPatch, params.maxTreesPerPatch);
        f.trees.reserve(static_cast<std::size_t>(count));
        for (int i = 0; i < count; ++i) {
            Tree t;
            t.x = std::clamp(static_cast<float>(c.x) + rng.uniform(-params.patchRadius, params.patchRadius), 0.0f, maxX);
            t.y = std::clamp(static_cast<float>(c.y) + rng.uniform(-params.patchRadius, params.patchRadius), 0.0f, maxY);
            t.height = rng.uniform(params.minTreeHeight, params.maxTreeHeight);

            const int cx = static_cast<int>(t.x), cy = static_cast<int>(t.y);
            float foliage = rng.uniform(params.minFoliage, params.maxFoliage);
            if (haveRivers && nearRiver(riverMask, cx, cy))
                foliage *= params.riverFoliageBoost;
            t.foliageDensity = std::min(foliage, 1.0f);

            const float magicFactor = biomes.at(cx, cy) == Biome::MagicalGrove ? 1.0f : 0.6f;
            t.magic = rng.chance(cfg.magicIntensity * magicFactor);

            t.ruleIndex = static_cast<std::size_t>(rng.rangeInt(0, rules - 1));
            t.skeleton = cache.get(t.ruleIndex, rng.rangeInt(minIt, maxIt));
            f.trees.push_back(std::move(t));
        }
        forests.push_back(std::move(f));
    }

    if (const int hits = cache.capHits(); hits > 0) {
        report.grammarCapHits += hits;
        report.add("vegetation", std::to_string(hits) + " L-system expansions hit the symbol cap");
        spdlog::warn("vegetation: {} expansions capped at {} symbols, seed={}",
                     hits, params.maxSymbols, root.rootSeed());
    }
    spdlog::debug("vegetation: {} patches, {} shared skeletons, seed={}",
                  forests.size(), cache.size(), root.rootSeed());
    return forests;
}

} // namespace fractal::worldgen
