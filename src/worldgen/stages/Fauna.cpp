// src/worldgen/stages/Fauna.cpp
#include "worldgen/WorldGen.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cmath>
#include <string>

namespace fractal::worldgen {

int initialPopulation(const core::WorldConfig& cfg) noexcept
{
    if (cfg.creatureDensity <= 0.0f) return 0;
    const double area = static_cast<double>(cfg.worldSize) * static_cast<double>(cfg.worldSize);
    return std::max(1, static_cast<int>(std::lround(cfg.creatureDensity * area / 128.0)));
}

void FaunaStage::generate(StageContext& ctx)
{
    const auto& grid = ctx.biomes.grid;
    ctx.ecosystem = std::make_unique<eco::EcosystemSimulator>(grid.width(), grid.height(), ctx.seed(),
                                                              ctx.settings.ecosystem, &ctx.jobs);

    const int wanted = std::min<int>(initialPopulation(ctx.config()),
                                     static_cast<int>(ctx.settings.ecosystem.maxPopulation));
    auto rng = ctx.root.substream("creatures");

    int placed = 0;
    const int maxAttempts = wanted * 8;
    for (int attempt = 0; attempt < maxAttempts && placed < wanted; ++attempt) {
        const int x = rng.rangeInt(0, grid.width() - 1);
        const int y = rng.rangeInt(0, grid.height() - 1);
        const Biome b = grid.at(x, y);

        eco::Species options[eco::kSpeciesCount];
        int n = 0;
        for (int s = 0; s < eco::kSpeciesCount; ++s)
            if (eco::livesIn(static_cast<eco::Species>(s), b))
                options[n++] = static_cast<eco::Species>(s);
        if (n == 0) continue;

        const eco::Species species = options[rng.rangeInt(0, n - 1)];
        const Vec2 at{static_cast<float>(x) + rng.uniform01(), static_cast<float>(y) + rng.uniform01()};
        if (ctx.ecosystem->spawn(species, at) != eco::kNoCreature)
            ++placed;
    }

    if (placed < wanted) {
        spdlog::warn("fauna: placed {} of {} creatures, seed={}", placed, wanted, ctx.seed());
        ctx.report.add("fauna", "placed " + std::to_string(placed) + " of " + std::to_string(wanted) + " creatures");
    }
}

} // namespace fractal::worldgen
