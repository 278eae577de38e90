// src/worldgen/stages/Biome.cpp
#include "worldgen/WorldGen.hpp"

#include <spdlog/spdlog.h>

namespace fractal::worldgen {

void BiomeStage::generate(StageContext& ctx)
{
    if (ctx.moisture.empty())
        ctx.moisture = Grid2D<float>(ctx.height.width(), ctx.height.height(), 0.5f);

    ctx.biomes = classifyGrid(ctx.height, ctx.moisture, BiomeTargets::forWaterLevel(ctx.config().waterLevel));

    const auto& c = ctx.biomes.coverage;
    spdlog::debug("biomes: forest {:.1f}% mountains {:.1f}% plains {:.1f}% desert {:.1f}% "
                  "swamp {:.1f}% tundra {:.1f}% grove {:.1f}% water {:.1f}%",
                  c[0], c[1], c[2], c[3], c[4], c[5], c[6], c[7]);
}

} // namespace fractal::worldgen
