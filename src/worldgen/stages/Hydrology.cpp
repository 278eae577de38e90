// src/worldgen/stages/Hydrology.cpp
#include "worldgen/WorldGen.hpp"

namespace fractal::worldgen {

void HydrologyStage::generate(StageContext& ctx)
{
    ctx.rivers = traceRivers(ctx.height, ctx.biomes.grid, ctx.settings.hydrology,
                             ctx.config().magicIntensity, ctx.root, ctx.report);
    ctx.riverMask = rasterizeRivers(ctx.rivers, ctx.height.width(), ctx.height.height());
}

} // namespace fractal::worldgen
