// src/worldgen/stages/Terrain.cpp
#include "worldgen/WorldGen.hpp"
#include "worldgen/Noise.hpp"

namespace fractal::worldgen {

void TerrainStage::generate(StageContext& ctx)
{
    ctx.height = generateHeightField(ctx.config(), ctx.root, ctx.jobs);
}

void ClimateStage::generate(StageContext& ctx)
{
    ctx.moisture = generateClimateField(ctx.config(), ctx.root, ctx.jobs);
}

} // namespace fractal::worldgen
