// src/worldgen/stages/Flora.cpp
#include "worldgen/WorldGen.hpp"
#include "core/JobSystem.h"

#include <taskflow/taskflow.hpp>

namespace fractal::worldgen {

// Vegetation reads the river mask, so this stage runs after hydrology.
// Structures do not depend on vegetation; the two share one taskflow.
void FloraStage::generate(StageContext& ctx)
{
    // Separate reports keep the merged order independent of scheduling.
    core::GenerationReport vegReport, structReport;
    std::vector<Forest> forests;
    std::vector<Structure> structures;

    tf::Taskflow flow("flora");
    flow.emplace(
        [&] { forests = generateForests(ctx.config(), ctx.biomes.grid, ctx.riverMask,
                                        ctx.settings.vegetation, ctx.root, vegReport); },
        [&] { structures = generateStructures(ctx.config(), ctx.biomes.grid,
                                              ctx.settings.structures, ctx.root, structReport); });
    ctx.jobs.RunAndWait(flow);

    ctx.forests = std::move(forests);
    ctx.structures = std::move(structures);

    for (auto* r : {&vegReport, &structReport}) {
        ctx.report.issues.insert(ctx.report.issues.end(), r->issues.begin(), r->issues.end());
        ctx.report.grammarCapHits  += r->grammarCapHits;
        ctx.report.discardedRivers += r->discardedRivers;
    }
}

} // namespace fractal::worldgen
