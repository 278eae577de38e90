// src/worldgen/WorldGen.cpp
#include "worldgen/WorldGen.hpp"
#include "core/JobSystem.h"

#include <spdlog/spdlog.h>

#include <chrono>
#include <stdexcept>
#include <utility>

namespace fractal::worldgen {

world::WorldState GeneratedWorld::advance(int ticks, const TickObserver& onTick)
{
    for (int i = 0; i < ticks; ++i) {
        const eco::TickDelta delta = ecosystem.tick();
        if (onTick)
            onTick(delta);
    }
    state = state.withCreatures(ecosystem.snapshot(), ecosystem.currentTick());
    return state;
}

WorldGenerator::WorldGenerator(core::JobSystem* jobs)
    : jobs_(jobs ? *jobs : core::JobSystem::Instance())
{
    stages_.push_back(std::make_unique<TerrainStage>());
    stages_.push_back(std::make_unique<ClimateStage>());
    stages_.push_back(std::make_unique<BiomeStage>());
    stages_.push_back(std::make_unique<HydrologyStage>());
    stages_.push_back(std::make_unique<FloraStage>());
    stages_.push_back(std::make_unique<FaunaStage>());
}

void WorldGenerator::clearStages() { stages_.clear(); }

void WorldGenerator::addStage(StagePtr stage)
{
    if (!stage) throw std::invalid_argument("WorldGenerator::addStage: null stage");
    stages_.push_back(std::move(stage));
}

GeneratedWorld WorldGenerator::generate(const core::WorldConfig& config) const
{
    world::GenerationSettings s;
    s.world = config;
    return generate(s);
}

GeneratedWorld WorldGenerator::generate(const world::GenerationSettings& settings) const
{
    settings.validate();

    const auto& cfg = settings.world;
    const auto t0 = std::chrono::steady_clock::now();
    spdlog::info("worldgen: seed={} size={} octaves={} roughness={:.2f}",
                 cfg.seed, cfg.worldSize, cfg.fractalIterations, cfg.roughness);

    const core::SeededRandomStream root(cfg.seed);
    auto report = std::make_shared<core::GenerationReport>();
    StageContext ctx(settings, root, jobs_, *report);

    for (const auto& stage : stages_) {
        const auto s0 = std::chrono::steady_clock::now();
        stage->generate(ctx);
        spdlog::debug("worldgen: stage {} done in {} ms", stage->name(),
                      std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - s0).count());
    }

    // Stages may have been replaced; fill in what is required for a valid state.
    if (ctx.height.empty())
        ctx.height = HeightField(cfg.worldSize, cfg.worldSize, 0.0f);
    if (ctx.biomes.grid.empty())
        ctx.biomes.grid = BiomeGrid(ctx.height.width(), ctx.height.height(), Biome::Plains);
    if (!ctx.ecosystem)
        ctx.ecosystem = std::make_unique<eco::EcosystemSimulator>(ctx.height.width(), ctx.height.height(),
                                                                  cfg.seed, settings.ecosystem, &jobs_);

    world::WorldState::Parts parts;
    parts.config     = cfg;
    parts.terrain    = world::TerrainStats::compute(ctx.height, ctx.biomes.grid);
    parts.thresholds = ctx.biomes.table;
    parts.height     = std::make_shared<const HeightField>(std::move(ctx.height));
    parts.biomes     = std::make_shared<const BiomeGrid>(std::move(ctx.biomes.grid));
    parts.forests    = std::make_shared<const std::vector<Forest>>(std::move(ctx.forests));
    parts.rivers     = std::make_shared<const std::vector<River>>(std::move(ctx.rivers));
    parts.structures = std::make_shared<const std::vector<Structure>>(std::move(ctx.structures));
    parts.creatures  = ctx.ecosystem->snapshot();
    parts.tick       = ctx.ecosystem->currentTick();
    parts.report     = report;

    world::WorldState state(std::move(parts));
    spdlog::info("worldgen: seed={} done in {} ms: {} rivers, {} forests ({} trees), {} structures, {} creatures, {} issues",
                 cfg.seed,
                 std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - t0).count(),
                 state.rivers().size(), state.forests().size(), state.treeCount(),
                 state.structures().size(), state.creatures().size(), state.report().issues.size());

    return GeneratedWorld{std::move(state), std::move(*ctx.ecosystem)};
}

} // namespace fractal::worldgen
