// src/worldgen/WorldGen.hpp
#pragma once

#include <cstdint>
#include <functional>
#include <memory>
#include <vector>

#include "eco/Ecosystem.hpp"
#include "world/Settings.h"
#include "world/WorldState.h"
#include "worldgen/StageContext.hpp"

namespace fractal::core { class JobSystem; }

namespace fractal::worldgen {

enum class StageId : std::uint8_t { Terrain, Climate, Biome, Hydrology, Flora, Fauna };

class IWorldGenStage {
public:
    virtual ~IWorldGenStage() = default;
    virtual StageId id() const noexcept = 0;
    virtual const char* name() const noexcept = 0;
    virtual void generate(StageContext& ctx) = 0;
};

using StagePtr = std::unique_ptr<IWorldGenStage>;

// A generated world plus the live simulator seeded with its population.
// The simulator keeps a pointer to the generator's JobSystem; rebind it with
// ecosystem.setJobSystem() before that JobSystem is destroyed.
struct GeneratedWorld {
    world::WorldState           state;
    eco::EcosystemSimulator     ecosystem;

    using TickObserver = std::function<void(const eco::TickDelta&)>;

    // Steps the ecosystem and returns a snapshot sharing the terrain.
    // `onTick` sees every delta in order.
    world::WorldState advance(int ticks, const TickObserver& onTick = {});
};

class WorldGenerator {
public:
    // Uses the process-wide JobSystem when `jobs` is null. A caller-owned
    // JobSystem must outlive the generator and every world it returns.
    explicit WorldGenerator(core::JobSystem* jobs = nullptr);

    // Register/override stages (call before generate)
    void clearStages();
    void addStage(StagePtr stage); // appended in order
    [[nodiscard]] std::size_t stageCount() const noexcept { return stages_.size(); }

    // Validates first; throws ConfigurationError before any work. Builds into
    // local state and only returns a complete world.
    [[nodiscard]] GeneratedWorld generate(const core::WorldConfig& config) const;
    [[nodiscard]] GeneratedWorld generate(const world::GenerationSettings& settings) const;

private:
    core::JobSystem& jobs_;
    std::vector<StagePtr> stages_;
};

// ----- Default stages, in pipeline order -----

class TerrainStage final : public IWorldGenStage {
public:
    StageId id() const noexcept override { return StageId::Terrain; }
    const char* name() const noexcept override { return "Terrain"; }
    void generate(StageContext& ctx) override;
};

class ClimateStage final : public IWorldGenStage {
public:
    StageId id() const noexcept override { return StageId::Climate; }
    const char* name() const noexcept override { return "Climate"; }
    void generate(StageContext& ctx) override;
};

class BiomeStage final : public IWorldGenStage {
public:
    StageId id() const noexcept override { return StageId::Biome; }
    const char* name() const noexcept override { return "Biome"; }
    void generate(StageContext& ctx) override;
};

class HydrologyStage final : public IWorldGenStage {
public:
    StageId id() const noexcept override { return StageId::Hydrology; }
    const char* name() const noexcept override { return "Hydrology"; }
    void generate(StageContext& ctx) override;
};

// Vegetation and structures, run concurrently.
class FloraStage final : public IWorldGenStage {
public:
    StageId id() const noexcept override { return StageId::Flora; }
    const char* name() const noexcept override { return "Flora"; }
    void generate(StageContext& ctx) override;
};

// Initial creature placement.
class FaunaStage final : public IWorldGenStage {
public:
    StageId id() const noexcept override { return StageId::Fauna; }
    const char* name() const noexcept override { return "Fauna"; }
    void generate(StageContext& ctx) override;
};

// Number of creatures placed at world creation.
[[nodiscard]] int initialPopulation(const core::WorldConfig& cfg) noexcept;

} // namespace fractal::worldgen
