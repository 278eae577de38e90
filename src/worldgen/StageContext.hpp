// src/worldgen/StageContext.hpp
#pragma once
#include <cstdint>
#include <memory>
#include <vector>

#include "core/Errors.h"
#include "core/Random.hpp"
#include "eco/Ecosystem.hpp"
#include "world/Settings.h"
#include "worldgen/Biomes.hpp"
#include "worldgen/Grid2D.hpp"
#include "worldgen/Hydrology.hpp"
#include "worldgen/Structures.hpp"
#include "worldgen/Vegetation.hpp"

namespace fractal::core { class JobSystem; }

namespace fractal::worldgen {

// Scratch state threaded through the stages of one generation run. Each
// stage reads the products of earlier stages and fills in its own; nothing
// here escapes the run except through the finished WorldState.
struct StageContext {
  StageContext(const world::GenerationSettings& s, const core::SeededRandomStream& r,
               core::JobSystem& j, core::GenerationReport& rep) noexcept
      : settings(s), root(r), jobs(j), report(rep) {}

  const world::GenerationSettings& settings;
  const core::SeededRandomStream&  root;
  core::JobSystem&                 jobs;
  core::GenerationReport&          report;

  [[nodiscard]] const core::WorldConfig& config() const noexcept { return settings.world; }
  [[nodiscard]] std::uint32_t seed() const noexcept { return root.rootSeed(); }

  HeightField                height;
  Grid2D<float>              moisture;
  BiomeClassification        biomes;
  std::vector<River>         rivers;
  Grid2D<std::uint8_t>       riverMask;
  std::vector<Forest>        forests;
  std::vector<Structure>     structures;
  std::unique_ptr<eco::EcosystemSimulator> ecosystem;
};

} // namespace fractal::worldgen
