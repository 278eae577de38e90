// src/world/WorldState.h
#pragma once
#include <array>
#include <cstdint>
#include <memory>
#include <vector>

#include "core/Config.h"
#include "core/Errors.h"
#include "eco/Creature.hpp"
#include "worldgen/Biomes.hpp"
#include "worldgen/Hydrology.hpp"
#include "worldgen/Structures.hpp"
#include "worldgen/Vegetation.hpp"

namespace fractal::world {

struct TerrainStats {
    float minHeight  = 0.0f;
    float maxHeight  = 0.0f;
    float meanHeight = 0.0f;
    std::array<float, worldgen::kBiomeCount> biomePercent{}; // indexed by biomeIndex()

    static TerrainStats compute(const worldgen::HeightField& h, const worldgen::BiomeGrid& b);
};

// Immutable snapshot of a generated world. The heavy parts are shared
// between copies and between withCreatures() results.
class WorldState {
public:
    struct Parts {
        core::WorldConfig config;
        TerrainStats terrain;
        worldgen::BiomeThresholdTable thresholds;
        std::shared_ptr<const worldgen::HeightField> height;
        std::shared_ptr<const worldgen::BiomeGrid> biomes;
        std::shared_ptr<const std::vector<worldgen::Forest>> forests;
        std::shared_ptr<const std::vector<worldgen::River>> rivers;
        std::shared_ptr<const std::vector<worldgen::Structure>> structures;
        std::shared_ptr<const core::GenerationReport> report;
        std::vector<eco::CreatureSnapshot> creatures;
        int tick = 0;
    };

    explicit WorldState(Parts parts);

    [[nodiscard]] const core::WorldConfig& config() const noexcept { return p_.config; }
    [[nodiscard]] std::uint32_t seed() const noexcept { return p_.config.seed; }
    [[nodiscard]] int size() const noexcept { return p_.config.worldSize; }
    [[nodiscard]] const TerrainStats& terrain() const noexcept { return p_.terrain; }
    [[nodiscard]] const worldgen::BiomeThresholdTable& thresholds() const noexcept { return p_.thresholds; }
    [[nodiscard]] const worldgen::HeightField& height() const noexcept { return *p_.height; }
    [[nodiscard]] const worldgen::BiomeGrid& biomes() const noexcept { return *p_.biomes; }
    [[nodiscard]] const std::vector<worldgen::Forest>& forests() const noexcept { return *p_.forests; }
    [[nodiscard]] const std::vector<worldgen::River>& rivers() const noexcept { return *p_.rivers; }
    [[nodiscard]] const std::vector<worldgen::Structure>& structures() const noexcept { return *p_.structures; }
    [[nodiscard]] const core::GenerationReport& report() const noexcept { return *p_.report; }
    [[nodiscard]] const std::vector<eco::CreatureSnapshot>& creatures() const noexcept { return p_.creatures; }
    [[nodiscard]] int tick() const noexcept { return p_.tick; }

    [[nodiscard]] std::size_t treeCount() const noexcept;

    // New state with a different creature population; everything else shared.
    [[nodiscard]] WorldState withCreatures(std::vector<eco::CreatureSnapshot> creatures, int tick) const;

    // True when both states point at the same terrain and feature storage.
    [[nodiscard]] bool sharesTerrainWith(const WorldState& other) const noexcept {
        return p_.height == other.p_.height && p_.biomes == other.p_.biomes && p_.forests == other.p_.forests;
    }

private:
    Parts p_;
};

} // namespace fractal::world
