// src/world/Settings.h
#pragma once
#include <filesystem>

#include <nlohmann/json.hpp>

#include "core/Config.h"
#include "eco/Ecosystem.hpp"
#include "worldgen/Hydrology.hpp"
#include "worldgen/Structures.hpp"
#include "worldgen/Vegetation.hpp"

namespace fractal::world {

// Everything one generation run needs: the validated world parameters plus
// the tuning knobs of the individual generators and the simulator.
struct GenerationSettings {
    core::WorldConfig          world;
    worldgen::HydrologyParams  hydrology;
    worldgen::VegetationParams vegetation;
    worldgen::StructureParams  structures;
    eco::EcosystemParams       ecosystem;

    // Throws ConfigurationError.
    void validate() const;
};

// Reads "world_settings" plus the optional "generation" and "ecosystem"
// objects. Missing keys keep defaults.
GenerationSettings settingsFromJson(const nlohmann::json& root);
GenerationSettings loadSettings(const std::filesystem::path& path);

nlohmann::json toJson(const GenerationSettings& s);

} // namespace fractal::world
