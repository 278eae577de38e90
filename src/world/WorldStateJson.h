// src/world/WorldStateJson.h
//
// Fixed-shape JSON schemas for the world snapshot, one per entity category.
#pragma once

#include <filesystem>

#include <nlohmann/json.hpp>

#include "eco/Ecosystem.hpp"
#include "world/WorldState.h"

namespace fractal::worldgen {
void to_json(nlohmann::json& j, const Vec2& v);
void to_json(nlohmann::json& j, const Vec3& v);
void to_json(nlohmann::json& j, const Tree& t);
void to_json(nlohmann::json& j, const Forest& f);
void to_json(nlohmann::json& j, const River& r);
void to_json(nlohmann::json& j, const StructureNode& n);
void to_json(nlohmann::json& j, const Structure& s);
void to_json(nlohmann::json& j, const BiomeThresholdTable& t);
} // namespace fractal::worldgen

namespace fractal::eco {
void to_json(nlohmann::json& j, const Genome& g);
void to_json(nlohmann::json& j, const CreatureSnapshot& c);
// One tick's events: deaths (with cause), births, movements and hunts.
void to_json(nlohmann::json& j, const TickDelta& d);
} // namespace fractal::eco

namespace fractal::core {
void to_json(nlohmann::json& j, const GenerationReport& r);
} // namespace fractal::core

namespace fractal::world {

inline constexpr int kSnapshotVersion = 1;

struct JsonOptions {
    bool includeGrids = false;     // full height and biome rasters
    bool includeSkeletons = true;  // shared tree skeleton geometry
    int  indent = 2;               // -1: compact
};

nlohmann::json toJson(const WorldState& state, const JsonOptions& options = {});

// Serialises and publishes atomically (temp file + rename). Throws
// core::IoError on failure.
void saveWorldState(const WorldState& state, const std::filesystem::path& path,
                    const JsonOptions& options = {});

} // namespace fractal::world
