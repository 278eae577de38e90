#pragma once
#include <cstdint>
#include <filesystem>
#include <string>

#include <nlohmann/json.hpp>

namespace fractal::core {

// Top-level generation parameters. Ranges are enforced by validate().
struct WorldConfig {
    std::uint32_t seed              = 12345;
    int           worldSize         = 256;   // [64, 1024] cells per side
    int           fractalIterations = 6;     // [1, 16] noise octaves
    float         roughness         = 0.5f;  // [0, 1]
    float         waterLevel        = 0.15f; // [0, 1] share of the map under water
    float         treeDensity       = 0.4f;  // [0, 1]
    float         creatureDensity   = 0.1f;  // [0, 1]
    float         magicIntensity    = 0.7f;  // [0, 1]

    // Throws ConfigurationError naming the first offending field.
    void validate() const;
};

// Parses the "world_settings" object (or a bare object with the same keys).
// Missing keys keep their defaults; wrong types and out-of-range values throw.
WorldConfig worldConfigFromJson(const nlohmann::json& j);
nlohmann::json toJson(const WorldConfig& cfg);

// Reads a whole JSON document from disk. Throws ConfigurationError when the
// file cannot be opened or parsed.
nlohmann::json readJsonFile(const std::filesystem::path& path);

WorldConfig loadWorldConfig(const std::filesystem::path& path);

} // namespace fractal::core
