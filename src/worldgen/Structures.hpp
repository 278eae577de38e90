// src/worldgen/Structures.hpp
#pragma once
#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string_view>
#include <vector>

#include "worldgen/Biomes.hpp"
#include "worldgen/Math.hpp"

namespace fractal::core {
struct WorldConfig;
class SeededRandomStream;
struct GenerationReport;
}

namespace fractal::worldgen {

enum class StructurePattern : std::uint8_t {
    FractalTower = 0, RadialMandala, HexagonalCrystal, Spiral, PortalCircle
};
inline constexpr int kStructurePatternCount = 5;

[[nodiscard]] std::string_view patternName(StructurePattern p) noexcept;
[[nodiscard]] std::optional<StructurePattern> patternFromName(std::string_view name) noexcept;

// Each node spawns childCount children at `scale` of its size, spread evenly
// around it, turned by rotationStepDeg per level and lifted by verticalOffset.
struct GeneratorRule {
    int   childCount;
    float scale;
    float rotationStepDeg;
    float offsetRadius;
    float verticalOffset;
};

[[nodiscard]] const GeneratorRule& generatorRule(StructurePattern p) noexcept;
[[nodiscard]] int patternDepth(StructurePattern p) noexcept;

// Base node size is hash-derived in [kMinBaseSize, kMaxBaseSize).
inline constexpr float kMinBaseSize = 2.0f;
inline constexpr float kMaxBaseSize = 6.0f;

// Upper bound on the horizontal distance between any node and the anchor,
// for the pattern at its own depth.
[[nodiscard]] float patternReach(StructurePattern p) noexcept;

struct StructureNode {
    Vec3  position;
    float size = 1.0f;
    float rotationDeg = 0.0f;
    int   depth = 0;
    int   parent = -1;
};

struct Structure {
    int x = 0;
    int y = 0;
    StructurePattern pattern = StructurePattern::FractalTower;
    int depth = 0;
    std::vector<StructureNode> nodes;
    int   runeCount = 0;
    float glowIntensity = 0.0f;
    bool  truncated = false; // stopped at maxNodes before reaching depth
};

struct StructureParams {
    std::size_t maxNodes = 4096;
    int placementRetries = 8;
};

// Pure in (seed, position, pattern, depth); breadth-first so a node cap keeps
// complete shallow levels.
Structure buildStructure(std::uint32_t seed, int x, int y, StructurePattern pattern,
                         int depth, std::size_t maxNodes);

// Anchors are drawn at least patternReach() away from every edge, so all
// nodes of a placed structure lie inside the world.
std::vector<Structure> generateStructures(const core::WorldConfig& cfg,
                                          const BiomeGrid& biomes,
                                          const StructureParams& params,
                                          const core::SeededRandomStream& root,
                                          core::GenerationReport& report);

} // namespace fractal::worldgen
