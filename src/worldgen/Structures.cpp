// src/worldgen/Structures.cpp
#include "worldgen/Structures.hpp"
#include "core/Config.h"
#include "core/Errors.h"
#include "core/Hash.hpp"
#include "core/Random.hpp"

#include <spdlog/spdlog.h>

#include <cmath>
#include <string>
#include <utility>

namespace fractal::worldgen {

namespace {

constexpr std::array<std::string_view, kStructurePatternCount> kPatternNames = {
    "fractal_tower", "radial_mandala", "hexagonal_crystal", "spiral", "portal_circle"
};

//                                                  children scale  rot    radius lift
constexpr std::array<GeneratorRule, kStructurePatternCount> kRules = {{
    /* FractalTower     */ {3, 0.50f, 40.0f, 0.6f, 1.0f},
    /* RadialMandala    */ {6, 0.40f, 30.0f, 1.5f, 0.0f},
    /* HexagonalCrystal */ {3, 0.55f, 60.0f, 1.0f, 0.3f},
    /* Spiral           */ {1, 0.85f, 30.0f, 1.0f, 0.2f},
    /* PortalCircle     */ {2, 0.60f, 90.0f, 1.2f, 0.0f},
}};

constexpr std::array<int, kStructurePatternCount> kDepths = {5, 4, 5, 8, 6};

} // namespace

std::string_view patternName(StructurePattern p) noexcept
{
    return kPatternNames[static_cast<std::size_t>(p)];
}

std::optional<StructurePattern> patternFromName(std::string_view name) noexcept
{
    for (int i = 0; i < kStructurePatternCount; ++i)
        if (kPatternNames[static_cast<std::size_t>(i)] == name)
            return static_cast<StructurePattern>(i);
    return std::nullopt;
}

const GeneratorRule& generatorRule(StructurePattern p) noexcept
{
    return kRules[static_cast<std::size_t>(p)];
}

int patternDepth(StructurePattern p) noexcept
{
    return kDepths[static_cast<std::size_t>(p)];
}

float patternReach(StructurePattern p) noexcept
{
    const GeneratorRule& rule = generatorRule(p);
    // Level d sits offsetRadius * size(d - 1) from its parent.
    float reach = 0.0f, size = kMaxBaseSize;
    for (int d = 1; d <= patternDepth(p); ++d) {
        reach += rule.offsetRadius * size;
        size *= rule.scale;
    }
    return reach;
}

Structure buildStructure(std::uint32_t seed, int x, int y, StructurePattern pattern,
                         int depth, std::size_t maxNodes)
{
    const GeneratorRule& rule = generatorRule(pattern);

    Structure s;
    s.x = x;
    s.y = y;
    s.pattern = pattern;
    s.depth = depth;

    const std::uint64_t h = core::hash_combine(core::hash_cell(seed, x, y),
                                               static_cast<std::uint64_t>(pattern) * 31u + static_cast<std::uint64_t>(depth));
    StructureNode base;
    base.position = Vec3{static_cast<float>(x), static_cast<float>(y), 0.0f};
    base.size = kMinBaseSize + (kMaxBaseSize - kMinBaseSize) * core::hash_to_unit(h);
    base.rotationDeg = 360.0f * core::hash_to_unit(core::splitmix64(h));

    if (maxNodes == 0) {
        s.truncated = true;
        return s;
    }
    s.nodes.push_back(base);

    std::size_t levelBegin = 0;
    for (int d = 1; d <= depth; ++d) {
        const std::size_t levelEnd = s.nodes.size();
        for (std::size_t i = levelBegin; i < levelEnd; ++i) {
            const StructureNode parent = s.nodes[i];
            for (int c = 0; c < rule.childCount; ++c) {
                if (s.nodes.size() >= maxNodes) {
                    s.truncated = true;
                    return s;
                }
                const float rot = parent.rotationDeg + rule.rotationStepDeg;
                const float ang = radians(rot + 360.0f * static_cast<float>(c) / static_cast<float>(rule.childCount));
                const float r = rule.offsetRadius * parent.size;

                StructureNode n;
                n.position = parent.position + Vec3{std::cos(ang) * r, std::sin(ang) * r, rule.verticalOffset * parent.size};
                n.size = parent.size * rule.scale;
                n.rotationDeg = rot;
                n.depth = d;
                n.parent = static_cast<int>(i);
                s.nodes.push_back(n);
            }
        }
        levelBegin = levelEnd;
    }
    return s;
}

std::vector<Structure> generateStructures(const core::WorldConfig& cfg,
                                          const BiomeGrid& biomes,
                                          const StructureParams& params,
                                          const core::SeededRandomStream& root,
                                          core::GenerationReport& report)
{
    auto rng = root.substream("structures");
    const std::uint32_t seed = root.rootSeed();

    const int attempts = 2 + static_cast<int>(std::lround(cfg.magicIntensity * static_cast<float>(cfg.worldSize) / 32.0f));
    const int W = biomes.width(), H = biomes.height();

    std::vector<Structure> out;
    int failed = 0;
    for (int a = 0; a < attempts; ++a) {
        const auto pattern = static_cast<StructurePattern>(rng.rangeInt(0, kStructurePatternCount - 1));
        const int margin = static_cast<int>(std::ceil(patternReach(pattern)));
        if (W - 1 - margin < margin || H - 1 - margin < margin) {
            ++failed;
            continue;
        }

        bool placed = false;
        for (int r = 0; r <= params.placementRetries && !placed; ++r) {
            const int x = rng.rangeInt(margin, W - 1 - margin);
            const int y = rng.rangeInt(margin, H - 1 - margin);
            if (biomes.at(x, y) == Biome::Water)
                continue;

            Structure s = buildStructure(seed, x, y, pattern, patternDepth(pattern), params.maxNodes);
            if (s.truncated)
                spdlog::warn("structures: {} at ({}, {}) truncated at {} nodes, seed={}",
                             patternName(pattern), x, y, s.nodes.size(), seed);
            s.runeCount = static_cast<int>(std::lround(static_cast<float>(s.nodes.size()) * cfg.magicIntensity));
            s.glowIntensity = rng.uniform(0.6f, 1.0f) * cfg.magicIntensity;
            out.push_back(std::move(s));
            placed = true;
        }
        if (!placed) ++failed;
    }

    if (failed > 0)
        report.add("structures", std::to_string(failed) + " placements found no room on dry land");
    spdlog::debug("structures: {} placed, {} failed, seed={}", out.size(), failed, seed);
    return out;
}

} // namespace fractal::worldgen
