// tests/worldgen/test_structures.cpp

#include <doctest/doctest.h>

#include "core/Config.h"
#include "core/Errors.h"
#include "core/Random.hpp"
#include "worldgen/Structures.hpp"

#include <cmath>
#include <cstdint>

using namespace fractal;
using namespace fractal::worldgen;

TEST_CASE("each pattern expands to its full geometric series")
{
    struct Expect { StructurePattern p; std::size_t nodes; };
    const Expect cases[] = {
        {StructurePattern::FractalTower,     364},
        {StructurePattern::RadialMandala,    1555},
        {StructurePattern::HexagonalCrystal, 364},
        {StructurePattern::Spiral,           9},
        {StructurePattern::PortalCircle,     127},
    };
    for (const auto& c : cases)
    {
        INFO("pattern ", patternName(c.p));
        const auto s = buildStructure(1, 10, 10, c.p, patternDepth(c.p), 4096);
        CHECK(s.nodes.size() == c.nodes);
        CHECK_FALSE(s.truncated);
    }
}

TEST_CASE("structure nodes shrink level by level and point at earlier parents")
{
    const auto s = buildStructure(5, 20, 30, StructurePattern::FractalTower, 3, 4096);
    REQUIRE(s.nodes.size() == 40u);
    CHECK(s.nodes.front().parent == -1);
    CHECK(s.nodes.front().position.x == doctest::Approx(20.0f));
    CHECK(s.nodes.front().position.y == doctest::Approx(30.0f));
    for (std::size_t i = 1; i < s.nodes.size(); ++i)
    {
        const auto& n = s.nodes[i];
        REQUIRE(n.parent >= 0);
        REQUIRE(static_cast<std::size_t>(n.parent) < i);
        const auto& p = s.nodes[static_cast<std::size_t>(n.parent)];
        CHECK(n.depth == p.depth + 1);
        CHECK(n.size == doctest::Approx(p.size * 0.5f));
        CHECK(n.position.z > p.position.z);
    }
}

TEST_CASE("buildStructure is a pure function of its inputs")
{
    const auto a = buildStructure(9, 4, 4, StructurePattern::RadialMandala, 3, 4096);
    const auto b = buildStructure(9, 4, 4, StructurePattern::RadialMandala, 3, 4096);
    REQUIRE(a.nodes.size() == b.nodes.size());
    for (std::size_t i = 0; i < a.nodes.size(); ++i)
    {
        CHECK(a.nodes[i].position == b.nodes[i].position);
        CHECK(a.nodes[i].size == b.nodes[i].size);
    }
    const auto c = buildStructure(10, 4, 4, StructurePattern::RadialMandala, 3, 4096);
    CHECK_FALSE(a.nodes.front().size == c.nodes.front().size);
}

TEST_CASE("node cap truncates breadth-first")
{
    const auto s = buildStructure(1, 0, 0, StructurePattern::RadialMandala, 4, 100);
    CHECK(s.truncated);
    CHECK(s.nodes.size() == 100u);
    // Levels 0..2 (43 nodes) are complete.
    int shallow = 0;
    for (const auto& n : s.nodes)
        if (n.depth <= 2)
            ++shallow;
    CHECK(shallow == 43);
}

TEST_CASE("pattern names round-trip")
{
    for (int i = 0; i < kStructurePatternCount; ++i)
    {
        const auto p = static_cast<StructurePattern>(i);
        REQUIRE(patternFromName(patternName(p)).has_value());
        CHECK(*patternFromName(patternName(p)) == p);
    }
    CHECK(patternName(StructurePattern::PortalCircle) == "portal_circle");
}

TEST_CASE("generateStructures avoids water and scales runes with magic")
{
    core::WorldConfig cfg;
    cfg.worldSize = 64;
    cfg.magicIntensity = 0.5f;

    BiomeGrid biomes(64, 64, Biome::Water);
    for (int y = 0; y < 64; ++y)
        for (int x = 32; x < 64; ++x)
            biomes.at(x, y) = Biome::Plains;

    core::GenerationReport report;
    const auto out = generateStructures(cfg, biomes, StructureParams{}, core::SeededRandomStream(cfg.seed), report);
    CHECK_FALSE(out.empty());
    CHECK(out.size() <= 3u); // 2 + round(0.5 * 64 / 32)
    for (const auto& s : out)
    {
        CHECK(biomes.at(s.x, s.y) != Biome::Water);
        CHECK(s.runeCount == static_cast<int>(std::lround(static_cast<float>(s.nodes.size()) * 0.5f)));
        CHECK(s.glowIntensity >= 0.3f);
        CHECK(s.glowIntensity <= 0.5f);
    }

    BiomeGrid sea(64, 64, Biome::Water);
    core::GenerationReport seaReport;
    CHECK(generateStructures(cfg, sea, StructureParams{}, core::SeededRandomStream(1), seaReport).empty());
    CHECK_FALSE(seaReport.clean());
}

TEST_CASE("patternReach bounds every node's distance from the anchor")
{
    for (int i = 0; i < kStructurePatternCount; ++i)
    {
        const auto p = static_cast<StructurePattern>(i);
        INFO("pattern ", patternName(p));
        const float reach = patternReach(p);
        CHECK(reach > 0.0f);
        for (std::uint32_t seed : {1u, 42u, 777u, 123456u})
        {
            const auto s = buildStructure(seed, 0, 0, p, patternDepth(p), 4096);
            for (const auto& n : s.nodes)
                CHECK(std::sqrt(n.position.x * n.position.x + n.position.y * n.position.y) <= reach);
        }
    }
}

TEST_CASE("placed structures stay inside the world")
{
    for (int size : {64, 100, 256})
    {
        core::WorldConfig cfg;
        cfg.worldSize = size;
        cfg.magicIntensity = 1.0f;
        const BiomeGrid land(size, size, Biome::Plains);

        for (std::uint32_t seed : {1u, 42u, 99u})
        {
            core::GenerationReport report;
            const auto out = generateStructures(cfg, land, StructureParams{}, core::SeededRandomStream(seed), report);
            CHECK(out.size() == static_cast<std::size_t>(2 + std::lround(static_cast<float>(size) / 32.0f)));
            for (const auto& s : out)
                for (const auto& n : s.nodes)
                {
                    INFO("size ", size, " seed ", seed, " pattern ", patternName(s.pattern));
                    CHECK(n.position.x >= 0.0f);
                    CHECK(n.position.y >= 0.0f);
                    CHECK(n.position.x <= static_cast<float>(size - 1));
                    CHECK(n.position.y <= static_cast<float>(size - 1));
                }
        }
    }
}

TEST_CASE("a grid too small for the pattern records a failed placement")
{
    core::WorldConfig cfg;
    cfg.worldSize = 64;
    cfg.magicIntensity = 1.0f;
    const BiomeGrid tiny(8, 8, Biome::Plains);

    core::GenerationReport report;
    const auto out = generateStructures(cfg, tiny, StructureParams{}, core::SeededRandomStream(5), report);
    CHECK(out.empty());
    CHECK_FALSE(report.clean());
}
