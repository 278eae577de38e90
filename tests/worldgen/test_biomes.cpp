// tests/worldgen/test_biomes.cpp

#include <doctest/doctest.h>

#include "core/Config.h"
#include "core/JobSystem.h"
#include "core/Random.hpp"
#include "worldgen/Biomes.hpp"
#include "worldgen/Noise.hpp"

#include <cmath>

using namespace fractal;
using namespace fractal::worldgen;

namespace {

BiomeClassification classifyWorld(const core::WorldConfig& cfg, core::JobSystem& jobs)
{
    const core::SeededRandomStream root(cfg.seed);
    const HeightField h = generateHeightField(cfg, root, jobs);
    const Grid2D<float> m = generateClimateField(cfg, root, jobs);
    return classifyGrid(h, m, BiomeTargets::forWaterLevel(cfg.waterLevel));
}

} // namespace

TEST_CASE("classify follows the ordered threshold table")
{
    BiomeThresholdTable t;
    t.waterMax = 0.2f;
    t.mountainMin = 0.9f;
    t.tundraMin = 0.8f;
    t.desertMax = 0.1f;
    t.plainsMax = 0.5f;
    t.forestMax = 0.8f;
    t.groveMax = 0.9f;

    CHECK(classify(0.1f, 0.95f, t) == Biome::Water);
    CHECK(classify(0.95f, 0.0f, t) == Biome::Mountains);
    CHECK(classify(0.85f, 0.5f, t) == Biome::Tundra);
    CHECK(classify(0.5f, 0.05f, t) == Biome::Desert);
    CHECK(classify(0.5f, 0.3f, t) == Biome::Plains);
    CHECK(classify(0.5f, 0.6f, t) == Biome::Forest);
    CHECK(classify(0.5f, 0.85f, t) == Biome::MagicalGrove);
    CHECK(classify(0.5f, 0.95f, t) == Biome::Swamp);
    // Boundaries: water is strict, mountains inclusive.
    CHECK(classify(0.2f, 0.3f, t) == Biome::Plains);
    CHECK(classify(0.9f, 0.3f, t) == Biome::Mountains);
}

TEST_CASE("biome names round-trip")
{
    for (int i = 0; i < kBiomeCount; ++i)
    {
        const auto b = static_cast<Biome>(i);
        REQUIRE(biomeFromName(biomeName(b)).has_value());
        CHECK(*biomeFromName(biomeName(b)) == b);
    }
    CHECK_FALSE(biomeFromName("Ocean").has_value());
}

TEST_CASE("targets scale land shares with the water level")
{
    const auto ref = BiomeTargets::forWaterLevel(0.15f);
    float sum = 0.0f;
    for (float s : ref.share)
        sum += s;
    CHECK(sum == doctest::Approx(1.0f).epsilon(0.001));
    CHECK(ref.share[biomeIndex(Biome::Plains)] == doctest::Approx(0.38f));
    CHECK(ref.share[biomeIndex(Biome::Water)] == doctest::Approx(0.15f));

    const auto dry = BiomeTargets::forWaterLevel(0.0f);
    CHECK(dry.share[biomeIndex(Biome::Water)] == doctest::Approx(0.0f));
    CHECK(dry.share[biomeIndex(Biome::Forest)] == doctest::Approx(0.29f / 0.85f));
}

TEST_CASE("coverage of a 256x256 world is within two points of the targets")
{
    core::JobSystem jobs(4);
    core::WorldConfig cfg; // defaults: seed 12345, size 256, water 0.15
    const auto result = classifyWorld(cfg, jobs);
    const auto targets = BiomeTargets::forWaterLevel(cfg.waterLevel);

    for (int i = 0; i < kBiomeCount; ++i)
    {
        INFO("biome ", biomeName(static_cast<Biome>(i)));
        CHECK(std::abs(result.coverage[static_cast<std::size_t>(i)] - 100.0f * targets.share[static_cast<std::size_t>(i)]) <= 2.0f);
    }
}

TEST_CASE("a small world still contains every biome")
{
    core::JobSystem jobs(2);
    core::WorldConfig cfg;
    cfg.seed = 42;
    cfg.worldSize = 64;
    const auto result = classifyWorld(cfg, jobs);
    for (int i = 0; i < kBiomeCount; ++i)
    {
        INFO("biome ", biomeName(static_cast<Biome>(i)));
        CHECK(result.coverage[static_cast<std::size_t>(i)] > 0.0f);
    }
}

TEST_CASE("calibrateThresholds rejects mismatched grids")
{
    HeightField h(8, 8, 0.5f);
    Grid2D<float> m(4, 8, 0.5f);
    CHECK_THROWS_AS((void)calibrateThresholds(h, m, BiomeTargets::forWaterLevel(0.15f)), std::invalid_argument);
}
