// tests/worldgen/test_noise.cpp

#include <doctest/doctest.h>

#include "core/Config.h"
#include "core/JobSystem.h"
#include "core/Random.hpp"
#include "worldgen/Noise.hpp"

#include <algorithm>
#include <cmath>

using namespace fractal;
using namespace fractal::worldgen;

TEST_CASE("perlin2D is deterministic and bounded")
{
    for (int i = 0; i < 500; ++i)
    {
        const float x = static_cast<float>(i) * 0.173f;
        const float y = static_cast<float>(i) * 0.291f - 20.0f;
        const float v = noise::perlin2D(x, y, 1234u);
        CHECK(v == noise::perlin2D(x, y, 1234u));
        CHECK(v >= -1.5f);
        CHECK(v <= 1.5f);
    }
    // Lattice points are zero by construction.
    CHECK(noise::perlin2D(3.0f, 4.0f, 9u) == doctest::Approx(0.0f));
}

TEST_CASE("NoiseField samples stay in [0, 1] and depend on the seed")
{
    NoiseConfig cfg;
    cfg.octaves = 5;
    const NoiseField a(1, cfg), b(2, cfg);

    int differ = 0;
    for (int y = 0; y < 32; ++y)
        for (int x = 0; x < 32; ++x)
        {
            const float va = a.sample(static_cast<float>(x), static_cast<float>(y));
            REQUIRE(va >= 0.0f);
            REQUIRE(va <= 1.0f);
            if (va != b.sample(static_cast<float>(x), static_cast<float>(y)))
                ++differ;
        }
    CHECK(differ > 900);
}

TEST_CASE("roughness maps to lacunarity")
{
    CHECK(lacunarityForRoughness(0.0f) == doctest::Approx(1.6f));
    CHECK(lacunarityForRoughness(0.5f) == doctest::Approx(2.0f));
    CHECK(lacunarityForRoughness(1.0f) == doctest::Approx(2.4f));

    core::WorldConfig cfg;
    cfg.fractalIterations = 9;
    CHECK(terrainNoiseConfig(cfg).octaves == 9);
    CHECK(climateNoiseConfig(cfg).octaves == 3);
}

TEST_CASE("generateHeightField is normalised and reproducible")
{
    core::JobSystem jobs(4);
    core::WorldConfig cfg;
    cfg.worldSize = 64;
    cfg.seed = 77;

    const core::SeededRandomStream root(cfg.seed);
    const HeightField h1 = generateHeightField(cfg, root, jobs);
    const HeightField h2 = generateHeightField(cfg, core::SeededRandomStream(cfg.seed), jobs);

    REQUIRE(h1.width() == 64);
    REQUIRE(h1.height() == 64);
    CHECK(h1 == h2);

    const auto [lo, hi] = std::minmax_element(h1.begin(), h1.end());
    CHECK(*lo == doctest::Approx(0.0f));
    CHECK(*hi == doctest::Approx(1.0f));

    cfg.seed = 78;
    CHECK_FALSE(generateHeightField(cfg, core::SeededRandomStream(cfg.seed), jobs) == h1);
}

TEST_CASE("height field does not depend on the worker count")
{
    core::JobSystem one(1), many(6);
    core::WorldConfig cfg;
    cfg.worldSize = 64;
    const core::SeededRandomStream root(cfg.seed);
    CHECK(generateHeightField(cfg, root, one) == generateHeightField(cfg, root, many));
    CHECK(generateClimateField(cfg, root, one) == generateClimateField(cfg, root, many));
}
