// tests/eco/test_genome.cpp
//
// Genome clamping and jitter, the species table and the predation matrix.

#include <doctest/doctest.h>

#include "core/Random.hpp"
#include "eco/Ecosystem.hpp"
#include "eco/Genome.hpp"
#include "eco/Species.hpp"

#include <cmath>

using namespace fractal;
using namespace fractal::eco;

namespace {

void check_within(const Traits& t, const Traits& base, float jitter)
{
    const float eps = 1e-6f;
    CHECK(std::abs(t.aggression - base.aggression) <= jitter + eps);
    CHECK(std::abs(t.intelligence - base.intelligence) <= jitter + eps);
    CHECK(std::abs(t.social - base.social) <= jitter + eps);
    CHECK(std::abs(t.territorial - base.territorial) <= jitter + eps);
    CHECK(std::abs(t.predator - base.predator) <= jitter + eps);
    CHECK(std::abs(t.prey - base.prey) <= jitter + eps);
}

} // namespace

TEST_CASE("Genome clamps every trait into [0, 1]")
{
    const Genome g(Species::GeometricWolf, Traits{-0.5f, 1.5f, 0.25f, 2.0f, -1.0f, 0.75f});
    CHECK(g.species() == Species::GeometricWolf);
    CHECK(g.aggression() == 0.0f);
    CHECK(g.intelligence() == 1.0f);
    CHECK(g.social() == doctest::Approx(0.25f));
    CHECK(g.territorial() == 1.0f);
    CHECK(g.predator() == 0.0f);
    CHECK(g.prey() == doctest::Approx(0.75f));
}

TEST_CASE("spawned genomes stay within 0.1 of the species baseline")
{
    core::SeededRandomStream rng(8);
    for (int s = 0; s < kSpeciesCount; ++s)
    {
        const auto species = static_cast<Species>(s);
        for (int i = 0; i < 50; ++i)
        {
            const Genome g = Genome::spawn(species, rng);
            CHECK(g.species() == species);
            check_within(g.traits(), speciesInfo(species).baseline, kSpawnJitter);
        }
    }
}

TEST_CASE("offspring stay within 0.05 of the parent and keep its species")
{
    core::SeededRandomStream rng(9);
    const Genome parent(Species::CrystalSpider, Traits{0.5f, 0.5f, 0.5f, 0.5f, 0.5f, 0.5f});
    for (int i = 0; i < 100; ++i)
    {
        const Genome child = Genome::offspring(parent, rng);
        CHECK(child.species() == Species::CrystalSpider);
        check_within(child.traits(), parent.traits(), kOffspringJitter);
    }
}

TEST_CASE("genome draws are reproducible")
{
    core::SeededRandomStream a(3), b(3);
    const Genome ga = Genome::spawn(Species::GoldenBear, a);
    const Genome gb = Genome::spawn(Species::GoldenBear, b);
    CHECK(ga.aggression() == gb.aggression());
    CHECK(ga.prey() == gb.prey());
}

TEST_CASE("predation table")
{
    using S = Species;
    // Dragons take everything smaller.
    CHECK(canHunt(S::FractalDragon, S::SpiralSerpent));
    CHECK(canHunt(S::FractalDragon, S::CrystalSpider));
    CHECK(canHunt(S::FractalDragon, S::PatternBird));
    CHECK(canHunt(S::FractalDragon, S::GoldenBear));
    CHECK_FALSE(canHunt(S::FractalDragon, S::GeometricWolf)); // no prey affinity

    CHECK(canHunt(S::GeometricWolf, S::SpiralSerpent));
    CHECK(canHunt(S::GeometricWolf, S::CrystalSpider));
    CHECK(canHunt(S::GeometricWolf, S::PatternBird));
    CHECK_FALSE(canHunt(S::GeometricWolf, S::GoldenBear));

    CHECK(canHunt(S::GoldenBear, S::CrystalSpider));
    CHECK(canHunt(S::GoldenBear, S::PatternBird));
    CHECK(canHunt(S::SpiralSerpent, S::PatternBird));
    CHECK(canHunt(S::CrystalSpider, S::PatternBird));

    for (int s = 0; s < kSpeciesCount; ++s)
    {
        CHECK_FALSE(canHunt(static_cast<S>(s), static_cast<S>(s)));
        CHECK_FALSE(canHunt(S::PatternBird, static_cast<S>(s)));
        CHECK_FALSE(canHunt(static_cast<S>(s), S::FractalDragon));
    }
}

TEST_CASE("species names and habitats")
{
    CHECK(speciesName(Species::FractalDragon) == "Fractal Dragon");
    for (int s = 0; s < kSpeciesCount; ++s)
    {
        const auto sp = static_cast<Species>(s);
        REQUIRE(speciesFromName(speciesName(sp)).has_value());
        CHECK(*speciesFromName(speciesName(sp)) == sp);
        CHECK_FALSE(livesIn(sp, worldgen::Biome::Water));
    }
    CHECK(livesIn(Species::FractalDragon, worldgen::Biome::Mountains));
    CHECK_FALSE(livesIn(Species::FractalDragon, worldgen::Biome::Plains));
    CHECK(speciesInfo(Species::PatternBird).movement == MovementPattern::Spiral);
    CHECK(isPredatorSpecies(Species::GeometricWolf));
    CHECK_FALSE(isPredatorSpecies(Species::PatternBird));
}

TEST_CASE("hunt success probability is clamped")
{
    const Genome strong(Species::FractalDragon, Traits{1, 1, 0, 0, 1, 0});
    const Genome weak(Species::FractalDragon, Traits{0, 0, 0, 0, 1, 0});
    const Genome bird(Species::PatternBird, Traits{0, 0, 0, 0, 0, 1});
    const Genome smartBird(Species::PatternBird, Traits{1, 1, 0, 0, 0, 1});

    // 0.45 + 0.5 + 0.3 - 0.35 * 0.9 = 0.935
    CHECK(huntSuccessProbability(strong, bird) == doctest::Approx(0.935f));
    CHECK(huntSuccessProbability(weak, smartBird) == doctest::Approx(0.05f));

    const Genome bear(Species::GoldenBear, Traits{0, 0, 0, 0, 0, 1});
    // 0.45 + 0.5 + 0.3 - 0.35 * 0.3 = 1.145 -> 0.95
    CHECK(huntSuccessProbability(strong, bear) == doctest::Approx(0.95f));
}
