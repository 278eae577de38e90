// tests/worldgen/test_lsystem.cpp

#include <doctest/doctest.h>

#include "worldgen/LSystem.hpp"

#include <algorithm>
#include <string>
#include <thread>
#include <vector>

using namespace fractal::worldgen;

namespace {

const LSystemRule& classic() { return ruleCatalogue().front(); }

} // namespace

TEST_CASE("classic plant grows by the expected symbol counts")
{
    CHECK(expand(classic(), 0, 50000).symbols == "F");
    CHECK(expand(classic(), 1, 50000).symbols == "FF+[+F-F-F]-[-F+F+F]");
    CHECK(expand(classic(), 2, 50000).symbols.size() == 172u);
    CHECK(expand(classic(), 3, 50000).symbols.size() == 1388u);

    const auto four = expand(classic(), 4, 50000);
    CHECK(four.symbols.size() == 11116u);
    CHECK(four.iterationsApplied == 4);
    CHECK_FALSE(four.capped);
}

TEST_CASE("expansion keeps the last generation under the cap")
{
    const auto ex = expand(classic(), 5, 50000);
    CHECK(ex.capped);
    CHECK(ex.iterationsApplied == 4);
    CHECK(ex.symbols.size() == 11116u);

    const auto tiny = expand(classic(), 3, 10);
    CHECK(tiny.capped);
    CHECK(tiny.iterationsApplied == 0);
    CHECK(tiny.symbols == "F");
}

TEST_CASE("symbols without a production pass through")
{
    LSystemRule r{"test", "AB", {{'A', "AB"}}};
    CHECK(expand(r, 2, 100).symbols == "ABBB");
}

TEST_CASE("turtle draws one segment per F and restores state on ]")
{
    const auto straight = interpretTurtle("FFF");
    REQUIRE(straight.segments.size() == 3u);
    CHECK(straight.height() == doctest::Approx(3.0f));
    CHECK(straight.segments.back().depth == 0);

    const auto branch = interpretTurtle("F[+F]F");
    REQUIRE(branch.segments.size() == 3u);
    CHECK(branch.segments[1].depth == 1);
    // After ']' the trunk continues from the end of the first segment.
    CHECK(branch.segments[2].start == branch.segments[0].end);
    CHECK(branch.height() == doctest::Approx(2.0f));
}

TEST_CASE("turtle ignores unknown symbols and unbalanced brackets")
{
    const auto sk = interpretTurtle("]]XF?F]");
    CHECK(sk.segments.size() == 2u);
    CHECK(sk.symbolCount == 7u);
}

TEST_CASE("SkeletonCache shares skeletons and counts cap hits once")
{
    SkeletonCache cache(50000);
    const auto a = cache.get(0, 3);
    const auto b = cache.get(0, 3);
    CHECK(a.get() == b.get());
    const std::string symbols = expand(classic(), 3, 50000).symbols;
    CHECK(a->segments.size() == static_cast<std::size_t>(std::count(symbols.begin(), symbols.end(), 'F')));

    (void)cache.get(0, 6);
    (void)cache.get(0, 6);
    CHECK(cache.capHits() == 1);
    CHECK(cache.size() == 2u);

    CHECK_THROWS_AS(cache.get(ruleCatalogue().size(), 2), std::out_of_range);
}

TEST_CASE("SkeletonCache is safe under concurrent lookups")
{
    SkeletonCache cache(50000);
    std::vector<std::thread> threads;
    std::vector<const TreeSkeleton*> seen(8, nullptr);
    for (int t = 0; t < 8; ++t)
        threads.emplace_back([&, t] { seen[static_cast<std::size_t>(t)] = cache.get(1, 3).get(); });
    for (auto& th : threads)
        th.join();
    for (auto* p : seen)
        CHECK(p == seen.front());
    CHECK(cache.size() == 1u);
}
