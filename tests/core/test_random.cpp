// tests/core/test_random.cpp

#include <doctest/doctest.h>

#include "core/Hash.hpp"
#include "core/Random.hpp"

#include <algorithm>
#include <array>
#include <numeric>
#include <vector>

using fractal::core::SeededRandomStream;

namespace {

std::vector<std::uint32_t> draw(SeededRandomStream s, int n)
{
    std::vector<std::uint32_t> out;
    for (int i = 0; i < n; ++i)
        out.push_back(s.nextU32());
    return out;
}

} // namespace

TEST_CASE("same root seed replays the same sequence")
{
    CHECK(draw(SeededRandomStream(42), 64) == draw(SeededRandomStream(42), 64));
    CHECK(draw(SeededRandomStream(42), 64) != draw(SeededRandomStream(43), 64));
}

TEST_CASE("substreams do not depend on how much the parent consumed")
{
    SeededRandomStream fresh(7);
    SeededRandomStream used(7);
    for (int i = 0; i < 1000; ++i)
        (void)used.nextU32();

    CHECK(draw(fresh.substream("terrain"), 16) == draw(used.substream("terrain"), 16));
    CHECK(draw(fresh.substream("decide", 3, 9), 16) == draw(used.substream("decide", 3, 9), 16));
}

TEST_CASE("substreams with different names or keys diverge")
{
    const SeededRandomStream root(7);
    CHECK(draw(root.substream("terrain"), 8) != draw(root.substream("climate"), 8));
    CHECK(draw(root.substream("decide", 1, 2), 8) != draw(root.substream("decide", 2, 1), 8));
    CHECK(draw(root.substream("decide", 1), 8) != draw(root.substream("decide", 2), 8));
    CHECK(root.substream("x").rootSeed() == 7u);
}

TEST_CASE("rangeInt is inclusive and uniform01 stays in [0, 1)")
{
    SeededRandomStream s(1);
    std::array<int, 5> seen{};
    for (int i = 0; i < 2000; ++i)
    {
        const int v = s.rangeInt(3, 7);
        REQUIRE(v >= 3);
        REQUIRE(v <= 7);
        ++seen[static_cast<std::size_t>(v - 3)];

        const float u = s.uniform01();
        REQUIRE(u >= 0.0f);
        REQUIRE(u < 1.0f);
    }
    for (int c : seen)
        CHECK(c > 0);

    CHECK(s.rangeInt(5, 5) == 5);
    CHECK(s.rangeInt(5, 2) == 5);
    CHECK_FALSE(s.chance(0.0f));
    CHECK(s.chance(1.0f));
}

TEST_CASE("shuffle is a deterministic permutation")
{
    std::vector<int> a(50), b(50);
    std::iota(a.begin(), a.end(), 0);
    std::iota(b.begin(), b.end(), 0);

    SeededRandomStream(11).substream("order").shuffle(a.begin(), a.end());
    SeededRandomStream(11).substream("order").shuffle(b.begin(), b.end());
    CHECK(a == b);

    std::vector<int> sorted = a;
    std::sort(sorted.begin(), sorted.end());
    for (int i = 0; i < 50; ++i)
        CHECK(sorted[static_cast<std::size_t>(i)] == i);
}

TEST_CASE("fnv1a64 matches the reference vectors")
{
    CHECK(fractal::core::fnv1a64("") == 0xcbf29ce484222325ull);
    CHECK(fractal::core::fnv1a64("a") == 0xaf63dc4c8601ec8cull);
}
