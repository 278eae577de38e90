// src/worldgen/Hydrology.cpp
#include "worldgen/Hydrology.hpp"
#include "core/Errors.h"
#include "core/Hash.hpp"
#include "core/Random.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cmath>
#include <string>
#include <utility>

namespace fractal::worldgen {

namespace {

struct Cell { int x, y; };

// Lowest strictly-lower neighbour; first in scan order wins a tie.
bool steepestDescent(const HeightField& H, int x, int y, Cell& out) noexcept
{
    float best = H.at(x, y);
    bool found = false;
    for (int k = 0; k < 8; ++k) {
        const int nx = x + kScanDx[k], ny = y + kScanDy[k];
        if (!H.inBounds(nx, ny)) continue;
        const float h = H.at(nx, ny);
        if (h < best) {
            best = h;
            out = Cell{nx, ny};
            found = true;
        }
    }
    return found;
}

} // namespace

std::vector<River> traceRivers(const HeightField& H,
                               const BiomeGrid& biomes,
                               const HydrologyParams& params,
                               float magicIntensity,
                               const core::SeededRandomStream& root,
                               core::GenerationReport& report)
{
    const int W = H.width();
    const int N = H.height();
    const std::uint32_t seed = root.rootSeed();

    std::vector<Cell> sources;
    for (int y = 0; y < N; ++y)
        for (int x = 0; x < W; ++x)
            if (H.at(x, y) > params.sourceMinHeight && biomes.at(x, y) != Biome::Water)
                sources.push_back(Cell{x, y});

    auto rng = root.substream("hydrology");
    rng.shuffle(sources.begin(), sources.end());

    const int maxRivers = params.maxRivers > 0 ? params.maxRivers : std::max(1, W / 16);

    Grid2D<std::uint8_t> onRiver(W, N, 0);
    std::vector<River> rivers;
    int discarded = 0;

    for (const Cell& src : sources) {
        if (static_cast<int>(rivers.size()) >= maxRivers) break;
        if (onRiver.at(src.x, src.y)) continue;

        River r;
        Cell c = src;
        for (;;) {
            r.samples.push_back(RiverSample{c.x, c.y, H.at(c.x, c.y)});
            if (biomes.at(c.x, c.y) == Biome::Water) { r.endsInWater = true; break; }
            if (c.x != src.x || c.y != src.y) {
                if (onRiver.at(c.x, c.y)) { r.confluence = true; break; }
            }
            Cell next{};
            if (!steepestDescent(H, c.x, c.y, next)) break; // local minimum
            c = next;
        }

        if (static_cast<int>(r.samples.size()) < params.minLength) {
            ++discarded;
            continue;
        }

        // Width/speed from one hash of the path shape, constant along the river.
        const float drop = r.samples.front().height - r.samples.back().height;
        const auto dropMilli = static_cast<std::uint64_t>(std::lround(drop * 1000.0f));
        const std::uint64_t h = core::hash_combine(
            core::hash_combine(seed, static_cast<std::uint64_t>(r.samples.size())), dropMilli);
        r.width = 1.0f + 3.0f * core::hash_to_unit(h);
        r.speed = 0.5f + 2.5f * core::hash_to_unit(core::splitmix64(h));
        r.glow  = core::hash_to_unit(core::splitmix64(h ^ 0x676c6f77ull)) < magicIntensity * 0.5f;

        for (auto& s : r.samples) {
            s.width = r.width;
            s.speed = r.speed;
            onRiver.at(s.x, s.y) = 1;
        }
        rivers.push_back(std::move(r));
    }

    report.discardedRivers += discarded;
    if (rivers.empty()) {
        spdlog::warn("hydrology: no rivers traced ({} sources, {} discarded), seed={}",
                     sources.size(), discarded, seed);
        report.add("hydrology", "no valid river sources (seed " + std::to_string(seed) + ")");
    } else {
        spdlog::debug("hydrology: {} rivers, {} discarded, seed={}", rivers.size(), discarded, seed);
    }
    return rivers;
}

Grid2D<std::uint8_t> rasterizeRivers(const std::vector<River>& rivers, int width, int height)
{
    Grid2D<std::uint8_t> mask(width, height, 0);
    for (const auto& r : rivers)
        for (const auto& s : r.samples)
            if (mask.inBounds(s.x, s.y))
                mask.at(s.x, s.y) = 1;
    return mask;
}

bool nearRiver(const Grid2D<std::uint8_t>& mask, int x, int y) noexcept
{
    for (int dy = -1; dy <= 1; ++dy)
        for (int dx = -1; dx <= 1; ++dx)
            if (mask.inBounds(x + dx, y + dy) && mask.at(x + dx, y + dy))
                return true;
    return false;
}

} // namespace fractal::worldgen
