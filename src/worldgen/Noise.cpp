// src/worldgen/Noise.cpp
#include "worldgen/Noise.hpp"
#include "worldgen/Math.hpp"
#include "core/Config.h"
#include "core/Hash.hpp"
#include "core/JobSystem.h"
#include "core/Random.hpp"

#include <algorithm>
#include <cmath>
#include <cstdint>

namespace fractal::worldgen {
namespace noise {
namespace {

// Ken Perlin-style fade curve
inline float fade(float t) noexcept { return t * t * t * (t * (t * 6.f - 15.f) + 10.f); }

inline std::uint32_t hash2i(int x, int y, std::uint32_t seed) noexcept {
  std::uint32_t h = static_cast<std::uint32_t>(x) * 0x8da6b343u
                  ^ static_cast<std::uint32_t>(y) * 0xd8163841u
                  ^ seed * 0xcb1ab31fu;
  h ^= h >> 16; h *= 0x7feb352du;
  h ^= h >> 15; h *= 0x846ca68bu;
  h ^= h >> 16;
  return h;
}

// 16 directions from a constant table; std::cos/std::sin may differ in the
// last bit between C runtimes.
struct Grad { float x, y; };
constexpr Grad kGrad16[16] = {
  { 1.0000000f,  0.0000000f}, { 0.9238795f,  0.3826834f}, { 0.7071068f,  0.7071068f}, { 0.3826834f,  0.9238795f},
  { 0.0000000f,  1.0000000f}, {-0.3826834f,  0.9238795f}, {-0.7071068f,  0.7071068f}, {-0.9238795f,  0.3826834f},
  {-1.0000000f,  0.0000000f}, {-0.9238795f, -0.3826834f}, {-0.7071068f, -0.7071068f}, {-0.3826834f, -0.9238795f},
  { 0.0000000f, -1.0000000f}, { 0.3826834f, -0.9238795f}, { 0.7071068f, -0.7071068f}, { 0.9238795f, -0.3826834f},
};

inline float dotgrid(int ix, int iy, float x, float y, std::uint32_t seed) noexcept {
  const Grad& g = kGrad16[hash2i(ix, iy, seed) & 15u];
  return g.x * (x - static_cast<float>(ix)) + g.y * (y - static_cast<float>(iy));
}

} // namespace

float perlin2D(float x, float y, std::uint32_t seed) noexcept {
  const int x0 = static_cast<int>(std::floor(x));
  const int x1 = x0 + 1;
  const int y0 = static_cast<int>(std::floor(y));
  const int y1 = y0 + 1;

  const float sx = fade(x - static_cast<float>(x0));
  const float sy = fade(y - static_cast<float>(y0));

  const float n00 = dotgrid(x0, y0, x, y, seed);
  const float n10 = dotgrid(x1, y0, x, y, seed);
  const float n01 = dotgrid(x0, y1, x, y, seed);
  const float n11 = dotgrid(x1, y1, x, y, seed);

  const float ix0 = lerp(n00, n10, sx);
  const float ix1 = lerp(n01, n11, sx);
  return lerp(ix0, ix1, sy); // ~[-1,1]
}

} // namespace noise

NoiseField::NoiseField(std::uint32_t seed, const NoiseConfig& cfg) noexcept
    : seed_(seed), cfg_(cfg)
{
    cfg_.octaves = std::max(1, cfg_.octaves);

    // Shift the sample grid off the integer lattice, where gradient noise is 0.
    const std::uint64_t h = core::splitmix64(seed);
    offsetX_ = 1000.0f * core::hash_to_unit(h) + 0.37f;
    offsetY_ = 1000.0f * core::hash_to_unit(core::splitmix64(h)) + 0.61f;

    float amp = 1.0f, sum = 0.0f;
    for (int i = 0; i < cfg_.octaves; ++i) {
        sum += amp;
        amp *= cfg_.persistence;
    }
    invAmpSum_ = sum > 0.0f ? 1.0f / sum : 1.0f;
}

float NoiseField::sample(float x, float y) const noexcept
{
    float amp = 1.0f;
    float freq = cfg_.baseFrequency;
    float sum = 0.0f;
    for (int i = 0; i < cfg_.octaves; ++i) {
        sum += amp * noise::perlin2D(x * freq + offsetX_, y * freq + offsetY_,
                                     seed_ + static_cast<std::uint32_t>(i * 131));
        freq *= cfg_.lacunarity;
        amp  *= cfg_.persistence;
    }
    return clamp01(0.5f + 0.5f * sum * invAmpSum_);
}

NoiseConfig terrainNoiseConfig(const core::WorldConfig& cfg) noexcept
{
    NoiseConfig nc;
    nc.octaves       = cfg.fractalIterations;
    nc.persistence   = 0.5f;
    nc.lacunarity    = lacunarityForRoughness(cfg.roughness);
    nc.baseFrequency = 4.0f / static_cast<float>(cfg.worldSize);
    return nc;
}

NoiseConfig climateNoiseConfig(const core::WorldConfig& cfg) noexcept
{
    NoiseConfig nc = terrainNoiseConfig(cfg);
    nc.octaves = 3;
    nc.baseFrequency *= 0.25f;
    return nc;
}

namespace {

Grid2D<float> sampleGrid(const NoiseField& field, int size, core::JobSystem& jobs)
{
    Grid2D<float> out(size, size, 0.0f);
    jobs.ParallelForIndex(0, size, 1, [&](int y) {
        float* row = out.rowPtr(y);
        for (int x = 0; x < size; ++x)
            row[x] = field.sample(static_cast<float>(x), static_cast<float>(y));
    });
    return out;
}

} // namespace

HeightField generateHeightField(const core::WorldConfig& cfg,
                                const core::SeededRandomStream& root,
                                core::JobSystem& jobs)
{
    auto stream = root.substream("terrain");
    const NoiseField field(stream.nextU32(), terrainNoiseConfig(cfg));
    HeightField h = sampleGrid(field, cfg.worldSize, jobs);

    const auto [lo, hi] = std::minmax_element(h.begin(), h.end());
    const float minV = *lo, maxV = *hi;
    const float range = maxV - minV;
    for (float& v : h)
        v = range > 0.0f ? clamp01((v - minV) / range) : 0.0f;
    return h;
}

Grid2D<float> generateClimateField(const core::WorldConfig& cfg,
                                   const core::SeededRandomStream& root,
                                   core::JobSystem& jobs)
{
    auto stream = root.substream("climate");
    const NoiseField field(stream.nextU32(), climateNoiseConfig(cfg));
    return sampleGrid(field, cfg.worldSize, jobs);
}

} // namespace fractal::worldgen
