// src/worldgen/Noise.hpp
#pragma once
#include <cstdint>

#include "worldgen/Grid2D.hpp"

namespace fractal::core {
struct WorldConfig;
class SeededRandomStream;
class JobSystem;
}

namespace fractal::worldgen {

namespace noise {

// Lattice-gradient noise, roughly [-1, 1].
float perlin2D(float x, float y, std::uint32_t seed) noexcept;

} // namespace noise

struct NoiseConfig {
    int   octaves       = 6;
    float persistence   = 0.5f;   // amplitude multiplier per octave
    float lacunarity    = 2.0f;   // frequency multiplier per octave
    float baseFrequency = 1.0f / 64.0f;
};

// Roughness 0.5 doubles the frequency per octave; 0 and 1 give 1.6x and 2.4x.
inline constexpr float lacunarityForRoughness(float roughness) noexcept {
    return 1.6f + 0.8f * roughness;
}

// Multi-octave sampler. Immutable after construction, so sample() is safe to
// call from any number of threads.
class NoiseField {
public:
    NoiseField(std::uint32_t seed, const NoiseConfig& cfg) noexcept;

    // Normalised fBm in [0, 1].
    [[nodiscard]] float sample(float x, float y) const noexcept;

    [[nodiscard]] std::uint32_t seed() const noexcept { return seed_; }
    [[nodiscard]] const NoiseConfig& config() const noexcept { return cfg_; }

private:
    std::uint32_t seed_;
    NoiseConfig   cfg_;
    float         offsetX_;
    float         offsetY_;
    float         invAmpSum_;
};

// Terrain noise settings derived from the world parameters.
NoiseConfig terrainNoiseConfig(const core::WorldConfig& cfg) noexcept;
// Moisture noise: three octaves at a quarter of the terrain base frequency.
NoiseConfig climateNoiseConfig(const core::WorldConfig& cfg) noexcept;

// Samples world_size^2 cells row-parallel from the "terrain" substream and
// min-max normalises the result to exactly [0, 1].
HeightField generateHeightField(const core::WorldConfig& cfg,
                                const core::SeededRandomStream& root,
                                core::JobSystem& jobs);

// Moisture field in [0, 1] from the "climate" substream.
Grid2D<float> generateClimateField(const core::WorldConfig& cfg,
                                   const core::SeededRandomStream& root,
                                   core::JobSystem& jobs);

} // namespace fractal::worldgen
