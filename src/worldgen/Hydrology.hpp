// src/worldgen/Hydrology.hpp
#pragma once
#include <cstdint>
#include <vector>

#include "worldgen/Biomes.hpp"
#include "worldgen/Grid2D.hpp"

namespace fractal::core {
class SeededRandomStream;
struct GenerationReport;
}

namespace fractal::worldgen {

struct HydrologyParams {
    float sourceMinHeight = 0.7f;
    int   maxRivers       = 0;   // <= 0: world width / 16 (at least 1)
    int   minLength       = 6;   // samples; shorter paths are discarded
};

struct RiverSample {
    int   x = 0;
    int   y = 0;
    float height = 0.0f;
    float width  = 1.0f;
    float speed  = 1.0f;
};

// Ordered source -> terminus. Width and speed are fixed per river and copied
// onto every sample.
struct River {
    std::vector<RiverSample> samples;
    float width  = 1.0f;
    float speed  = 1.0f;
    bool  glow   = false;
    bool  endsInWater = false;
    bool  confluence  = false;
};

// Neighbour scan order used for tie-breaks: N, NE, E, SE, S, SW, W, NW.
inline constexpr int kScanDx[8] = { 0,  1, 1, 1, 0, -1, -1, -1};
inline constexpr int kScanDy[8] = {-1, -1, 0, 1, 1,  1,  0, -1};

// Steepest-descent walks from high ground. `magicIntensity` sets the glow
// probability (x0.5). Zero rivers is a valid result and is recorded in `report`.
std::vector<River> traceRivers(const HeightField& height,
                               const BiomeGrid& biomes,
                               const HydrologyParams& params,
                               float magicIntensity,
                               const core::SeededRandomStream& root,
                               core::GenerationReport& report);

// 1 where a river sample lies.
Grid2D<std::uint8_t> rasterizeRivers(const std::vector<River>& rivers, int width, int height);

// True when (x, y) or one of its 8 neighbours carries a river.
bool nearRiver(const Grid2D<std::uint8_t>& mask, int x, int y) noexcept;

} // namespace fractal::worldgen
