// src/worldgen/Biomes.cpp
#include "worldgen/Biomes.hpp"

#include <algorithm>
#include <cmath>
#include <stdexcept>
#include <vector>

namespace fractal::worldgen {

namespace {

// Above any normalised sample; used when a quantile reaches the top of the range.
constexpr float kAboveAll = 2.0f;

constexpr std::array<std::string_view, kBiomeCount> kNames = {
    "Forest", "Mountains", "Plains", "Desert", "Swamp", "Tundra", "MagicalGrove", "Water"
};

// Smallest value v such that about q*n samples are strictly below v.
float quantile(const std::vector<float>& sorted, double q)
{
    if (sorted.empty())
        return kAboveAll;
    const double n = static_cast<double>(sorted.size());
    const auto k = static_cast<std::size_t>(std::clamp(std::llround(q * n), 0LL, static_cast<long long>(sorted.size())));
    return k >= sorted.size() ? kAboveAll : sorted[k];
}

} // namespace

std::string_view biomeName(Biome b) noexcept
{
    const int i = biomeIndex(b);
    return (i >= 0 && i < kBiomeCount) ? kNames[static_cast<std::size_t>(i)] : std::string_view{"Unknown"};
}

std::optional<Biome> biomeFromName(std::string_view name) noexcept
{
    for (int i = 0; i < kBiomeCount; ++i)
        if (kNames[static_cast<std::size_t>(i)] == name)
            return static_cast<Biome>(i);
    return std::nullopt;
}

BiomeTargets BiomeTargets::forWaterLevel(float waterLevel) noexcept
{
    const float w = std::clamp(waterLevel, 0.0f, 1.0f);
    const float s = (1.0f - w) / 0.85f;

    BiomeTargets t;
    t.share[biomeIndex(Biome::Forest)]       = 0.29f * s;
    t.share[biomeIndex(Biome::Mountains)]    = 0.08f * s;
    t.share[biomeIndex(Biome::Plains)]       = 0.38f * s;
    t.share[biomeIndex(Biome::Desert)]       = 0.02f * s;
    t.share[biomeIndex(Biome::Swamp)]        = 0.03f * s;
    t.share[biomeIndex(Biome::Tundra)]       = 0.03f * s;
    t.share[biomeIndex(Biome::MagicalGrove)] = 0.02f * s;
    t.share[biomeIndex(Biome::Water)]        = w;
    return t;
}

Biome classify(float h, float m, const BiomeThresholdTable& t) noexcept
{
    if (h <  t.waterMax)    return Biome::Water;
    if (h >= t.mountainMin) return Biome::Mountains;
    if (h >= t.tundraMin)   return Biome::Tundra;
    if (m <  t.desertMax)   return Biome::Desert;
    if (m <  t.plainsMax)   return Biome::Plains;
    if (m <  t.forestMax)   return Biome::Forest;
    if (m <  t.groveMax)    return Biome::MagicalGrove;
    return Biome::Swamp;
}

BiomeThresholdTable calibrateThresholds(const HeightField& height,
                                        const Grid2D<float>& moisture,
                                        const BiomeTargets& targets)
{
    if (height.width() != moisture.width() || height.height() != moisture.height())
        throw std::invalid_argument("calibrateThresholds: height and moisture grids differ in shape");

    auto share = [&](Biome b) { return static_cast<double>(targets.share[biomeIndex(b)]); };

    std::vector<float> hs(height.begin(), height.end());
    std::sort(hs.begin(), hs.end());

    BiomeThresholdTable t;
    t.waterMax    = quantile(hs, share(Biome::Water));
    t.mountainMin = quantile(hs, 1.0 - share(Biome::Mountains));
    t.tundraMin   = quantile(hs, 1.0 - share(Biome::Mountains) - share(Biome::Tundra));

    // Moisture bands split whatever land is left between the height bands.
    std::vector<float> ms;
    ms.reserve(height.size());
    for (std::size_t i = 0; i < height.size(); ++i) {
        const float h = height.data()[i];
        if (h >= t.waterMax && h < t.tundraMin)
            ms.push_back(moisture.data()[i]);
    }
    std::sort(ms.begin(), ms.end());

    const double desert = share(Biome::Desert);
    const double plains = share(Biome::Plains);
    const double forest = share(Biome::Forest);
    const double grove  = share(Biome::MagicalGrove);
    const double land   = desert + plains + forest + grove + share(Biome::Swamp);

    if (land <= 0.0) {
        t.desertMax = t.plainsMax = t.forestMax = t.groveMax = kAboveAll;
        return t;
    }
    t.desertMax = quantile(ms, desert / land);
    t.plainsMax = quantile(ms, (desert + plains) / land);
    t.forestMax = quantile(ms, (desert + plains + forest) / land);
    t.groveMax  = quantile(ms, (desert + plains + forest + grove) / land);
    return t;
}

std::array<float, kBiomeCount> biomeCoverage(const BiomeGrid& grid)
{
    std::array<std::size_t, kBiomeCount> counts{};
    for (Biome b : grid)
        ++counts[static_cast<std::size_t>(biomeIndex(b))];

    std::array<float, kBiomeCount> pct{};
    if (grid.empty())
        return pct;
    const double n = static_cast<double>(grid.size());
    for (int i = 0; i < kBiomeCount; ++i)
        pct[static_cast<std::size_t>(i)] = static_cast<float>(100.0 * static_cast<double>(counts[static_cast<std::size_t>(i)]) / n);
    return pct;
}

BiomeClassification classifyGrid(const HeightField& height,
                                  const Grid2D<float>& moisture,
                                  const BiomeTargets& targets)
{
    BiomeClassification out;
    out.table = calibrateThresholds(height, moisture, targets);
    out.grid = BiomeGrid(height.width(), height.height(), Biome::Plains);
    for (int y = 0; y < height.height(); ++y)
        for (int x = 0; x < height.width(); ++x)
            out.grid.at(x, y) = classify(height.at(x, y), moisture.at(x, y), out.table);
    out.coverage = biomeCoverage(out.grid);
    return out;
}

} // namespace fractal::worldgen
