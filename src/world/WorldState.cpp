#include "world/WorldState.h"

#include <algorithm>
#include <stdexcept>
#include <utility>

namespace fractal::world {

TerrainStats TerrainStats::compute(const worldgen::HeightField& h, const worldgen::BiomeGrid& b)
{
    TerrainStats s;
    if (h.empty())
        return s;
    s.minHeight = h.data()[0];
    s.maxHeight = h.data()[0];
    double sum = 0.0;
    for (float v : h) {
        s.minHeight = std::min(s.minHeight, v);
        s.maxHeight = std::max(s.maxHeight, v);
        sum += v;
    }
    s.meanHeight = static_cast<float>(sum / static_cast<double>(h.size()));
    s.biomePercent = worldgen::biomeCoverage(b);
    return s;
}

WorldState::WorldState(Parts parts) : p_(std::move(parts))
{
    if (!p_.height || !p_.biomes || !p_.forests || !p_.rivers || !p_.structures || !p_.report)
        throw std::invalid_argument("WorldState: every shared part must be set");
}

std::size_t WorldState::treeCount() const noexcept
{
    std::size_t n = 0;
    for (const auto& f : *p_.forests)
        n += f.trees.size();
    return n;
}

WorldState WorldState::withCreatures(std::vector<eco::CreatureSnapshot> creatures, int tick) const
{
    Parts p = p_;
    p.creatures = std::move(creatures);
    p.tick = tick;
    return WorldState(std::move(p));
}

} // namespace fractal::world
