// src/eco/Genome.cpp
#include "eco/Genome.hpp"
#include "core/Random.hpp"

#include <algorithm>

namespace fractal::eco {

namespace {

float clampTrait(float v) noexcept { return std::clamp(v, 0.0f, 1.0f); }

Traits jittered(const Traits& base, float amount, core::SeededRandomStream& rng) noexcept
{
    // Fixed draw order keeps replays identical.
    Traits t;
    t.aggression   = base.aggression   + rng.uniform(-amount, amount);
    t.intelligence = base.intelligence + rng.uniform(-amount, amount);
    t.social       = base.social       + rng.uniform(-amount, amount);
    t.territorial  = base.territorial  + rng.uniform(-amount, amount);
    t.predator     = base.predator     + rng.uniform(-amount, amount);
    t.prey         = base.prey         + rng.uniform(-amount, amount);
    return t;
}

} // namespace

Genome::Genome(Species species, const Traits& traits) noexcept
    : species_(species)
{
    traits_.aggression   = clampTrait(traits.aggression);
    traits_.intelligence = clampTrait(traits.intelligence);
    traits_.social       = clampTrait(traits.social);
    traits_.territorial  = clampTrait(traits.territorial);
    traits_.predator     = clampTrait(traits.predator);
    traits_.prey         = clampTrait(traits.prey);
}

Genome Genome::spawn(Species species, core::SeededRandomStream& rng) noexcept
{
    return Genome(species, jittered(speciesInfo(species).baseline, kSpawnJitter, rng));
}

Genome Genome::offspring(const Genome& parent, core::SeededRandomStream& rng) noexcept
{
    return Genome(parent.species_, jittered(parent.traits_, kOffspringJitter, rng));
}

} // namespace fractal::eco
