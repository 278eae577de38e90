// src/eco/Genome.hpp
#pragma once
#include "eco/Species.hpp"
#include "eco/Traits.hpp"

namespace fractal::core { class SeededRandomStream; }

namespace fractal::eco {

inline constexpr float kSpawnJitter     = 0.10f;
inline constexpr float kOffspringJitter = 0.05f;

// Per-creature trait vector. Values are clamped to [0, 1] on construction
// and never change afterwards.
class Genome {
public:
    Genome() = default;
    Genome(Species species, const Traits& traits) noexcept;

    // Species baseline plus uniform +/-0.1 jitter per trait.
    static Genome spawn(Species species, core::SeededRandomStream& rng) noexcept;
    // Parent's traits plus uniform +/-0.05 jitter per trait.
    static Genome offspring(const Genome& parent, core::SeededRandomStream& rng) noexcept;

    [[nodiscard]] Species species() const noexcept { return species_; }
    [[nodiscard]] const Traits& traits() const noexcept { return traits_; }

    [[nodiscard]] float aggression() const noexcept   { return traits_.aggression; }
    [[nodiscard]] float intelligence() const noexcept { return traits_.intelligence; }
    [[nodiscard]] float social() const noexcept       { return traits_.social; }
    [[nodiscard]] float territorial() const noexcept  { return traits_.territorial; }
    [[nodiscard]] float predator() const noexcept     { return traits_.predator; }
    [[nodiscard]] float prey() const noexcept         { return traits_.prey; }

private:
    Species species_ = Species::PatternBird;
    Traits  traits_{};
};

} // namespace fractal::eco
