// src/eco/Creature.hpp
#pragma once
#include <cstdint>
#include <string_view>

#include "eco/Genome.hpp"
#include "worldgen/Math.hpp"

namespace fractal::eco {

// Stable external handle. Ids are never reused within one simulator.
using CreatureId = std::uint32_t;
inline constexpr CreatureId kNoCreature = 0;

enum class BehaviorState : std::uint8_t { Idle = 0, Flee, Hunt, Defend, Socialize, Wander };

enum class DeathCause : std::uint8_t { Predation = 0, Starvation, OldAge, Culled, Removed };

[[nodiscard]] std::string_view behaviorName(BehaviorState s) noexcept;
[[nodiscard]] std::string_view deathCauseName(DeathCause c) noexcept;

// Value copy of one live creature, handed out by the simulator.
struct CreatureSnapshot {
    CreatureId    id = kNoCreature;
    Genome        genome;
    worldgen::Vec2 position;
    worldgen::Vec2 home;
    BehaviorState state = BehaviorState::Idle;
    CreatureId    target = kNoCreature;
    float         health = 1.0f;
    float         energy = 1.0f;
    int           age = 0;

    [[nodiscard]] Species species() const noexcept { return genome.species(); }
};

} // namespace fractal::eco
