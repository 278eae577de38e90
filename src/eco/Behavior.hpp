// src/eco/Behavior.hpp
#pragma once
#include <span>

#include "eco/Creature.hpp"

namespace fractal::core { class SeededRandomStream; }

namespace fractal::eco {

struct BehaviorParams {
    float threatRadius         = 12.0f;
    float huntRadius           = 10.0f;
    float territoryRadius      = 15.0f; // measured from the creature's home
    float sightRadius          = 20.0f;
    float territorialThreshold = 0.7f;
    float socialThreshold      = 0.5f;
    float fleeSpeed            = 3.0f;
    float huntSpeed            = 2.0f;
    float wanderSpeed          = 1.0f;
    float homeBias             = 0.1f;
};

struct Decision {
    BehaviorState  state = BehaviorState::Idle;
    CreatureId     target = kNoCreature; // prey, threat or intruder
    worldgen::Vec2 velocity;             // intended displacement this tick
};

// Priority order: Flee, Hunt, Defend, Socialize, Wander. Pure apart from
// the draws taken from `rng` by the wander patterns.
Decision decide(const CreatureSnapshot& self,
                std::span<const CreatureSnapshot> neighbours,
                const BehaviorParams& params,
                int tick,
                core::SeededRandomStream& rng);

// Per-creature heading offset in radians, fixed for the creature's life.
float movementPhase(CreatureId id) noexcept;

} // namespace fractal::eco
