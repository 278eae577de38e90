// src/eco/Components.hpp
#pragma once
#include "eco/Creature.hpp"

#include <entt/entt.hpp> // required

namespace fractal::eco::components {

// Registry components for one creature. The Genome class is stored as-is.

struct Identity { CreatureId id = kNoCreature; };

struct Placement {
  worldgen::Vec2 position;
  worldgen::Vec2 home;
};

struct Vitals {
  float health = 1.f;
  float energy = 1.f;
  int   age    = 0;
};

struct Intent {
  BehaviorState  state  = BehaviorState::Idle;
  CreatureId     target = kNoCreature;
  worldgen::Vec2 velocity;
};

} // namespace fractal::eco::components
