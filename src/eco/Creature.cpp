// src/eco/Creature.cpp
#include "eco/Creature.hpp"

namespace fractal::eco {

std::string_view behaviorName(BehaviorState s) noexcept
{
    switch (s) {
    case BehaviorState::Idle:      return "idle";
    case BehaviorState::Flee:      return "flee";
    case BehaviorState::Hunt:      return "hunt";
    case BehaviorState::Defend:    return "defend";
    case BehaviorState::Socialize: return "socialize";
    case BehaviorState::Wander:    return "wander";
    }
    return "unknown";
}

std::string_view deathCauseName(DeathCause c) noexcept
{
    switch (c) {
    case DeathCause::Predation:  return "predation";
    case DeathCause::Starvation: return "starvation";
    case DeathCause::OldAge:     return "old_age";
    case DeathCause::Culled:     return "culled";
    case DeathCause::Removed:    return "removed";
    }
    return "unknown";
}

} // namespace fractal::eco
