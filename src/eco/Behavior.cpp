// src/eco/Behavior.cpp
#include "eco/Behavior.hpp"
#include "eco/Movement.hpp"
#include "core/Hash.hpp"
#include "core/Random.hpp"

#include <algorithm>
#include <cmath>
#include <limits>

namespace fractal::eco {

using worldgen::Vec2;

namespace {

float dist(Vec2 a, Vec2 b) noexcept
{
    const float dx = a.x - b.x, dy = a.y - b.y;
    return std::sqrt(dx * dx + dy * dy);
}

// Displacement of at most `len` from `from` toward `to`.
Vec2 toward(Vec2 from, Vec2 to, float len) noexcept
{
    const float d = dist(from, to);
    if (d <= 0.0f) return Vec2{};
    const float k = std::min(len, d) / d;
    return Vec2{(to.x - from.x) * k, (to.y - from.y) * k};
}

// Nearest neighbour matching `pred` within `radius` of `origin`; ties go to the lowest id.
template <class Pred>
const CreatureSnapshot* nearest(std::span<const CreatureSnapshot> ns, CreatureId self,
                                Vec2 origin, float radius, Pred pred)
{
    const CreatureSnapshot* best = nullptr;
    float bestD = std::numeric_limits<float>::max();
    for (const auto& n : ns) {
        if (n.id == self || !pred(n)) continue;
        const float d = dist(origin, n.position);
        if (d > radius) continue;
        if (d < bestD || (d == bestD && best && n.id < best->id)) {
            best = &n;
            bestD = d;
        }
    }
    return best;
}

} // namespace

float movementPhase(CreatureId id) noexcept
{
    return core::hash_to_unit(core::splitmix64(id)) * 2.0f * worldgen::kPi;
}

Decision decide(const CreatureSnapshot& self,
                std::span<const CreatureSnapshot> neighbours,
                const BehaviorParams& params,
                int tick,
                core::SeededRandomStream& rng)
{
    const Genome& g = self.genome;
    const Species sp = self.species();
    const float speed = speciesInfo(sp).speed;

    if (g.prey() > g.predator()) {
        if (const auto* threat = nearest(neighbours, self.id, self.position, params.threatRadius,
                                         [&](const CreatureSnapshot& n) { return canHunt(n.species(), sp); })) {
            Decision d{BehaviorState::Flee, threat->id, {}};
            const float away = params.fleeSpeed * speed;
            if (dist(self.position, threat->position) > 0.0f) {
                const Vec2 v = toward(threat->position, self.position, std::numeric_limits<float>::max());
                const float len = std::sqrt(v.x * v.x + v.y * v.y);
                d.velocity = Vec2{v.x / len * away, v.y / len * away};
            } else {
                const float a = movementPhase(self.id);
                d.velocity = Vec2{std::cos(a) * away, std::sin(a) * away};
            }
            return d;
        }
    }

    if (g.predator() > g.prey()) {
        if (const auto* prey = nearest(neighbours, self.id, self.position, params.huntRadius,
                                       [&](const CreatureSnapshot& n) { return canHunt(sp, n.species()); })) {
            return Decision{BehaviorState::Hunt, prey->id,
                            toward(self.position, prey->position, params.huntSpeed * speed)};
        }
    }

    if (g.territorial() > params.territorialThreshold) {
        if (const auto* intruder = nearest(neighbours, self.id, self.home, params.territoryRadius,
                                           [&](const CreatureSnapshot& n) {
                                               return n.species() != sp && !canHunt(sp, n.species());
                                           })) {
            return Decision{BehaviorState::Defend, intruder->id,
                            toward(self.position, intruder->position, params.wanderSpeed * speed)};
        }
    }

    const MovementPattern pattern = speciesInfo(sp).movement;
    const float phase = movementPhase(self.id);

    if (g.social() > params.socialThreshold) {
        float cx = 0.0f, cy = 0.0f;
        int n = 0;
        for (const auto& o : neighbours) {
            if (o.id == self.id || o.species() != sp) continue;
            if (dist(self.position, o.position) > params.sightRadius) continue;
            cx += o.position.x;
            cy += o.position.y;
            ++n;
        }
        if (n > 0) {
            const Vec2 centre{cx / static_cast<float>(n), cy / static_cast<float>(n)};
            const Vec2 pull = toward(self.position, centre, 0.5f * params.wanderSpeed * speed);
            const Vec2 step = patternStep(pattern, tick, phase, rng);
            return Decision{BehaviorState::Socialize, kNoCreature,
                            Vec2{pull.x + 0.5f * step.x * speed, pull.y + 0.5f * step.y * speed}};
        }
    }

    const Vec2 step = patternStep(pattern, tick, phase, rng);
    const float s = params.wanderSpeed * speed;
    return Decision{BehaviorState::Wander, kNoCreature,
                    Vec2{step.x * s + (self.home.x - self.position.x) * params.homeBias,
                         step.y * s + (self.home.y - self.position.y) * params.homeBias}};
}

} // namespace fractal::eco
