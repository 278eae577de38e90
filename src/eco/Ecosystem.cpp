// src/eco/Ecosystem.cpp
#include "eco/Ecosystem.hpp"
#include "eco/Components.hpp"
#include "core/JobSystem.h"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cmath>
#include <set>
#include <tuple>
#include <type_traits>
#include <unordered_map>

namespace fractal::eco {

using worldgen::Vec2;
namespace cmp = components;

namespace {

float distance(Vec2 a, Vec2 b) noexcept
{
    const float dx = a.x - b.x, dy = a.y - b.y;
    return std::sqrt(dx * dx + dy * dy);
}

// Buckets creatures of a frozen snapshot into square cells of `cell` size.
class SpatialIndex {
public:
    SpatialIndex(const std::vector<CreatureSnapshot>& frozen, float cell)
        : frozen_(frozen), cell_(std::max(1.0f, cell))
    {
        for (std::size_t i = 0; i < frozen.size(); ++i)
            buckets_[key(cellOf(frozen[i].position.x), cellOf(frozen[i].position.y))].push_back(i);
    }

    // Everything in the 3x3 block of cells around `p`, ascending id.
    std::vector<CreatureSnapshot> around(Vec2 p) const
    {
        std::vector<std::size_t> idx;
        const int cx = cellOf(p.x), cy = cellOf(p.y);
        for (int dy = -1; dy <= 1; ++dy)
            for (int dx = -1; dx <= 1; ++dx)
                if (auto it = buckets_.find(key(cx + dx, cy + dy)); it != buckets_.end())
                    idx.insert(idx.end(), it->second.begin(), it->second.end());
        std::sort(idx.begin(), idx.end()); // frozen is id-ordered

        std::vector<CreatureSnapshot> out;
        out.reserve(idx.size());
        for (std::size_t i : idx) out.push_back(frozen_[i]);
        return out;
    }

private:
    int cellOf(float v) const noexcept { return static_cast<int>(std::floor(v / cell_)); }
    static std::int64_t key(int x, int y) noexcept
    {
        return (static_cast<std::int64_t>(x) << 32) ^ static_cast<std::int64_t>(static_cast<std::uint32_t>(y));
    }

    const std::vector<CreatureSnapshot>& frozen_;
    float cell_;
    std::unordered_map<std::int64_t, std::vector<std::size_t>> buckets_;
};

std::size_t indexOf(const std::vector<CreatureSnapshot>& frozen, CreatureId id) noexcept
{
    auto it = std::lower_bound(frozen.begin(), frozen.end(), id,
                               [](const CreatureSnapshot& s, CreatureId v) { return s.id < v; });
    return (it != frozen.end() && it->id == id) ? static_cast<std::size_t>(it - frozen.begin()) : frozen.size();
}

} // namespace

float huntSuccessProbability(const Genome& hunter, const Genome& prey) noexcept
{
    const float p = 0.45f
                  + 0.5f * (hunter.aggression() - prey.aggression())
                  + 0.3f * (hunter.intelligence() - prey.intelligence())
                  - 0.35f * speciesInfo(prey.species()).agility;
    return std::clamp(p, 0.05f, 0.95f);
}

EcosystemSimulator::EcosystemSimulator(int worldWidth, int worldHeight, std::uint32_t seed,
                                       EcosystemParams params, core::JobSystem* jobs)
    : width_(worldWidth), height_(worldHeight), root_(seed), params_(params), jobs_(jobs)
{
    if (width_ <= 0 || height_ <= 0)
        throw core::ConfigurationError("world_size", "ecosystem bounds must be positive");
    if (params_.regionSize <= 0)
        throw core::ConfigurationError("ecosystem.region_size", "must be positive");
}

Vec2 EcosystemSimulator::clampToWorld_(Vec2 p) const noexcept
{
    return Vec2{std::clamp(p.x, 0.0f, static_cast<float>(width_ - 1)),
                std::clamp(p.y, 0.0f, static_cast<float>(height_ - 1))};
}

CreatureId EcosystemSimulator::create_(const Genome& genome, Vec2 position)
{
    const CreatureId id = nextId_++;
    const Vec2 p = clampToWorld_(position);

    const entt::entity e = registry_.create();
    registry_.emplace<cmp::Identity>(e, id);
    registry_.emplace<Genome>(e, genome);
    registry_.emplace<cmp::Placement>(e, p, p);
    registry_.emplace<cmp::Vitals>(e);
    registry_.emplace<cmp::Intent>(e);
    live_.emplace(id, e);
    return id;
}

CreatureId EcosystemSimulator::spawn(Species species, Vec2 position, std::optional<Genome> genome)
{
    if (live_.size() >= params_.maxPopulation)
        return kNoCreature;
    // The genome draw is keyed by the id the creature is about to receive.
    auto rng = root_.substream("creatures", nextId_);
    const Genome g = genome ? Genome(species, genome->traits()) : Genome::spawn(species, rng);
    return create_(g, position);
}

void EcosystemSimulator::kill_(CreatureId id, DeathCause cause, TickDelta& delta)
{
    auto it = live_.find(id);
    if (it == live_.end())
        return;
    const Species s = registry_.get<Genome>(it->second).species();
    registry_.destroy(it->second);
    live_.erase(it);
    delta.deaths.push_back(DeathEvent{id, s, cause});
}

void EcosystemSimulator::inconsistency_(const std::string& what) const
{
    spdlog::error("ecosystem: {} (tick {}, seed={})", what, tick_, root_.rootSeed());
    if (params_.strictInvariants)
        throw core::SimulationInconsistency(what + " at tick " + std::to_string(tick_) +
                                            ", seed " + std::to_string(root_.rootSeed()));
}

void EcosystemSimulator::validateActions_(std::span<const Action> actions) const
{
    std::set<CreatureId> removed;
    for (const Action& a : actions) {
        CreatureId ref = kNoCreature;
        if (const auto* r = std::get_if<RemoveAction>(&a)) ref = r->id;
        else if (const auto* m = std::get_if<RelocateAction>(&a)) ref = m->id;
        else continue;

        if (!isAlive(ref) || removed.count(ref)) {
            inconsistency_("action references dead or unknown creature " + std::to_string(ref));
            return;
        }
        if (std::holds_alternative<RemoveAction>(a))
            removed.insert(ref);
    }
}

void EcosystemSimulator::applyActions_(std::span<const Action> actions, TickDelta& delta)
{
    for (const Action& a : actions) {
        std::visit([&](const auto& act) {
            using T = std::decay_t<decltype(act)>;
            if constexpr (std::is_same_v<T, SpawnAction>) {
                const CreatureId id = spawn(act.species, act.position, act.genome);
                if (id == kNoCreature) {
                    spdlog::warn("ecosystem: spawn of {} dropped, population cap {} reached (seed={})",
                                 speciesName(act.species), params_.maxPopulation, root_.rootSeed());
                    return;
                }
                const auto& pl = registry_.get<cmp::Placement>(live_.at(id));
                delta.births.push_back(BirthEvent{id, act.species, kNoCreature, pl.position});
            } else if constexpr (std::is_same_v<T, RemoveAction>) {
                if (!isAlive(act.id)) {
                    inconsistency_("remove of dead or unknown creature " + std::to_string(act.id));
                    return;
                }
                kill_(act.id, DeathCause::Removed, delta);
            } else {
                if (!isAlive(act.id)) {
                    inconsistency_("relocate of dead or unknown creature " + std::to_string(act.id));
                    return;
                }
                auto& pl = registry_.get<cmp::Placement>(live_.at(act.id));
                const Vec2 to = clampToWorld_(act.position);
                delta.movements.push_back(MoveEvent{act.id, pl.position, to, registry_.get<cmp::Intent>(live_.at(act.id)).state});
                pl.position = to;
            }
        }, a);
    }
}

std::vector<Decision> EcosystemSimulator::decideAll_(const std::vector<CreatureSnapshot>& frozen) const
{
    const BehaviorParams& bp = params_.behavior;
    const float reach = std::max({bp.threatRadius, bp.huntRadius, bp.sightRadius, bp.territoryRadius});
    const SpatialIndex index(frozen, reach);

    std::vector<Decision> decisions(frozen.size());
    auto evaluate = [&](std::size_t i) {
        const CreatureSnapshot& self = frozen[i];
        // Neighbourhoods are looked up around both the creature and its home,
        // since territory is measured from home.
        std::vector<CreatureSnapshot> ns = index.around(self.position);
        if (distance(self.position, self.home) > reach) {
            auto more = index.around(self.home);
            ns.insert(ns.end(), more.begin(), more.end());
            std::sort(ns.begin(), ns.end(), [](const auto& a, const auto& b) { return a.id < b.id; });
            ns.erase(std::unique(ns.begin(), ns.end(), [](const auto& a, const auto& b) { return a.id == b.id; }), ns.end());
        }
        auto rng = root_.substream("decide", tick_, self.id);
        decisions[i] = decide(self, ns, bp, tick_, rng);
    };

    if (jobs_ && frozen.size() > 64) {
        jobs_->ParallelForIndex(std::size_t{0}, frozen.size(), std::size_t{1}, evaluate);
    } else {
        for (std::size_t i = 0; i < frozen.size(); ++i) evaluate(i);
    }
    return decisions;
}

void EcosystemSimulator::resolveHunts_(const std::vector<CreatureSnapshot>& frozen,
                                       std::vector<Decision>& decisions, TickDelta& delta)
{
    auto rng = root_.substream("ecosystem", tick_);
    const BehaviorParams& bp = params_.behavior;

    for (std::size_t i = 0; i < frozen.size(); ++i) {
        if (decisions[i].state != BehaviorState::Hunt) continue;
        const CreatureId hunterId = frozen[i].id;
        const CreatureId preyId = decisions[i].target;
        // Either side may already have been taken by a lower-id hunter.
        if (!isAlive(hunterId) || !isAlive(preyId)) continue;

        const entt::entity he = live_.at(hunterId);
        const entt::entity pe = live_.at(preyId);
        const Vec2 hp = registry_.get<cmp::Placement>(he).position;
        const Vec2 pp = registry_.get<cmp::Placement>(pe).position;
        if (distance(hp, pp) > params_.strikeRange) continue;

        const float p = huntSuccessProbability(registry_.get<Genome>(he), registry_.get<Genome>(pe));
        if (rng.chance(p)) {
            kill_(preyId, DeathCause::Predation, delta);
            registry_.get<cmp::Vitals>(he).energy = 1.0f;
            delta.hunts.push_back(HuntEvent{hunterId, preyId, p, HuntOutcome::Kill});
        } else {
            delta.hunts.push_back(HuntEvent{hunterId, preyId, p, HuntOutcome::Escape});
            const std::size_t j = indexOf(frozen, preyId);
            if (j < decisions.size()) {
                const float speed = bp.fleeSpeed * speciesInfo(frozen[j].species()).speed;
                const float d = distance(hp, pp);
                Vec2 dir = d > 0.0f ? Vec2{(pp.x - hp.x) / d, (pp.y - hp.y) / d}
                                    : Vec2{std::cos(movementPhase(preyId)), std::sin(movementPhase(preyId))};
                decisions[j] = Decision{BehaviorState::Flee, hunterId, Vec2{dir.x * speed, dir.y * speed}};
            }
        }
    }
}

void EcosystemSimulator::moveAndAge_(const std::vector<CreatureSnapshot>& frozen,
                                     const std::vector<Decision>& decisions, TickDelta& delta)
{
    for (std::size_t i = 0; i < frozen.size(); ++i) {
        const CreatureId id = frozen[i].id;
        if (!isAlive(id)) continue;
        const entt::entity e = live_.at(id);

        auto& intent = registry_.get<cmp::Intent>(e);
        intent.state = decisions[i].state;
        intent.target = decisions[i].target;
        intent.velocity = decisions[i].velocity;

        auto& pl = registry_.get<cmp::Placement>(e);
        const Vec2 to = clampToWorld_(Vec2{pl.position.x + intent.velocity.x, pl.position.y + intent.velocity.y});
        if (to.x != pl.position.x || to.y != pl.position.y) {
            delta.movements.push_back(MoveEvent{id, pl.position, to, intent.state});
            pl.position = to;
        }

        auto& v = registry_.get<cmp::Vitals>(e);
        const Species s = registry_.get<Genome>(e).species();
        ++v.age;
        if (isPredatorSpecies(s)) {
            v.energy = std::max(0.0f, v.energy - params_.energyDecay);
            if (v.energy <= 0.0f)
                v.health = std::max(0.0f, v.health - params_.starvationDamage);
        }
        if (v.health <= 0.0f)
            kill_(id, DeathCause::Starvation, delta);
        else if (v.age >= speciesInfo(s).lifespan)
            kill_(id, DeathCause::OldAge, delta);
    }
}

void EcosystemSimulator::applyCapacity_(TickDelta& delta)
{
    // (region x, region y, species) -> ids, ascending.
    std::map<std::tuple<int, int, int>, std::vector<CreatureId>> groups;
    for (const auto& [id, e] : live_) {
        const Vec2 p = registry_.get<cmp::Placement>(e).position;
        const int rx = static_cast<int>(p.x) / params_.regionSize;
        const int ry = static_cast<int>(p.y) / params_.regionSize;
        groups[{rx, ry, static_cast<int>(registry_.get<Genome>(e).species())}].push_back(id);
    }

    auto rng = root_.substream("capacity", tick_);
    for (const auto& [key, ids] : groups) {
        const auto species = static_cast<Species>(std::get<2>(key));
        const int count = static_cast<int>(ids.size());
        const int capacity = speciesInfo(species).regionCapacity;

        if (count > capacity) {
            for (int k = 0; k < count - capacity; ++k) {
                const CreatureId id = ids[static_cast<std::size_t>(count - 1 - k)]; // highest ids first
                if (rng.chance(params_.cullProbability))
                    kill_(id, DeathCause::Culled, delta);
            }
        } else if (count < params_.minLocalPopulation) {
            const CreatureId* adult = nullptr;
            for (const CreatureId& id : ids) {
                if (isAlive(id) && registry_.get<cmp::Vitals>(live_.at(id)).age >= params_.adultAge) {
                    adult = &id;
                    break;
                }
            }
            if (!adult || live_.size() >= params_.maxPopulation) continue;
            if (!rng.chance(params_.spawnProbability)) continue;

            const entt::entity pe = live_.at(*adult);
            const Vec2 pp = registry_.get<cmp::Placement>(pe).position;
            const Vec2 at{pp.x + rng.uniform(-params_.offspringRadius, params_.offspringRadius),
                          pp.y + rng.uniform(-params_.offspringRadius, params_.offspringRadius)};
            auto grng = root_.substream("creatures", nextId_);
            const Genome child = Genome::offspring(registry_.get<Genome>(pe), grng);
            const CreatureId id = create_(child, at);
            delta.births.push_back(BirthEvent{id, species, *adult, registry_.get<cmp::Placement>(live_.at(id)).position});
        }
    }
}

// Runs after every removal of the tick; a target never outlives its creature.
void EcosystemSimulator::releaseStaleTargets_()
{
    for (auto [e, intent] : registry_.view<cmp::Intent>().each()) {
        if (intent.target == kNoCreature || isAlive(intent.target))
            continue;
        intent.target = kNoCreature;
        intent.state = BehaviorState::Idle;
    }
}

void EcosystemSimulator::recordHistory_()
{
    PopulationSample s;
    s.tick = tick_;
    s.counts = speciesCounts();
    s.total = static_cast<int>(live_.size());
    history_.push_back(s);
    while (history_.size() > params_.historyLength)
        history_.pop_front();
}

TickDelta EcosystemSimulator::tick(std::span<const Action> actions)
{
    if (params_.strictInvariants)
        validateActions_(actions); // throws before anything changes

    ++tick_;
    TickDelta delta;
    delta.tick = tick_;

    applyActions_(actions, delta);

    const std::vector<CreatureSnapshot> frozen = snapshot();
    std::vector<Decision> decisions = decideAll_(frozen);
    resolveHunts_(frozen, decisions, delta);
    moveAndAge_(frozen, decisions, delta);
    applyCapacity_(delta);
    releaseStaleTargets_();
    recordHistory_();

    spdlog::debug("ecosystem: tick {} live={} deaths={} births={} hunts={}",
                  tick_, live_.size(), delta.deaths.size(), delta.births.size(), delta.hunts.size());
    return delta;
}

CreatureSnapshot EcosystemSimulator::snapshotOf_(entt::entity e) const
{
    const auto& pl = registry_.get<cmp::Placement>(e);
    const auto& v  = registry_.get<cmp::Vitals>(e);
    const auto& in = registry_.get<cmp::Intent>(e);

    CreatureSnapshot s;
    s.id = registry_.get<cmp::Identity>(e).id;
    s.genome = registry_.get<Genome>(e);
    s.position = pl.position;
    s.home = pl.home;
    s.state = in.state;
    s.target = in.target;
    s.health = v.health;
    s.energy = v.energy;
    s.age = v.age;
    return s;
}

std::vector<CreatureSnapshot> EcosystemSimulator::snapshot() const
{
    std::vector<CreatureSnapshot> out;
    out.reserve(live_.size());
    for (const auto& [id, e] : live_)
        out.push_back(snapshotOf_(e));
    return out;
}

std::optional<CreatureSnapshot> EcosystemSimulator::find(CreatureId id) const
{
    auto it = live_.find(id);
    if (it == live_.end())
        return std::nullopt;
    return snapshotOf_(it->second);
}

std::array<int, kSpeciesCount> EcosystemSimulator::speciesCounts() const
{
    std::array<int, kSpeciesCount> counts{};
    for (const auto& [id, e] : live_)
        ++counts[static_cast<std::size_t>(registry_.get<Genome>(e).species())];
    return counts;
}

} // namespace fractal::eco
