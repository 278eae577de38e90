// src/eco/Ecosystem.hpp
#pragma once
#include <array>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <map>
#include <optional>
#include <span>
#include <string>
#include <variant>
#include <vector>

#include <entt/entt.hpp>

#include "core/Errors.h"
#include "core/Random.hpp"
#include "eco/Behavior.hpp"
#include "eco/Creature.hpp"

namespace fractal::core { class JobSystem; }

namespace fractal::eco {

struct EcosystemParams {
    BehaviorParams behavior;
    float       strikeRange        = 2.0f;
    int         regionSize         = 32;    // cells per side of a capacity region
    int         minLocalPopulation = 2;
    float       cullProbability    = 0.5f;
    float       spawnProbability   = 0.1f;
    int         adultAge           = 20;    // ticks before a creature can reproduce
    float       offspringRadius    = 3.0f;
    std::size_t maxPopulation      = 4096;
    float       energyDecay        = 0.002f; // per tick, predators only
    float       starvationDamage   = 0.02f;  // health lost per tick at zero energy
    std::size_t historyLength      = 1000;
    bool        strictInvariants   = core::kStrictInvariantsDefault;
};

// External actions, applied in log order at the start of a tick.
struct SpawnAction {
    Species                species = Species::PatternBird;
    worldgen::Vec2         position;
    std::optional<Genome>  genome;   // empty: baseline plus spawn jitter
};
struct RemoveAction   { CreatureId id = kNoCreature; };
struct RelocateAction { CreatureId id = kNoCreature; worldgen::Vec2 position; };

using Action = std::variant<SpawnAction, RemoveAction, RelocateAction>;

struct DeathEvent {
    CreatureId id = kNoCreature;
    Species    species = Species::PatternBird;
    DeathCause cause = DeathCause::Removed;
};

struct BirthEvent {
    CreatureId     id = kNoCreature;
    Species        species = Species::PatternBird;
    CreatureId     parent = kNoCreature; // kNoCreature for external spawns
    worldgen::Vec2 position;
};

struct MoveEvent {
    CreatureId     id = kNoCreature;
    worldgen::Vec2 from;
    worldgen::Vec2 to;
    BehaviorState  state = BehaviorState::Idle;
};

enum class HuntOutcome : std::uint8_t { Kill, Escape };

struct HuntEvent {
    CreatureId  hunter = kNoCreature;
    CreatureId  prey = kNoCreature;
    float       probability = 0.0f;
    HuntOutcome outcome = HuntOutcome::Escape;
};

struct TickDelta {
    int tick = 0;
    std::vector<DeathEvent> deaths;
    std::vector<BirthEvent> births;
    std::vector<MoveEvent>  movements;
    std::vector<HuntEvent>  hunts;
};

struct PopulationSample {
    int tick = 0;
    std::array<int, kSpeciesCount> counts{};
    int total = 0;
};

// p = clamp(0.45 + 0.5*d_aggression + 0.3*d_intelligence - 0.35*agility(prey), 0.05, 0.95)
[[nodiscard]] float huntSuccessProbability(const Genome& hunter, const Genome& prey) noexcept;

// Sole owner of the creature arena. Callers refer to creatures by id and
// receive value snapshots; nothing outside holds references into the registry.
class EcosystemSimulator {
public:
    EcosystemSimulator(int worldWidth, int worldHeight, std::uint32_t seed,
                       EcosystemParams params = {}, core::JobSystem* jobs = nullptr);

    EcosystemSimulator(EcosystemSimulator&&) = default;
    EcosystemSimulator& operator=(EcosystemSimulator&&) = default;
    EcosystemSimulator(const EcosystemSimulator&) = delete;
    EcosystemSimulator& operator=(const EcosystemSimulator&) = delete;

    // Direct placement outside the tick loop (world population). Returns
    // kNoCreature when the global cap is reached.
    CreatureId spawn(Species species, worldgen::Vec2 position, std::optional<Genome> genome = std::nullopt);

    // Advances one tick. Unknown or removed ids in `actions` follow the
    // strict-invariant policy: SimulationInconsistency before any state
    // changes, or a logged no-op when strict invariants are off.
    TickDelta tick(std::span<const Action> actions = {});

    [[nodiscard]] std::vector<CreatureSnapshot> snapshot() const;
    [[nodiscard]] std::optional<CreatureSnapshot> find(CreatureId id) const;
    [[nodiscard]] bool isAlive(CreatureId id) const noexcept { return live_.count(id) != 0; }
    [[nodiscard]] std::size_t liveCount() const noexcept { return live_.size(); }
    [[nodiscard]] int currentTick() const noexcept { return tick_; }
    [[nodiscard]] std::uint32_t seed() const noexcept { return root_.rootSeed(); }
    [[nodiscard]] std::array<int, kSpeciesCount> speciesCounts() const;
    [[nodiscard]] const std::deque<PopulationSample>& populationHistory() const noexcept { return history_; }
    [[nodiscard]] const EcosystemParams& params() const noexcept { return params_; }
    [[nodiscard]] int width() const noexcept { return width_; }
    [[nodiscard]] int height() const noexcept { return height_; }

    // `jobs` is borrowed and must outlive every later tick(); null runs the
    // decision pass serially.
    void setJobSystem(core::JobSystem* jobs) noexcept { jobs_ = jobs; }

private:
    CreatureId create_(const Genome& genome, worldgen::Vec2 position);
    void kill_(CreatureId id, DeathCause cause, TickDelta& delta);
    void inconsistency_(const std::string& what) const;
    void validateActions_(std::span<const Action> actions) const;
    void applyActions_(std::span<const Action> actions, TickDelta& delta);
    std::vector<Decision> decideAll_(const std::vector<CreatureSnapshot>& frozen) const;
    void resolveHunts_(const std::vector<CreatureSnapshot>& frozen, std::vector<Decision>& decisions, TickDelta& delta);
    void moveAndAge_(const std::vector<CreatureSnapshot>& frozen, const std::vector<Decision>& decisions, TickDelta& delta);
    void applyCapacity_(TickDelta& delta);
    void releaseStaleTargets_();
    void recordHistory_();
    [[nodiscard]] worldgen::Vec2 clampToWorld_(worldgen::Vec2 p) const noexcept;
    [[nodiscard]] CreatureSnapshot snapshotOf_(entt::entity e) const;

    int width_;
    int height_;
    core::SeededRandomStream root_;
    EcosystemParams params_;
    core::JobSystem* jobs_ = nullptr;

    entt::registry registry_;
    std::map<CreatureId, entt::entity> live_; // ascending id = processing order
    CreatureId nextId_ = 1;
    int tick_ = 0;
    std::deque<PopulationSample> history_;
};

} // namespace fractal::eco
