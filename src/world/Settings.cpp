#include "world/Settings.h"
#include "core/Errors.h"

#include <cmath>
#include <cstdint>
#include <limits>
#include <string>
#include <type_traits>

using json = nlohmann::json;
namespace fs = std::filesystem;

namespace fractal::world {

namespace
{
    // Like a plain lookup with a default, except that a present key of the
    // wrong type is rejected rather than silently replaced.
    template <typename T>
    T GetOr(const json& j, const char* section, const char* key, const T& fallback)
    {
        auto it = j.find(key);
        if (it == j.end())
            return fallback;
        const std::string field = std::string(section) + "." + key;
        if constexpr (std::is_same_v<T, bool>)
        {
            if (!it->is_boolean())
                throw core::ConfigurationError(field, "expected a boolean");
        }
        else if constexpr (std::is_integral_v<T>)
        {
            if (!it->is_number_integer())
                throw core::ConfigurationError(field, "expected an integer");
            if constexpr (std::is_unsigned_v<T>)
                if (!it->is_number_unsigned() && it->template get<std::int64_t>() < 0)
                    throw core::ConfigurationError(field, "must not be negative");

            // Reject rather than truncate values the field's type cannot hold.
            bool fits = true;
            if (it->is_number_unsigned())
                fits = it->template get<std::uint64_t>() <= static_cast<std::uint64_t>(std::numeric_limits<T>::max());
            else if constexpr (std::is_signed_v<T>)
            {
                const std::int64_t v = it->template get<std::int64_t>();
                fits = v >= static_cast<std::int64_t>(std::numeric_limits<T>::min()) &&
                       v <= static_cast<std::int64_t>(std::numeric_limits<T>::max());
            }
            if (!fits)
                throw core::ConfigurationError(field, "integer out of range");
        }
        else
        {
            if (!it->is_number())
                throw core::ConfigurationError(field, "expected a number");
        }
        return it->template get<T>();
    }

    const json& Section(const json& parent, const char* name, const char* path)
    {
        static const json kEmpty = json::object();
        auto it = parent.find(name);
        if (it == parent.end())
            return kEmpty;
        if (!it->is_object())
            throw core::ConfigurationError(path, "expected an object");
        return *it;
    }

    void Require(bool ok, const char* field, const char* what)
    {
        if (!ok)
            throw core::ConfigurationError(field, what);
    }

    bool Unit(float v) { return !std::isnan(v) && v >= 0.0f && v <= 1.0f; }
    bool Positive(float v) { return !std::isnan(v) && v > 0.0f; }
}

void GenerationSettings::validate() const
{
    world.validate();

    Require(!std::isnan(hydrology.sourceMinHeight) && hydrology.sourceMinHeight >= 0.0f &&
            hydrology.sourceMinHeight < 1.0f, "generation.hydrology.source_min_height", "must be in [0, 1)");
    Require(hydrology.minLength >= 2, "generation.hydrology.min_length", "must be at least 2");

    Require(vegetation.minIterations >= 0 && vegetation.minIterations <= vegetation.maxIterations,
            "generation.vegetation.min_iterations", "must be in [0, max_iterations]");
    Require(vegetation.maxIterations <= 8, "generation.vegetation.max_iterations", "must be at most 8");
    Require(vegetation.maxSymbols >= 1, "generation.vegetation.max_symbols", "must be positive");
    Require(vegetation.minTreesPerPatch >= 0 && vegetation.minTreesPerPatch <= vegetation.maxTreesPerPatch,
            "generation.vegetation.min_trees_per_patch", "must be in [0, max_trees_per_patch]");
    Require(Positive(vegetation.patchRadius), "generation.vegetation.patch_radius", "must be positive");

    Require(structures.maxNodes >= 1, "generation.structures.max_nodes", "must be positive");

    const auto& e = ecosystem;
    Require(Positive(e.strikeRange), "ecosystem.strike_range", "must be positive");
    Require(e.regionSize > 0, "ecosystem.region_size", "must be positive");
    Require(e.minLocalPopulation >= 0, "ecosystem.min_local_population", "must not be negative");
    Require(Unit(e.cullProbability), "ecosystem.cull_probability", "must be in [0, 1]");
    Require(Unit(e.spawnProbability), "ecosystem.spawn_probability", "must be in [0, 1]");
    Require(e.adultAge >= 0, "ecosystem.adult_age", "must not be negative");
    Require(e.maxPopulation >= 1, "ecosystem.max_population", "must be positive");
    Require(Positive(e.behavior.threatRadius), "ecosystem.threat_radius", "must be positive");
    Require(Positive(e.behavior.huntRadius), "ecosystem.hunt_radius", "must be positive");
    Require(Positive(e.behavior.territoryRadius), "ecosystem.territory_radius", "must be positive");
    Require(Positive(e.behavior.sightRadius), "ecosystem.sight_radius", "must be positive");
}

GenerationSettings settingsFromJson(const json& root)
{
    if (!root.is_object())
        throw core::ConfigurationError("config", "expected a JSON object at the top level");

    GenerationSettings s;
    s.world = core::worldConfigFromJson(root);

    const json& gen = Section(root, "generation", "generation");

    const json& hy = Section(gen, "hydrology", "generation.hydrology");
    s.hydrology.sourceMinHeight = GetOr<float>(hy, "generation.hydrology", "source_min_height", s.hydrology.sourceMinHeight);
    s.hydrology.maxRivers       = GetOr<int>  (hy, "generation.hydrology", "max_rivers",        s.hydrology.maxRivers);
    s.hydrology.minLength       = GetOr<int>  (hy, "generation.hydrology", "min_length",        s.hydrology.minLength);

    const json& ve = Section(gen, "vegetation", "generation.vegetation");
    s.vegetation.minIterations    = GetOr<int>        (ve, "generation.vegetation", "min_iterations",      s.vegetation.minIterations);
    s.vegetation.maxIterations    = GetOr<int>        (ve, "generation.vegetation", "max_iterations",      s.vegetation.maxIterations);
    s.vegetation.maxSymbols       = GetOr<std::size_t>(ve, "generation.vegetation", "max_symbols",         s.vegetation.maxSymbols);
    s.vegetation.minTreesPerPatch = GetOr<int>        (ve, "generation.vegetation", "min_trees_per_patch", s.vegetation.minTreesPerPatch);
    s.vegetation.maxTreesPerPatch = GetOr<int>        (ve, "generation.vegetation", "max_trees_per_patch", s.vegetation.maxTreesPerPatch);
    s.vegetation.patchRadius      = GetOr<float>      (ve, "generation.vegetation", "patch_radius",        s.vegetation.patchRadius);

    const json& st = Section(gen, "structures", "generation.structures");
    s.structures.maxNodes = GetOr<std::size_t>(st, "generation.structures", "max_nodes", s.structures.maxNodes);

    const json& ec = Section(root, "ecosystem", "ecosystem");
    auto& e = s.ecosystem;
    e.strikeRange        = GetOr<float>      (ec, "ecosystem", "strike_range",         e.strikeRange);
    e.regionSize         = GetOr<int>        (ec, "ecosystem", "region_size",          e.regionSize);
    e.minLocalPopulation = GetOr<int>        (ec, "ecosystem", "min_local_population", e.minLocalPopulation);
    e.cullProbability    = GetOr<float>      (ec, "ecosystem", "cull_probability",     e.cullProbability);
    e.spawnProbability   = GetOr<float>      (ec, "ecosystem", "spawn_probability",    e.spawnProbability);
    e.adultAge           = GetOr<int>        (ec, "ecosystem", "adult_age",            e.adultAge);
    e.maxPopulation      = GetOr<std::size_t>(ec, "ecosystem", "max_population",       e.maxPopulation);
    e.historyLength      = GetOr<std::size_t>(ec, "ecosystem", "history_length",       e.historyLength);
    e.strictInvariants   = GetOr<bool>       (ec, "ecosystem", "strict_invariants",    e.strictInvariants);
    e.behavior.threatRadius    = GetOr<float>(ec, "ecosystem", "threat_radius",    e.behavior.threatRadius);
    e.behavior.huntRadius      = GetOr<float>(ec, "ecosystem", "hunt_radius",      e.behavior.huntRadius);
    e.behavior.territoryRadius = GetOr<float>(ec, "ecosystem", "territory_radius", e.behavior.territoryRadius);
    e.behavior.sightRadius     = GetOr<float>(ec, "ecosystem", "sight_radius",     e.behavior.sightRadius);

    s.validate();
    return s;
}

GenerationSettings loadSettings(const fs::path& path)
{
    return settingsFromJson(core::readJsonFile(path));
}

json toJson(const GenerationSettings& s)
{
    const auto& e = s.ecosystem;
    return json{
        {"world_settings", core::toJson(s.world)},
        {"generation", {
            {"hydrology", {
                {"source_min_height", s.hydrology.sourceMinHeight},
                {"max_rivers",        s.hydrology.maxRivers},
                {"min_length",        s.hydrology.minLength},
            }},
            {"vegetation", {
                {"min_iterations",      s.vegetation.minIterations},
                {"max_iterations",      s.vegetation.maxIterations},
                {"max_symbols",         s.vegetation.maxSymbols},
                {"min_trees_per_patch", s.vegetation.minTreesPerPatch},
                {"max_trees_per_patch", s.vegetation.maxTreesPerPatch},
                {"patch_radius",        s.vegetation.patchRadius},
            }},
            {"structures", {{"max_nodes", s.structures.maxNodes}}},
        }},
        {"ecosystem", {
            {"strike_range",         e.strikeRange},
            {"region_size",          e.regionSize},
            {"min_local_population", e.minLocalPopulation},
            {"cull_probability",     e.cullProbability},
            {"spawn_probability",    e.spawnProbability},
            {"adult_age",            e.adultAge},
            {"max_population",       e.maxPopulation},
            {"history_length",       e.historyLength},
            {"strict_invariants",    e.strictInvariants},
            {"threat_radius",        e.behavior.threatRadius},
            {"hunt_radius",          e.behavior.huntRadius},
            {"territory_radius",     e.behavior.territoryRadius},
            {"sight_radius",         e.behavior.sightRadius},
        }},
    };
}

} // namespace fractal::world
