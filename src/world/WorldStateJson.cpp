#include "world/WorldStateJson.h"
#include "io/AtomicFile.h"

#include <spdlog/spdlog.h>

#include <map>
#include <string>

using json = nlohmann::json;

namespace fractal::worldgen {

void to_json(json& j, const Vec2& v) { j = json::array({v.x, v.y}); }
void to_json(json& j, const Vec3& v) { j = json::array({v.x, v.y, v.z}); }

void to_json(json& j, const Tree& t)
{
    j = json{
        {"position",        Vec2{t.x, t.y}},
        {"height",          t.height},
        {"foliage_density", t.foliageDensity},
        {"magic",           t.magic},
        {"rule",            ruleCatalogue()[t.ruleIndex].name},
        {"iterations",      t.skeleton ? t.skeleton->iterations : 0},
        {"segments",        t.skeleton ? t.skeleton->segments.size() : 0},
    };
}

void to_json(json& j, const Forest& f)
{
    j = json{
        {"center", json::array({f.centerX, f.centerY})},
        {"biome",  std::string(biomeName(f.biome))},
        {"trees",  f.trees},
    };
}

void to_json(json& j, const River& r)
{
    json samples = json::array();
    for (const auto& s : r.samples)
        samples.push_back(json::array({s.x, s.y, s.height}));
    j = json{
        {"width",         r.width},
        {"speed",         r.speed},
        {"glow",          r.glow},
        {"ends_in_water", r.endsInWater},
        {"confluence",    r.confluence},
        {"samples",       std::move(samples)},
    };
}

void to_json(json& j, const StructureNode& n)
{
    j = json{
        {"position", n.position},
        {"size",     n.size},
        {"rotation", n.rotationDeg},
        {"depth",    n.depth},
        {"parent",   n.parent},
    };
}

void to_json(json& j, const Structure& s)
{
    j = json{
        {"pattern",        std::string(patternName(s.pattern))},
        {"position",       json::array({s.x, s.y})},
        {"depth",          s.depth},
        {"rune_count",     s.runeCount},
        {"glow_intensity", s.glowIntensity},
        {"truncated",      s.truncated},
        {"nodes",          s.nodes},
    };
}

void to_json(json& j, const BiomeThresholdTable& t)
{
    j = json{
        {"water_max",    t.waterMax},
        {"mountain_min", t.mountainMin},
        {"tundra_min",   t.tundraMin},
        {"desert_max",   t.desertMax},
        {"plains_max",   t.plainsMax},
        {"forest_max",   t.forestMax},
        {"grove_max",    t.groveMax},
    };
}

} // namespace fractal::worldgen

namespace fractal::eco {

void to_json(json& j, const Genome& g)
{
    const Traits& t = g.traits();
    j = json{
        {"aggression",   t.aggression},
        {"intelligence", t.intelligence},
        {"social",       t.social},
        {"territorial",  t.territorial},
        {"predator",     t.predator},
        {"prey",         t.prey},
    };
}

void to_json(json& j, const CreatureSnapshot& c)
{
    j = json{
        {"id",       c.id},
        {"species",  std::string(speciesName(c.species()))},
        {"genome",   c.genome},
        {"position", c.position},
        {"home",     c.home},
        {"movement", std::string(movementPatternName(speciesInfo(c.species()).movement))},
        {"state",    std::string(behaviorName(c.state))},
        {"target",   c.target},
        {"health",   c.health},
        {"energy",   c.energy},
        {"age",      c.age},
    };
}

void to_json(json& j, const TickDelta& d)
{
    json deaths = json::array();
    for (const auto& e : d.deaths)
        deaths.push_back(json{{"id", e.id},
                              {"species", std::string(speciesName(e.species))},
                              {"cause", std::string(deathCauseName(e.cause))}});
    json births = json::array();
    for (const auto& e : d.births)
        births.push_back(json{{"id", e.id},
                              {"species", std::string(speciesName(e.species))},
                              {"parent", e.parent},
                              {"position", e.position}});
    json moves = json::array();
    for (const auto& e : d.movements)
        moves.push_back(json{{"id", e.id}, {"from", e.from}, {"to", e.to},
                             {"state", std::string(behaviorName(e.state))}});
    json hunts = json::array();
    for (const auto& e : d.hunts)
        hunts.push_back(json{{"hunter", e.hunter},
                             {"prey", e.prey},
                             {"probability", e.probability},
                             {"outcome", e.outcome == HuntOutcome::Kill ? "kill" : "escape"}});
    j = json{
        {"tick",      d.tick},
        {"deaths",    std::move(deaths)},
        {"births",    std::move(births)},
        {"movements", std::move(moves)},
        {"hunts",     std::move(hunts)},
    };
}

} // namespace fractal::eco

namespace fractal::core {

void to_json(json& j, const GenerationReport& r)
{
    json issues = json::array();
    for (const auto& i : r.issues)
        issues.push_back(json{{"stage", i.stage}, {"message", i.message}});
    j = json{
        {"issues",           std::move(issues)},
        {"grammar_cap_hits", r.grammarCapHits},
        {"discarded_rivers", r.discardedRivers},
    };
}

} // namespace fractal::core

namespace fractal::world {

namespace {

json skeletonsJson(const WorldState& state)
{
    // Skeletons are shared; emit each distinct one once.
    std::map<std::pair<std::string, int>, const worldgen::TreeSkeleton*> unique;
    for (const auto& f : state.forests())
        for (const auto& t : f.trees)
            if (t.skeleton)
                unique.emplace(std::make_pair(worldgen::ruleCatalogue()[t.ruleIndex].name, t.skeleton->iterations),
                               t.skeleton.get());

    json out = json::array();
    for (const auto& [key, sk] : unique) {
        json segs = json::array();
        for (const auto& s : sk->segments)
            segs.push_back(json::array({s.start.x, s.start.y, s.start.z, s.end.x, s.end.y, s.end.z, s.depth}));
        out.push_back(json{
            {"rule",         key.first},
            {"iterations",   key.second},
            {"symbol_count", sk->symbolCount},
            {"capped",       sk->capped},
            {"bounds_min",   sk->boundsMin},
            {"bounds_max",   sk->boundsMax},
            {"segments",     std::move(segs)},
        });
    }
    return out;
}

json gridsJson(const WorldState& state)
{
    const auto& h = state.height();
    const auto& b = state.biomes();
    json height = json::array();
    json biomes = json::array();
    for (int y = 0; y < h.height(); ++y) {
        json hr = json::array();
        json br = json::array();
        for (int x = 0; x < h.width(); ++x) {
            hr.push_back(h.at(x, y));
            br.push_back(worldgen::biomeIndex(b.at(x, y)));
        }
        height.push_back(std::move(hr));
        biomes.push_back(std::move(br));
    }
    return json{{"height", std::move(height)}, {"biome", std::move(biomes)}};
}

} // namespace

json toJson(const WorldState& state, const JsonOptions& options)
{
    const TerrainStats& t = state.terrain();
    json dist = json::object();
    for (int i = 0; i < worldgen::kBiomeCount; ++i)
        dist[std::string(worldgen::biomeName(static_cast<worldgen::Biome>(i)))] = t.biomePercent[static_cast<std::size_t>(i)];

    json j = {
        {"version",        kSnapshotVersion},
        {"seed",           state.seed()},
        {"tick",           state.tick()},
        {"world_settings", core::toJson(state.config())},
        {"terrain", {
            {"min_height",         t.minHeight},
            {"max_height",         t.maxHeight},
            {"mean_height",        t.meanHeight},
            {"biome_distribution", std::move(dist)},
            {"thresholds",         state.thresholds()},
        }},
        {"forests",    state.forests()},
        {"rivers",     state.rivers()},
        {"structures", state.structures()},
        {"creatures",  state.creatures()},
        {"report",     state.report()},
    };
    if (options.includeSkeletons)
        j["tree_skeletons"] = skeletonsJson(state);
    if (options.includeGrids)
        j["grids"] = gridsJson(state);
    return j;
}

void saveWorldState(const WorldState& state, const std::filesystem::path& path, const JsonOptions& options)
{
    const std::string bytes = toJson(state, options).dump(options.indent);
    std::string err;
    if (!io::write_atomic(path, bytes, &err))
        throw core::IoError("saving world snapshot to '" + path.string() + "': " + err);
    spdlog::info("world snapshot written to {} ({} bytes, seed={})", path.string(), bytes.size(), state.seed());
}

} // namespace fractal::world
