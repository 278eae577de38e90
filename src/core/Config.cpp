#include "core/Config.h"
#include "core/Errors.h"

#include <cmath>
#include <fstream>
#include <limits>
#include <string_view>

using json = nlohmann::json;
namespace fs = std::filesystem;

namespace fractal::core {

namespace
{
    void RequireRange(const char* field, double v, double lo, double hi)
    {
        if (std::isnan(v) || v < lo || v > hi)
            throw ConfigurationError(field, "value " + std::to_string(v) + " outside [" +
                                                std::to_string(lo) + ", " + std::to_string(hi) + "]");
    }

    // Integral JSON numbers only; 3.0 is accepted, 3.5 is not.
    std::int64_t GetInteger(const json& j, const char* key, std::int64_t fallback)
    {
        auto it = j.find(key);
        if (it == j.end())
            return fallback;
        if (it->is_number_integer())
            return it->get<std::int64_t>();
        if (it->is_number_unsigned())
        {
            const auto u = it->get<std::uint64_t>();
            if (u > static_cast<std::uint64_t>(std::numeric_limits<std::int64_t>::max()))
                throw ConfigurationError(key, "integer too large");
            return static_cast<std::int64_t>(u);
        }
        if (it->is_number_float())
        {
            const double d = it->get<double>();
            if (std::floor(d) != d || std::abs(d) > 9.0e15)
                throw ConfigurationError(key, "expected an integer");
            return static_cast<std::int64_t>(d);
        }
        throw ConfigurationError(key, std::string("expected a number, got ") + it->type_name());
    }

    float GetFloat(const json& j, const char* key, float fallback)
    {
        auto it = j.find(key);
        if (it == j.end())
            return fallback;
        if (!it->is_number())
            throw ConfigurationError(key, std::string("expected a number, got ") + it->type_name());
        return it->get<float>();
    }
}

void WorldConfig::validate() const
{
    // seed is a uint32_t, so its range is enforced by the type itself.
    RequireRange("world_size",         worldSize,         64, 1024);
    RequireRange("fractal_iterations", fractalIterations, 1,  16);
    RequireRange("roughness",          roughness,         0.0, 1.0);
    RequireRange("water_level",        waterLevel,        0.0, 1.0);
    RequireRange("tree_density",       treeDensity,       0.0, 1.0);
    RequireRange("creature_density",   creatureDensity,   0.0, 1.0);
    RequireRange("magic_intensity",    magicIntensity,    0.0, 1.0);
}

WorldConfig worldConfigFromJson(const json& root)
{
    if (!root.is_object())
        throw ConfigurationError("world_settings", "expected an object");

    const json& j = root.contains("world_settings") ? root.at("world_settings") : root;
    if (!j.is_object())
        throw ConfigurationError("world_settings", "expected an object");

    WorldConfig cfg;

    const std::int64_t seed = GetInteger(j, "seed", cfg.seed);
    RequireRange("seed", static_cast<double>(seed), 0.0, 4294967295.0);
    cfg.seed = static_cast<std::uint32_t>(seed);

    const std::int64_t size = GetInteger(j, "world_size", cfg.worldSize);
    RequireRange("world_size", static_cast<double>(size), 64, 1024);
    cfg.worldSize = static_cast<int>(size);

    const std::int64_t iters = GetInteger(j, "fractal_iterations", cfg.fractalIterations);
    RequireRange("fractal_iterations", static_cast<double>(iters), 1, 16);
    cfg.fractalIterations = static_cast<int>(iters);

    cfg.roughness       = GetFloat(j, "roughness",        cfg.roughness);
    cfg.waterLevel      = GetFloat(j, "water_level",      cfg.waterLevel);
    cfg.treeDensity     = GetFloat(j, "tree_density",     cfg.treeDensity);
    cfg.creatureDensity = GetFloat(j, "creature_density", cfg.creatureDensity);
    cfg.magicIntensity  = GetFloat(j, "magic_intensity",  cfg.magicIntensity);

    cfg.validate();
    return cfg;
}

json toJson(const WorldConfig& cfg)
{
    return json{
        {"seed",               cfg.seed},
        {"world_size",         cfg.worldSize},
        {"fractal_iterations", cfg.fractalIterations},
        {"roughness",          cfg.roughness},
        {"water_level",        cfg.waterLevel},
        {"tree_density",       cfg.treeDensity},
        {"creature_density",   cfg.creatureDensity},
        {"magic_intensity",    cfg.magicIntensity},
    };
}

json readJsonFile(const fs::path& path)
{
    std::ifstream f(path, std::ios::in | std::ios::binary);
    if (!f)
        throw ConfigurationError("config", "could not open '" + path.string() + "'");

    json root;
    try
    {
        f >> root;
    }
    catch (const json::parse_error& e)
    {
        throw ConfigurationError("config", "parse error in '" + path.string() + "': " + e.what());
    }
    return root;
}

WorldConfig loadWorldConfig(const fs::path& path)
{
    return worldConfigFromJson(readJsonFile(path));
}

} // namespace fractal::core
