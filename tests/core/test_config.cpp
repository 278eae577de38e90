// tests/core/test_config.cpp
//
// WorldConfig ranges, JSON parsing and the layered GenerationSettings loader.

#include <doctest/doctest.h>

#include "core/Config.h"
#include "core/Errors.h"
#include "world/Settings.h"

#include <chrono>
#include <filesystem>
#include <fstream>
#include <limits>
#include <string>
#include <system_error>

using namespace fractal;
using nlohmann::json;
namespace fs = std::filesystem;

namespace {

fs::path make_unique_temp_dir()
{
    std::error_code ec;
    fs::path base = fs::temp_directory_path(ec);
    if (ec || base.empty())
        base = fs::path(".");

    const auto stamp = static_cast<long long>(
        std::chrono::high_resolution_clock::now().time_since_epoch().count());

    fs::path dir = base / ("fractal_config_tests_" + std::to_string(stamp));
    fs::create_directories(dir, ec);
    return dir;
}

std::string field_of(const core::WorldConfig& cfg)
{
    try
    {
        cfg.validate();
    }
    catch (const core::ConfigurationError& e)
    {
        return e.field();
    }
    return {};
}

} // namespace

TEST_CASE("WorldConfig defaults are valid")
{
    core::WorldConfig cfg;
    CHECK_NOTHROW(cfg.validate());
    CHECK(cfg.seed == 12345u);
    CHECK(cfg.worldSize == 256);
    CHECK(cfg.fractalIterations == 6);
}

TEST_CASE("WorldConfig::validate names the offending field")
{
    core::WorldConfig cfg;

    SUBCASE("world_size below range")
    {
        cfg.worldSize = 63;
        CHECK(field_of(cfg) == "world_size");
    }
    SUBCASE("world_size above range")
    {
        cfg.worldSize = 1025;
        CHECK(field_of(cfg) == "world_size");
    }
    SUBCASE("world_size bounds are inclusive")
    {
        cfg.worldSize = 64;
        CHECK(field_of(cfg).empty());
        cfg.worldSize = 1024;
        CHECK(field_of(cfg).empty());
    }
    SUBCASE("fractal_iterations zero")
    {
        cfg.fractalIterations = 0;
        CHECK(field_of(cfg) == "fractal_iterations");
    }
    SUBCASE("roughness above one")
    {
        cfg.roughness = 1.01f;
        CHECK(field_of(cfg) == "roughness");
    }
    SUBCASE("NaN water level")
    {
        cfg.waterLevel = std::numeric_limits<float>::quiet_NaN();
        CHECK(field_of(cfg) == "water_level");
    }
    SUBCASE("negative magic")
    {
        cfg.magicIntensity = -0.1f;
        CHECK(field_of(cfg) == "magic_intensity");
    }
}

TEST_CASE("worldConfigFromJson reads world_settings and keeps defaults for missing keys")
{
    const json j = json::parse(R"({"world_settings": {"seed": 42, "world_size": 128, "roughness": 0.25}})");
    const auto cfg = core::worldConfigFromJson(j);
    CHECK(cfg.seed == 42u);
    CHECK(cfg.worldSize == 128);
    CHECK(cfg.roughness == doctest::Approx(0.25f));
    CHECK(cfg.waterLevel == doctest::Approx(0.15f));
    CHECK(cfg.magicIntensity == doctest::Approx(0.7f));

    // A bare object is accepted too.
    const auto bare = core::worldConfigFromJson(json{{"seed", 7}});
    CHECK(bare.seed == 7u);
}

TEST_CASE("worldConfigFromJson rejects bad values")
{
    CHECK_THROWS_AS(core::worldConfigFromJson(json{{"seed", -1}}), core::ConfigurationError);
    CHECK_THROWS_AS(core::worldConfigFromJson(json{{"seed", 4294967296LL}}), core::ConfigurationError);
    CHECK_THROWS_AS(core::worldConfigFromJson(json{{"world_size", 12.5}}), core::ConfigurationError);
    CHECK_THROWS_AS(core::worldConfigFromJson(json{{"roughness", "rough"}}), core::ConfigurationError);
    CHECK_THROWS_AS(core::worldConfigFromJson(json::array()), core::ConfigurationError);

    // Integral floats are accepted.
    CHECK(core::worldConfigFromJson(json{{"world_size", 128.0}}).worldSize == 128);
    CHECK(core::worldConfigFromJson(json{{"seed", 4294967295LL}}).seed == 4294967295u);
}

TEST_CASE("toJson and worldConfigFromJson agree")
{
    core::WorldConfig cfg;
    cfg.seed = 99;
    cfg.worldSize = 512;
    cfg.treeDensity = 0.9f;
    const auto back = core::worldConfigFromJson(core::toJson(cfg));
    CHECK(back.seed == 99u);
    CHECK(back.worldSize == 512);
    CHECK(back.treeDensity == doctest::Approx(0.9f));
}

TEST_CASE("loadWorldConfig reports missing and malformed files as ConfigurationError")
{
    const fs::path dir = make_unique_temp_dir();

    CHECK_THROWS_AS(core::loadWorldConfig(dir / "nope.json"), core::ConfigurationError);

    const fs::path bad = dir / "bad.json";
    {
        std::ofstream f(bad);
        f << "{ \"world_settings\": { \"seed\": ";
    }
    CHECK_THROWS_AS(core::loadWorldConfig(bad), core::ConfigurationError);

    std::error_code ec;
    fs::remove_all(dir, ec);
}

TEST_CASE("settingsFromJson layers generation and ecosystem sections")
{
    const json j = json::parse(R"({
        "world_settings": {"seed": 5, "world_size": 64},
        "generation": {
            "hydrology": {"max_rivers": 3, "min_length": 4},
            "vegetation": {"max_symbols": 1000},
            "structures": {"max_nodes": 200}
        },
        "ecosystem": {"cull_probability": 0.25, "strict_invariants": true, "hunt_radius": 8.0}
    })");

    const auto s = world::settingsFromJson(j);
    CHECK(s.world.seed == 5u);
    CHECK(s.hydrology.maxRivers == 3);
    CHECK(s.hydrology.minLength == 4);
    CHECK(s.vegetation.maxSymbols == 1000u);
    CHECK(s.structures.maxNodes == 200u);
    CHECK(s.ecosystem.cullProbability == doctest::Approx(0.25f));
    CHECK(s.ecosystem.strictInvariants);
    CHECK(s.ecosystem.behavior.huntRadius == doctest::Approx(8.0f));
    // untouched
    CHECK(s.ecosystem.behavior.threatRadius == doctest::Approx(12.0f));

    const auto again = world::settingsFromJson(world::toJson(s));
    CHECK(again.structures.maxNodes == 200u);
    CHECK(again.ecosystem.strictInvariants);
}

TEST_CASE("settingsFromJson rejects wrong types with a dotted field name")
{
    const json j = json::parse(R"({"ecosystem": {"adult_age": "old"}})");
    try
    {
        (void)world::settingsFromJson(j);
        FAIL("expected ConfigurationError");
    }
    catch (const core::ConfigurationError& e)
    {
        CHECK(e.field() == "ecosystem.adult_age");
    }

    CHECK_THROWS_AS(world::settingsFromJson(json::parse(R"({"generation": []})")), core::ConfigurationError);
    CHECK_THROWS_AS(world::settingsFromJson(json::parse(R"({"ecosystem": {"cull_probability": 2.0}})")),
                    core::ConfigurationError);
}

TEST_CASE("settingsFromJson rejects integers the field cannot hold")
{
    const auto field_rejected = [](const char* text) -> std::string {
        try
        {
            (void)world::settingsFromJson(json::parse(text));
        }
        catch (const core::ConfigurationError& e)
        {
            return e.field();
        }
        return {};
    };

    // 2^32 + 32 would truncate to 32 in an int.
    CHECK(field_rejected(R"({"ecosystem": {"region_size": 4294967328}})") == "ecosystem.region_size");
    CHECK(field_rejected(R"({"ecosystem": {"min_local_population": -4294967296}})") == "ecosystem.min_local_population");
    CHECK(field_rejected(R"({"generation": {"hydrology": {"max_rivers": 2147483648}}})") == "generation.hydrology.max_rivers");
    CHECK(field_rejected(R"({"ecosystem": {"max_population": -1}})") == "ecosystem.max_population");

    const auto s = world::settingsFromJson(json::parse(R"({"ecosystem": {"region_size": 2147483647}})"));
    CHECK(s.ecosystem.regionSize == std::numeric_limits<int>::max());
}

TEST_CASE("shipped world.json loads")
{
    const fs::path p = fs::path(FRACTAL_ASSET_DIR) / "config" / "world.json";
    const auto s = world::loadSettings(p);
    CHECK(s.world.seed == 12345u);
    CHECK(s.world.worldSize == 256);
}
