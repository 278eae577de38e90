// tools/worldgen/worldgen_main.cpp
//
// fractalgen generate [--config world.json] [--seed N] [--size N] [--ticks N]
//                     [--out world.json] [--log-dir DIR] [--grids] [--verbose]
//
// Exit codes: 0 success, 1 usage, 2 configuration error, 3 I/O failure.

#include <cstdint>
#include <exception>
#include <filesystem>
#include <iostream>
#include <limits>
#include <map>
#include <set>
#include <string>

#include <spdlog/spdlog.h>

#include "core/Errors.h"
#include "eco/Species.hpp"
#include "logging/Log.h"
#include "world/Settings.h"
#include "world/WorldStateJson.h"
#include "worldgen/WorldGen.hpp"

using std::string;
namespace fs = std::filesystem;
using namespace fractal;

namespace {

constexpr int kExitOk = 0;
constexpr int kExitUsage = 1;
constexpr int kExitConfig = 2;
constexpr int kExitIo = 3;

const std::set<string> kSwitches = {"--grids", "--verbose", "--help", "-h"};

std::map<string, string> parse_kv(int argc, char** argv, int first) {
    std::map<string, string> kv;
    for (int i = first; i < argc; ++i) {
        string a = argv[i];
        auto eq = a.find('=');
        if (eq != string::npos) {
            kv[a.substr(0, eq)] = a.substr(eq + 1);
        } else if (kSwitches.count(a)) {
            kv[a] = "";
        } else if (a.rfind("--", 0) == 0 && i + 1 < argc) {
            kv[a] = argv[++i];
        } else {
            kv[a] = "";
        }
    }
    return kv;
}

void usage(std::ostream& os) {
    os << "usage: fractalgen generate [--config world.json] [--seed N] [--size N] [--ticks N]\n"
          "                           [--out world.json] [--log-dir DIR] [--grids] [--verbose]\n";
}

// Integer argument; ConfigurationError names the flag on bad input.
long long int_arg(const std::map<string, string>& kv, const string& key, long long fallback) {
    auto it = kv.find(key);
    if (it == kv.end()) return fallback;
    try {
        std::size_t used = 0;
        const long long v = std::stoll(it->second, &used);
        if (used != it->second.size()) throw std::invalid_argument("trailing characters");
        return v;
    } catch (const std::logic_error&) {
        throw core::ConfigurationError(key, "expected an integer, got '" + it->second + "'");
    }
}

void print_summary(const world::WorldState& s, const eco::EcosystemSimulator& sim) {
    const auto& t = s.terrain();
    std::cout << "seed " << s.seed() << ", " << s.size() << "x" << s.size() << ", tick " << s.tick() << "\n";
    std::cout << "height min " << t.minHeight << " max " << t.maxHeight << " mean " << t.meanHeight << "\n";
    std::cout << "biomes:";
    for (int i = 0; i < worldgen::kBiomeCount; ++i)
        std::cout << " " << worldgen::biomeName(static_cast<worldgen::Biome>(i)) << "="
                  << t.biomePercent[static_cast<std::size_t>(i)] << "%";
    std::cout << "\n";
    std::cout << "rivers " << s.rivers().size() << ", forests " << s.forests().size()
              << " (" << s.treeCount() << " trees), structures " << s.structures().size() << "\n";
    std::cout << "creatures " << s.creatures().size() << ":";
    const auto counts = sim.speciesCounts();
    for (int i = 0; i < eco::kSpeciesCount; ++i)
        std::cout << " " << eco::speciesName(static_cast<eco::Species>(i)) << "=" << counts[static_cast<std::size_t>(i)];
    std::cout << "\n";
    for (const auto& issue : s.report().issues)
        std::cout << "note [" << issue.stage << "] " << issue.message << "\n";
}

int run_generate(const std::map<string, string>& kv) {
    world::GenerationSettings settings;
    long long ticks = 0;
    try {
        if (auto it = kv.find("--config"); it != kv.end())
            settings = world::loadSettings(it->second);

        const long long seed = int_arg(kv, "--seed", settings.world.seed);
        if (seed < 0 || seed > 0xFFFFFFFFll)
            throw core::ConfigurationError("--seed", "must be in [0, 4294967295]");
        settings.world.seed = static_cast<std::uint32_t>(seed);
        const long long size = int_arg(kv, "--size", settings.world.worldSize);
        if (size < 64 || size > 1024)
            throw core::ConfigurationError("--size", "must be in [64, 1024]");
        settings.world.worldSize = static_cast<int>(size);
        ticks = int_arg(kv, "--ticks", 0);
        if (ticks < 0 || ticks > std::numeric_limits<int>::max())
            throw core::ConfigurationError("--ticks", "must be in [0, " +
                                           std::to_string(std::numeric_limits<int>::max()) + "]");
        settings.validate();
    } catch (const core::ConfigurationError& e) {
        spdlog::error("configuration error: {}", e.what());
        return kExitConfig;
    }

    worldgen::WorldGenerator generator;
    auto generated = generator.generate(settings);
    if (ticks > 0) {
        generated.advance(static_cast<int>(ticks), [](const eco::TickDelta& d) {
            spdlog::debug("tick {}", nlohmann::json(d).dump());
        });
        spdlog::info("ecosystem advanced {} ticks, {} creatures alive", ticks, generated.ecosystem.liveCount());
    }
    print_summary(generated.state, generated.ecosystem);

    const fs::path out = kv.count("--out") ? fs::path(kv.at("--out")) : fs::path("world.json");
    world::JsonOptions opts;
    opts.includeGrids = kv.count("--grids") != 0;
    try {
        world::saveWorldState(generated.state, out, opts);
    } catch (const core::IoError& e) {
        spdlog::error("{}", e.what());
        return kExitIo;
    }
    std::cout << "wrote " << out.string() << "\n";
    return kExitOk;
}

} // namespace

int main(int argc, char** argv) {
    if (argc < 2) {
        usage(std::cerr);
        return kExitUsage;
    }
    const string cmd = argv[1];
    if (cmd == "--help" || cmd == "-h" || cmd == "help") {
        usage(std::cout);
        return kExitOk;
    }
    if (cmd != "generate") {
        std::cerr << "unknown command: " << cmd << "\n";
        usage(std::cerr);
        return kExitUsage;
    }

    const auto kv = parse_kv(argc, argv, 2);
    for (const auto& [k, v] : kv) {
        static const std::set<string> known = {"--config", "--seed", "--size", "--ticks", "--out",
                                               "--log-dir", "--grids", "--verbose", "--help", "-h"};
        if (!known.count(k)) {
            std::cerr << "unknown option: " << k << "\n";
            usage(std::cerr);
            return kExitUsage;
        }
    }
    if (kv.count("--help") || kv.count("-h")) {
        usage(std::cout);
        return kExitOk;
    }

    logsys::LogOptions logOpts;
    if (auto it = kv.find("--log-dir"); it != kv.end()) logOpts.logDir = it->second;
    if (kv.count("--verbose")) logOpts.level = spdlog::level::debug;
    logsys::init(logOpts);

    int rc = kExitIo;
    try {
        rc = run_generate(kv);
    } catch (const core::ConfigurationError& e) {
        spdlog::error("configuration error: {}", e.what());
        rc = kExitConfig;
    } catch (const std::exception& e) {
        spdlog::critical("generation failed: {}", e.what());
        rc = kExitIo;
    }
    logsys::get()->flush();
    return rc;
}
