// tests/core/test_logging.cpp

#include <doctest/doctest.h>

#include "io/AtomicFile.h"
#include "logging/Log.h"

#include <chrono>
#include <filesystem>
#include <string>
#include <system_error>

namespace fs = std::filesystem;
using namespace fractal;

TEST_CASE("logsys writes to the rotating file and installs the default logger")
{
    std::error_code ec;
    fs::path base = fs::temp_directory_path(ec);
    if (ec || base.empty())
        base = fs::path(".");
    const auto stamp = static_cast<long long>(
        std::chrono::high_resolution_clock::now().time_since_epoch().count());
    const fs::path dir = base / ("fractal_log_tests_" + std::to_string(stamp));

    logsys::LogOptions opts;
    opts.logDir = dir;
    opts.level = spdlog::level::warn;
    logsys::init(opts);

    auto logger = logsys::get();
    REQUIRE(logger);
    CHECK(logger->name() == "fractal");
    CHECK(logger == spdlog::default_logger());
    CHECK(logger->sinks().size() == 2u);

    spdlog::warn("hydrology: no rivers traced, seed={}", 4242);
    logger->flush();

    std::string text;
    REQUIRE(io::read_all(dir / "fractal.log", text));
    CHECK(text.find("seed=4242") != std::string::npos);
    CHECK(text.find("[warning]") != std::string::npos);

    // Back to console only so later tests do not hold the file open.
    logsys::LogOptions quiet;
    quiet.level = spdlog::level::warn;
    logsys::init(quiet);
    CHECK(logsys::get()->sinks().size() == 1u);

    fs::remove_all(dir, ec);
}
