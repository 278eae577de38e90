// tests/test_main.cpp
//
// The only translation unit in the test executable that defines
// DOCTEST_CONFIG_IMPLEMENT. Other test files include doctest plainly.
#define DOCTEST_CONFIG_IMPLEMENT
#include <doctest/doctest.h>
#undef DOCTEST_CONFIG_IMPLEMENT

#include <cstdlib> // std::getenv
#include <cstring> // std::strcmp

#include <spdlog/spdlog.h>

namespace {

bool env_truthy(const char* v) {
    // Any non-empty value except "0".
    return v != nullptr && v[0] != '\0' && std::strcmp(v, "0") != 0;
}

bool running_in_ci() {
    return env_truthy(std::getenv("CI")) ||
           env_truthy(std::getenv("GITHUB_ACTIONS"));
}

} // namespace

int main(int argc, char** argv) {
    doctest::Context context;

    // ----- defaults (can be overridden by CLI flags) -----
    context.setOption("order-by", "name"); // deterministic ordering
    context.setOption("duration", true);

    if (running_in_ci()) {
        context.setOption("no-breaks", true);
        context.setOption("no-colors", true);
    }

    // Generation logs summaries at info; keep test output to warnings.
    spdlog::set_level(env_truthy(std::getenv("FRACTAL_TEST_VERBOSE")) ? spdlog::level::debug
                                                                      : spdlog::level::warn);

    context.applyCommandLine(argc, argv);
    return context.run();
}
