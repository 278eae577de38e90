// src/core/Errors.h
#pragma once
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace fractal::core {

// Rejected input. Raised before any generation work starts.
class ConfigurationError : public std::invalid_argument {
public:
    ConfigurationError(std::string field, const std::string& what)
        : std::invalid_argument(field + ": " + what), field_(std::move(field)) {}

    [[nodiscard]] const std::string& field() const noexcept { return field_; }

private:
    std::string field_;
};

// A tick referenced state that no longer exists (e.g. a removed creature).
class SimulationInconsistency : public std::logic_error {
public:
    using std::logic_error::logic_error;
};

// Snapshot or log output could not be written.
class IoError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Generation failures never abort a world; the stage skips the feature and
// records what happened here.
struct GenerationIssue {
    std::string stage;
    std::string message;
};

struct GenerationReport {
    std::vector<GenerationIssue> issues;
    int grammarCapHits = 0;
    int discardedRivers = 0;

    void add(std::string stage, std::string message) {
        issues.push_back(GenerationIssue{std::move(stage), std::move(message)});
    }
    [[nodiscard]] bool clean() const noexcept { return issues.empty(); }
};

#ifdef NDEBUG
inline constexpr bool kStrictInvariantsDefault = false;
#else
inline constexpr bool kStrictInvariantsDefault = true;
#endif

} // namespace fractal::core
