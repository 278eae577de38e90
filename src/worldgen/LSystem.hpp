// src/worldgen/LSystem.hpp
#pragma once
#include <cstddef>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "worldgen/Math.hpp"

namespace fractal::worldgen {

// Deterministic context-free L-system. Symbols without a production are
// copied through unchanged.
struct LSystemRule {
    std::string name;
    std::string axiom = "F";
    std::vector<std::pair<char, std::string>> productions;
};

// Fixed catalogue; index 0 is the classic F -> FF+[+F-F-F]-[-F+F+F] plant.
const std::vector<LSystemRule>& ruleCatalogue();

struct Expansion {
    std::string symbols;
    int  iterationsApplied = 0;
    bool capped = false;     // an iteration would have exceeded maxSymbols
};

// Rewrites the axiom `iterations` times. When an iteration would produce
// more than `maxSymbols` symbols the previous result is kept. Never throws
// on the cap.
Expansion expand(const LSystemRule& rule, int iterations, std::size_t maxSymbols);

struct TurtleParams {
    float angleDeg      = 25.0f;
    float spreadRollDeg = 137.5f; // applied on every '[' so siblings fan out in 3-D
    float segmentLength = 1.0f;
};

struct Segment {
    Vec3 start;
    Vec3 end;
    int  depth = 0; // bracket nesting level
};

struct TreeSkeleton {
    std::vector<Segment> segments;
    Vec3 boundsMin;
    Vec3 boundsMax;
    std::size_t symbolCount = 0;
    int iterations = 0;
    bool capped = false;

    [[nodiscard]] float height() const noexcept { return boundsMax.z - boundsMin.z; }
};

// F forward, +/- yaw, &/^ pitch, / and \ roll, [ push, ] pop.
// Unknown symbols and unbalanced ']' are ignored.
TreeSkeleton interpretTurtle(std::string_view symbols, const TurtleParams& params = {});

// Immutable skeletons shared between trees that use the same
// (rule, iterations). Thread-safe.
class SkeletonCache {
public:
    explicit SkeletonCache(std::size_t maxSymbols, TurtleParams turtle = {}) noexcept
        : maxSymbols_(maxSymbols), turtle_(turtle) {}

    std::shared_ptr<const TreeSkeleton> get(std::size_t ruleIndex, int iterations);

    [[nodiscard]] std::size_t size() const;
    [[nodiscard]] int capHits() const;

private:
    std::size_t maxSymbols_;
    TurtleParams turtle_;
    mutable std::mutex mutex_;
    std::map<std::pair<std::size_t, int>, std::shared_ptr<const TreeSkeleton>> cache_;
    int capHits_ = 0;
};

} // namespace fractal::worldgen
