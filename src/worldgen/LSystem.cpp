// src/worldgen/LSystem.cpp
#include "worldgen/LSystem.hpp"

#include <algorithm>
#include <cmath>
#include <stdexcept>

namespace fractal::worldgen {

const std::vector<LSystemRule>& ruleCatalogue()
{
    static const std::vector<LSystemRule> rules = {
        {"classic", "F", {{'F', "FF+[+F-F-F]-[-F+F+F]"}}},
        {"conifer", "F", {{'F', "F[&+F][&-F]F[^/F]"}}},
        {"willow",  "F", {{'F', "FF[&F][^\\F][+&F]"}}},
    };
    return rules;
}

namespace {

const std::string* productionFor(const LSystemRule& rule, char c) noexcept
{
    for (const auto& p : rule.productions)
        if (p.first == c) return &p.second;
    return nullptr;
}

std::size_t rewrittenLength(const LSystemRule& rule, std::string_view s) noexcept
{
    std::size_t n = 0;
    for (char c : s) {
        const std::string* p = productionFor(rule, c);
        n += p ? p->size() : 1;
    }
    return n;
}

struct Turtle {
    Vec3 pos{0.0f, 0.0f, 0.0f};
    Vec3 heading{0.0f, 0.0f, 1.0f};
    Vec3 left{-1.0f, 0.0f, 0.0f};
    Vec3 up{0.0f, 1.0f, 0.0f};
};

// Rotates `a` towards `b` by `rad` in the plane they span.
void rotatePair(Vec3& a, Vec3& b, float rad) noexcept
{
    const float c = std::cos(rad), s = std::sin(rad);
    const Vec3 na = a * c + b * s;
    const Vec3 nb = b * c - a * s;
    a = na;
    b = nb;
}

} // namespace

Expansion expand(const LSystemRule& rule, int iterations, std::size_t maxSymbols)
{
    Expansion out;
    out.symbols = rule.axiom;
    if (out.symbols.size() > maxSymbols) {
        out.symbols.resize(maxSymbols);
        out.capped = true;
        return out;
    }

    for (int i = 0; i < iterations; ++i) {
        // Size the next generation first so an oversized one is never built.
        const std::size_t next = rewrittenLength(rule, out.symbols);
        if (next > maxSymbols) {
            out.capped = true;
            break;
        }
        std::string s;
        s.reserve(next);
        for (char c : out.symbols) {
            if (const std::string* p = productionFor(rule, c)) s += *p;
            else s.push_back(c);
        }
        out.symbols = std::move(s);
        ++out.iterationsApplied;
    }
    return out;
}

TreeSkeleton interpretTurtle(std::string_view symbols, const TurtleParams& params)
{
    TreeSkeleton sk;
    sk.symbolCount = symbols.size();

    const float a = radians(params.angleDeg);
    const float spread = radians(params.spreadRollDeg);

    Turtle t;
    std::vector<Turtle> stack;
    sk.boundsMin = sk.boundsMax = t.pos;

    auto grow = [&](Vec3 p) {
        sk.boundsMin = Vec3{std::min(sk.boundsMin.x, p.x), std::min(sk.boundsMin.y, p.y), std::min(sk.boundsMin.z, p.z)};
        sk.boundsMax = Vec3{std::max(sk.boundsMax.x, p.x), std::max(sk.boundsMax.y, p.y), std::max(sk.boundsMax.z, p.z)};
    };

    for (char c : symbols) {
        switch (c) {
        case 'F': {
            const Vec3 end = t.pos + t.heading * params.segmentLength;
            sk.segments.push_back(Segment{t.pos, end, static_cast<int>(stack.size())});
            t.pos = end;
            grow(end);
            break;
        }
        case '+':  rotatePair(t.heading, t.left,  a); break;
        case '-':  rotatePair(t.heading, t.left, -a); break;
        case '&':  rotatePair(t.heading, t.up,   -a); break;
        case '^':  rotatePair(t.heading, t.up,    a); break;
        case '/':  rotatePair(t.left,    t.up,    a); break;
        case '\\': rotatePair(t.left,    t.up,   -a); break;
        case '[':
            stack.push_back(t);
            rotatePair(t.left, t.up, spread);
            break;
        case ']':
            if (!stack.empty()) {
                t = stack.back();
                stack.pop_back();
            }
            break;
        default:
            break;
        }
    }
    return sk;
}

std::shared_ptr<const TreeSkeleton> SkeletonCache::get(std::size_t ruleIndex, int iterations)
{
    const auto& rules = ruleCatalogue();
    if (ruleIndex >= rules.size())
        throw std::out_of_range("SkeletonCache: unknown L-system rule " + std::to_string(ruleIndex));

    std::lock_guard<std::mutex> lock(mutex_);
    const auto key = std::make_pair(ruleIndex, iterations);
    if (auto it = cache_.find(key); it != cache_.end())
        return it->second;

    const Expansion ex = expand(rules[ruleIndex], iterations, maxSymbols_);
    auto sk = std::make_shared<TreeSkeleton>(interpretTurtle(ex.symbols, turtle_));
    sk->iterations = ex.iterationsApplied;
    sk->capped = ex.capped;
    if (ex.capped) ++capHits_;

    std::shared_ptr<const TreeSkeleton> shared = std::move(sk);
    cache_.emplace(key, shared);
    return shared;
}

std::size_t SkeletonCache::size() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return cache_.size();
}

int SkeletonCache::capHits() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return capHits_;
}

} // namespace fractal::worldgen
