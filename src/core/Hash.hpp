// src/core/Hash.hpp
#pragma once
#include <cstddef>
#include <cstdint>
#include <string_view>

namespace fractal::core {

// Public-domain style SplitMix64 mixer (Sebastiano Vigna).
// Good for seeding other RNGs; *not* a stream RNG by itself.
constexpr inline std::uint64_t splitmix64(std::uint64_t x) noexcept {
    x += 0x9e3779b97f4a7c15ull;
    x = (x ^ (x >> 30)) * 0xbf58476d1ce4e5b9ull;
    x = (x ^ (x >> 27)) * 0x94d049bb133111ebull;
    return x ^ (x >> 31);
}

// 64-bit FNV-1a. Stable across platforms and standard libraries,
// unlike std::hash, so it is safe to feed into seeds.
constexpr inline std::uint64_t fnv1a64(std::string_view s) noexcept {
    std::uint64_t h = 14695981039346656037ull;
    for (char c : s) {
        h ^= static_cast<std::uint64_t>(static_cast<unsigned char>(c));
        h *= 1099511628211ull;
    }
    return h;
}

// Order-dependent combination of several keys into one well-mixed word.
constexpr inline std::uint64_t hash_combine(std::uint64_t a, std::uint64_t b) noexcept {
    return splitmix64(a ^ (splitmix64(b) + 0x9e3779b97f4a7c15ull + (a << 6) + (a >> 2)));
}

constexpr inline std::uint64_t hash_cell(std::uint64_t seed, int x, int y) noexcept {
    const std::uint64_t xy = (static_cast<std::uint64_t>(static_cast<std::uint32_t>(x)) << 32)
                           | static_cast<std::uint32_t>(y);
    return hash_combine(seed, xy);
}

// Map the top 24 bits of a hash to [0,1).
constexpr inline float hash_to_unit(std::uint64_t h) noexcept {
    return static_cast<float>(static_cast<double>(h >> 40) * (1.0 / 16777216.0));
}

} // namespace fractal::core
