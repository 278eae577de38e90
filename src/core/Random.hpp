// src/core/Random.hpp
#pragma once
#include <cstdint>
#include <iterator>
#include <string_view>
#include <utility>

#include "core/Hash.hpp"

namespace fractal::core {

// Minimal PCG32 RNG (O'Neill). 32-bit outputs, 64-bit state/stream.
struct Pcg32 {
  using result_type = std::uint32_t;

  std::uint64_t state = 0x853c49e6748fea9bULL;
  std::uint64_t inc   = 0xda3e39cb94b95bdbULL; // must be odd

  Pcg32() = default;
  explicit Pcg32(std::uint64_t seed, std::uint64_t seq = 1u) noexcept { seed_rng(seed, seq); }

  static constexpr result_type min() noexcept { return 0u; }
  static constexpr result_type max() noexcept { return 0xFFFFFFFFu; }

  // `seq` selects the stream; inc = (seq << 1) | 1 keeps it odd.
  inline void seed_rng(std::uint64_t seed, std::uint64_t seq = 1u) noexcept {
    state = 0u;
    inc   = (seq << 1u) | 1u;
    next();
    state += seed;
    next();
  }

  inline result_type next() noexcept {
    const std::uint64_t old = state;
    state = old * 6364136223846793005ULL + inc;
    const auto xorshifted = static_cast<std::uint32_t>(((old >> 18u) ^ old) >> 27u);
    const auto rot        = static_cast<std::uint32_t>(old >> 59u);
    return (xorshifted >> rot) | (xorshifted << ((-static_cast<std::int32_t>(rot)) & 31));
  }

  inline result_type operator()() noexcept { return next(); }

  // Uniform in [0, bound) without modulo bias.
  inline std::uint32_t next_bounded(std::uint32_t bound) noexcept {
    if (bound == 0u) return 0u;
    std::uint64_t m = static_cast<std::uint64_t>(next()) * static_cast<std::uint64_t>(bound);
    auto l = static_cast<std::uint32_t>(m);
    const std::uint32_t thresh = static_cast<std::uint32_t>(-bound) % bound;
    while (l < thresh) {
      m = static_cast<std::uint64_t>(next()) * static_cast<std::uint64_t>(bound);
      l = static_cast<std::uint32_t>(m);
    }
    return static_cast<std::uint32_t>(m >> 32);
  }

  // [0,1) from the top 24 bits.
  inline float next_float01() noexcept {
    const std::uint32_t v = next() >> 8;
    return static_cast<float>(static_cast<double>(v) * (1.0 / 16777216.0));
  }
};

// Deterministic randomness rooted in one 32-bit world seed.
//
// Substreams are derived from (root seed, name[, a, b]) only, never from the
// parent's consumed state, so adding or reordering draws in one stage does not
// perturb any other stage.
class SeededRandomStream {
public:
  using result_type = std::uint32_t;

  SeededRandomStream() : SeededRandomStream(0u) {}
  explicit SeededRandomStream(std::uint32_t rootSeed) noexcept
      : root_(rootSeed), key_(splitmix64(rootSeed)),
        rng_(splitmix64(key_ ^ 0x6a09e667f3bcc909ull), splitmix64(key_ ^ 0xbb67ae8584caa73bull)) {}

  [[nodiscard]] std::uint32_t rootSeed() const noexcept { return root_; }
  [[nodiscard]] std::uint64_t key() const noexcept { return key_; }

  [[nodiscard]] SeededRandomStream substream(std::string_view name) const noexcept {
    return SeededRandomStream(root_, hash_combine(key_, fnv1a64(name)));
  }
  [[nodiscard]] SeededRandomStream substream(std::string_view name, std::int64_t a, std::int64_t b = 0) const noexcept {
    const std::uint64_t k = hash_combine(hash_combine(key_, fnv1a64(name)), static_cast<std::uint64_t>(a));
    return SeededRandomStream(root_, hash_combine(k, static_cast<std::uint64_t>(b)));
  }

  static constexpr result_type min() noexcept { return Pcg32::min(); }
  static constexpr result_type max() noexcept { return Pcg32::max(); }
  result_type operator()() noexcept { return rng_.next(); }

  std::uint32_t nextU32() noexcept { return rng_.next(); }
  float uniform01() noexcept { return rng_.next_float01(); }
  float uniform(float lo, float hi) noexcept { return lo + (hi - lo) * rng_.next_float01(); }

  // Inclusive on both ends.
  int rangeInt(int lo, int hi) noexcept {
    if (hi <= lo) return lo;
    const auto span = static_cast<std::uint32_t>(static_cast<std::int64_t>(hi) - lo + 1);
    return lo + static_cast<int>(rng_.next_bounded(span));
  }

  bool chance(float p) noexcept {
    if (p <= 0.0f) return false;
    if (p >= 1.0f) return true;
    return uniform01() < p;
  }

  // Fisher-Yates with our own bounded draw; std::shuffle's use of the
  // engine is implementation-defined and would break cross-platform replay.
  template <class RandomIt>
  void shuffle(RandomIt first, RandomIt last) noexcept {
    const auto n = std::distance(first, last);
    for (auto i = n - 1; i > 0; --i) {
      const auto j = static_cast<decltype(i)>(rng_.next_bounded(static_cast<std::uint32_t>(i + 1)));
      using std::swap;
      swap(first[i], first[j]);
    }
  }

private:
  SeededRandomStream(std::uint32_t root, std::uint64_t key) noexcept
      : root_(root), key_(key),
        rng_(splitmix64(key ^ 0x6a09e667f3bcc909ull), splitmix64(key ^ 0xbb67ae8584caa73bull)) {}

  std::uint32_t root_ = 0;
  std::uint64_t key_  = 0;
  Pcg32         rng_;
};

} // namespace fractal::core
