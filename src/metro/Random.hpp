#pragma once

#include <cstdint>

namespace metro {

// One SplitMix64 step: advances `state` and returns the mixed output.
inline std::uint64_t SplitMix64Next(std::uint64_t& state)
{
  std::uint64_t z = (state += 0x9E3779B97F4A7C15ULL);
  z = (z ^ (z >> 30)) * 0xBF58476D1CE4E5B9ULL;
  z = (z ^ (z >> 27)) * 0x94D049BB133111EBULL;
  return z ^ (z >> 31);
}

// Seeded random source used by map generation and passenger spawning.
//
// The state is a single word so GameState can persist it and a loaded game
// continues the exact same stream.
struct RNG {
  static constexpr std::uint64_t kDefaultState = 0x4D45545230434F52ULL; // "METR0COR"

  std::uint64_t state = kDefaultState;

  RNG() = default;
  explicit RNG(std::uint64_t seed) : state(seed ? seed : kDefaultState) {}

  std::uint64_t nextU64() { return SplitMix64Next(state); }

  // Uniform in [0, 1) with 53 bits of precision.
  double nextF01() { return static_cast<double>(nextU64() >> 11) * 0x1.0p-53; }

  // Uniform in [lo, hi]; returns lo when hi <= lo.
  int rangeInt(int lo, int hi)
  {
    if (hi <= lo) return lo;
    const std::uint64_t span = static_cast<std::uint64_t>(static_cast<std::int64_t>(hi) - lo) + 1u;
    // Reject the short tail so every value is equally likely.
    const std::uint64_t limit = UINT64_MAX - (UINT64_MAX % span);
    std::uint64_t r = nextU64();
    while (r >= limit) r = nextU64();
    return static_cast<int>(lo + static_cast<std::int64_t>(r % span));
  }

  double rangeFloat(double lo, double hi) { return lo + (hi - lo) * nextF01(); }

  bool chance(double p) { return nextF01() < p; }
};

// Independent stream seed for a subsystem (salt names the subsystem).
inline std::uint64_t DeriveSeed(std::uint64_t base, std::uint64_t salt)
{
  std::uint64_t s = base ^ (salt * 0x9E3779B97F4A7C15ULL);
  return SplitMix64Next(s);
}

} // namespace metro
