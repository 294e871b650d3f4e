#pragma once

#include "metro/Config.hpp"
#include "metro/MapGrid.hpp"

#include <cstdint>
#include <optional>

namespace metro {

struct MapGenConfig {
  int width = 48;
  int height = 32;

  // When set, overrides the seeded river/archipelago coin flip. The flip is still
  // drawn so the rest of the random stream is the same either way.
  std::optional<MapType> forceType;

  // Hotspot tuning for the density fields.
  double hotspotFalloff = 12.0;

  // Upper bound for the sum of each density field over all land tiles.
  int densityCeiling = 50000;
};

// Dimensions and density tuning taken from the game config; no forced type.
MapGenConfig MapGenConfigFromGame(const GameConfig& cfg);

// Generate a complete map (terrain + residential/office densities) from a seed.
//
// Deterministic: the same seed and config always produce bit-identical tiles.
// The generator never re-rolls; ratio targets are reached by bounded iterative
// correction.
MapGrid GenerateMap(std::uint64_t seed, const MapGenConfig& cfg = {});

} // namespace metro
