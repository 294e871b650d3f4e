#pragma once

#include <cstdint>

namespace metro {

class MapGrid;
struct GameState;

// Stable 64-bit FNV-1a hashes of simulation state, independent of host endianness.
//
// Used by determinism tests and tool output. Values are not a stable contract
// across format changes; compare two runs of the same build.

std::uint64_t HashMap(const MapGrid& map);

// Map + stations + lines + trains + passengers + clock/money/rng.
std::uint64_t HashGameState(const GameState& state);

} // namespace metro
