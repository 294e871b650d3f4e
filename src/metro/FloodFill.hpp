#pragma once

#include "metro/MapGrid.hpp"
#include "metro/Types.hpp"

#include <cstdint>
#include <vector>

namespace metro {

// Deterministic 4-connected flood fills over a MapGrid.
//
// Fills use an explicit stack and a fixed neighbor order (W, E, N, S), so the
// visit order of a given grid + start is stable across platforms.

struct FloodFillResult {
  int w = 0;
  int h = 0;

  // Flat array (size w*h). 1 => tile is part of the filled region.
  std::vector<std::uint8_t> mask;

  // Tiles of the region in visit order.
  std::vector<Point> tiles;
};

// Fill the connected region of tiles sharing the start tile's type.
FloodFillResult FloodFillRegion(const MapGrid& map, Point start);

// All connected components of the given tile type, in row-major order of their first tile.
std::vector<std::vector<Point>> FindComponents(const MapGrid& map, TileType type);

// Mask (size w*h) of water tiles reachable from any water tile on the map border.
std::vector<std::uint8_t> EdgeConnectedWaterMask(const MapGrid& map);

} // namespace metro
