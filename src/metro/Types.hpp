#pragma once

#include <cstdint>

namespace metro {

// Integer grid coordinate.
//
// Used both for tiles (unit squares carrying terrain) and for vertices (the grid
// intersections stations sit on). Vertex (x, y) is the top-left corner of tile (x, y).
struct Point {
  int x = 0;
  int y = 0;
};

inline bool operator==(const Point& a, const Point& b) { return a.x == b.x && a.y == b.y; }
inline bool operator!=(const Point& a, const Point& b) { return !(a == b); }

// Station ids are derived from the vertex (see MakeStationId); the others are
// allocated from monotonically increasing counters in GameState.
using StationId = std::uint32_t;
using LineId = std::uint32_t;
using TrainId = std::uint32_t;
using PassengerId = std::uint64_t;

} // namespace metro
