#pragma once

#include "metro/Types.hpp"

#include <string>
#include <vector>

namespace metro {

struct Station {
  StationId id = 0;
  int vertexX = 0;
  int vertexY = 0;
  std::string label;

  // Passengers waiting here, in arrival order. Each id is also in GameState::passengers.
  std::vector<PassengerId> passengers;

  Point vertex() const { return Point{vertexX, vertexY}; }
};

// Identity is the vertex: two stations can never share one.
inline StationId MakeStationId(int vertexX, int vertexY)
{
  return (static_cast<StationId>(vertexX & 0xFFFF) << 16) | static_cast<StationId>(vertexY & 0xFFFF);
}

inline Point StationIdVertex(StationId id)
{
  return Point{static_cast<int>(id >> 16), static_cast<int>(id & 0xFFFFu)};
}

// Zero-padded "xxyy" display form, e.g. vertex (5, 12) -> "0512".
std::string FormatStationId(StationId id);

// A, B, ... Z, AA, AB, ... AZ, BA, ...
std::string GenerateStationLabel(int index);

Station MakeStation(int vertexX, int vertexY, const std::string& label = std::string());

} // namespace metro
