#pragma once

#include "metro/Types.hpp"

#include <cstdint>
#include <optional>
#include <vector>

namespace metro {

struct GameState;
struct MetroLine;

// Octilinear line routing.
//
// Lines only run horizontally, vertically or at 45 degrees. A segment between
// two stations is either a straight run (2 waypoints) or a run with a single
// "knee" bend (3 waypoints). Angles are screen-space degrees: y grows downward,
// so 90 is south.

enum class Direction : std::uint16_t {
  East = 0,
  SouthEast = 45,
  South = 90,
  SouthWest = 135,
  West = 180,
  NorthWest = 225,
  North = 270,
  NorthEast = 315,
};

struct DirectionVector {
  int dx = 0;
  int dy = 0;
};

DirectionVector DirectionToVector(Direction d);

// Direction from the signs of (dx, dy). (0, 0) maps to East.
Direction DirectionFromDelta(int dx, int dy);

// Angle from `from` to `to` snapped to the nearest 45 degrees.
Direction SnapAngle(Point from, Point to);

// Bend angle between two travel directions: 0 = straight through, 180 = U-turn.
int DeflectionAngle(Direction a, Direction b);

enum class WaypointType : std::uint8_t {
  Station = 0,
  Bend = 1,
};

struct Waypoint {
  int x = 0;
  int y = 0;
  WaypointType type = WaypointType::Station;
  std::optional<Direction> incomingAngle;
  std::optional<Direction> outgoingAngle;
};

struct LineSegment {
  StationId fromStation = 0;
  StationId toStation = 0;
  Direction entryAngle = Direction::East;
  Direction exitAngle = Direction::East;
  std::vector<Waypoint> waypoints;
};

// Route a segment from `from` to `to`.
//
// For unaligned stations the knee is placed either diagonal-first or
// straight-first, whichever exits with the smaller deflection against
// `nextLeg` (the direction the line continues in after `to`). Without a hint,
// or on a tie, diagonal-first wins.
LineSegment ComputeSegmentPath(Point from, Point to, std::optional<Direction> nextLeg = std::nullopt);

// Euclidean length along the waypoints. Zero for single-waypoint segments.
double SegmentLength(const LineSegment& seg);

// Reverse a segment in place (waypoints, angles and endpoints).
void ReverseSegment(LineSegment& seg);

// The canonical path between stations `idxA` and `idxB` (adjacent indices, or the
// wrap pair of a loop) of a line. The segment is always computed from the lower to
// the higher index, with the station after the higher index as lookahead, then
// reversed when idxA > idxB. Identical station ids give a single-waypoint,
// zero-length segment.
//
// Returns nullopt when an index is out of range or a station is missing.
std::optional<LineSegment> ComputeLineSegment(const GameState& state, const MetroLine& line, int idxA, int idxB);

// The as-built polyline of a whole line: one segment per consecutive station pair.
std::vector<LineSegment> BuildLinePath(const GameState& state, const MetroLine& line);

// Sum of SegmentLength over BuildLinePath.
double LinePathLength(const GameState& state, const MetroLine& line);

} // namespace metro
