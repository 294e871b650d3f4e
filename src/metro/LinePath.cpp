#include "metro/LinePath.hpp"

#include "metro/GameState.hpp"

#include <algorithm>
#include <cmath>
#include <cstdlib>
#include <utility>

namespace metro {

namespace {

constexpr double kPi = 3.14159265358979323846;

int Sign(int v) { return (v > 0) - (v < 0); }

Direction Opposite(Direction d)
{
  return static_cast<Direction>((static_cast<int>(d) + 180) % 360);
}

Waypoint MakeWaypoint(int x, int y, WaypointType type, std::optional<Direction> in, std::optional<Direction> out)
{
  Waypoint w;
  w.x = x;
  w.y = y;
  w.type = type;
  w.incomingAngle = in;
  w.outgoingAngle = out;
  return w;
}

} // namespace

DirectionVector DirectionToVector(Direction d)
{
  switch (d) {
  case Direction::East: return {1, 0};
  case Direction::SouthEast: return {1, 1};
  case Direction::South: return {0, 1};
  case Direction::SouthWest: return {-1, 1};
  case Direction::West: return {-1, 0};
  case Direction::NorthWest: return {-1, -1};
  case Direction::North: return {0, -1};
  case Direction::NorthEast: return {1, -1};
  }
  return {1, 0};
}

Direction DirectionFromDelta(int dx, int dy)
{
  const int sx = Sign(dx);
  const int sy = Sign(dy);
  if (sx > 0 && sy == 0) return Direction::East;
  if (sx > 0 && sy > 0) return Direction::SouthEast;
  if (sx == 0 && sy > 0) return Direction::South;
  if (sx < 0 && sy > 0) return Direction::SouthWest;
  if (sx < 0 && sy == 0) return Direction::West;
  if (sx < 0 && sy < 0) return Direction::NorthWest;
  if (sx == 0 && sy < 0) return Direction::North;
  if (sx > 0 && sy < 0) return Direction::NorthEast;
  return Direction::East;
}

Direction SnapAngle(Point from, Point to)
{
  const double raw = std::atan2(static_cast<double>(to.y - from.y), static_cast<double>(to.x - from.x)) * 180.0 / kPi;

  // Candidates in the atan2 range; first strictly-closer wins, so exact ties keep the earlier one.
  static const int kCandidates[] = {0, 45, 90, 135, 180, -180, -135, -90, -45};
  int best = kCandidates[0];
  double bestDiff = std::fabs(raw - best);
  for (int c : kCandidates) {
    const double diff = std::fabs(raw - c);
    if (diff < bestDiff) {
      bestDiff = diff;
      best = c;
    }
  }

  const int norm = ((best % 360) + 360) % 360;
  return static_cast<Direction>(norm);
}

int DeflectionAngle(Direction a, Direction b)
{
  const int d = std::abs(static_cast<int>(a) - static_cast<int>(b)) % 360;
  return std::min(d, 360 - d);
}

LineSegment ComputeSegmentPath(Point from, Point to, std::optional<Direction> nextLeg)
{
  LineSegment seg;
  const int dx = to.x - from.x;
  const int dy = to.y - from.y;
  const int adx = std::abs(dx);
  const int ady = std::abs(dy);

  if (dx == 0 && dy == 0) {
    seg.waypoints.push_back(MakeWaypoint(from.x, from.y, WaypointType::Station, std::nullopt, std::nullopt));
    return seg;
  }

  // Horizontal, vertical or a perfect diagonal: straight run.
  if (adx == 0 || ady == 0 || adx == ady) {
    const Direction dir = DirectionFromDelta(dx, dy);
    seg.entryAngle = dir;
    seg.exitAngle = dir;
    seg.waypoints.push_back(MakeWaypoint(from.x, from.y, WaypointType::Station, std::nullopt, dir));
    seg.waypoints.push_back(MakeWaypoint(to.x, to.y, WaypointType::Station, dir, std::nullopt));
    return seg;
  }

  const int sx = Sign(dx);
  const int sy = Sign(dy);
  const Direction diagonal = DirectionFromDelta(sx, sy);
  const Direction straight = (adx > ady) ? DirectionFromDelta(sx, 0) : DirectionFromDelta(0, sy);

  // Diagonal-first exits straight; straight-first exits diagonally.
  bool diagonalFirst = true;
  if (nextLeg) {
    const int defDiagFirst = DeflectionAngle(straight, *nextLeg);
    const int defStraightFirst = DeflectionAngle(diagonal, *nextLeg);
    diagonalFirst = defDiagFirst <= defStraightFirst;
  }

  Point knee;
  Direction first;
  Direction second;
  if (diagonalFirst) {
    const int diag = std::min(adx, ady);
    knee = Point{from.x + sx * diag, from.y + sy * diag};
    first = diagonal;
    second = straight;
  } else {
    if (adx > ady) {
      knee = Point{from.x + sx * (adx - ady), from.y};
    } else {
      knee = Point{from.x, from.y + sy * (ady - adx)};
    }
    first = straight;
    second = diagonal;
  }

  seg.entryAngle = first;
  seg.exitAngle = second;
  seg.waypoints.push_back(MakeWaypoint(from.x, from.y, WaypointType::Station, std::nullopt, first));
  seg.waypoints.push_back(MakeWaypoint(knee.x, knee.y, WaypointType::Bend, first, second));
  seg.waypoints.push_back(MakeWaypoint(to.x, to.y, WaypointType::Station, second, std::nullopt));
  return seg;
}

double SegmentLength(const LineSegment& seg)
{
  double len = 0.0;
  for (std::size_t i = 1; i < seg.waypoints.size(); ++i) {
    const Waypoint& a = seg.waypoints[i - 1];
    const Waypoint& b = seg.waypoints[i];
    len += std::hypot(static_cast<double>(b.x - a.x), static_cast<double>(b.y - a.y));
  }
  return len;
}

void ReverseSegment(LineSegment& seg)
{
  std::reverse(seg.waypoints.begin(), seg.waypoints.end());
  for (Waypoint& w : seg.waypoints) {
    const std::optional<Direction> in = w.incomingAngle;
    const std::optional<Direction> out = w.outgoingAngle;
    w.incomingAngle = out ? std::optional<Direction>(Opposite(*out)) : std::nullopt;
    w.outgoingAngle = in ? std::optional<Direction>(Opposite(*in)) : std::nullopt;
  }

  std::swap(seg.fromStation, seg.toStation);
  const Direction entry = seg.entryAngle;
  seg.entryAngle = Opposite(seg.exitAngle);
  seg.exitAngle = Opposite(entry);
}

std::optional<LineSegment> ComputeLineSegment(const GameState& state, const MetroLine& line, int idxA, int idxB)
{
  const int count = static_cast<int>(line.stationIds.size());
  if (idxA < 0 || idxB < 0 || idxA >= count || idxB >= count) return std::nullopt;

  const StationId idA = line.stationIds[static_cast<std::size_t>(idxA)];
  const StationId idB = line.stationIds[static_cast<std::size_t>(idxB)];
  const Station* a = FindStation(state, idA);
  const Station* b = FindStation(state, idB);
  if (!a || !b) return std::nullopt;

  if (idA == idB) {
    LineSegment seg;
    seg.fromStation = idA;
    seg.toStation = idB;
    seg.waypoints.push_back(MakeWaypoint(a->vertexX, a->vertexY, WaypointType::Station, std::nullopt, std::nullopt));
    return seg;
  }

  const int lo = std::min(idxA, idxB);
  const int hi = std::max(idxA, idxB);
  const Station* from = (lo == idxA) ? a : b;
  const Station* to = (hi == idxB) ? b : a;

  std::optional<Direction> hint;
  if (hi + 1 < count) {
    if (const Station* after = FindStation(state, line.stationIds[static_cast<std::size_t>(hi + 1)])) {
      hint = SnapAngle(to->vertex(), after->vertex());
    }
  }

  LineSegment seg = ComputeSegmentPath(from->vertex(), to->vertex(), hint);
  seg.fromStation = from->id;
  seg.toStation = to->id;
  if (idxA > idxB) ReverseSegment(seg);
  return seg;
}

std::vector<LineSegment> BuildLinePath(const GameState& state, const MetroLine& line)
{
  std::vector<LineSegment> out;
  for (std::size_t i = 1; i < line.stationIds.size(); ++i) {
    std::optional<LineSegment> seg = ComputeLineSegment(state, line, static_cast<int>(i - 1), static_cast<int>(i));
    if (seg) out.push_back(std::move(*seg));
  }
  return out;
}

double LinePathLength(const GameState& state, const MetroLine& line)
{
  double total = 0.0;
  for (const LineSegment& seg : BuildLinePath(state, line)) total += SegmentLength(seg);
  return total;
}

} // namespace metro
