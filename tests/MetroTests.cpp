#include "metro/ConfigIO.hpp"
#include "metro/Economics.hpp"
#include "metro/FloodFill.hpp"
#include "metro/GameController.hpp"
#include "metro/GameState.hpp"
#include "metro/Hash.hpp"
#include "metro/Json.hpp"
#include "metro/LineManager.hpp"
#include "metro/LinePath.hpp"
#include "metro/Log.hpp"
#include "metro/MapGen.hpp"
#include "metro/PassengerMovement.hpp"
#include "metro/PassengerSpawner.hpp"
#include "metro/Persistence.hpp"
#include "metro/Random.hpp"
#include "metro/SaveLoad.hpp"
#include "metro/ScriptRunner.hpp"
#include "metro/StationGraph.hpp"
#include "metro/StationManager.hpp"
#include "metro/TrainManager.hpp"
#include "metro/TrainMovement.hpp"

#include <chrono>
#include <cmath>
#include <cstdint>
#include <filesystem>
#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>

namespace fs = std::filesystem;

static int g_failures = 0;

#define EXPECT_TRUE(cond)                                                                                            \
  do {                                                                                                               \
    if (!(cond)) {                                                                                                   \
      ++g_failures;                                                                                                  \
      std::cerr << __FILE__ << ":" << __LINE__ << " EXPECT_TRUE failed: " << #cond << "\n";                          \
    }                                                                                                                \
  } while (0)

#define EXPECT_FALSE(cond) EXPECT_TRUE(!(cond))

#define EXPECT_EQ(a, b)                                                                                              \
  do {                                                                                                               \
    const auto _a = (a);                                                                                             \
    const auto _b = (b);                                                                                             \
    if (!(_a == _b)) {                                                                                               \
      ++g_failures;                                                                                                  \
      std::cerr << __FILE__ << ":" << __LINE__ << " EXPECT_EQ failed: " << #a << " == " << #b << "\n";              \
    }                                                                                                                \
  } while (0)

#define EXPECT_NE(a, b)                                                                                              \
  do {                                                                                                               \
    const auto _a = (a);                                                                                             \
    const auto _b = (b);                                                                                             \
    if ((_a == _b)) {                                                                                                \
      ++g_failures;                                                                                                  \
      std::cerr << __FILE__ << ":" << __LINE__ << " EXPECT_NE failed: " << #a << " != " << #b << "\n";              \
    }                                                                                                                \
  } while (0)

#define EXPECT_NEAR(a, b, eps)                                                                                        \
  do {                                                                                                               \
    const auto _a = (a);                                                                                             \
    const auto _b = (b);                                                                                             \
    const auto _e = (eps);                                                                                           \
    if (std::fabs((_a) - (_b)) > (_e)) {                                                                             \
      ++g_failures;                                                                                                  \
      std::cerr << __FILE__ << ":" << __LINE__ << " EXPECT_NEAR failed: " << #a << " ~= " << #b << " (eps=" << _e   \
                << ")\n";                                                                                            \
    }                                                                                                                \
  } while (0)

#define ASSERT_TRUE(cond)                                                                                            \
  do {                                                                                                               \
    if (!(cond)) {                                                                                                   \
      ++g_failures;                                                                                                  \
      std::cerr << __FILE__ << ":" << __LINE__ << " ASSERT_TRUE failed: " << #cond << "\n";                          \
      return;                                                                                                        \
    }                                                                                                                \
  } while (0)

namespace {

using namespace metro;

fs::path MakeTempPath(const std::string& prefix)
{
  static std::uint64_t counter = 0;
  ++counter;

  std::error_code ec;
  fs::path root = fs::temp_directory_path(ec);
  if (ec || root.empty()) root = fs::path(".");

  const auto stamp = static_cast<std::uint64_t>(
    std::chrono::high_resolution_clock::now().time_since_epoch().count());
  return root / (prefix + "_" + std::to_string(stamp) + "_" + std::to_string(counter));
}

// All-land map with uniform densities.
MapGrid LandMap(int w, int h, int residential = 0, int office = 0)
{
  MapGrid m(w, h, 1, TileType::Land);
  for (int y = 0; y < h; ++y) {
    for (int x = 0; x < w; ++x) {
      m.at(x, y).residentialDensity = static_cast<std::uint8_t>(residential);
      m.at(x, y).officeDensity = static_cast<std::uint8_t>(office);
    }
  }
  return m;
}

StationId AddStation(GameState& s, int x, int y)
{
  s.stations.push_back(MakeStation(x, y, GenerateStationLabel(static_cast<int>(s.stations.size()))));
  return s.stations.back().id;
}

MetroLine& AddLine(GameState& s, LineColor color, const std::vector<StationId>& ids)
{
  MetroLine l;
  l.id = s.nextLineId++;
  l.color = color;
  l.stationIds = ids;
  l.isLoop = IsLineLoop(ids);
  s.lines.push_back(l);
  return s.lines.back();
}

PassengerId AddWaitingPassenger(GameState& s, const std::vector<StationId>& path)
{
  Passenger p;
  p.id = s.nextPassengerId++;
  p.sourceStationId = path.front();
  p.destinationStationId = path.back();
  p.spawnTime = s.simulationTime;
  p.path = path;
  p.nextWaypointIndex = 1;
  p.currentStationId = path.front();
  FindStation(s, path.front())->passengers.push_back(p.id);
  s.passengers.emplace(p.id, p);
  return p.id;
}

bool InvariantsHold(const GameState& s)
{
  std::string err;
  if (CheckPassengerInvariants(s, err)) return true;
  std::cerr << "  invariant violated: " << err << "\n";
  return false;
}

bool WaterTouchesOppositeEdges(const MapGrid& map)
{
  for (const std::vector<Point>& comp : FindComponents(map, TileType::Water)) {
    bool left = false;
    bool right = false;
    bool top = false;
    bool bottom = false;
    for (const Point& p : comp) {
      left = left || p.x == 0;
      right = right || p.x == map.width() - 1;
      top = top || p.y == 0;
      bottom = bottom || p.y == map.height() - 1;
    }
    if ((left && right) || (top && bottom)) return true;
  }
  return false;
}

void TestRngDeterminism()
{
  RNG a(42);
  RNG b(42);
  for (int i = 0; i < 100; ++i) EXPECT_EQ(a.nextU64(), b.nextU64());

  // Zero seeds fall back to the default stream.
  EXPECT_EQ(RNG(0).state, RNG().state);

  RNG r(7);
  for (int i = 0; i < 1000; ++i) {
    const int v = r.rangeInt(-3, 4);
    EXPECT_TRUE(v >= -3 && v <= 4);
    const double f = r.nextF01();
    EXPECT_TRUE(f >= 0.0 && f < 1.0);
  }
  EXPECT_EQ(r.rangeInt(5, 5), 5);
  EXPECT_EQ(r.rangeInt(9, 2), 9);

  EXPECT_NE(DeriveSeed(1, 2), DeriveSeed(1, 3));
  EXPECT_EQ(DeriveSeed(11, 0x50415353u), DeriveSeed(11, 0x50415353u));
}

void TestMapGenerationDeterministic()
{
  const MapGrid a = GenerateMap(1234);
  const MapGrid b = GenerateMap(1234);
  EXPECT_EQ(a.width(), 48);
  EXPECT_EQ(a.height(), 32);
  EXPECT_EQ(HashMap(a), HashMap(b));
  EXPECT_EQ(a.mapType(), b.mapType());

  bool identical = a.tiles().size() == b.tiles().size();
  for (std::size_t i = 0; identical && i < a.tiles().size(); ++i) {
    const Tile& ta = a.tiles()[i];
    const Tile& tb = b.tiles()[i];
    identical = ta.type == tb.type && ta.residentialDensity == tb.residentialDensity &&
                ta.officeDensity == tb.officeDensity;
  }
  EXPECT_TRUE(identical);

  EXPECT_NE(HashMap(GenerateMap(1234)), HashMap(GenerateMap(1235)));

  // Forcing the type keeps the rest of the stream: forcing the type the coin
  // flip picked anyway reproduces the unforced map.
  MapGenConfig forced;
  forced.forceType = a.mapType();
  EXPECT_EQ(HashMap(GenerateMap(1234, forced)), HashMap(a));
}

void TestRiverMapShape()
{
  MapGenConfig cfg;
  cfg.forceType = MapType::River;
  const MapGrid map = GenerateMap(42, cfg);

  EXPECT_EQ(map.mapType(), MapType::River);
  EXPECT_TRUE(map.landRatio() >= 0.5);
  EXPECT_TRUE(map.countTiles(TileType::Water) > 0);
  EXPECT_TRUE(WaterTouchesOppositeEdges(map));

  for (std::uint64_t seed = 1; seed <= 6; ++seed) {
    const MapGrid m = GenerateMap(seed, cfg);
    EXPECT_TRUE(WaterTouchesOppositeEdges(m));
  }
}

void TestArchipelagoHasNoLakes()
{
  MapGenConfig cfg;
  cfg.forceType = MapType::Archipelago;

  for (std::uint64_t seed = 1; seed <= 5; ++seed) {
    const MapGrid map = GenerateMap(seed, cfg);
    EXPECT_EQ(map.mapType(), MapType::Archipelago);
    EXPECT_TRUE(map.landRatio() > 0.4);
    EXPECT_TRUE(map.countTiles(TileType::Water) > 0);

    const std::vector<std::uint8_t> edge = EdgeConnectedWaterMask(map);
    int lakeTiles = 0;
    for (int y = 0; y < map.height(); ++y) {
      for (int x = 0; x < map.width(); ++x) {
        const std::size_t i = static_cast<std::size_t>(y) * static_cast<std::size_t>(map.width()) +
                              static_cast<std::size_t>(x);
        if (map.isWater(x, y) && !edge[i]) ++lakeTiles;
      }
    }
    EXPECT_EQ(lakeTiles, 0);
  }
}

void TestDensityFields()
{
  for (std::uint64_t seed = 3; seed <= 6; ++seed) {
    const MapGrid map = GenerateMap(seed);
    long long home = 0;
    long long office = 0;
    bool inRange = true;
    bool dryWater = true;
    for (const Tile& t : map.tiles()) {
      inRange = inRange && t.residentialDensity <= 99 && t.officeDensity <= 99;
      if (t.type == TileType::Water) dryWater = dryWater && t.residentialDensity == 0 && t.officeDensity == 0;
      home += t.residentialDensity;
      office += t.officeDensity;
    }
    EXPECT_TRUE(inRange);
    EXPECT_TRUE(dryWater);
    EXPECT_TRUE(home <= 50000);
    EXPECT_TRUE(office <= 50000);
  }

  MapGenConfig tight;
  tight.densityCeiling = 1000;
  const MapGrid map = GenerateMap(5, tight);
  long long home = 0;
  long long office = 0;
  for (const Tile& t : map.tiles()) {
    home += t.residentialDensity;
    office += t.officeDensity;
  }
  EXPECT_TRUE(home <= 1000);
  EXPECT_TRUE(office <= 1000);

  // Density never changes terrain.
  EXPECT_EQ(map.countTiles(TileType::Water), GenerateMap(5).countTiles(TileType::Water));
}

void TestFloodFillComponents()
{
  // Two land islands separated by a water column.
  MapGrid m = LandMap(5, 3);
  for (int y = 0; y < 3; ++y) m.at(2, y).type = TileType::Water;
  m.at(4, 2).type = TileType::Water;

  const std::vector<std::vector<Point>> land = FindComponents(m, TileType::Land);
  ASSERT_TRUE(land.size() == 2);
  EXPECT_EQ(land[0].size(), static_cast<std::size_t>(6));
  EXPECT_EQ(land[1].size(), static_cast<std::size_t>(5));

  const FloodFillResult r = FloodFillRegion(m, Point{0, 0});
  EXPECT_EQ(r.tiles.size(), static_cast<std::size_t>(6));
  EXPECT_EQ(r.mask[static_cast<std::size_t>(1 * 5 + 1)], static_cast<std::uint8_t>(1));
  EXPECT_EQ(r.mask[static_cast<std::size_t>(1 * 5 + 3)], static_cast<std::uint8_t>(0));

  // Enclosed water is not edge connected.
  MapGrid lake = LandMap(5, 5);
  lake.at(2, 2).type = TileType::Water;
  lake.at(0, 4).type = TileType::Water;
  const std::vector<std::uint8_t> edge = EdgeConnectedWaterMask(lake);
  EXPECT_EQ(edge[static_cast<std::size_t>(2 * 5 + 2)], static_cast<std::uint8_t>(0));
  EXPECT_EQ(edge[static_cast<std::size_t>(4 * 5 + 0)], static_cast<std::uint8_t>(1));
}

void TestOctilinearSegments()
{
  const double diag = std::sqrt(2.0);

  const Direction all[] = {Direction::East,  Direction::SouthEast, Direction::South, Direction::SouthWest,
                           Direction::West,  Direction::NorthWest, Direction::North, Direction::NorthEast};
  for (Direction d : all) {
    const DirectionVector v = DirectionToVector(d);
    EXPECT_EQ(DirectionFromDelta(v.dx * 3, v.dy * 3), d);
  }
  EXPECT_EQ(DeflectionAngle(Direction::East, Direction::East), 0);
  EXPECT_EQ(DeflectionAngle(Direction::NorthEast, Direction::East), 45);
  EXPECT_EQ(DeflectionAngle(Direction::West, Direction::East), 180);

  const LineSegment straight = ComputeSegmentPath(Point{0, 0}, Point{3, 0});
  EXPECT_EQ(straight.waypoints.size(), static_cast<std::size_t>(2));
  EXPECT_NEAR(SegmentLength(straight), 3.0, 1e-12);
  EXPECT_EQ(straight.entryAngle, Direction::East);

  const LineSegment diagonal = ComputeSegmentPath(Point{0, 0}, Point{2, 2});
  EXPECT_EQ(diagonal.waypoints.size(), static_cast<std::size_t>(2));
  EXPECT_EQ(diagonal.entryAngle, Direction::SouthEast);
  EXPECT_NEAR(SegmentLength(diagonal), 2.0 * diag, 1e-12);

  // Unaligned: diagonal first by default.
  const LineSegment knee = ComputeSegmentPath(Point{0, 0}, Point{4, 2});
  ASSERT_TRUE(knee.waypoints.size() == 3);
  EXPECT_EQ(knee.waypoints[1].x, 2);
  EXPECT_EQ(knee.waypoints[1].y, 2);
  EXPECT_EQ(knee.waypoints[1].type, WaypointType::Bend);
  EXPECT_EQ(knee.entryAngle, Direction::SouthEast);
  EXPECT_EQ(knee.exitAngle, Direction::East);
  EXPECT_NEAR(SegmentLength(knee), 2.0 * diag + 2.0, 1e-12);

  // A south-east continuation prefers exiting diagonally.
  const LineSegment hinted = ComputeSegmentPath(Point{0, 0}, Point{4, 2}, Direction::SouthEast);
  ASSERT_TRUE(hinted.waypoints.size() == 3);
  EXPECT_EQ(hinted.waypoints[1].x, 2);
  EXPECT_EQ(hinted.waypoints[1].y, 0);
  EXPECT_EQ(hinted.exitAngle, Direction::SouthEast);
  EXPECT_NEAR(SegmentLength(hinted), SegmentLength(knee), 1e-12);

  // An eastward continuation keeps diagonal-first.
  const LineSegment tie = ComputeSegmentPath(Point{0, 0}, Point{4, 2}, Direction::East);
  EXPECT_EQ(tie.waypoints[1].y, 2);

  LineSegment rev = ComputeSegmentPath(Point{0, 0}, Point{4, 2});
  rev.fromStation = 1;
  rev.toStation = 2;
  ReverseSegment(rev);
  EXPECT_EQ(rev.waypoints.front().x, 4);
  EXPECT_EQ(rev.waypoints.back().x, 0);
  EXPECT_EQ(rev.fromStation, 2u);
  EXPECT_EQ(rev.entryAngle, Direction::West);
  EXPECT_EQ(rev.exitAngle, Direction::NorthWest);

  EXPECT_EQ(SnapAngle(Point{0, 0}, Point{2, 1}), Direction::SouthEast);
  EXPECT_EQ(SnapAngle(Point{0, 0}, Point{-3, -1}), Direction::West);
  EXPECT_EQ(SnapAngle(Point{0, 0}, Point{0, -5}), Direction::North);
  EXPECT_EQ(DeflectionAngle(Direction::East, Direction::West), 180);
  EXPECT_EQ(DeflectionAngle(Direction::NorthEast, Direction::SouthEast), 90);
  EXPECT_EQ(DeflectionAngle(Direction::East, Direction::NorthEast), 45);
}

void TestLineGeometryAndCost()
{
  GameState s = CreateGameState(1, LandMap(12, 12));
  const StationId a = AddStation(s, 2, 2);
  const StationId b = AddStation(s, 6, 4);
  const StationId c = AddStation(s, 6, 8);
  const MetroLine& line = AddLine(s, LineColor::Red, {a, b, c});

  // The lookahead towards c (south) bends the first segment straight-first.
  const std::vector<LineSegment> path = BuildLinePath(s, line);
  ASSERT_TRUE(path.size() == 2);
  ASSERT_TRUE(path[0].waypoints.size() == 3);
  EXPECT_EQ(path[0].waypoints[1].x, 4);
  EXPECT_EQ(path[0].waypoints[1].y, 2);

  const double expected = 2.0 + 2.0 * std::sqrt(2.0) + 4.0;
  EXPECT_NEAR(LinePathLength(s, line), expected, 1e-9);
  EXPECT_NEAR(CalculateLineCost(s, line, GameConfig{}), expected * 100.0, 1e-6);

  // Either travel direction follows the same track.
  const std::optional<LineSegment> back = ComputeLineSegment(s, line, 1, 0);
  ASSERT_TRUE(back.has_value());
  EXPECT_EQ(back->fromStation, b);
  EXPECT_EQ(back->waypoints.front().x, 6);
  EXPECT_EQ(back->waypoints[1].x, 4);
  EXPECT_EQ(back->waypoints.back().x, 2);

  EXPECT_FALSE(ComputeLineSegment(s, line, 0, 3).has_value());
}

void TestStationGraphRoutes()
{
  GameState s = CreateGameState(1, LandMap(20, 20));
  const StationId a = AddStation(s, 2, 2);
  const StationId b = AddStation(s, 6, 2);
  const StationId c = AddStation(s, 10, 2);
  const StationId d = AddStation(s, 10, 6);
  const StationId e = AddStation(s, 16, 16);
  AddLine(s, LineColor::Red, {a, b, c});
  AddLine(s, LineColor::Blue, {c, d});

  const std::optional<std::vector<StationId>> r = FindRoute(s, a, d);
  ASSERT_TRUE(r.has_value());
  EXPECT_EQ(*r, (std::vector<StationId>{a, b, c, d}));

  EXPECT_FALSE(FindRoute(s, a, e).has_value());
  EXPECT_FALSE(FindRoute(s, a, MakeStationId(19, 19)).has_value());

  const std::optional<std::vector<StationId>> self = FindRoute(s, b, b);
  ASSERT_TRUE(self.has_value());
  EXPECT_TRUE(self->empty());

  const StationGraph graph(s);
  EXPECT_EQ(graph.edges(c).size(), static_cast<std::size_t>(2));
  EXPECT_TRUE(graph.edges(e).empty());

  // Closing a loop adds the wrap edge.
  GameState loop = CreateGameState(1, LandMap(20, 20));
  const StationId la = AddStation(loop, 2, 2);
  const StationId lb = AddStation(loop, 8, 2);
  const StationId lc = AddStation(loop, 8, 8);
  const StationId ld = AddStation(loop, 2, 8);
  AddLine(loop, LineColor::Green, {la, lb, lc, ld, la});
  const std::optional<std::vector<StationId>> wrap = FindRoute(loop, la, ld);
  ASSERT_TRUE(wrap.has_value());
  EXPECT_EQ(*wrap, (std::vector<StationId>{la, ld}));
}

void TestStationPlacementRules()
{
  GameConfig cfg;
  MapGrid map = LandMap(10, 10);
  map.at(1, 1).type = TileType::Water;
  map.at(2, 1).type = TileType::Water;
  map.at(1, 2).type = TileType::Water;
  map.at(2, 2).type = TileType::Water;
  GameState s = CreateGameState(7, map, cfg);
  StationManager sm(s, cfg);

  const ActionResult first = sm.placeStation(5, 5);
  ASSERT_TRUE(first.success);
  EXPECT_EQ(*first.data.stationId, MakeStationId(5, 5));
  EXPECT_EQ(s.stations[0].label, std::string("A"));
  EXPECT_NEAR(s.money, 50000.0 - 500.0, 1e-9);

  EXPECT_EQ(sm.placeStation(5, 6).error, std::string("Cannot place station adjacent to another station"));
  EXPECT_EQ(sm.placeStation(5, 5).error, std::string("Station already exists at this location"));
  EXPECT_EQ(sm.placeStation(-1, 0).error, std::string("X coordinate out of bounds"));
  EXPECT_EQ(sm.placeStation(0, 11).error, std::string("Y coordinate out of bounds"));
  EXPECT_EQ(sm.placeStation(2, 2).error, std::string("Cannot place station on water"));

  // Diagonal neighbours, the far corner and shorelines are allowed.
  EXPECT_TRUE(sm.placeStation(6, 6).success);
  EXPECT_TRUE(sm.placeStation(10, 10).success);
  EXPECT_TRUE(sm.placeStation(1, 1).success);
  EXPECT_EQ(s.stations.size(), static_cast<std::size_t>(4));
  EXPECT_EQ(s.stations[3].label, std::string("D"));
  EXPECT_NEAR(s.money, 50000.0 - 4 * 500.0, 1e-9);

  AddLine(s, LineColor::Red, {MakeStationId(5, 5), MakeStationId(6, 6)});
  EXPECT_EQ(sm.removeStation(MakeStationId(5, 5)).error, std::string("Cannot remove station that is part of a line"));
  EXPECT_EQ(sm.removeStation(MakeStationId(3, 3)).error, std::string("Station not found"));
  EXPECT_TRUE(sm.removeStation(MakeStationId(10, 10)).success);
  EXPECT_TRUE(sm.getStationAt(10, 10) == nullptr);
  EXPECT_EQ(s.stations.size(), static_cast<std::size_t>(3));

  EXPECT_EQ(GenerateStationLabel(25), std::string("Z"));
  EXPECT_EQ(GenerateStationLabel(26), std::string("AA"));
  EXPECT_EQ(FormatStationId(MakeStationId(5, 12)), std::string("0512"));
}

void TestLineBuildingRules()
{
  GameConfig cfg;
  GameState s = CreateGameState(1, LandMap(20, 20), cfg);
  const StationId a = AddStation(s, 2, 2);
  const StationId b = AddStation(s, 5, 2);
  const StationId c = AddStation(s, 8, 2);
  LineManager lm(s, cfg);

  EXPECT_EQ(lm.addStationToLine(a).error, std::string("No line is being built"));
  EXPECT_EQ(lm.completeLine().error, std::string("No line is being built"));

  ASSERT_TRUE(lm.startLine(LineColor::Red).success);
  EXPECT_TRUE(lm.addStationToLine(a).success);
  EXPECT_EQ(lm.completeLine().error, std::string("Line must have at least 2 stations"));
  EXPECT_EQ(lm.addStationToLine(a).error, std::string("Cannot add this station to the line"));
  EXPECT_EQ(lm.addStationToLine(MakeStationId(15, 15)).error, std::string("Station not found"));
  EXPECT_TRUE(lm.addStationToLine(b).success);
  EXPECT_TRUE(lm.addStationToLine(c).success);

  const double before = s.money;
  const ActionResult done = lm.completeLine();
  ASSERT_TRUE(done.success);
  EXPECT_EQ(*done.data.lineId, 1u);
  EXPECT_FALSE(lm.isBuilding());
  EXPECT_NEAR(before - s.money, 600.0, 1e-9);
  ASSERT_TRUE(s.lines.size() == 1);
  EXPECT_FALSE(s.lines[0].isLoop);
  EXPECT_TRUE(s.lines[0].trains.empty());

  EXPECT_EQ(lm.startLine(LineColor::Red).error, std::string("Line with color red already exists"));
  EXPECT_EQ(lm.availableColors().size(), static_cast<std::size_t>(kLineColorCount - 1));

  // Revisiting the first station closes a loop; nothing may follow.
  ASSERT_TRUE(lm.startLine(LineColor::Blue).success);
  EXPECT_TRUE(lm.addStationToLine(a).success);
  EXPECT_TRUE(lm.addStationToLine(b).success);
  EXPECT_TRUE(lm.addStationToLine(c).success);
  EXPECT_EQ(lm.addStationToLine(b).error, std::string("Cannot add this station to the line"));
  EXPECT_TRUE(lm.addStationToLine(a).success);
  EXPECT_EQ(lm.addStationToLine(b).error, std::string("Cannot add this station to the line"));
  ASSERT_TRUE(lm.completeLine().success);
  EXPECT_TRUE(s.lines[1].isLoop);
  EXPECT_EQ(s.lines[1].id, 2u);
  EXPECT_EQ(lm.getLinesForStation(b), (std::vector<LineId>{1, 2}));

  // Two stations back to the first is not a loop yet.
  EXPECT_FALSE(IsLineLoop({a, b}));
  EXPECT_TRUE(CanAddStationToLine({a, b}, a));
  EXPECT_FALSE(CanAddStationToLine({a}, a));

  ASSERT_TRUE(lm.startLine(LineColor::Green).success);
  EXPECT_TRUE(lm.addStationToLine(a).success);
  lm.cancelLine();
  EXPECT_FALSE(lm.isBuilding());
  lm.cancelLine();
  EXPECT_EQ(s.lines.size(), static_cast<std::size_t>(2));
}

void TestTrainFleetLimits()
{
  GameConfig cfg;
  GameState s = CreateGameState(1, LandMap(30, 10), cfg);
  const StationId a = AddStation(s, 2, 2);
  const StationId b = AddStation(s, 8, 2);
  const StationId c = AddStation(s, 14, 2);
  const StationId d = AddStation(s, 20, 2);
  const LineId lineId = AddLine(s, LineColor::Red, {a, b, c, d}).id;
  TrainManager tm(s, cfg);

  EXPECT_EQ(tm.addTrainToLine(99).error, std::string("Line not found"));

  for (int i = 0; i < 5; ++i) EXPECT_TRUE(tm.addTrainToLine(lineId).success);
  EXPECT_EQ(tm.addTrainToLine(lineId).error, std::string("Maximum trains reached for this line"));
  EXPECT_FALSE(tm.canAddTrain(lineId));

  const std::vector<Train>& trains = *tm.getTrainsForLine(lineId);
  ASSERT_TRUE(trains.size() == 5);

  // Ordinals alternate direction and spread over the line.
  EXPECT_EQ(trains[0].direction, 1);
  EXPECT_EQ(trains[0].currentStationIdx, 0);
  EXPECT_EQ(trains[0].targetStationIdx, 1);
  EXPECT_EQ(trains[1].direction, -1);
  EXPECT_EQ(trains[1].currentStationIdx, 3);
  EXPECT_EQ(trains[1].targetStationIdx, 2);
  EXPECT_EQ(trains[2].direction, 1);
  EXPECT_EQ(trains[2].currentStationIdx, 2);
  EXPECT_EQ(trains[2].targetStationIdx, 3);
  EXPECT_EQ(trains[3].direction, -1);
  EXPECT_EQ(trains[3].currentStationIdx, 1);
  EXPECT_EQ(trains[3].targetStationIdx, 0);
  for (const Train& t : trains) {
    EXPECT_TRUE(t.currentSegment.has_value());
    EXPECT_NEAR(t.totalLength, 6.0, 1e-12);
    EXPECT_EQ(t.capacity, cfg.trainCapacity);
    EXPECT_EQ(t.state, TrainState::Moving);
  }

  const TrainId firstId = trains[0].id;
  EXPECT_EQ(tm.removeTrainFromLine(lineId, TrainId{999}).error, std::string("Train not found"));

  const ActionResult removed = tm.removeTrainFromLine(lineId);
  ASSERT_TRUE(removed.success);
  EXPECT_EQ(*removed.data.trainId, s.nextTrainId - 1);
  EXPECT_TRUE(tm.removeTrainFromLine(lineId, firstId).success);
  EXPECT_TRUE(tm.removeTrainFromLine(lineId).success);
  EXPECT_TRUE(tm.removeTrainFromLine(lineId).success);
  EXPECT_EQ(tm.getTrainCount(lineId), 1);
  EXPECT_EQ(tm.removeTrainFromLine(lineId).error, std::string("Must have at least one train per line"));
  EXPECT_EQ(tm.removeTrainFromLine(99).error, std::string("Line not found"));
}

void TestTrainReversesAtLineEnds()
{
  GameConfig cfg;
  GameState s = CreateGameState(1, LandMap(20, 6), cfg);
  std::vector<StationId> ids;
  for (int i = 0; i < 4; ++i) ids.push_back(AddStation(s, 2 + 4 * i, 2));
  MetroLine& line = AddLine(s, LineColor::Red, ids);

  Train t = CreateTrainForLine(s, line, 1, cfg);
  t.currentStationIdx = 2;
  t.targetStationIdx = 3;
  ASSERT_TRUE(UpdateTrainPath(s, line, t));
  t.progress = 0.99;
  line.trains.push_back(t);

  UpdateTrains(s, 0.1, cfg);
  const Train& tr = s.lines[0].trains[0];
  EXPECT_EQ(tr.currentStationIdx, 3);
  EXPECT_EQ(tr.direction, -1);
  EXPECT_EQ(tr.targetStationIdx, 2);
  EXPECT_EQ(tr.state, TrainState::Stopped);
  EXPECT_NEAR(tr.dwellRemaining, cfg.dwellDistance, 1e-12);
  EXPECT_NEAR(tr.progress, 0.0, 1e-12);

  // Never targets an index outside the line, and always turns at the ends.
  bool ok = true;
  int arrivalsAtZero = 0;
  int prev = tr.currentStationIdx;
  for (int i = 0; i < 4000; ++i) {
    UpdateTrains(s, 0.05, cfg);
    const Train& x = s.lines[0].trains[0];
    ok = ok && x.targetStationIdx >= 0 && x.targetStationIdx <= 3 &&
         std::abs(x.targetStationIdx - x.currentStationIdx) == 1;
    if (x.currentStationIdx == 0) ok = ok && x.direction == 1;
    if (x.currentStationIdx == 3) ok = ok && x.direction == -1;
    if (x.currentStationIdx == 0 && prev != 0) ++arrivalsAtZero;
    prev = x.currentStationIdx;
  }
  EXPECT_TRUE(ok);
  EXPECT_TRUE(arrivalsAtZero >= 2);
}

void TestLoopWrapDwellAndZeroLengthLeg()
{
  GameConfig cfg;
  GameState s = CreateGameState(1, LandMap(20, 20), cfg);
  const StationId a = AddStation(s, 2, 2);
  const StationId b = AddStation(s, 8, 2);
  const StationId c = AddStation(s, 8, 8);
  MetroLine& line = AddLine(s, LineColor::Teal, {a, b, c, a});
  ASSERT_TRUE(line.isLoop);

  Train t = CreateTrainForLine(s, line, 1, cfg);
  t.currentStationIdx = 2;
  t.targetStationIdx = 3;
  ASSERT_TRUE(UpdateTrainPath(s, line, t));
  t.progress = 0.999;
  line.trains.push_back(t);

  // Arriving at the closing entry wraps the target to the first index.
  UpdateTrains(s, 0.1, cfg);
  {
    const Train& x = s.lines[0].trains[0];
    EXPECT_EQ(x.currentStationIdx, 3);
    EXPECT_EQ(x.targetStationIdx, 0);
    EXPECT_EQ(x.direction, 1);
    EXPECT_NEAR(x.totalLength, 0.0, 1e-12);
  }

  // Dwell counts down in distance units at train speed.
  UpdateTrains(s, 0.2, cfg);
  {
    const Train& x = s.lines[0].trains[0];
    EXPECT_EQ(x.state, TrainState::Stopped);
    EXPECT_NEAR(x.dwellRemaining, 1.0, 1e-9);
  }

  // Dwell ends and the zero-length leg completes within the same tick.
  UpdateTrains(s, 0.3, cfg);
  {
    const Train& x = s.lines[0].trains[0];
    EXPECT_EQ(x.currentStationIdx, 0);
    EXPECT_EQ(x.targetStationIdx, 1);
    EXPECT_EQ(x.state, TrainState::Stopped);
    EXPECT_NEAR(x.totalLength, 6.0, 1e-12);
  }

  // Leaving a station is slow: the ramp floor is 10% of cruise.
  s.lines[0].trains[0].state = TrainState::Moving;
  const double moneyBefore = s.money;
  UpdateTrains(s, 0.1, cfg);
  EXPECT_NEAR(s.lines[0].trains[0].progress, (5.0 * 0.1 * 0.1) / 6.0, 1e-12);
  EXPECT_NEAR(moneyBefore - s.money, 0.05 * cfg.runningCostPerUnit, 1e-12);
}

void TestBoardingAndAlighting()
{
  GameConfig cfg;
  GameState s = CreateGameState(1, LandMap(20, 10), cfg);
  const StationId a = AddStation(s, 2, 2);
  const StationId b = AddStation(s, 6, 2);
  const StationId c = AddStation(s, 10, 2);
  AddLine(s, LineColor::Red, {a, b, c});
  s.lines[0].trains.push_back(CreateTrainForLine(s, s.lines[0], 1, cfg));

  MetroLine& line = s.lines[0];
  Train& train = line.trains[0];
  Station& sa = *FindStation(s, a);
  Station& sb = *FindStation(s, b);
  Station& sc = *FindStation(s, c);

  const PassengerId rider = AddWaitingPassenger(s, {a, b, c});
  const PassengerId backwards = AddWaitingPassenger(s, {b, a});
  ASSERT_TRUE(InvariantsHold(s));

  HandlePassengerBoarding(s, line, train, sa);
  EXPECT_EQ(train.passengers, (std::vector<PassengerId>{rider}));
  EXPECT_TRUE(sa.passengers.empty());
  EXPECT_EQ(*s.passengers[rider].currentTrainId, train.id);
  EXPECT_FALSE(s.passengers[rider].currentStationId.has_value());
  EXPECT_TRUE(InvariantsHold(s));

  // At b the rider steps off (waypoint) and back on; the passenger heading
  // back towards a stays put while the train runs forward.
  train.currentStationIdx = 1;
  UpdatePassengerMovement(s, line, train, sb, cfg);
  EXPECT_EQ(train.passengers, (std::vector<PassengerId>{rider}));
  EXPECT_EQ(sb.passengers, (std::vector<PassengerId>{backwards}));
  EXPECT_EQ(s.passengers[rider].nextWaypointIndex, 2);
  EXPECT_TRUE(InvariantsHold(s));

  // Destination: fare collected, passenger gone.
  train.currentStationIdx = 2;
  const double before = s.money;
  UpdatePassengerMovement(s, line, train, sc, cfg);
  EXPECT_TRUE(train.passengers.empty());
  EXPECT_TRUE(sc.passengers.empty());
  EXPECT_TRUE(s.passengers.find(rider) == s.passengers.end());
  EXPECT_NEAR(s.money - before, cfg.fare, 1e-12);

  // Reversed at c, the train now serves the b -> a passenger.
  train.direction = -1;
  train.currentStationIdx = 1;
  HandlePassengerBoarding(s, line, train, sb);
  EXPECT_EQ(train.passengers, (std::vector<PassengerId>{backwards}));
  EXPECT_TRUE(InvariantsHold(s));
}

void TestBoardingRespectsCapacityAndLineChoice()
{
  GameConfig cfg;
  GameState s = CreateGameState(1, LandMap(20, 10), cfg);
  const StationId a = AddStation(s, 2, 2);
  const StationId b = AddStation(s, 6, 2);
  const StationId c = AddStation(s, 10, 2);
  AddLine(s, LineColor::Red, {a, b});
  AddLine(s, LineColor::Blue, {a, b, c});
  s.lines[0].trains.push_back(CreateTrainForLine(s, s.lines[0], 1, cfg));
  s.lines[1].trains.push_back(CreateTrainForLine(s, s.lines[1], 1, cfg));

  const PassengerId p1 = AddWaitingPassenger(s, {a, b});
  const PassengerId p2 = AddWaitingPassenger(s, {a, b});
  const PassengerId p3 = AddWaitingPassenger(s, {a, b, c});
  Station& sa = *FindStation(s, a);

  // The first line serving a -> b is red, so blue leaves them all behind.
  HandlePassengerBoarding(s, s.lines[1], s.lines[1].trains[0], sa);
  EXPECT_TRUE(s.lines[1].trains[0].passengers.empty());
  EXPECT_EQ(sa.passengers.size(), static_cast<std::size_t>(3));

  Train& red = s.lines[0].trains[0];
  red.capacity = 2;
  HandlePassengerBoarding(s, s.lines[0], red, sa);
  EXPECT_EQ(red.passengers, (std::vector<PassengerId>{p1, p2}));
  EXPECT_EQ(sa.passengers, (std::vector<PassengerId>{p3}));
  EXPECT_TRUE(InvariantsHold(s));
}

void TestLoopBoardingTowardsClosingStation()
{
  GameConfig cfg;
  GameState s = CreateGameState(1, LandMap(20, 12), cfg);
  const StationId a = AddStation(s, 2, 2);
  const StationId b = AddStation(s, 6, 2);
  const StationId c = AddStation(s, 6, 6);
  MetroLine& loop = AddLine(s, LineColor::Green, {a, b, c, a});
  ASSERT_TRUE(loop.isLoop);
  loop.trains.push_back(CreateTrainForLine(s, loop, 1, cfg));
  Train& train = loop.trains[0];
  train.currentStationIdx = 2;
  train.direction = 1;

  // Next stop after c is the closing a at index 3.
  const PassengerId toA = AddWaitingPassenger(s, {c, a});
  const PassengerId toB = AddWaitingPassenger(s, {c, b});
  Station& sc = *FindStation(s, c);
  HandlePassengerBoarding(s, loop, train, sc);
  EXPECT_EQ(train.passengers, (std::vector<PassengerId>{toA}));
  EXPECT_EQ(sc.passengers, (std::vector<PassengerId>{toB}));

  // Running backwards, b comes next and a is reached through it.
  train.direction = -1;
  HandlePassengerBoarding(s, loop, train, sc);
  EXPECT_EQ(train.passengers, (std::vector<PassengerId>{toA, toB}));
  EXPECT_TRUE(sc.passengers.empty());
  EXPECT_TRUE(InvariantsHold(s));
}

void TestFareOnArrivalTick()
{
  GameConfig cfg;
  GameState s = CreateGameState(1, LandMap(12, 6), cfg);
  const StationId a = AddStation(s, 2, 2);
  const StationId b = AddStation(s, 6, 2);
  MetroLine& line = AddLine(s, LineColor::Red, {a, b});

  Train t = CreateTrainForLine(s, line, 1, cfg);
  ASSERT_TRUE(UpdateTrainPath(s, line, t));
  t.progress = 0.99;

  Passenger p;
  p.id = s.nextPassengerId++;
  p.sourceStationId = a;
  p.destinationStationId = b;
  p.path = {a, b};
  p.nextWaypointIndex = 1;
  p.currentTrainId = t.id;
  t.passengers.push_back(p.id);
  s.passengers.emplace(p.id, p);
  line.trains.push_back(t);
  ASSERT_TRUE(InvariantsHold(s));

  const double before = s.money;
  UpdateTrains(s, 0.1, cfg);

  // 0.05 units at the ramp floor, then the fare.
  EXPECT_NEAR(s.money, before - 0.05 * cfg.runningCostPerUnit + cfg.fare, 1e-9);
  EXPECT_TRUE(s.passengers.empty());
  EXPECT_TRUE(s.lines[0].trains[0].passengers.empty());
  EXPECT_TRUE(FindStation(s, b)->passengers.empty());
  EXPECT_TRUE(FindStation(s, a)->passengers.empty());
}

void TestCatchmentAndTimeRegimes()
{
  MapGrid map = LandMap(10, 10, 10, 3);
  const CatchmentStats full = ComputeStationCatchment(map, 5, 5, 2);
  EXPECT_EQ(full.residential, 160);
  EXPECT_EQ(full.office, 48);

  EXPECT_EQ(ComputeStationCatchment(map, 0, 0, 2).residential, 40);
  EXPECT_EQ(ComputeStationCatchment(map, 5, 5, 0).residential, 0);

  // Land behind water is out of reach even inside the box.
  for (int y = 0; y < 10; ++y) map.at(5, y).type = TileType::Water;
  EXPECT_EQ(ComputeStationCatchment(map, 5, 5, 2).residential, 80);

  GameConfig cfg;
  EXPECT_EQ(HourOfDay(cfg.startTimeMs), 8);
  EXPECT_EQ(HourOfDay(cfg.startTimeMs + 9LL * 3600 * 1000), 17);
  EXPECT_EQ(RegimeForHour(8), TimeRegime::MorningRush);
  EXPECT_EQ(RegimeForHour(10), TimeRegime::OffPeak);
  EXPECT_EQ(RegimeForHour(16), TimeRegime::EveningRush);
  EXPECT_EQ(RegimeForHour(21), TimeRegime::OffPeak);
  EXPECT_EQ(RegimeForHour(22), TimeRegime::Night);
  EXPECT_EQ(RegimeForHour(4), TimeRegime::Night);
  EXPECT_EQ(RegimeForHour(5), TimeRegime::OffPeak);
  EXPECT_NEAR(SpawnMultiplier(TimeRegime::EveningRush, cfg), 3.0, 1e-12);
  EXPECT_NEAR(SpawnMultiplier(TimeRegime::Night, cfg), 0.1, 1e-12);
}

void TestPassengerSpawning()
{
  GameConfig cfg;
  cfg.baseSpawnRate = 100.0;

  GameState s = CreateGameState(3, LandMap(20, 10, 50, 20), cfg);
  const StationId a = AddStation(s, 2, 2);
  const StationId b = AddStation(s, 8, 2);
  PassengerSpawner spawner(cfg);

  // No line: the stream advances but nobody can travel.
  const std::uint64_t rng0 = s.rngState;
  EXPECT_EQ(spawner.update(s, 3600.0), 0);
  EXPECT_TRUE(s.passengers.empty());
  EXPECT_NE(s.rngState, rng0);
  EXPECT_EQ(spawner.cache().size(), static_cast<std::size_t>(2));

  AddLine(s, LineColor::Red, {a, b});
  EXPECT_EQ(spawner.update(s, 0.0), 0);
  EXPECT_EQ(spawner.update(s, 3600.0), 2);
  ASSERT_TRUE(s.passengers.size() == 2);
  for (const auto& kv : s.passengers) {
    const Passenger& p = kv.second;
    EXPECT_NE(p.sourceStationId, p.destinationStationId);
    EXPECT_EQ(p.path.front(), p.sourceStationId);
    EXPECT_EQ(p.path.back(), p.destinationStationId);
    EXPECT_EQ(p.nextWaypointIndex, 1);
    EXPECT_EQ(*p.currentStationId, p.sourceStationId);
    EXPECT_EQ(p.spawnTime, s.simulationTime);
  }
  EXPECT_TRUE(InvariantsHold(s));

  // A station placed later gets a cache entry on the next tick.
  AddStation(s, 14, 2);
  spawner.update(s, 1.0);
  EXPECT_EQ(spawner.cache().size(), static_cast<std::size_t>(3));
  spawner.invalidate();
  EXPECT_EQ(spawner.cache().size(), static_cast<std::size_t>(0));

  // Same state and stream, same passengers.
  GameState x = CreateGameState(9, LandMap(20, 10, 30, 30), cfg);
  const StationId xa = AddStation(x, 2, 2);
  const StationId xb = AddStation(x, 8, 2);
  const StationId xc = AddStation(x, 8, 8);
  AddLine(x, LineColor::Red, {xa, xb, xc});
  GameState y = x;
  GameConfig slow;
  PassengerSpawner sx(slow);
  PassengerSpawner sy(slow);
  for (int i = 0; i < 200; ++i) {
    sx.update(x, 600.0);
    sy.update(y, 600.0);
  }
  EXPECT_EQ(x.nextPassengerId, y.nextPassengerId);
  EXPECT_EQ(x.rngState, y.rngState);
  EXPECT_EQ(HashGameState(x), HashGameState(y));
}

void TestEconomics()
{
  GameConfig cfg;
  GameState s = CreateGameState(1, LandMap(4, 4), cfg);
  EXPECT_NEAR(s.money, 50000.0, 1e-12);

  DeductStationCost(s, cfg);
  DeductTrainRunningCost(s, 10.0, cfg);
  AddTicketRevenue(s, cfg);
  EXPECT_NEAR(s.money, 50000.0 - 500.0 - 5.0 + 5.0, 1e-9);

  // Money may go negative.
  s.money = 10.0;
  DeductStationCost(s, cfg);
  EXPECT_NEAR(s.money, -490.0, 1e-12);

  EXPECT_EQ(FormatMoney(1234.4), std::string("$1234"));
  EXPECT_EQ(FormatMoney(-56.2), std::string("-$56"));
  EXPECT_EQ(FormatMoney(0.0), std::string("$0"));
}

GameAction PlaceAt(int x, int y) { return PlaceStationAction{x, y}; }

void TestControllerDispatchAndListeners()
{
  ActionKind kind = ActionKind::Pause;
  EXPECT_EQ(ActionKindOf(GameAction{PlaceStationAction{1, 2}}), ActionKind::PlaceStation);
  EXPECT_EQ(std::string(ToString(ActionKind::AddStationToLine)), std::string("ADD_STATION_TO_LINE"));
  EXPECT_TRUE(ParseActionKind("set_speed", kind));
  EXPECT_EQ(kind, ActionKind::SetSpeed);
  EXPECT_FALSE(ParseActionKind("TELEPORT", kind));
  EXPECT_EQ(kind, ActionKind::SetSpeed);

  const PersistencePort port = MakeMemoryPersistence();
  std::unique_ptr<GameController> game = GameController::createNew(5, LandMap(24, 16), GameConfig{}, port);
  ASSERT_TRUE(game != nullptr);

  int notified = 0;
  std::function<void()> unsubscribe = game->subscribe([&](const GameState&) { ++notified; });

  EXPECT_FALSE(GameController::hasSavedGame(port));
  ASSERT_TRUE(game->dispatch(PlaceAt(3, 3)).success);
  EXPECT_EQ(notified, 1);
  EXPECT_TRUE(GameController::hasSavedGame(port));

  // Rejected actions neither notify nor save.
  game->clearSaved();
  EXPECT_FALSE(game->dispatch(PlaceAt(3, 4)).success);
  EXPECT_EQ(notified, 1);
  EXPECT_FALSE(GameController::hasSavedGame(port));

  ASSERT_TRUE(game->dispatch(PlaceAt(9, 3)).success);
  ASSERT_TRUE(game->dispatch(PlaceAt(15, 3)).success);
  ASSERT_TRUE(game->dispatch(StartLineAction{LineColor::Yellow}).success);
  for (int x : {3, 9, 15}) {
    ASSERT_TRUE(game->dispatch(AddStationToLineAction{MakeStationId(x, 3)}).success);
  }
  const ActionResult done = game->dispatch(CompleteLineAction{});
  ASSERT_TRUE(done.success);
  ASSERT_TRUE(done.data.trainId.has_value());
  EXPECT_EQ(game->state().lines[0].trains.size(), static_cast<std::size_t>(1));
  EXPECT_EQ(game->state().lines[0].trains[0].id, *done.data.trainId);
  EXPECT_TRUE(game->dispatch(CancelLineAction{}).success);

  EXPECT_EQ(game->dispatch(SetSpeedAction{3}).error, std::string("Invalid speed value"));
  EXPECT_EQ(game->speed(), 1);
  EXPECT_TRUE(game->dispatch(SetSpeedAction{2}).success);
  EXPECT_EQ(game->speed(), 2);

  // Pausing stops the clock; ticks notify but never autosave.
  ASSERT_TRUE(game->dispatch(PauseAction{}).success);
  const std::int64_t t0 = game->state().simulationTime;
  const int beforeTick = notified;
  game->update(16.0);
  EXPECT_EQ(game->state().simulationTime, t0);
  EXPECT_EQ(notified, beforeTick);

  ASSERT_TRUE(game->dispatch(ResumeAction{}).success);
  game->clearSaved();
  game->update(16.0);
  EXPECT_EQ(game->state().simulationTime, t0 + static_cast<std::int64_t>(16.0 * 2 * 10080.0));
  EXPECT_FALSE(GameController::hasSavedGame(port));
  game->update(0.0);
  game->update(-5.0);
  EXPECT_EQ(game->state().simulationTime, t0 + static_cast<std::int64_t>(16.0 * 2 * 10080.0));

  const int beforeToggle = notified;
  game->togglePause();
  EXPECT_TRUE(game->isPaused());
  EXPECT_EQ(notified, beforeToggle + 1);

  unsubscribe();
  unsubscribe();
  game->togglePause();
  EXPECT_EQ(notified, beforeToggle + 1);

  // Listeners may unsubscribe themselves while being notified.
  int once = 0;
  std::function<void()> selfRemove;
  selfRemove = game->subscribe([&](const GameState&) {
    ++once;
    selfRemove();
  });
  game->togglePause();
  game->togglePause();
  EXPECT_EQ(once, 1);

  std::function<void()> late = game->subscribe([](const GameState&) {});
  game.reset();
  late();

  bool threw = false;
  try {
    GameController bad(1, MapGrid{});
  } catch (const std::invalid_argument&) {
    threw = true;
  }
  EXPECT_TRUE(threw);

  threw = false;
  try {
    GameController wide(1, LandMap(kMaxMapDimension + 1, 2));
  } catch (const std::invalid_argument&) {
    threw = true;
  }
  EXPECT_TRUE(threw);
}

// Builds a small network on a dense all-land map and runs it at 4x.
std::unique_ptr<GameController> BuildNetwork(std::uint64_t seed)
{
  std::unique_ptr<GameController> game = GameController::createNew(seed, LandMap(30, 20, 50, 20));
  const int xs[] = {3, 9, 15, 21, 15, 15, 9};
  const int ys[] = {3, 3, 3, 3, 9, 15, 9};
  for (int i = 0; i < 7; ++i) game->dispatch(PlaceAt(xs[i], ys[i]));

  auto build = [&](LineColor color, std::vector<Point> stops) {
    game->dispatch(StartLineAction{color});
    for (const Point& p : stops) game->dispatch(AddStationToLineAction{MakeStationId(p.x, p.y)});
    game->dispatch(CompleteLineAction{});
  };
  build(LineColor::Red, {{3, 3}, {9, 3}, {15, 3}, {21, 3}});
  build(LineColor::Blue, {{15, 15}, {15, 9}, {15, 3}});
  build(LineColor::Green, {{9, 3}, {9, 9}, {15, 9}, {9, 3}});
  game->dispatch(SetSpeedAction{4});
  return game;
}

void TestLongRunConservesPassengers()
{
  std::unique_ptr<GameController> game = BuildNetwork(21);
  ASSERT_TRUE(game->state().lines.size() == 3);
  ASSERT_TRUE(game->state().lines[2].isLoop);

  std::vector<std::vector<StationId>> layout;
  for (const MetroLine& l : game->state().lines) layout.push_back(l.stationIds);

  bool ok = true;
  for (int i = 0; i < 2000; ++i) {
    game->update(16.0);
    if (i % 50 == 0) ok = ok && InvariantsHold(game->state());
  }
  EXPECT_TRUE(ok);
  EXPECT_TRUE(InvariantsHold(game->state()));

  const GameState& s = game->state();
  const std::uint64_t created = s.nextPassengerId - 1;
  const std::uint64_t completed = created - static_cast<std::uint64_t>(s.passengers.size());
  EXPECT_TRUE(created > 0);
  EXPECT_TRUE(completed > 0);

  for (std::size_t i = 0; i < layout.size(); ++i) EXPECT_EQ(s.lines[i].stationIds, layout[i]);
  for (const MetroLine& l : s.lines) {
    for (const Train& t : l.trains) {
      EXPECT_TRUE(t.passengers.size() <= static_cast<std::size_t>(t.capacity));
      EXPECT_TRUE(t.currentStationIdx >= 0 && t.currentStationIdx < static_cast<int>(l.stationIds.size()));
    }
  }

  // Fleet changes mid-run keep everyone accounted for.
  ASSERT_TRUE(game->dispatch(AddTrainAction{1}).success);
  for (int i = 0; i < 200; ++i) game->update(16.0);
  ASSERT_TRUE(game->dispatch(RemoveTrainAction{1, std::nullopt}).success);
  EXPECT_TRUE(InvariantsHold(game->state()));
  for (int i = 0; i < 200; ++i) game->update(16.0);
  EXPECT_TRUE(InvariantsHold(game->state()));
}

void TestSimulationDeterministic()
{
  std::unique_ptr<GameController> a = BuildNetwork(77);
  std::unique_ptr<GameController> b = BuildNetwork(77);
  for (int i = 0; i < 600; ++i) {
    a->update(16.0);
    b->update(16.0);
  }
  EXPECT_EQ(HashGameState(a->state()), HashGameState(b->state()));

  std::unique_ptr<GameController> c = BuildNetwork(78);
  for (int i = 0; i < 600; ++i) c->update(16.0);
  EXPECT_NE(HashGameState(a->state()), HashGameState(c->state()));
}

void TestSaveRoundTrip()
{
  std::unique_ptr<GameController> game = BuildNetwork(31);
  for (int i = 0; i < 700; ++i) game->update(16.0);
  game->dispatch(PauseAction{});

  const std::string blob = SerializeGameState(game->state());
  GameState loaded;
  std::string err;
  ASSERT_TRUE(DeserializeGameState(blob, loaded, err));
  EXPECT_EQ(HashGameState(loaded), HashGameState(game->state()));
  EXPECT_TRUE(loaded.isPaused);
  EXPECT_EQ(loaded.speed, 4);
  EXPECT_EQ(loaded.rngState, game->state().rngState);
  EXPECT_EQ(loaded.nextPassengerId, game->state().nextPassengerId);
  EXPECT_EQ(loaded.lines[2].isLoop, true);
  EXPECT_EQ(ReconcilePassengers(loaded), 0);

  // Path caches are rebuilt by the adopting controller; the run continues identically.
  GameController resumed(loaded, GameConfig{}, PersistencePort{});
  for (const MetroLine& l : resumed.state().lines) {
    for (const Train& t : l.trains) EXPECT_TRUE(t.currentSegment.has_value());
  }
  game->dispatch(ResumeAction{});
  resumed.dispatch(ResumeAction{});
  for (int i = 0; i < 300; ++i) {
    game->update(16.0);
    resumed.update(16.0);
  }
  EXPECT_EQ(HashGameState(resumed.state()), HashGameState(game->state()));

  // A failed load leaves the destination untouched.
  GameState untouched = loaded;
  EXPECT_FALSE(DeserializeGameState("{\"format\":\"metrocore-save\",\"version\":99}", untouched, err));
  EXPECT_TRUE(err.find("newer") != std::string::npos);
  EXPECT_EQ(HashGameState(untouched), HashGameState(loaded));
}

void TestMinimalSaveDefaults()
{
  const std::string text =
    "{\"seed\":\"5\",\"map\":{\"width\":3,\"height\":2,\"tiles\":[\"LLL\",\"LWL\"]},"
    "\"stations\":[{\"x\":0,\"y\":0},{\"x\":3,\"y\":2}],"
    "\"lines\":[{\"color\":\"red\",\"stations\":[0,196610]}]}";

  GameConfig cfg;
  GameState s;
  std::string err;
  ASSERT_TRUE(DeserializeGameState(text, s, err));
  EXPECT_EQ(s.seed, 5u);
  EXPECT_TRUE(s.map.isWater(1, 1));
  EXPECT_EQ(s.simulationTime, cfg.startTimeMs);
  EXPECT_NEAR(s.money, cfg.startingMoney, 1e-12);
  EXPECT_FALSE(s.isPaused);
  EXPECT_EQ(s.speed, 1);
  EXPECT_EQ(s.rngState, DeriveSeed(5, 0x50415353u));
  ASSERT_TRUE(s.stations.size() == 2);
  EXPECT_EQ(s.stations[0].label, std::string("A"));
  EXPECT_EQ(s.stations[1].label, std::string("B"));
  EXPECT_EQ(s.stations[1].id, MakeStationId(3, 2));
  ASSERT_TRUE(s.lines.size() == 1);
  EXPECT_EQ(s.lines[0].id, 1u);
  EXPECT_TRUE(s.lines[0].trains.empty());
  EXPECT_EQ(s.nextLineId, 2u);
  EXPECT_EQ(s.nextTrainId, 1u);
  EXPECT_EQ(s.nextPassengerId, 1u);

  GameController game(s, cfg, PersistencePort{});
  ASSERT_TRUE(game.state().lines[0].trains.size() == 1);
  EXPECT_EQ(game.state().lines[0].trains[0].id, 1u);
  EXPECT_NEAR(game.state().lines[0].trains[0].totalLength, 2.0 * std::sqrt(2.0) + 1.0, 1e-12);

  // Required sections and references are validated.
  GameState bad;
  EXPECT_FALSE(DeserializeGameState("{\"map\":{}}", bad, err));
  EXPECT_FALSE(DeserializeGameState("[1,2]", bad, err));
  EXPECT_FALSE(DeserializeGameState(
    "{\"seed\":1,\"map\":{\"width\":2,\"height\":1,\"tiles\":[\"LL\"]},\"stations\":[{\"x\":0,\"y\":0}],"
    "\"lines\":[{\"color\":\"red\",\"stations\":[0,65536]}]}",
    bad, err));
  EXPECT_TRUE(err.find("unknown station") != std::string::npos);
  EXPECT_FALSE(DeserializeGameState(
    "{\"seed\":1,\"map\":{\"width\":2,\"height\":1,\"tiles\":[\"LX\"]},\"stations\":[],\"lines\":[]}", bad, err));
}

void TestReconcileRepairsBookkeeping()
{
  GameConfig cfg;
  GameState s = CreateGameState(1, LandMap(12, 6), cfg);
  const StationId a = AddStation(s, 2, 2);
  const StationId b = AddStation(s, 6, 2);
  AddLine(s, LineColor::Red, {a, b});
  s.lines[0].trains.push_back(CreateTrainForLine(s, s.lines[0], 1, cfg));

  auto makePassenger = [&](PassengerId id) {
    Passenger p;
    p.id = id;
    p.sourceStationId = a;
    p.destinationStationId = b;
    p.path = {a, b};
    p.nextWaypointIndex = 1;
    s.passengers.emplace(id, p);
  };

  // 1: in the roster at a, missing from the queue.
  makePassenger(1);
  s.passengers[1].currentStationId = a;
  // 2: in the roster with no location at all.
  makePassenger(2);
  // 3: queued at a and aboard the train.
  makePassenger(3);
  FindStation(s, a)->passengers = {3, 99};
  s.lines[0].trains[0].passengers = {3};
  s.passengers[3].currentTrainId = s.lines[0].trains[0].id;
  s.nextPassengerId = 4;

  EXPECT_FALSE(InvariantsHold(s));
  EXPECT_TRUE(ReconcilePassengers(s) > 0);
  EXPECT_TRUE(InvariantsHold(s));
  EXPECT_EQ(s.passengers.size(), static_cast<std::size_t>(2));
  EXPECT_EQ(FindStation(s, a)->passengers, (std::vector<PassengerId>{3, 1}));
  EXPECT_TRUE(s.lines[0].trains[0].passengers.empty());
  EXPECT_FALSE(s.passengers[3].currentTrainId.has_value());
  EXPECT_EQ(ReconcilePassengers(s), 0);
}

void TestPersistencePorts()
{
  std::vector<std::string> warnings;
  const LogLevel oldLevel = GetLogLevel();
  SetLogLevel(LogLevel::Warn);
  SetLogSink([&](LogLevel level, const std::string& msg) {
    if (level == LogLevel::Warn) warnings.push_back(msg);
  });

  const PersistencePort mem = MakeMemoryPersistence();
  EXPECT_FALSE(HasSavedGame(mem));
  EXPECT_FALSE(LoadGame(mem).has_value());
  EXPECT_TRUE(GameController::loadSaved(mem) == nullptr);

  // A corrupt blob is reported and treated as no save.
  ASSERT_TRUE(mem.save(kSaveGameKey, "{not json"));
  EXPECT_FALSE(HasSavedGame(mem));
  EXPECT_FALSE(GameController::hasSavedGame(mem));
  EXPECT_FALSE(LoadGame(mem).has_value());
  EXPECT_TRUE(GameController::loadSaved(mem) == nullptr);
  EXPECT_FALSE(warnings.empty());

  std::unique_ptr<GameController> game = BuildNetwork(8);
  for (int i = 0; i < 100; ++i) game->update(16.0);
  ASSERT_TRUE(SaveGame(mem, game->state()));
  std::unique_ptr<GameController> again = GameController::loadSaved(mem);
  ASSERT_TRUE(again != nullptr);
  EXPECT_EQ(HashGameState(again->state()), HashGameState(game->state()));
  EXPECT_TRUE(GameController::hasSavedGame(mem));

  // Out-of-range numbers in an otherwise valid save.
  JsonValue root;
  std::string err;
  ASSERT_TRUE(ParseJson(SerializeGameState(game->state()), root, err));
  JsonValue* map = FindJsonMember(root, "map");
  ASSERT_TRUE(map != nullptr);
  JsonValue* residential = FindJsonMember(*map, "residential");
  ASSERT_TRUE(residential != nullptr && !residential->arrayValue.empty());
  residential->arrayValue[0] = JsonValue::MakeNumber(1e30);
  residential->arrayValue[1] = JsonValue::MakeNumber(-1e30);
  ASSERT_TRUE(mem.save(kSaveGameKey, JsonStringify(root)));
  const std::optional<GameState> clamped = LoadGame(mem);
  ASSERT_TRUE(clamped.has_value());
  EXPECT_EQ(static_cast<int>(clamped->map.tiles()[0].residentialDensity), 99);
  EXPECT_EQ(static_cast<int>(clamped->map.tiles()[1].residentialDensity), 0);

  JsonValue* stations = FindJsonMember(root, "stations");
  ASSERT_TRUE(stations != nullptr && !stations->arrayValue.empty());
  const double badIds[] = {1e30, 2.5, -1.0};
  for (double bad : badIds) {
    JsonValue ids = JsonValue::MakeArray();
    ids.push(JsonValue::MakeNumber(bad));
    stations->arrayValue[0].set("passengers", std::move(ids));
    ASSERT_TRUE(mem.save(kSaveGameKey, JsonStringify(root)));
    EXPECT_FALSE(LoadGame(mem).has_value());
    EXPECT_FALSE(HasSavedGame(mem));
  }

  ClearSavedGame(mem);
  EXPECT_FALSE(HasSavedGame(mem));

  // File storage: one atomically replaced file per key.
  const fs::path dir = MakeTempPath("metrocore_saves");
  const PersistencePort files = MakeFilePersistence(dir.string());
  EXPECT_FALSE(HasSavedGame(files));
  ASSERT_TRUE(SaveGame(files, game->state()));
  EXPECT_TRUE(fs::exists(dir / (std::string(kSaveGameKey) + ".json")));
  ASSERT_TRUE(SaveGame(files, game->state()));
  const std::optional<GameState> fromDisk = LoadGame(files);
  ASSERT_TRUE(fromDisk.has_value());
  EXPECT_EQ(HashGameState(*fromDisk), HashGameState(game->state()));
  ClearSavedGame(files);
  EXPECT_FALSE(HasSavedGame(files));

  std::error_code ec;
  fs::remove_all(dir, ec);
  SetLogSink(LogSink{});
  SetLogLevel(oldLevel);
}

void TestConfigOverrides()
{
  GameConfig cfg;
  JsonValue root;
  std::string err;
  ASSERT_TRUE(ParseJson("{\"train_capacity\": 40, \"fare\": 7.5, \"start_time_ms\": 0}", root, err));
  ASSERT_TRUE(ApplyGameConfigJson(root, cfg, err));
  EXPECT_EQ(cfg.trainCapacity, 40);
  EXPECT_NEAR(cfg.fare, 7.5, 1e-12);
  EXPECT_EQ(cfg.startTimeMs, 0);
  EXPECT_EQ(cfg.maxTrainsPerLine, 5);

  // Errors name the key and leave the config alone.
  ASSERT_TRUE(ParseJson("{\"fare\": \"cheap\", \"train_capacity\": 10}", root, err));
  EXPECT_FALSE(ApplyGameConfigJson(root, cfg, err));
  EXPECT_TRUE(err.find("fare") != std::string::npos);
  EXPECT_EQ(cfg.trainCapacity, 40);

  ASSERT_TRUE(ParseJson("{\"train_capacity\": 0}", root, err));
  EXPECT_FALSE(ApplyGameConfigJson(root, cfg, err));
  EXPECT_TRUE(err.find("train_capacity") != std::string::npos);

  // Station ids pack coordinates into 16 bits, so oversized maps are refused.
  ASSERT_TRUE(ParseJson("{\"map_width\": 70000, \"train_capacity\": 12}", root, err));
  EXPECT_FALSE(ApplyGameConfigJson(root, cfg, err));
  EXPECT_TRUE(err.find("map_width") != std::string::npos);
  EXPECT_EQ(cfg.mapWidth, 48);
  EXPECT_EQ(cfg.trainCapacity, 40);
  ASSERT_TRUE(ParseJson("{\"map_height\": 4096}", root, err));
  ASSERT_TRUE(ApplyGameConfigJson(root, cfg, err));
  EXPECT_EQ(cfg.mapHeight, 4096);
  cfg.mapHeight = 32;

  MapGenConfig map;
  ASSERT_TRUE(ParseJson("{\"map_type\": \"archipelago\", \"width\": 20}", root, err));
  ASSERT_TRUE(ApplyMapGenConfigJson(root, map, err));
  ASSERT_TRUE(map.forceType.has_value());
  EXPECT_EQ(*map.forceType, MapType::Archipelago);
  EXPECT_EQ(map.width, 20);
  EXPECT_EQ(map.height, 32);

  ASSERT_TRUE(ParseJson("{\"map_type\": \"volcano\"}", root, err));
  EXPECT_FALSE(ApplyMapGenConfigJson(root, map, err));
  ASSERT_TRUE(ParseJson("{\"height\": 4097}", root, err));
  EXPECT_FALSE(ApplyMapGenConfigJson(root, map, err));
  EXPECT_EQ(map.height, 32);

  // Files carry both sections and round-trip.
  const fs::path path = MakeTempPath("metrocore_cfg") / "config.json";
  ASSERT_TRUE(WriteConfigJsonFile(path.string(), cfg, map, err));
  GameConfig cfg2;
  MapGenConfig map2;
  ASSERT_TRUE(LoadConfigJsonFile(path.string(), &cfg2, &map2, err));
  EXPECT_EQ(cfg2.trainCapacity, 40);
  EXPECT_NEAR(cfg2.fare, 7.5, 1e-12);
  EXPECT_EQ(map2.width, 20);
  EXPECT_TRUE(map2.forceType.has_value());

  const MapGenConfig fromGame = MapGenConfigFromGame(cfg2);
  EXPECT_EQ(fromGame.width, cfg2.mapWidth);
  EXPECT_FALSE(fromGame.forceType.has_value());

  std::error_code ec;
  fs::remove_all(path.parent_path(), ec);
}

void TestScriptRunner()
{
  std::vector<std::string> printed;
  std::vector<std::string> errors;

  ScriptRunner runner;
  ScriptCallbacks cb;
  cb.print = [&](const std::string& line) { printed.push_back(line); };
  cb.error = [&](const std::string& line) { errors.push_back(line); };
  runner.setCallbacks(cb);
  ScriptRunOptions opt;
  opt.quiet = true;
  runner.setOptions(opt);

  EXPECT_FALSE(runner.runText("station 1 1\n", "setup.txt"));
  EXPECT_EQ(runner.lastErrorLine(), 1);
  EXPECT_TRUE(runner.lastError().find("setup.txt:1: no game yet") == 0);

  runner.state().game = GameController::createNew(1, LandMap(24, 16, 40, 20));

  const fs::path dir = MakeTempPath("metrocore_script");
  const std::string script =
    "# a three-stop line\n"
    "station 2 2\n"
    "station 6 2\n"
    "station 10 2   # east end\n"
    "line red 2,2 6,2 10,2\n"
    "train 1\n"
    "speed 4\n"
    "run_seconds 5.05\n"
    "check\n"
    "expect_money_ge 40000\n"
    "print stats\n"
    "remove_train 1\n"
    "check\n"
    "save " + dir.string() + "\n"
    "hash\n"
    "load " + dir.string() + "\n"
    "hash\n";
  EXPECT_TRUE(runner.runText(script));
  EXPECT_TRUE(errors.empty());
  ASSERT_TRUE(printed.size() == 3);
  EXPECT_TRUE(printed[0].find("stations=3 lines=1 trains=2") != std::string::npos);
  EXPECT_EQ(printed[1], printed[2]);
  EXPECT_EQ(printed[1].rfind("0x", 0), 0u);
  EXPECT_EQ(runner.state().game->state().lines[0].trains.size(), static_cast<std::size_t>(1));

  const std::string expect = "expect_hash " + printed[1] + "\n";
  EXPECT_TRUE(runner.runText(expect));
  EXPECT_FALSE(runner.runText("expect_hash 0x1\n"));

  // Rejected actions stop the run with the action kind and reason.
  EXPECT_FALSE(runner.runText("station 14 2\nstation 14 3\n"));
  EXPECT_EQ(runner.lastErrorLine(), 2);
  EXPECT_TRUE(runner.lastError().find("PLACE_STATION: Cannot place station adjacent to another station") !=
              std::string::npos);

  // A failed line is cancelled so the next one can start.
  EXPECT_FALSE(runner.runText("line red 2,2 14,2\n"));
  EXPECT_FALSE(runner.state().game->lineManager().isBuilding());
  EXPECT_TRUE(runner.runText("line blue 10,2 14,2\n"));

  EXPECT_FALSE(runner.runText("speed 3\n"));
  EXPECT_TRUE(runner.lastError().find("Invalid speed value") != std::string::npos);
  EXPECT_FALSE(runner.runText("\n\nfly_to_moon\n"));
  EXPECT_EQ(runner.lastErrorLine(), 3);

  // Generated maps honour size and type.
  EXPECT_TRUE(runner.runText("seed 0x2a\nsize 20x12\ntype river\ngenerate\ncheck\n"));
  EXPECT_EQ(runner.state().game->state().map.width(), 20);
  EXPECT_EQ(runner.state().game->state().map.mapType(), MapType::River);
  EXPECT_EQ(runner.state().seed, 42u);

  std::error_code ec;
  fs::remove_all(dir, ec);
}

struct FormatCounter {
  int* hits = nullptr;
};

std::ostream& operator<<(std::ostream& os, const FormatCounter& c)
{
  ++*c.hits;
  return os << "counted";
}

void TestLogging()
{
  std::vector<std::string> captured;
  SetLogSink([&](LogLevel level, const std::string& msg) {
    captured.push_back(std::string(LogLevelName(level)) + ":" + msg);
  });

  int formatted = 0;
  const LogLevel old = GetLogLevel();
  SetLogLevel(LogLevel::Warn);
  LogLine(LogLevel::Info) << "hidden " << FormatCounter{&formatted};
  LogLine(LogLevel::Warn) << "shown " << 2 << ' ' << FormatCounter{&formatted};
  LogMessage(LogLevel::Error, "also shown");
  SetLogLevel(LogLevel::None);
  LogLine(LogLevel::Error) << "silenced " << FormatCounter{&formatted};
  SetLogLevel(old);
  SetLogSink(LogSink{});

  EXPECT_EQ(formatted, 1);
  ASSERT_TRUE(captured.size() == 2);
  EXPECT_EQ(captured[0], std::string("WARN:shown 2 counted"));
  EXPECT_TRUE(captured[1].find("also shown") != std::string::npos);

  EXPECT_EQ(ParseLogLevel("WARNING", LogLevel::Info), LogLevel::Warn);
  EXPECT_EQ(ParseLogLevel("quiet", LogLevel::Info), LogLevel::None);
  EXPECT_EQ(ParseLogLevel("loud", LogLevel::Debug), LogLevel::Debug);
}

} // namespace

int main()
{
  SetLogLevel(LogLevel::Error);

  TestRngDeterminism();
  TestMapGenerationDeterministic();
  TestRiverMapShape();
  TestArchipelagoHasNoLakes();
  TestDensityFields();
  TestFloodFillComponents();
  TestOctilinearSegments();
  TestLineGeometryAndCost();
  TestStationGraphRoutes();
  TestStationPlacementRules();
  TestLineBuildingRules();
  TestTrainFleetLimits();
  TestTrainReversesAtLineEnds();
  TestLoopWrapDwellAndZeroLengthLeg();
  TestBoardingAndAlighting();
  TestBoardingRespectsCapacityAndLineChoice();
  TestLoopBoardingTowardsClosingStation();
  TestFareOnArrivalTick();
  TestCatchmentAndTimeRegimes();
  TestPassengerSpawning();
  TestEconomics();
  TestControllerDispatchAndListeners();
  TestLongRunConservesPassengers();
  TestSimulationDeterministic();
  TestSaveRoundTrip();
  TestMinimalSaveDefaults();
  TestReconcileRepairsBookkeeping();
  TestPersistencePorts();
  TestConfigOverrides();
  TestScriptRunner();
  TestLogging();

  if (g_failures == 0) {
    std::cout << "metro_tests: OK\n";
    return 0;
  }

  std::cerr << "metro_tests: FAILED (" << g_failures << ")\n";
  return 1;
}
