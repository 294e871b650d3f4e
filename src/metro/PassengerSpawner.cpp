#include "metro/PassengerSpawner.hpp"

#include "metro/GameState.hpp"
#include "metro/MapGrid.hpp"
#include "metro/Random.hpp"
#include "metro/StationGraph.hpp"

#include <algorithm>
#include <cstddef>
#include <deque>
#include <optional>
#include <utility>
#include <vector>

namespace metro {

CatchmentStats ComputeStationCatchment(const MapGrid& map, int vertexX, int vertexY, int radius)
{
  CatchmentStats stats;
  if (radius <= 0) return stats;

  const int minX = vertexX - radius;
  const int maxX = vertexX + radius - 1;
  const int minY = vertexY - radius;
  const int maxY = vertexY + radius - 1;
  const int boxW = maxX - minX + 1;
  const int boxH = maxY - minY + 1;

  auto inBox = [&](int x, int y) { return x >= minX && x <= maxX && y >= minY && y <= maxY; };
  auto boxIndex = [&](int x, int y) {
    return static_cast<std::size_t>(y - minY) * static_cast<std::size_t>(boxW) + static_cast<std::size_t>(x - minX);
  };

  std::vector<std::uint8_t> visited(static_cast<std::size_t>(boxW) * static_cast<std::size_t>(boxH), 0);
  std::deque<Point> queue;

  auto tryPush = [&](int x, int y) {
    if (!inBox(x, y) || !map.isLand(x, y)) return;
    std::uint8_t& v = visited[boxIndex(x, y)];
    if (v) return;
    v = 1;
    queue.push_back(Point{x, y});
  };

  tryPush(vertexX - 1, vertexY - 1);
  tryPush(vertexX, vertexY - 1);
  tryPush(vertexX - 1, vertexY);
  tryPush(vertexX, vertexY);

  while (!queue.empty()) {
    const Point p = queue.front();
    queue.pop_front();

    const Tile& t = map.at(p.x, p.y);
    stats.residential += t.residentialDensity;
    stats.office += t.officeDensity;

    tryPush(p.x - 1, p.y);
    tryPush(p.x + 1, p.y);
    tryPush(p.x, p.y - 1);
    tryPush(p.x, p.y + 1);
  }

  return stats;
}

const CatchmentStats& CatchmentCache::get(const MapGrid& map, const Station& station, int radius)
{
  auto it = m_entries.find(station.id);
  if (it != m_entries.end()) return it->second;

  const CatchmentStats stats = ComputeStationCatchment(map, station.vertexX, station.vertexY, radius);
  return m_entries.emplace(station.id, stats).first->second;
}

const char* ToString(TimeRegime r)
{
  switch (r) {
  case TimeRegime::MorningRush: return "morning_rush";
  case TimeRegime::EveningRush: return "evening_rush";
  case TimeRegime::Night: return "night";
  case TimeRegime::OffPeak: return "off_peak";
  }
  return "off_peak";
}

int HourOfDay(std::int64_t epochMs)
{
  constexpr std::int64_t kMsPerHour = 3600 * 1000;
  std::int64_t hours = epochMs / kMsPerHour;
  if (epochMs % kMsPerHour < 0) --hours;
  const std::int64_t h = hours % 24;
  return static_cast<int>(h < 0 ? h + 24 : h);
}

TimeRegime RegimeForHour(int hour)
{
  if (hour >= 6 && hour < 10) return TimeRegime::MorningRush;
  if (hour >= 16 && hour < 20) return TimeRegime::EveningRush;
  if (hour >= 22 || hour < 5) return TimeRegime::Night;
  return TimeRegime::OffPeak;
}

double SpawnMultiplier(TimeRegime r, const GameConfig& cfg)
{
  switch (r) {
  case TimeRegime::MorningRush:
  case TimeRegime::EveningRush: return cfg.rushHourMultiplier;
  case TimeRegime::Night: return cfg.nightMultiplier;
  case TimeRegime::OffPeak: return 1.0;
  }
  return 1.0;
}

int PassengerSpawner::update(GameState& state, double gameSeconds)
{
  if (state.stations.size() < 2 || gameSeconds <= 0.0) return 0;

  const TimeRegime regime = RegimeForHour(HourOfDay(state.simulationTime));
  const double multiplier = SpawnMultiplier(regime, m_cfg);

  // Destination weights for this tick.
  std::vector<double> destWeight(state.stations.size(), 1.0);
  std::vector<double> sourcePotential(state.stations.size(), 0.0);
  for (std::size_t i = 0; i < state.stations.size(); ++i) {
    const CatchmentStats& c = m_cache.get(state.map, state.stations[i], m_cfg.catchmentRadius);
    switch (regime) {
    case TimeRegime::MorningRush:
      destWeight[i] += c.office * 2.0;
      sourcePotential[i] = c.residential;
      break;
    case TimeRegime::EveningRush:
      destWeight[i] += c.residential * 2.0;
      sourcePotential[i] = c.office;
      break;
    case TimeRegime::Night:
    case TimeRegime::OffPeak:
      destWeight[i] += c.residential + c.office;
      sourcePotential[i] = (c.residential + c.office) * 0.5;
      break;
    }
  }

  double totalWeight = 0.0;
  for (double w : destWeight) totalWeight += w;

  const double normalizer = m_cfg.spawnDensityNormalizer > 0.0 ? m_cfg.spawnDensityNormalizer : 1.0;

  RNG rng;
  rng.state = state.rngState;

  // Route lookups in this tick share one graph snapshot; spawning never changes lines.
  const StationGraph graph(state);

  int spawned = 0;
  for (std::size_t i = 0; i < state.stations.size(); ++i) {
    const double chance = std::min(
        1.0, m_cfg.baseSpawnRate * multiplier * (sourcePotential[i] / normalizer) * gameSeconds / 3600.0);
    if (!rng.chance(chance)) continue;

    const StationId sourceId = state.stations[i].id;
    const double available = totalWeight - destWeight[i];
    if (available <= 0.0) continue;

    // Roulette over every other station.
    double r = rng.nextF01() * available;
    std::optional<std::size_t> pick;
    for (std::size_t j = 0; j < state.stations.size(); ++j) {
      if (j == i) continue;
      r -= destWeight[j];
      if (r <= 0.0) {
        pick = j;
        break;
      }
    }
    if (!pick) pick = (i == 0) ? 1 : 0;

    const StationId destId = state.stations[*pick].id;
    std::optional<std::vector<StationId>> route = graph.findRoute(sourceId, destId);
    if (!route || route->size() < 2) continue;

    Passenger p;
    p.id = state.nextPassengerId++;
    p.sourceStationId = sourceId;
    p.destinationStationId = destId;
    p.spawnTime = state.simulationTime;
    p.path = std::move(*route);
    p.nextWaypointIndex = 1;
    p.currentStationId = sourceId;

    state.stations[i].passengers.push_back(p.id);
    state.passengers.emplace(p.id, std::move(p));
    ++spawned;
  }

  state.rngState = rng.state;
  return spawned;
}

} // namespace metro
