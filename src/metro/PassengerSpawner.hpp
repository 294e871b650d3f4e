#pragma once

#include "metro/Config.hpp"
#include "metro/Types.hpp"

#include <cstdint>
#include <unordered_map>

namespace metro {

class MapGrid;
struct GameState;
struct Station;

struct CatchmentStats {
  int residential = 0;
  int office = 0;
};

// Sum of densities over the land tiles connected (4-neighborhood, land only) to
// the four tiles touching the station's vertex, limited to the box
// [vx - radius, vx + radius - 1] x [vy - radius, vy + radius - 1].
CatchmentStats ComputeStationCatchment(const MapGrid& map, int vertexX, int vertexY, int radius);

// Per-station catchment memo. Catchments depend only on the map, so entries stay
// valid until the map is replaced; the owner must call clear() then.
class CatchmentCache {
public:
  const CatchmentStats& get(const MapGrid& map, const Station& station, int radius);

  void clear() { m_entries.clear(); }
  std::size_t size() const { return m_entries.size(); }

private:
  std::unordered_map<StationId, CatchmentStats> m_entries;
};

enum class TimeRegime : std::uint8_t {
  MorningRush = 0,
  EveningRush,
  Night,
  OffPeak,
};

const char* ToString(TimeRegime r);

// UTC hour (0..23) of an epoch-milliseconds clock.
int HourOfDay(std::int64_t epochMs);

TimeRegime RegimeForHour(int hour);

double SpawnMultiplier(TimeRegime r, const GameConfig& cfg);

// Probabilistic passenger generation.
//
// Each station runs one Bernoulli trial per call. Randomness comes from
// GameState::rngState, so a saved game resumes the same stream.
class PassengerSpawner {
public:
  explicit PassengerSpawner(const GameConfig& cfg) : m_cfg(cfg) {}

  // `gameSeconds` is elapsed in-game time since the previous call.
  // Returns the number of passengers created.
  int update(GameState& state, double gameSeconds);

  CatchmentCache& cache() { return m_cache; }

  // Call whenever the map in the driven GameState is replaced.
  void invalidate() { m_cache.clear(); }

  void setConfig(const GameConfig& cfg) { m_cfg = cfg; }

private:
  GameConfig m_cfg;
  CatchmentCache m_cache;
};

} // namespace metro
