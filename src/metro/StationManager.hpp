#pragma once

#include "metro/ActionResult.hpp"
#include "metro/Config.hpp"
#include "metro/GameState.hpp"

#include <vector>

namespace metro {

// Station placement and removal rules.
//
// Vertices range over [0, width] x [0, height]. A vertex counts as water only
// when all four tiles around it exist and are water. Stations must not share a
// vertex or sit on 4-adjacent vertices.
class StationManager {
public:
  StationManager(GameState& state, const GameConfig& cfg) : m_state(state), m_cfg(cfg) {}

  bool hasStationAt(int vertexX, int vertexY) const;
  bool hasAdjacentStation(int vertexX, int vertexY) const;
  bool isWater(int vertexX, int vertexY) const;
  bool isOnLand(int vertexX, int vertexY) const;

  ValidationResult canPlaceStation(int vertexX, int vertexY) const;

  // Places the station, labels it by insertion order and charges the station cost.
  ActionResult placeStation(int vertexX, int vertexY);

  ValidationResult canRemoveStation(StationId id) const;
  ActionResult removeStation(StationId id);

  const Station* getStationAt(int vertexX, int vertexY) const;
  const Station* getStationById(StationId id) const;
  const std::vector<Station>& getAllStations() const { return m_state.stations; }

private:
  GameState& m_state;
  const GameConfig& m_cfg;
};

} // namespace metro
