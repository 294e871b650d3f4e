#include "metro/StationManager.hpp"

#include "metro/Economics.hpp"
#include "metro/Log.hpp"

namespace metro {

bool StationManager::hasStationAt(int vertexX, int vertexY) const
{
  return FindStation(m_state, MakeStationId(vertexX, vertexY)) != nullptr;
}

bool StationManager::hasAdjacentStation(int vertexX, int vertexY) const
{
  return hasStationAt(vertexX - 1, vertexY) || hasStationAt(vertexX + 1, vertexY) ||
         hasStationAt(vertexX, vertexY - 1) || hasStationAt(vertexX, vertexY + 1);
}

bool StationManager::isWater(int vertexX, int vertexY) const { return m_state.map.isWaterVertex(vertexX, vertexY); }

bool StationManager::isOnLand(int vertexX, int vertexY) const
{
  const MapGrid& m = m_state.map;
  return m.isLand(vertexX - 1, vertexY - 1) || m.isLand(vertexX, vertexY - 1) || m.isLand(vertexX - 1, vertexY) ||
         m.isLand(vertexX, vertexY);
}

ValidationResult StationManager::canPlaceStation(int vertexX, int vertexY) const
{
  if (vertexX < 0 || vertexX > m_state.map.width()) return ValidationResult::Fail("X coordinate out of bounds");
  if (vertexY < 0 || vertexY > m_state.map.height()) return ValidationResult::Fail("Y coordinate out of bounds");
  if (isWater(vertexX, vertexY)) return ValidationResult::Fail("Cannot place station on water");
  if (hasStationAt(vertexX, vertexY)) return ValidationResult::Fail("Station already exists at this location");
  if (hasAdjacentStation(vertexX, vertexY)) {
    return ValidationResult::Fail("Cannot place station adjacent to another station");
  }
  return ValidationResult::Ok();
}

ActionResult StationManager::placeStation(int vertexX, int vertexY)
{
  const ValidationResult v = canPlaceStation(vertexX, vertexY);
  if (!v.valid) return ActionResult::Fail(v.reason);

  Station st = MakeStation(vertexX, vertexY, GenerateStationLabel(static_cast<int>(m_state.stations.size())));
  DeductStationCost(m_state, m_cfg);
  m_state.stations.push_back(st);

  ActionData d;
  d.stationId = st.id;
  return ActionResult::Ok(d);
}

ValidationResult StationManager::canRemoveStation(StationId id) const
{
  if (!FindStation(m_state, id)) return ValidationResult::Fail("Station not found");
  if (IsStationInAnyLine(m_state, id)) return ValidationResult::Fail("Cannot remove station that is part of a line");
  return ValidationResult::Ok();
}

ActionResult StationManager::removeStation(StationId id)
{
  const ValidationResult v = canRemoveStation(id);
  if (!v.valid) return ActionResult::Fail(v.reason);

  for (auto it = m_state.stations.begin(); it != m_state.stations.end(); ++it) {
    if (it->id != id) continue;

    // Nobody can wait at a station no line serves, but keep the roster honest anyway.
    for (PassengerId pid : it->passengers) {
      LogLine(LogLevel::Warn) << "removing station " << FormatStationId(id) << " drops waiting passenger " << pid;
      m_state.passengers.erase(pid);
    }
    m_state.stations.erase(it);
    break;
  }

  ActionData d;
  d.stationId = id;
  return ActionResult::Ok(d);
}

const Station* StationManager::getStationAt(int vertexX, int vertexY) const
{
  return FindStation(m_state, MakeStationId(vertexX, vertexY));
}

const Station* StationManager::getStationById(StationId id) const { return FindStation(m_state, id); }

} // namespace metro
