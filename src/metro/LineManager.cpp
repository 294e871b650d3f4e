#include "metro/LineManager.hpp"

#include "metro/Economics.hpp"
#include "metro/Log.hpp"

#include <algorithm>
#include <string>
#include <utility>

namespace metro {

ActionResult LineManager::startLine(LineColor color)
{
  if (HasLineWithColor(m_state, color)) {
    return ActionResult::Fail(std::string("Line with color ") + ToString(color) + " already exists");
  }

  BuildingLine b;
  b.color = color;
  m_current = b;
  return ActionResult::Ok();
}

ActionResult LineManager::addStationToLine(StationId id)
{
  if (!m_current) return ActionResult::Fail("No line is being built");
  if (!FindStation(m_state, id)) return ActionResult::Fail("Station not found");
  if (!CanAddStationToLine(m_current->stationIds, id)) return ActionResult::Fail("Cannot add this station to the line");

  m_current->stationIds.push_back(id);

  ActionData d;
  d.stationId = id;
  return ActionResult::Ok(d);
}

ActionResult LineManager::completeLine()
{
  if (!m_current) return ActionResult::Fail("No line is being built");
  if (m_current->stationIds.size() < 2) return ActionResult::Fail("Line must have at least 2 stations");

  // A station may have been removed while the line was being drawn.
  for (StationId sid : m_current->stationIds) {
    if (!FindStation(m_state, sid)) return ActionResult::Fail("Station not found");
  }
  if (HasLineWithColor(m_state, m_current->color)) {
    return ActionResult::Fail(std::string("Line with color ") + ToString(m_current->color) + " already exists");
  }

  MetroLine line;
  line.id = m_state.nextLineId++;
  line.color = m_current->color;
  line.stationIds = std::move(m_current->stationIds);
  line.isLoop = IsLineLoop(line.stationIds);
  m_current.reset();

  const double cost = DeductLineCost(m_state, line, m_cfg);
  LogLine(LogLevel::Debug) << "line " << line.id << " (" << ToString(line.color) << ") completed with "
      << line.stationIds.size() << " stops, cost " << cost;

  const LineId id = line.id;
  m_state.lines.push_back(std::move(line));

  ActionData d;
  d.lineId = id;
  return ActionResult::Ok(d);
}

std::vector<LineId> LineManager::getLinesForStation(StationId id) const
{
  std::vector<LineId> out;
  for (const MetroLine& l : m_state.lines) {
    if (std::find(l.stationIds.begin(), l.stationIds.end(), id) != l.stationIds.end()) out.push_back(l.id);
  }
  return out;
}

} // namespace metro
