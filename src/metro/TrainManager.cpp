#include "metro/TrainManager.hpp"

#include "metro/Log.hpp"
#include "metro/StationGraph.hpp"
#include "metro/TrainMovement.hpp"

#include <cstddef>
#include <utility>

namespace metro {

ActionResult TrainManager::addTrainToLine(LineId lineId)
{
  MetroLine* line = FindLine(m_state, lineId);
  if (!line) return ActionResult::Fail("Line not found");
  if (static_cast<int>(line->trains.size()) >= m_cfg.maxTrainsPerLine) {
    return ActionResult::Fail("Maximum trains reached for this line");
  }
  if (line->stationIds.size() < 2) return ActionResult::Fail("Line needs at least 2 stations");

  const int ordinal = static_cast<int>(line->trains.size()) + 1;
  Train t = CreateTrainForLine(m_state, *line, ordinal, m_cfg);
  if (!UpdateTrainPath(m_state, *line, t)) {
    LogLine(LogLevel::Warn) << "new train " << t.id << " on line " << lineId << " has no path yet";
  }

  ActionData d;
  d.lineId = lineId;
  d.trainId = t.id;
  line->trains.push_back(std::move(t));
  return ActionResult::Ok(d);
}

void TrainManager::evacuate(const MetroLine& line, Train& train)
{
  if (train.passengers.empty()) return;

  const int idx = train.currentStationIdx;
  Station* st = nullptr;
  if (idx >= 0 && idx < static_cast<int>(line.stationIds.size())) {
    st = FindStation(m_state, line.stationIds[static_cast<std::size_t>(idx)]);
  }

  const StationGraph graph(m_state);
  for (PassengerId pid : train.passengers) {
    Passenger* p = FindPassenger(m_state, pid);
    if (!p) continue;

    std::optional<std::vector<StationId>> route;
    if (st) route = graph.findRoute(st->id, p->destinationStationId);

    if (!st || !route || route->size() < 2) {
      LogLine(LogLevel::Info) << "passenger " << pid << " stranded by removal of train " << train.id << "; dropped";
      m_state.passengers.erase(pid);
      continue;
    }

    p->currentTrainId.reset();
    p->currentStationId = st->id;
    p->path = std::move(*route);
    p->nextWaypointIndex = 1;
    st->passengers.push_back(pid);
  }
  train.passengers.clear();
}

ActionResult TrainManager::removeTrainFromLine(LineId lineId, std::optional<TrainId> trainId)
{
  MetroLine* line = FindLine(m_state, lineId);
  if (!line) return ActionResult::Fail("Line not found");
  if (static_cast<int>(line->trains.size()) <= m_cfg.minTrainsPerLine) {
    return ActionResult::Fail("Must have at least one train per line");
  }

  std::size_t index = line->trains.size() - 1;
  if (trainId) {
    bool found = false;
    for (std::size_t i = 0; i < line->trains.size(); ++i) {
      if (line->trains[i].id == *trainId) {
        index = i;
        found = true;
        break;
      }
    }
    if (!found) return ActionResult::Fail("Train not found");
  }

  const TrainId removed = line->trains[index].id;
  evacuate(*line, line->trains[index]);
  line->trains.erase(line->trains.begin() + static_cast<std::ptrdiff_t>(index));

  ActionData d;
  d.lineId = lineId;
  d.trainId = removed;
  return ActionResult::Ok(d);
}

int TrainManager::getTrainCount(LineId lineId) const
{
  const MetroLine* line = FindLine(m_state, lineId);
  return line ? static_cast<int>(line->trains.size()) : 0;
}

bool TrainManager::canAddTrain(LineId lineId) const
{
  const MetroLine* line = FindLine(m_state, lineId);
  return line && static_cast<int>(line->trains.size()) < m_cfg.maxTrainsPerLine;
}

bool TrainManager::canRemoveTrain(LineId lineId) const
{
  const MetroLine* line = FindLine(m_state, lineId);
  return line && static_cast<int>(line->trains.size()) > m_cfg.minTrainsPerLine;
}

const std::vector<Train>* TrainManager::getTrainsForLine(LineId lineId) const
{
  const MetroLine* line = FindLine(m_state, lineId);
  return line ? &line->trains : nullptr;
}

} // namespace metro
