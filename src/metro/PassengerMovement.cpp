#include "metro/PassengerMovement.hpp"

#include "metro/Economics.hpp"
#include "metro/GameState.hpp"
#include "metro/Log.hpp"

#include <algorithm>
#include <iterator>
#include <optional>
#include <utility>
#include <vector>

namespace metro {

namespace {

int IndexOf(const std::vector<StationId>& ids, StationId id)
{
  auto it = std::find(ids.begin(), ids.end(), id);
  return it == ids.end() ? -1 : static_cast<int>(std::distance(ids.begin(), it));
}

std::optional<LineId> LineConnecting(const GameState& state, StationId a, StationId b)
{
  for (const MetroLine& l : state.lines) {
    if (IndexOf(l.stationIds, a) >= 0 && IndexOf(l.stationIds, b) >= 0) return l.id;
  }
  return std::nullopt;
}

int LastIndexOf(const std::vector<StationId>& ids, StationId id)
{
  auto it = std::find(ids.rbegin(), ids.rend(), id);
  return it == ids.rend() ? -1 : static_cast<int>(std::distance(it, ids.rend())) - 1;
}

bool HeadingTowards(const Train& train, const MetroLine& line, StationId target)
{
  // A loop's closing station sits at both ends; forward trains reach it at the back.
  const bool forward = train.direction == 1;
  const int idx = (forward && line.isLoop) ? LastIndexOf(line.stationIds, target) : IndexOf(line.stationIds, target);
  if (idx < 0) return false;
  return train.direction == 1 ? idx > train.currentStationIdx : idx < train.currentStationIdx;
}

bool ShouldBoard(const GameState& state, const Passenger& p, const MetroLine& line, const Train& train)
{
  if (p.nextWaypointIndex < 0 || p.nextWaypointIndex >= static_cast<int>(p.path.size())) return false;
  if (!p.currentStationId) return false;

  const StationId next = p.path[static_cast<std::size_t>(p.nextWaypointIndex)];
  const std::optional<LineId> required = LineConnecting(state, *p.currentStationId, next);
  if (!required || *required != line.id) return false;

  return HeadingTowards(train, line, next);
}

} // namespace

void HandlePassengerAlighting(GameState& state, Train& train, Station& station, const GameConfig& cfg)
{
  std::vector<PassengerId> staying;
  staying.reserve(train.passengers.size());

  for (PassengerId pid : train.passengers) {
    Passenger* p = FindPassenger(state, pid);
    if (!p) {
      LogLine(LogLevel::Warn) << "train " << train.id << " carried unknown passenger " << pid << "; dropped";
      continue;
    }

    const bool arrived = p->nextWaypointIndex >= 0 && p->nextWaypointIndex < static_cast<int>(p->path.size()) &&
                         p->path[static_cast<std::size_t>(p->nextWaypointIndex)] == station.id;
    if (!arrived) {
      staying.push_back(pid);
      continue;
    }

    p->currentTrainId.reset();

    if (station.id == p->destinationStationId) {
      state.passengers.erase(pid);
      AddTicketRevenue(state, cfg);
    } else {
      p->currentStationId = station.id;
      ++p->nextWaypointIndex;
      station.passengers.push_back(pid);
    }
  }

  train.passengers = std::move(staying);
}

void HandlePassengerBoarding(GameState& state, const MetroLine& line, Train& train, Station& station)
{
  std::vector<PassengerId> remaining;
  remaining.reserve(station.passengers.size());

  for (PassengerId pid : station.passengers) {
    Passenger* p = FindPassenger(state, pid);
    if (!p) {
      LogLine(LogLevel::Warn) << "station " << FormatStationId(station.id) << " queued unknown passenger " << pid
          << "; dropped";
      continue;
    }

    const bool waiting = p->currentStationId && *p->currentStationId == station.id && !p->currentTrainId;
    if (waiting && static_cast<int>(train.passengers.size()) < train.capacity && ShouldBoard(state, *p, line, train)) {
      p->currentStationId.reset();
      p->currentTrainId = train.id;
      train.passengers.push_back(pid);
    } else {
      remaining.push_back(pid);
    }
  }

  station.passengers = std::move(remaining);
}

void UpdatePassengerMovement(GameState& state, const MetroLine& line, Train& train, Station& station,
                             const GameConfig& cfg)
{
  HandlePassengerAlighting(state, train, station, cfg);
  HandlePassengerBoarding(state, line, train, station);
}

} // namespace metro
