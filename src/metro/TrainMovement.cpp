#include "metro/TrainMovement.hpp"

#include "metro/Economics.hpp"
#include "metro/GameState.hpp"
#include "metro/LinePath.hpp"
#include "metro/Log.hpp"
#include "metro/PassengerMovement.hpp"

#include <algorithm>
#include <cstddef>
#include <optional>
#include <utility>

namespace metro {

namespace {

// Choose the station index after arriving at train.currentStationIdx.
void AdvanceTarget(Train& train, const MetroLine& line)
{
  const int count = static_cast<int>(line.stationIds.size());
  const int cur = train.currentStationIdx;

  if (line.isLoop) {
    if (train.direction == 1) {
      train.targetStationIdx = (cur + 1) % count;
    } else {
      train.targetStationIdx = (cur - 1 + count) % count;
    }
    return;
  }

  if (train.direction == 1) {
    if (cur >= count - 1) {
      train.direction = -1;
      train.targetStationIdx = cur - 1;
    } else {
      train.targetStationIdx = cur + 1;
    }
  } else {
    if (cur <= 0) {
      train.direction = 1;
      train.targetStationIdx = cur + 1;
    } else {
      train.targetStationIdx = cur - 1;
    }
  }
}

double SpeedFactor(double covered, double remaining, double rampDistance)
{
  if (rampDistance <= 0.0) return 1.0;

  double factor = 1.0;
  if (covered < rampDistance) factor = std::min(factor, std::max(0.1, covered / rampDistance));
  if (remaining < rampDistance) factor = std::min(factor, std::max(0.1, remaining / rampDistance));
  return factor;
}

void ArriveAtTarget(GameState& state, MetroLine& line, Train& train, const GameConfig& cfg)
{
  const int count = static_cast<int>(line.stationIds.size());
  if (train.targetStationIdx < 0 || train.targetStationIdx >= count) {
    LogLine(LogLevel::Warn) << "train " << train.id << " targets index " << train.targetStationIdx << " outside line "
        << line.id << "; arrival skipped";
    return;
  }

  train.currentStationIdx = train.targetStationIdx;
  train.progress = 0.0;
  train.state = TrainState::Stopped;
  train.dwellRemaining = cfg.dwellDistance;

  // Direction is settled before boarding so passengers see where the train goes next.
  AdvanceTarget(train, line);

  const StationId sid = line.stationIds[static_cast<std::size_t>(train.currentStationIdx)];
  if (Station* st = FindStation(state, sid)) {
    UpdatePassengerMovement(state, line, train, *st, cfg);
  } else {
    LogLine(LogLevel::Warn) << "line " << line.id << " references missing station " << FormatStationId(sid)
        << "; passenger exchange skipped";
  }

  if (!UpdateTrainPath(state, line, train)) {
    LogLine(LogLevel::Warn) << "train " << train.id << " could not route " << train.currentStationIdx << " -> "
        << train.targetStationIdx << " on line " << line.id;
  }
}

void StepTrain(GameState& state, MetroLine& line, Train& train, double dt, const GameConfig& cfg)
{
  if (!train.currentSegment) {
    if (!UpdateTrainPath(state, line, train)) {
      LogLine(LogLevel::Warn) << "train " << train.id << " has no routable segment on line " << line.id << "; skipped";
      return;
    }
  }

  if (train.state == TrainState::Stopped) {
    train.dwellRemaining -= cfg.trainSpeed * dt;
    if (train.dwellRemaining > 0.0) return;

    // Dwell over: start moving within this same tick.
    train.state = TrainState::Moving;
    train.dwellRemaining = 0.0;
  }

  const double total = train.totalLength;
  const double covered = train.progress * total;
  const double remaining = total - covered;

  const double factor = SpeedFactor(covered, remaining, cfg.accelerationDistance);
  const double moveDist = cfg.trainSpeed * factor * dt;

  DeductTrainRunningCost(state, moveDist, cfg);

  train.progress += (total > 0.0) ? moveDist / total : 1.0;

  if (train.progress >= 1.0) ArriveAtTarget(state, line, train, cfg);
}

} // namespace

Train CreateTrainForLine(GameState& state, const MetroLine& line, int ordinal, const GameConfig& cfg)
{
  const int count = static_cast<int>(line.stationIds.size());
  const int last = std::max(0, count - 1);

  Train t;
  t.id = state.nextTrainId++;
  t.lineId = line.id;
  t.state = TrainState::Moving;
  t.capacity = cfg.trainCapacity;
  t.direction = (ordinal % 2 == 1) ? 1 : -1;

  int start = 0;
  if (ordinal <= 2) {
    start = (t.direction == 1) ? 0 : last;
  } else {
    start = (t.direction == 1) ? count / 2 : last - count / 2;
  }
  start = std::clamp(start, 0, last);

  t.currentStationIdx = start;
  t.targetStationIdx = (t.direction == 1) ? std::min(start + 1, last) : std::max(start - 1, 0);
  return t;
}

bool UpdateTrainPath(const GameState& state, const MetroLine& line, Train& train)
{
  std::optional<LineSegment> seg = ComputeLineSegment(state, line, train.currentStationIdx, train.targetStationIdx);
  if (!seg) return false;

  train.totalLength = SegmentLength(*seg);
  train.currentSegment = std::move(*seg);
  return true;
}

void InitializeTrains(GameState& state, const GameConfig& cfg)
{
  for (MetroLine& line : state.lines) {
    if (line.trains.empty()) {
      if (line.stationIds.size() < 2) continue;
      Train t = CreateTrainForLine(state, line, 1, cfg);
      if (!UpdateTrainPath(state, line, t)) {
        LogLine(LogLevel::Warn) << "first train " << t.id << " on line " << line.id << " has no path yet";
      }
      line.trains.push_back(std::move(t));
      continue;
    }

    for (Train& t : line.trains) {
      if (t.currentSegment) continue;
      if (!UpdateTrainPath(state, line, t)) {
        LogLine(LogLevel::Warn) << "train " << t.id << " on line " << line.id << " has an unroutable position";
      }
    }
  }
}

void UpdateTrains(GameState& state, double deltaSeconds, const GameConfig& cfg)
{
  if (deltaSeconds <= 0.0) return;

  for (std::size_t li = 0; li < state.lines.size(); ++li) {
    MetroLine& line = state.lines[li];
    for (std::size_t ti = 0; ti < line.trains.size(); ++ti) {
      StepTrain(state, line, line.trains[ti], deltaSeconds, cfg);
    }
  }
}

} // namespace metro
