#pragma once

#include "metro/LinePath.hpp"
#include "metro/Types.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace metro {

enum class TrainState : std::uint8_t {
  Moving = 0,
  Stopped = 1,
};

const char* ToString(TrainState s);
bool ParseTrainState(const std::string& s, TrainState& out);

// A train belongs to exactly one line and refers to it by id.
struct Train {
  TrainId id = 0;
  LineId lineId = 0;

  TrainState state = TrainState::Moving;

  // Remaining dwell, in distance units (see GameConfig::dwellDistance).
  double dwellRemaining = 0.0;

  // Indices into the owning line's stationIds.
  int currentStationIdx = 0;
  int targetStationIdx = 1;

  // Fraction [0, 1) of the current segment covered.
  double progress = 0.0;

  // +1 towards higher station indices, -1 towards lower.
  int direction = 1;

  // Cached path for current -> target. Not persisted; recomputed after load.
  std::optional<LineSegment> currentSegment;
  double totalLength = 0.0;

  std::vector<PassengerId> passengers;
  int capacity = 30;
};

} // namespace metro
