#pragma once

#include "metro/Types.hpp"

#include <cstdint>
#include <optional>
#include <vector>

namespace metro {

// A passenger sits in exactly one place at a time: a station queue
// (currentStationId set) or a train (currentTrainId set). Completed passengers
// are removed from the game.
struct Passenger {
  PassengerId id = 0;
  StationId sourceStationId = 0;
  StationId destinationStationId = 0;

  // Simulation clock (epoch milliseconds) at spawn.
  std::int64_t spawnTime = 0;

  // Station hops from source to destination, inclusive.
  std::vector<StationId> path;
  int nextWaypointIndex = 0;

  std::optional<StationId> currentStationId;
  std::optional<TrainId> currentTrainId;
};

} // namespace metro
