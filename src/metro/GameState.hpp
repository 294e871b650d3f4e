#pragma once

#include "metro/Config.hpp"
#include "metro/MapGrid.hpp"
#include "metro/MetroLine.hpp"
#include "metro/Passenger.hpp"
#include "metro/Station.hpp"
#include "metro/Types.hpp"

#include <cstdint>
#include <map>
#include <string>
#include <vector>

namespace metro {

// The single root aggregate of a game.
//
// Passenger records live in `passengers`; station queues and train rosters hold
// ids into it. Every id in a queue or roster is in `passengers` exactly once and
// vice versa.
struct GameState {
  std::uint64_t seed = 0;
  MapGrid map;

  // Insertion order (labels and spawn iteration depend on it).
  std::vector<Station> stations;
  std::vector<MetroLine> lines;

  std::map<PassengerId, Passenger> passengers;

  // Epoch milliseconds (UTC).
  std::int64_t simulationTime = 0;

  double money = 0.0;
  bool isPaused = false;
  int speed = 1;

  // Passenger spawner random stream.
  std::uint64_t rngState = 0;

  LineId nextLineId = 1;
  TrainId nextTrainId = 1;
  PassengerId nextPassengerId = 1;
};

GameState CreateGameState(std::uint64_t seed, MapGrid map, const GameConfig& cfg = {});

Station* FindStation(GameState& s, StationId id);
const Station* FindStation(const GameState& s, StationId id);

MetroLine* FindLine(GameState& s, LineId id);
const MetroLine* FindLine(const GameState& s, LineId id);

// Searches every line's train list.
Train* FindTrain(GameState& s, TrainId id);
const Train* FindTrain(const GameState& s, TrainId id);

Passenger* FindPassenger(GameState& s, PassengerId id);

bool HasLineWithColor(const GameState& s, LineColor color);

// Colors not used by any line, in palette order.
std::vector<LineColor> AvailableLineColors(const GameState& s);

// True if any line's station list references the station.
bool IsStationInAnyLine(const GameState& s, StationId id);

// Verify the roster/queue/train consistency. Returns false with a description of
// the first violation found.
bool CheckPassengerInvariants(const GameState& s, std::string& outError);

} // namespace metro
