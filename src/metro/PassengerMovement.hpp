#pragma once

#include "metro/Config.hpp"

namespace metro {

struct GameState;
struct MetroLine;
struct Station;
struct Train;

// Passengers whose next waypoint is `station` leave the train. Those at their
// destination complete their journey (fare, removed from the game); the rest
// re-queue at the station with their waypoint index advanced.
void HandlePassengerAlighting(GameState& state, Train& train, Station& station, const GameConfig& cfg);

// Waiting passengers board in queue order while capacity lasts, when the first
// line serving both their station and their next waypoint is this train's line
// and the train is heading towards that waypoint.
void HandlePassengerBoarding(GameState& state, const MetroLine& line, Train& train, Station& station);

// Alighting, then boarding.
void UpdatePassengerMovement(GameState& state, const MetroLine& line, Train& train, Station& station,
                             const GameConfig& cfg);

} // namespace metro
