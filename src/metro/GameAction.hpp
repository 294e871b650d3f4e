#pragma once

#include "metro/MetroLine.hpp"
#include "metro/Types.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <variant>

namespace metro {

// Closed set of player actions accepted by GameController::dispatch.
//
// One payload struct per action; GameAction is the variant over all of them so
// dispatch is an exhaustive std::visit.

struct PlaceStationAction {
  int vertexX = 0;
  int vertexY = 0;
};

struct RemoveStationAction {
  StationId stationId = 0;
};

struct StartLineAction {
  LineColor color = LineColor::Red;
};

struct AddStationToLineAction {
  StationId stationId = 0;
};

struct CompleteLineAction {};

struct CancelLineAction {};

struct AddTrainAction {
  LineId lineId = 0;
};

struct RemoveTrainAction {
  LineId lineId = 0;
  std::optional<TrainId> trainId;
};

struct PauseAction {};

struct ResumeAction {};

struct SetSpeedAction {
  int speed = 1;
};

using GameAction = std::variant<PlaceStationAction, RemoveStationAction, StartLineAction, AddStationToLineAction,
                                CompleteLineAction, CancelLineAction, AddTrainAction, RemoveTrainAction, PauseAction,
                                ResumeAction, SetSpeedAction>;

enum class ActionKind : std::uint8_t {
  PlaceStation = 0,
  RemoveStation,
  StartLine,
  AddStationToLine,
  CompleteLine,
  CancelLine,
  AddTrain,
  RemoveTrain,
  Pause,
  Resume,
  SetSpeed,
};

ActionKind ActionKindOf(const GameAction& action);

// "PLACE_STATION", "REMOVE_STATION", ...
const char* ToString(ActionKind kind);

// Accepts the upper-case names above (case-insensitive).
bool ParseActionKind(const std::string& s, ActionKind& out);

} // namespace metro
