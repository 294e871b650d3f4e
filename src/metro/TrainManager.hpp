#pragma once

#include "metro/ActionResult.hpp"
#include "metro/Config.hpp"
#include "metro/GameState.hpp"

#include <optional>
#include <vector>

namespace metro {

// Per-line train fleet limits: between GameConfig::minTrainsPerLine and
// maxTrainsPerLine trains on every completed line.
class TrainManager {
public:
  TrainManager(GameState& state, const GameConfig& cfg) : m_state(state), m_cfg(cfg) {}

  // Adds the next train (ordinal = current count + 1) with its path computed.
  ActionResult addTrainToLine(LineId lineId);

  // Removes `trainId`, or the newest train when none is given. Passengers aboard
  // are put back at the station the train last served.
  ActionResult removeTrainFromLine(LineId lineId, std::optional<TrainId> trainId = std::nullopt);

  int getTrainCount(LineId lineId) const;
  bool canAddTrain(LineId lineId) const;
  bool canRemoveTrain(LineId lineId) const;

  const std::vector<Train>* getTrainsForLine(LineId lineId) const;

private:
  void evacuate(const MetroLine& line, Train& train);

  GameState& m_state;
  const GameConfig& m_cfg;
};

} // namespace metro
