#pragma once

#include "metro/ActionResult.hpp"
#include "metro/Config.hpp"
#include "metro/GameState.hpp"

#include <optional>
#include <vector>

namespace metro {

// A line under construction. Only becomes part of GameState on completion.
struct BuildingLine {
  LineColor color = LineColor::Red;
  std::vector<StationId> stationIds;
};

// Line construction rules: one line per color, no repeated stations except the
// first one to close a loop, at least two stations to complete. Completed lines
// are immutable.
class LineManager {
public:
  LineManager(GameState& state, const GameConfig& cfg) : m_state(state), m_cfg(cfg) {}

  bool isBuilding() const { return m_current.has_value(); }
  const std::optional<BuildingLine>& currentLine() const { return m_current; }

  std::vector<LineColor> availableColors() const { return AvailableLineColors(m_state); }

  ActionResult startLine(LineColor color);
  ActionResult addStationToLine(StationId id);

  // Always succeeds; a no-op when nothing is being built.
  void cancelLine() { m_current.reset(); }

  // Appends the line to GameState and charges its construction cost.
  ActionResult completeLine();

  const MetroLine* getLineById(LineId id) const { return FindLine(m_state, id); }
  const std::vector<MetroLine>& getAllLines() const { return m_state.lines; }
  std::vector<LineId> getLinesForStation(StationId id) const;

private:
  GameState& m_state;
  const GameConfig& m_cfg;
  std::optional<BuildingLine> m_current;
};

} // namespace metro
