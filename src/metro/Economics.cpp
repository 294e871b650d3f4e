#include "metro/Economics.hpp"

#include "metro/GameState.hpp"
#include "metro/LinePath.hpp"

#include <cmath>
#include <cstdio>

namespace metro {

double CalculateLineLength(const GameState& state, const MetroLine& line)
{
  if (line.stationIds.size() < 2) return 0.0;
  return LinePathLength(state, line);
}

double CalculateLineCost(const GameState& state, const MetroLine& line, const GameConfig& cfg)
{
  return CalculateLineLength(state, line) * cfg.lineCostPerUnit;
}

void DeductStationCost(GameState& state, const GameConfig& cfg) { state.money -= cfg.stationCost; }

double DeductLineCost(GameState& state, const MetroLine& line, const GameConfig& cfg)
{
  const double cost = CalculateLineCost(state, line, cfg);
  state.money -= cost;
  return cost;
}

void DeductTrainRunningCost(GameState& state, double distance, const GameConfig& cfg)
{
  state.money -= distance * cfg.runningCostPerUnit;
}

void AddTicketRevenue(GameState& state, const GameConfig& cfg) { state.money += cfg.fare; }

std::string FormatMoney(double money)
{
  char buf[64];
  std::snprintf(buf, sizeof(buf), "%s$%.0f", money < 0.0 ? "-" : "", std::fabs(money));
  return std::string(buf);
}

} // namespace metro
