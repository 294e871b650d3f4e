#pragma once

#include "metro/Config.hpp"

#include <string>

namespace metro {

struct GameState;
struct MetroLine;

// Money ledger. All functions mutate GameState::money in place; money may go
// negative.

// Total octilinear length of a line (same geometry the trains follow).
double CalculateLineLength(const GameState& state, const MetroLine& line);

double CalculateLineCost(const GameState& state, const MetroLine& line, const GameConfig& cfg);

void DeductStationCost(GameState& state, const GameConfig& cfg);

// Returns the amount deducted.
double DeductLineCost(GameState& state, const MetroLine& line, const GameConfig& cfg);

void DeductTrainRunningCost(GameState& state, double distance, const GameConfig& cfg);

void AddTicketRevenue(GameState& state, const GameConfig& cfg);

// "$1234" / "-$56", rounded to whole units.
std::string FormatMoney(double money);

} // namespace metro
