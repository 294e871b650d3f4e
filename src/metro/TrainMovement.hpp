#pragma once

#include "metro/Config.hpp"
#include "metro/Train.hpp"

namespace metro {

struct GameState;
struct MetroLine;

// Build a train for `line` positioned by its 1-based ordinal on that line:
// odd ordinals run forward and even ones backward; the first two start at the
// line ends and later ones start mid-line so trains spread out. The id is
// allocated from state.nextTrainId. The path is not computed yet.
Train CreateTrainForLine(GameState& state, const MetroLine& line, int ordinal, const GameConfig& cfg);

// Recompute and cache the train's current -> target segment. Returns false (and
// leaves the cache untouched) when an index or station lookup fails.
bool UpdateTrainPath(const GameState& state, const MetroLine& line, Train& train);

// Give every line without trains its first train and compute missing path caches
// (needed after loading a save, which does not store them).
void InitializeTrains(GameState& state, const GameConfig& cfg);

// Advance every train by `deltaSeconds` of real time at the current speed:
// dwell countdown, accelerate/cruise/decelerate, arrival handling (next target,
// alighting, boarding, new path). Running costs are charged per distance moved.
void UpdateTrains(GameState& state, double deltaSeconds, const GameConfig& cfg);

} // namespace metro
