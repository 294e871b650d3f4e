#pragma once

#include "metro/Config.hpp"
#include "metro/GameState.hpp"
#include "metro/Json.hpp"

#include <string>

namespace metro {

// Text save format.
//
// A save is a single JSON object tagged {"format": "metrocore-save", "version": 1}.
// 64-bit values that may exceed 2^53 (seeds, RNG state) are written as decimal
// strings. Train path caches are not stored; InitializeTrains rebuilds them.
//
// Loading is lenient about optional data: the clock, money, passenger roster,
// station queues and labels, line train lists, pause flag, speed, RNG state and
// id counters default when absent. Seed, map, stations and lines are required.

constexpr const char* kSaveFormatName = "metrocore-save";
constexpr int kSaveFormatVersion = 1;

JsonValue GameStateToJson(const GameState& state);

std::string SerializeGameState(const GameState& state, bool pretty = false);

bool GameStateFromJson(const JsonValue& root, GameState& outState, std::string& outError, const GameConfig& cfg = {});

// Parse + validate + reconcile. On failure `outState` is untouched.
bool DeserializeGameState(const std::string& text, GameState& outState, std::string& outError,
                          const GameConfig& cfg = {});

// Repair passenger bookkeeping so that every roster passenger sits in exactly one
// station queue or train and every queued/carried id is in the roster. Returns the
// number of repairs made.
int ReconcilePassengers(GameState& state);

} // namespace metro
