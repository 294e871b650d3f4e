#pragma once

#include "metro/Config.hpp"
#include "metro/GameState.hpp"

#include <functional>
#include <optional>
#include <string>

namespace metro {

constexpr const char* kSaveGameKey = "metromap-saved-game";

// Injected key/value storage for save data.
//
// `load` returns nullopt when the key has no value. `save` returns false when the
// blob could not be stored. Any member may be empty (treated as "no storage").
struct PersistencePort {
  std::function<std::optional<std::string>(const std::string& key)> load;
  std::function<bool(const std::string& key, const std::string& blob)> save;
  std::function<void(const std::string& key)> remove;
};

// Process-local storage, shared by copies of the returned port.
PersistencePort MakeMemoryPersistence();

// One file per key under `directory` (<key>.json), replaced atomically.
PersistencePort MakeFilePersistence(const std::string& directory);

bool SaveGame(const PersistencePort& port, const GameState& state);

// nullopt when there is no save or the stored blob is corrupt (logged).
std::optional<GameState> LoadGame(const PersistencePort& port, const GameConfig& cfg = {});

// True only when LoadGame would succeed; a corrupt blob counts as no save.
bool HasSavedGame(const PersistencePort& port);
void ClearSavedGame(const PersistencePort& port);

} // namespace metro
