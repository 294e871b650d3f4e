#include "metro/Persistence.hpp"

#include "metro/FileSync.hpp"
#include "metro/Log.hpp"
#include "metro/SaveLoad.hpp"

#include <filesystem>
#include <map>
#include <memory>
#include <system_error>
#include <utility>

namespace metro {

PersistencePort MakeMemoryPersistence()
{
  auto store = std::make_shared<std::map<std::string, std::string>>();

  PersistencePort port;
  port.load = [store](const std::string& key) -> std::optional<std::string> {
    auto it = store->find(key);
    if (it == store->end()) return std::nullopt;
    return it->second;
  };
  port.save = [store](const std::string& key, const std::string& blob) {
    (*store)[key] = blob;
    return true;
  };
  port.remove = [store](const std::string& key) { store->erase(key); };
  return port;
}

PersistencePort MakeFilePersistence(const std::string& directory)
{
  namespace fs = std::filesystem;
  const fs::path dir = directory.empty() ? fs::path(".") : fs::path(directory);
  auto pathFor = [dir](const std::string& key) { return dir / (key + ".json"); };

  PersistencePort port;
  port.load = [pathFor](const std::string& key) -> std::optional<std::string> {
    const fs::path p = pathFor(key);
    std::error_code ec;
    if (!fs::exists(p, ec) || ec) return std::nullopt;

    std::string text;
    std::string err;
    if (!ReadFileText(p, text, err)) {
      LogLine(LogLevel::Warn) << "persistence: " << err;
      return std::nullopt;
    }
    return text;
  };
  port.save = [pathFor](const std::string& key, const std::string& blob) {
    std::string err;
    if (!WriteFileAtomic(pathFor(key), blob, err)) {
      LogLine(LogLevel::Error) << "persistence: " << err;
      return false;
    }
    return true;
  };
  port.remove = [pathFor](const std::string& key) {
    std::error_code ec;
    fs::remove(pathFor(key), ec);
    if (ec) {
      LogLine(LogLevel::Warn) << "persistence: could not remove " << pathFor(key).string() << ": " << ec.message();
    }
  };
  return port;
}

bool SaveGame(const PersistencePort& port, const GameState& state)
{
  if (!port.save) return false;
  return port.save(kSaveGameKey, SerializeGameState(state));
}

std::optional<GameState> LoadGame(const PersistencePort& port, const GameConfig& cfg)
{
  if (!port.load) return std::nullopt;

  const std::optional<std::string> blob = port.load(kSaveGameKey);
  if (!blob) return std::nullopt;

  GameState state;
  std::string err;
  if (!DeserializeGameState(*blob, state, err, cfg)) {
    LogLine(LogLevel::Warn) << "saved game is unreadable, ignoring it: " << err;
    return std::nullopt;
  }
  return state;
}

bool HasSavedGame(const PersistencePort& port)
{
  // Same answer loadSaved would give: an unreadable blob is no save at all.
  return LoadGame(port).has_value();
}

void ClearSavedGame(const PersistencePort& port)
{
  if (port.remove) port.remove(kSaveGameKey);
}

} // namespace metro
