#pragma once

#include "metro/ActionResult.hpp"
#include "metro/Config.hpp"
#include "metro/GameAction.hpp"
#include "metro/GameState.hpp"
#include "metro/LineManager.hpp"
#include "metro/MapGrid.hpp"
#include "metro/PassengerSpawner.hpp"
#include "metro/Persistence.hpp"
#include "metro/StationManager.hpp"
#include "metro/TrainManager.hpp"

#include <cstdint>
#include <functional>
#include <map>
#include <memory>

namespace metro {

// Central coordinator: owns the GameState, routes actions to the managers, runs
// the tick and notifies subscribers. Renderers only read state() and listen.
//
// The managers hold references into this object, so a controller is neither
// copyable nor movable; factories hand it out by unique_ptr.
class GameController {
public:
  using Listener = std::function<void(const GameState&)>;

  // Throws std::invalid_argument if the map has non-positive dimensions.
  GameController(std::uint64_t seed, MapGrid map, const GameConfig& cfg = {}, PersistencePort port = {});

  // Adopts an existing state (e.g. a loaded save) and rebuilds train paths.
  GameController(GameState state, const GameConfig& cfg, PersistencePort port);

  GameController(const GameController&) = delete;
  GameController& operator=(const GameController&) = delete;

  static std::unique_ptr<GameController> createNew(std::uint64_t seed, MapGrid map, const GameConfig& cfg = {},
                                                   PersistencePort port = {});

  // Null when the port holds no readable save.
  static std::unique_ptr<GameController> loadSaved(PersistencePort port, const GameConfig& cfg = {});

  static bool hasSavedGame(const PersistencePort& port);

  // Advance the simulation by `deltaMs` real milliseconds. No-op while paused.
  void update(double deltaMs);

  ActionResult dispatch(const GameAction& action);

  // Returns a function that removes the listener. Safe to call more than once and
  // after the controller is gone.
  std::function<void()> subscribe(Listener listener);

  bool save() const;
  void clearSaved() const;

  void initializeSimulation();

  bool isPaused() const { return m_state.isPaused; }
  int speed() const { return m_state.speed; }
  void togglePause();

  const GameState& state() const { return m_state; }
  const GameConfig& config() const { return m_cfg; }

  StationManager& stationManager() { return m_stations; }
  LineManager& lineManager() { return m_lines; }
  TrainManager& trainManager() { return m_trains; }
  PassengerSpawner& spawner() { return m_spawner; }

private:
  struct Dispatcher;

  void notifyListeners();
  void autosave();

  using ListenerMap = std::map<std::uint64_t, Listener>;

  GameConfig m_cfg;
  GameState m_state;
  PersistencePort m_port;

  StationManager m_stations;
  LineManager m_lines;
  TrainManager m_trains;
  PassengerSpawner m_spawner;

  std::shared_ptr<ListenerMap> m_listeners;
  std::uint64_t m_nextListenerId = 1;
};

} // namespace metro
