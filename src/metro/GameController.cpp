#include "metro/GameController.hpp"

#include "metro/Log.hpp"
#include "metro/SaveLoad.hpp"
#include "metro/TrainMovement.hpp"

#include <stdexcept>
#include <string>
#include <utility>
#include <variant>
#include <vector>

namespace metro {

namespace {

void RequireValidMap(const MapGrid& map)
{
  if (map.width() <= 0 || map.height() <= 0 || map.width() > kMaxMapDimension || map.height() > kMaxMapDimension) {
    throw std::invalid_argument("GameController: map dimensions must be within 1.." +
                                std::to_string(kMaxMapDimension) + " (got " +
                                std::to_string(map.width()) + "x" + std::to_string(map.height()) + ")");
  }
}

MapGrid CheckedMap(MapGrid map)
{
  RequireValidMap(map);
  return map;
}

} // namespace

// One overload per action kind; std::visit rejects a missing case at compile time.
struct GameController::Dispatcher {
  GameController& c;

  ActionResult operator()(const PlaceStationAction& a) const { return c.m_stations.placeStation(a.vertexX, a.vertexY); }

  ActionResult operator()(const RemoveStationAction& a) const { return c.m_stations.removeStation(a.stationId); }

  ActionResult operator()(const StartLineAction& a) const { return c.m_lines.startLine(a.color); }

  ActionResult operator()(const AddStationToLineAction& a) const { return c.m_lines.addStationToLine(a.stationId); }

  ActionResult operator()(const CompleteLineAction&) const
  {
    ActionResult r = c.m_lines.completeLine();
    if (r.success && r.data.lineId) {
      const ActionResult first = c.m_trains.addTrainToLine(*r.data.lineId);
      if (first.success) {
        r.data.trainId = first.data.trainId;
      } else {
        LogLine(LogLevel::Warn) << "line " << *r.data.lineId << " completed without a train: " << first.error;
      }
    }
    return r;
  }

  ActionResult operator()(const CancelLineAction&) const
  {
    c.m_lines.cancelLine();
    return ActionResult::Ok();
  }

  ActionResult operator()(const AddTrainAction& a) const { return c.m_trains.addTrainToLine(a.lineId); }

  ActionResult operator()(const RemoveTrainAction& a) const
  {
    return c.m_trains.removeTrainFromLine(a.lineId, a.trainId);
  }

  ActionResult operator()(const PauseAction&) const
  {
    c.m_state.isPaused = true;
    return ActionResult::Ok();
  }

  ActionResult operator()(const ResumeAction&) const
  {
    c.m_state.isPaused = false;
    return ActionResult::Ok();
  }

  ActionResult operator()(const SetSpeedAction& a) const
  {
    if (a.speed != 1 && a.speed != 2 && a.speed != 4) return ActionResult::Fail("Invalid speed value");
    c.m_state.speed = a.speed;
    return ActionResult::Ok();
  }
};

GameController::GameController(std::uint64_t seed, MapGrid map, const GameConfig& cfg, PersistencePort port)
    : m_cfg(cfg)
    , m_state(CreateGameState(seed, CheckedMap(std::move(map)), cfg))
    , m_port(std::move(port))
    , m_stations(m_state, m_cfg)
    , m_lines(m_state, m_cfg)
    , m_trains(m_state, m_cfg)
    , m_spawner(m_cfg)
    , m_listeners(std::make_shared<ListenerMap>())
{
  LogLine(LogLevel::Debug) << "controller: new game seed=" << seed << " map=" << m_state.map.width() << "x"
      << m_state.map.height();
}

GameController::GameController(GameState state, const GameConfig& cfg, PersistencePort port)
    : m_cfg(cfg)
    , m_state(std::move(state))
    , m_port(std::move(port))
    , m_stations(m_state, m_cfg)
    , m_lines(m_state, m_cfg)
    , m_trains(m_state, m_cfg)
    , m_spawner(m_cfg)
    , m_listeners(std::make_shared<ListenerMap>())
{
  RequireValidMap(m_state.map);
  InitializeTrains(m_state, m_cfg);
  LogLine(LogLevel::Debug) << "controller: adopted game seed=" << m_state.seed
      << " stations=" << m_state.stations.size() << " lines=" << m_state.lines.size();
}

std::unique_ptr<GameController> GameController::createNew(std::uint64_t seed, MapGrid map, const GameConfig& cfg,
                                                          PersistencePort port)
{
  return std::make_unique<GameController>(seed, std::move(map), cfg, std::move(port));
}

std::unique_ptr<GameController> GameController::loadSaved(PersistencePort port, const GameConfig& cfg)
{
  std::optional<GameState> loaded = LoadGame(port, cfg);
  if (!loaded) return nullptr;
  if (loaded->map.width() <= 0 || loaded->map.height() <= 0) {
    LogLine(LogLevel::Warn) << "saved game has an empty map, ignoring it";
    return nullptr;
  }
  return std::make_unique<GameController>(std::move(*loaded), cfg, std::move(port));
}

bool GameController::hasSavedGame(const PersistencePort& port) { return HasSavedGame(port); }

void GameController::update(double deltaMs)
{
  if (m_state.isPaused || !(deltaMs > 0.0)) return;

  const double scaledMs = deltaMs * m_state.speed;
  const double gameMs = scaledMs * m_cfg.gameTimeScale;
  m_state.simulationTime += static_cast<std::int64_t>(gameMs);

  m_spawner.update(m_state, gameMs / 1000.0);
  UpdateTrains(m_state, scaledMs / 1000.0, m_cfg);

  notifyListeners();
}

ActionResult GameController::dispatch(const GameAction& action)
{
  ActionResult r = std::visit(Dispatcher{*this}, action);
  if (!r.success) {
    LogLine(LogLevel::Debug) << "dispatch " << ToString(ActionKindOf(action)) << " rejected: " << r.error;
    return r;
  }

  autosave();
  notifyListeners();
  return r;
}

std::function<void()> GameController::subscribe(Listener listener)
{
  const std::uint64_t id = m_nextListenerId++;
  (*m_listeners)[id] = std::move(listener);

  std::weak_ptr<ListenerMap> weak = m_listeners;
  return [weak, id]() {
    if (std::shared_ptr<ListenerMap> map = weak.lock()) map->erase(id);
  };
}

void GameController::notifyListeners()
{
  // Listeners may unsubscribe while being notified.
  std::vector<Listener> snapshot;
  snapshot.reserve(m_listeners->size());
  for (const auto& kv : *m_listeners) snapshot.push_back(kv.second);
  for (const Listener& fn : snapshot) {
    if (fn) fn(m_state);
  }
}

void GameController::autosave()
{
  if (!m_port.save) return;
  if (!SaveGame(m_port, m_state)) LogLine(LogLevel::Warn) << "autosave failed";
}

bool GameController::save() const { return SaveGame(m_port, m_state); }

void GameController::clearSaved() const { ClearSavedGame(m_port); }

void GameController::initializeSimulation() { InitializeTrains(m_state, m_cfg); }

void GameController::togglePause()
{
  m_state.isPaused = !m_state.isPaused;
  notifyListeners();
}

} // namespace metro
