#include "metro/GameState.hpp"

#include "metro/Random.hpp"

#include <algorithm>
#include <utility>

namespace metro {

GameState CreateGameState(std::uint64_t seed, MapGrid map, const GameConfig& cfg)
{
  GameState s;
  s.seed = seed;
  s.map = std::move(map);
  s.simulationTime = cfg.startTimeMs;
  s.money = cfg.startingMoney;
  s.isPaused = false;
  s.speed = 1;
  s.rngState = DeriveSeed(seed, 0x50415353u); // "PASS"
  return s;
}

Station* FindStation(GameState& s, StationId id)
{
  for (Station& st : s.stations) {
    if (st.id == id) return &st;
  }
  return nullptr;
}

const Station* FindStation(const GameState& s, StationId id)
{
  for (const Station& st : s.stations) {
    if (st.id == id) return &st;
  }
  return nullptr;
}

MetroLine* FindLine(GameState& s, LineId id)
{
  for (MetroLine& l : s.lines) {
    if (l.id == id) return &l;
  }
  return nullptr;
}

const MetroLine* FindLine(const GameState& s, LineId id)
{
  for (const MetroLine& l : s.lines) {
    if (l.id == id) return &l;
  }
  return nullptr;
}

Train* FindTrain(GameState& s, TrainId id)
{
  for (MetroLine& l : s.lines) {
    for (Train& t : l.trains) {
      if (t.id == id) return &t;
    }
  }
  return nullptr;
}

const Train* FindTrain(const GameState& s, TrainId id)
{
  for (const MetroLine& l : s.lines) {
    for (const Train& t : l.trains) {
      if (t.id == id) return &t;
    }
  }
  return nullptr;
}

Passenger* FindPassenger(GameState& s, PassengerId id)
{
  auto it = s.passengers.find(id);
  return it == s.passengers.end() ? nullptr : &it->second;
}

bool HasLineWithColor(const GameState& s, LineColor color)
{
  return std::any_of(s.lines.begin(), s.lines.end(), [&](const MetroLine& l) { return l.color == color; });
}

std::vector<LineColor> AvailableLineColors(const GameState& s)
{
  std::vector<LineColor> out;
  for (LineColor c : AllLineColors()) {
    if (!HasLineWithColor(s, c)) out.push_back(c);
  }
  return out;
}

bool IsStationInAnyLine(const GameState& s, StationId id)
{
  for (const MetroLine& l : s.lines) {
    if (std::find(l.stationIds.begin(), l.stationIds.end(), id) != l.stationIds.end()) return true;
  }
  return false;
}

bool CheckPassengerInvariants(const GameState& s, std::string& outError)
{
  std::map<PassengerId, int> seen;

  for (const Station& st : s.stations) {
    for (PassengerId pid : st.passengers) {
      auto it = s.passengers.find(pid);
      if (it == s.passengers.end()) {
        outError = "station " + FormatStationId(st.id) + " queues unknown passenger " + std::to_string(pid);
        return false;
      }
      if (!it->second.currentStationId || *it->second.currentStationId != st.id || it->second.currentTrainId) {
        outError = "passenger " + std::to_string(pid) + " queued at " + FormatStationId(st.id) +
                   " but its location disagrees";
        return false;
      }
      ++seen[pid];
    }
  }

  for (const MetroLine& l : s.lines) {
    for (const Train& t : l.trains) {
      if (static_cast<int>(t.passengers.size()) > t.capacity) {
        outError = "train " + std::to_string(t.id) + " is over capacity";
        return false;
      }
      for (PassengerId pid : t.passengers) {
        auto it = s.passengers.find(pid);
        if (it == s.passengers.end()) {
          outError = "train " + std::to_string(t.id) + " carries unknown passenger " + std::to_string(pid);
          return false;
        }
        if (!it->second.currentTrainId || *it->second.currentTrainId != t.id || it->second.currentStationId) {
          outError = "passenger " + std::to_string(pid) + " aboard train " + std::to_string(t.id) +
                     " but its location disagrees";
          return false;
        }
        ++seen[pid];
      }
    }
  }

  for (const auto& kv : s.passengers) {
    auto it = seen.find(kv.first);
    const int n = (it == seen.end()) ? 0 : it->second;
    if (n != 1) {
      outError = "passenger " + std::to_string(kv.first) + " appears in " + std::to_string(n) + " locations";
      return false;
    }
  }

  outError.clear();
  return true;
}

} // namespace metro
