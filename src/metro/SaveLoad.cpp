#include "metro/SaveLoad.hpp"

#include "metro/Log.hpp"
#include "metro/Random.hpp"

#include <algorithm>
#include <charconv>
#include <cmath>
#include <cstddef>
#include <limits>
#include <set>
#include <utility>

namespace metro {

namespace {

JsonValue Num(double v) { return JsonValue::MakeNumber(v); }

JsonValue U64String(std::uint64_t v) { return JsonValue::MakeString(std::to_string(v)); }

template <typename T>
JsonValue IdArray(const std::vector<T>& ids)
{
  JsonValue arr = JsonValue::MakeArray();
  for (T id : ids) arr.push(Num(static_cast<double>(id)));
  return arr;
}

// Accepts a decimal string or a (non-negative, integral) number.
bool ReadU64(const JsonValue& obj, const std::string& key, std::uint64_t& out)
{
  const JsonValue* v = FindJsonMember(obj, key);
  if (!v) return false;

  if (v->isString()) {
    const std::string& s = v->stringValue;
    std::uint64_t parsed = 0;
    const auto res = std::from_chars(s.data(), s.data() + s.size(), parsed);
    if (res.ec != std::errc() || res.ptr != s.data() + s.size() || s.empty()) return false;
    out = parsed;
    return true;
  }

  if (v->isNumber() && std::isfinite(v->numberValue) && v->numberValue >= 0.0 &&
      v->numberValue <= 18446744073709549568.0 && std::floor(v->numberValue) == v->numberValue) {
    out = static_cast<std::uint64_t>(v->numberValue);
    return true;
  }
  return false;
}

bool ReadInt(const JsonValue& obj, const std::string& key, int& out)
{
  std::int64_t v = 0;
  if (!GetJsonInt64(obj, key, v)) return false;
  if (v < -2147483647LL || v > 2147483647LL) return false;
  out = static_cast<int>(v);
  return true;
}

template <typename T>
bool ReadIdArray(const JsonValue& obj, const std::string& key, std::vector<T>& out, std::string& err)
{
  const JsonValue* arr = FindJsonMember(obj, key);
  if (!arr) return true;
  if (!arr->isArray()) {
    err = "expected array for '" + key + "'";
    return false;
  }
  // Ids are written as plain numbers, so anything beyond 2^53 cannot be one of ours.
  const double maxId = std::min(9007199254740992.0, static_cast<double>(std::numeric_limits<T>::max()));
  out.clear();
  for (const JsonValue& e : arr->arrayValue) {
    if (!e.isNumber() || !std::isfinite(e.numberValue) || e.numberValue < 0.0 || e.numberValue > maxId ||
        std::floor(e.numberValue) != e.numberValue) {
      err = "invalid id in '" + key + "'";
      return false;
    }
    out.push_back(static_cast<T>(e.numberValue));
  }
  return true;
}

JsonValue MapToJson(const MapGrid& map)
{
  JsonValue m = JsonValue::MakeObject();
  m.set("width", Num(map.width()));
  m.set("height", Num(map.height()));
  m.set("seed", U64String(map.seed()));
  m.set("type", JsonValue::MakeString(ToString(map.mapType())));

  // One string per row: 'L' land, 'W' water.
  JsonValue rows = JsonValue::MakeArray();
  JsonValue res = JsonValue::MakeArray();
  JsonValue off = JsonValue::MakeArray();
  for (int y = 0; y < map.height(); ++y) {
    std::string row(static_cast<std::size_t>(map.width()), 'L');
    for (int x = 0; x < map.width(); ++x) {
      const Tile& t = map.at(x, y);
      if (t.type == TileType::Water) row[static_cast<std::size_t>(x)] = 'W';
      res.push(Num(t.residentialDensity));
      off.push(Num(t.officeDensity));
    }
    rows.push(JsonValue::MakeString(std::move(row)));
  }
  m.set("tiles", std::move(rows));
  m.set("residential", std::move(res));
  m.set("office", std::move(off));
  return m;
}

bool MapFromJson(const JsonValue& m, MapGrid& out, std::string& err)
{
  if (!m.isObject()) {
    err = "map must be an object";
    return false;
  }

  int w = 0;
  int h = 0;
  if (!ReadInt(m, "width", w) || !ReadInt(m, "height", h) || w <= 0 || h <= 0 || w > kMaxMapDimension ||
      h > kMaxMapDimension) {
    err = "map has invalid dimensions";
    return false;
  }

  std::uint64_t seed = 0;
  ReadU64(m, "seed", seed);

  MapGrid grid(w, h, seed, TileType::Land);

  std::string typeName;
  if (GetJsonString(m, "type", typeName)) {
    MapType t = MapType::River;
    if (!ParseMapType(typeName, t)) {
      err = "unknown map type '" + typeName + "'";
      return false;
    }
    grid.setMapType(t);
  }

  const JsonValue* rows = FindJsonMember(m, "tiles");
  if (!rows || !rows->isArray() || static_cast<int>(rows->arrayValue.size()) != h) {
    err = "map tiles must be an array of " + std::to_string(h) + " rows";
    return false;
  }
  for (int y = 0; y < h; ++y) {
    const JsonValue& row = rows->arrayValue[static_cast<std::size_t>(y)];
    if (!row.isString() || static_cast<int>(row.stringValue.size()) != w) {
      err = "map row " + std::to_string(y) + " must be a string of " + std::to_string(w) + " tiles";
      return false;
    }
    for (int x = 0; x < w; ++x) {
      const char c = row.stringValue[static_cast<std::size_t>(x)];
      if (c == 'W') {
        grid.at(x, y).type = TileType::Water;
      } else if (c != 'L') {
        err = "invalid tile '" + std::string(1, c) + "' in row " + std::to_string(y);
        return false;
      }
    }
  }

  auto readDensity = [&](const char* key, bool residential) {
    const JsonValue* arr = FindJsonMember(m, key);
    if (!arr) return true;
    const std::size_t n = static_cast<std::size_t>(w) * static_cast<std::size_t>(h);
    if (!arr->isArray() || arr->arrayValue.size() != n) {
      err = std::string("map ") + key + " must hold " + std::to_string(n) + " values";
      return false;
    }
    for (std::size_t i = 0; i < n; ++i) {
      const JsonValue& e = arr->arrayValue[i];
      if (!e.isNumber() || !std::isfinite(e.numberValue)) {
        err = std::string("invalid value in map ") + key;
        return false;
      }
      const int v = static_cast<int>(std::clamp(e.numberValue, 0.0, 99.0));
      Tile& t = grid.at(static_cast<int>(i % static_cast<std::size_t>(w)), static_cast<int>(i / static_cast<std::size_t>(w)));
      if (residential) {
        t.residentialDensity = static_cast<std::uint8_t>(v);
      } else {
        t.officeDensity = static_cast<std::uint8_t>(v);
      }
    }
    return true;
  };

  if (!readDensity("residential", true) || !readDensity("office", false)) return false;

  out = std::move(grid);
  return true;
}

JsonValue TrainToJson(const Train& t)
{
  JsonValue o = JsonValue::MakeObject();
  o.set("id", Num(t.id));
  o.set("state", JsonValue::MakeString(ToString(t.state)));
  o.set("dwellRemaining", Num(t.dwellRemaining));
  o.set("currentStationIdx", Num(t.currentStationIdx));
  o.set("targetStationIdx", Num(t.targetStationIdx));
  o.set("progress", Num(t.progress));
  o.set("direction", Num(t.direction));
  o.set("capacity", Num(t.capacity));
  o.set("passengers", IdArray(t.passengers));
  return o;
}

bool TrainFromJson(const JsonValue& o, const MetroLine& line, const GameConfig& cfg, Train& out, std::string& err)
{
  if (!o.isObject()) {
    err = "train must be an object";
    return false;
  }

  Train t;
  t.lineId = line.id;
  t.capacity = cfg.trainCapacity;

  std::int64_t id = 0;
  if (!GetJsonInt64(o, "id", id) || id <= 0) {
    err = "train is missing a valid id";
    return false;
  }
  t.id = static_cast<TrainId>(id);

  std::string stateName;
  if (GetJsonString(o, "state", stateName) && !ParseTrainState(stateName, t.state)) {
    err = "unknown train state '" + stateName + "'";
    return false;
  }

  GetJsonNumber(o, "dwellRemaining", t.dwellRemaining);
  GetJsonNumber(o, "progress", t.progress);
  ReadInt(o, "currentStationIdx", t.currentStationIdx);
  ReadInt(o, "targetStationIdx", t.targetStationIdx);
  ReadInt(o, "direction", t.direction);
  ReadInt(o, "capacity", t.capacity);

  const int count = static_cast<int>(line.stationIds.size());
  if (t.currentStationIdx < 0 || t.currentStationIdx >= count || t.targetStationIdx < 0 ||
      t.targetStationIdx >= count) {
    err = "train " + std::to_string(t.id) + " has station indices outside its line";
    return false;
  }
  if (t.direction != 1 && t.direction != -1) t.direction = 1;
  t.progress = std::clamp(t.progress, 0.0, 1.0);
  t.dwellRemaining = std::max(0.0, t.dwellRemaining);
  if (t.capacity <= 0) t.capacity = cfg.trainCapacity;

  if (!ReadIdArray(o, "passengers", t.passengers, err)) return false;

  out = std::move(t);
  return true;
}

JsonValue PassengerToJson(const Passenger& p)
{
  JsonValue o = JsonValue::MakeObject();
  o.set("id", Num(static_cast<double>(p.id)));
  o.set("source", Num(p.sourceStationId));
  o.set("destination", Num(p.destinationStationId));
  o.set("spawnTime", Num(static_cast<double>(p.spawnTime)));
  o.set("path", IdArray(p.path));
  o.set("nextWaypointIndex", Num(p.nextWaypointIndex));
  if (p.currentStationId) o.set("currentStationId", Num(*p.currentStationId));
  if (p.currentTrainId) o.set("currentTrainId", Num(*p.currentTrainId));
  return o;
}

bool PassengerFromJson(const JsonValue& o, Passenger& out, std::string& err)
{
  if (!o.isObject()) {
    err = "passenger must be an object";
    return false;
  }

  Passenger p;
  std::uint64_t id = 0;
  std::uint64_t src = 0;
  std::uint64_t dst = 0;
  if (!ReadU64(o, "id", id) || id == 0 || !ReadU64(o, "source", src) || !ReadU64(o, "destination", dst)) {
    err = "passenger is missing id/source/destination";
    return false;
  }
  p.id = id;
  p.sourceStationId = static_cast<StationId>(src);
  p.destinationStationId = static_cast<StationId>(dst);

  std::int64_t spawn = 0;
  if (GetJsonInt64(o, "spawnTime", spawn)) p.spawnTime = spawn;

  if (!ReadIdArray(o, "path", p.path, err)) return false;
  ReadInt(o, "nextWaypointIndex", p.nextWaypointIndex);

  std::uint64_t loc = 0;
  if (ReadU64(o, "currentStationId", loc)) p.currentStationId = static_cast<StationId>(loc);
  if (ReadU64(o, "currentTrainId", loc)) p.currentTrainId = static_cast<TrainId>(loc);

  out = std::move(p);
  return true;
}

} // namespace

JsonValue GameStateToJson(const GameState& s)
{
  JsonValue root = JsonValue::MakeObject();
  root.set("format", JsonValue::MakeString(kSaveFormatName));
  root.set("version", Num(kSaveFormatVersion));
  root.set("seed", U64String(s.seed));
  root.set("map", MapToJson(s.map));

  JsonValue stations = JsonValue::MakeArray();
  for (const Station& st : s.stations) {
    JsonValue o = JsonValue::MakeObject();
    o.set("x", Num(st.vertexX));
    o.set("y", Num(st.vertexY));
    o.set("label", JsonValue::MakeString(st.label));
    o.set("passengers", IdArray(st.passengers));
    stations.push(std::move(o));
  }
  root.set("stations", std::move(stations));

  JsonValue lines = JsonValue::MakeArray();
  for (const MetroLine& l : s.lines) {
    JsonValue o = JsonValue::MakeObject();
    o.set("id", Num(l.id));
    o.set("color", JsonValue::MakeString(ToString(l.color)));
    o.set("stations", IdArray(l.stationIds));
    o.set("isLoop", JsonValue::MakeBool(l.isLoop));
    JsonValue trains = JsonValue::MakeArray();
    for (const Train& t : l.trains) trains.push(TrainToJson(t));
    o.set("trains", std::move(trains));
    lines.push(std::move(o));
  }
  root.set("lines", std::move(lines));

  JsonValue pax = JsonValue::MakeArray();
  for (const auto& kv : s.passengers) pax.push(PassengerToJson(kv.second));
  root.set("passengers", std::move(pax));

  root.set("simulationTime", Num(static_cast<double>(s.simulationTime)));
  root.set("money", Num(s.money));
  root.set("isPaused", JsonValue::MakeBool(s.isPaused));
  root.set("speed", Num(s.speed));
  root.set("rngState", U64String(s.rngState));
  root.set("nextLineId", Num(s.nextLineId));
  root.set("nextTrainId", Num(s.nextTrainId));
  root.set("nextPassengerId", U64String(s.nextPassengerId));
  return root;
}

std::string SerializeGameState(const GameState& state, bool pretty)
{
  JsonWriteOptions opt;
  opt.pretty = pretty;
  return JsonStringify(GameStateToJson(state), opt);
}

bool GameStateFromJson(const JsonValue& root, GameState& outState, std::string& outError, const GameConfig& cfg)
{
  if (!root.isObject()) {
    outError = "save root must be an object";
    return false;
  }

  std::string format;
  if (GetJsonString(root, "format", format) && format != kSaveFormatName) {
    outError = "not a " + std::string(kSaveFormatName) + " document (format '" + format + "')";
    return false;
  }
  int version = kSaveFormatVersion;
  ReadInt(root, "version", version);
  if (version > kSaveFormatVersion) {
    outError = "save version " + std::to_string(version) + " is newer than supported";
    return false;
  }

  GameState s;
  if (!ReadU64(root, "seed", s.seed)) {
    outError = "save is missing 'seed'";
    return false;
  }

  const JsonValue* map = FindJsonMember(root, "map");
  if (!map) {
    outError = "save is missing 'map'";
    return false;
  }
  if (!MapFromJson(*map, s.map, outError)) return false;

  // --- stations ---
  const JsonValue* stations = FindJsonMember(root, "stations");
  if (!stations || !stations->isArray()) {
    outError = "save is missing 'stations'";
    return false;
  }
  for (std::size_t i = 0; i < stations->arrayValue.size(); ++i) {
    const JsonValue& o = stations->arrayValue[i];
    int x = 0;
    int y = 0;
    if (!o.isObject() || !ReadInt(o, "x", x) || !ReadInt(o, "y", y)) {
      outError = "station " + std::to_string(i) + " needs integer x/y";
      return false;
    }
    if (x < 0 || y < 0 || x > s.map.width() || y > s.map.height()) {
      outError = "station " + std::to_string(i) + " lies outside the map";
      return false;
    }
    Station st = MakeStation(x, y);
    if (FindStation(s, st.id)) {
      outError = "duplicate station at " + FormatStationId(st.id);
      return false;
    }
    if (!GetJsonString(o, "label", st.label) || st.label.empty()) {
      st.label = GenerateStationLabel(static_cast<int>(i));
    }
    if (!ReadIdArray(o, "passengers", st.passengers, outError)) return false;
    s.stations.push_back(std::move(st));
  }

  // --- lines ---
  const JsonValue* lines = FindJsonMember(root, "lines");
  if (!lines || !lines->isArray()) {
    outError = "save is missing 'lines'";
    return false;
  }
  std::set<TrainId> trainIds;
  for (std::size_t i = 0; i < lines->arrayValue.size(); ++i) {
    const JsonValue& o = lines->arrayValue[i];
    if (!o.isObject()) {
      outError = "line " + std::to_string(i) + " must be an object";
      return false;
    }

    MetroLine l;
    std::int64_t id = 0;
    l.id = (GetJsonInt64(o, "id", id) && id > 0) ? static_cast<LineId>(id) : static_cast<LineId>(i + 1);
    if (FindLine(s, l.id)) {
      outError = "duplicate line id " + std::to_string(l.id);
      return false;
    }

    std::string colorName;
    if (!GetJsonString(o, "color", colorName) || !ParseLineColor(colorName, l.color)) {
      outError = "line " + std::to_string(l.id) + " has an unknown color";
      return false;
    }
    if (HasLineWithColor(s, l.color)) {
      outError = "two lines share color " + colorName;
      return false;
    }

    if (!ReadIdArray(o, "stations", l.stationIds, outError)) return false;
    if (l.stationIds.size() < 2) {
      outError = "line " + std::to_string(l.id) + " has fewer than 2 stations";
      return false;
    }
    for (StationId sid : l.stationIds) {
      if (!FindStation(s, sid)) {
        outError = "line " + std::to_string(l.id) + " references unknown station " + FormatStationId(sid);
        return false;
      }
    }
    l.isLoop = IsLineLoop(l.stationIds);

    const JsonValue* trains = FindJsonMember(o, "trains");
    if (trains) {
      if (!trains->isArray()) {
        outError = "line " + std::to_string(l.id) + " trains must be an array";
        return false;
      }
      for (const JsonValue& to : trains->arrayValue) {
        Train t;
        if (!TrainFromJson(to, l, cfg, t, outError)) return false;
        if (!trainIds.insert(t.id).second) {
          outError = "duplicate train id " + std::to_string(t.id);
          return false;
        }
        l.trains.push_back(std::move(t));
      }
    }

    s.lines.push_back(std::move(l));
  }

  // --- passengers ---
  if (const JsonValue* pax = FindJsonMember(root, "passengers")) {
    if (!pax->isArray()) {
      outError = "'passengers' must be an array";
      return false;
    }
    for (const JsonValue& o : pax->arrayValue) {
      Passenger p;
      if (!PassengerFromJson(o, p, outError)) return false;
      const PassengerId pid = p.id;
      if (!s.passengers.emplace(pid, std::move(p)).second) {
        outError = "duplicate passenger id " + std::to_string(pid);
        return false;
      }
    }
  }

  // --- scalars ---
  s.simulationTime = cfg.startTimeMs;
  std::int64_t simTime = 0;
  if (GetJsonInt64(root, "simulationTime", simTime)) s.simulationTime = simTime;

  s.money = cfg.startingMoney;
  GetJsonNumber(root, "money", s.money);

  GetJsonBool(root, "isPaused", s.isPaused);

  int speed = 1;
  ReadInt(root, "speed", speed);
  s.speed = (speed == 1 || speed == 2 || speed == 4) ? speed : 1;

  if (!ReadU64(root, "rngState", s.rngState)) s.rngState = DeriveSeed(s.seed, 0x50415353u);

  // Counters never go backwards past ids already in use.
  LineId maxLine = 0;
  TrainId maxTrain = 0;
  for (const MetroLine& l : s.lines) {
    maxLine = std::max(maxLine, l.id);
    for (const Train& t : l.trains) maxTrain = std::max(maxTrain, t.id);
  }
  PassengerId maxPax = s.passengers.empty() ? 0 : s.passengers.rbegin()->first;

  int nextLine = 0;
  int nextTrain = 0;
  std::uint64_t nextPax = 0;
  ReadInt(root, "nextLineId", nextLine);
  ReadInt(root, "nextTrainId", nextTrain);
  ReadU64(root, "nextPassengerId", nextPax);
  s.nextLineId = std::max<LineId>(static_cast<LineId>(std::max(nextLine, 0)), maxLine + 1);
  s.nextTrainId = std::max<TrainId>(static_cast<TrainId>(std::max(nextTrain, 0)), maxTrain + 1);
  s.nextPassengerId = std::max<PassengerId>(nextPax, maxPax + 1);

  const int repairs = ReconcilePassengers(s);
  if (repairs > 0) LogLine(LogLevel::Info) << "save load: reconciled " << repairs << " passenger reference(s)";

  outState = std::move(s);
  outError.clear();
  return true;
}

bool DeserializeGameState(const std::string& text, GameState& outState, std::string& outError, const GameConfig& cfg)
{
  JsonValue root;
  if (!ParseJson(text, root, outError)) return false;
  return GameStateFromJson(root, outState, outError, cfg);
}

int ReconcilePassengers(GameState& state)
{
  int repairs = 0;
  std::set<PassengerId> placed;

  // Pass 1: drop unknown or duplicate references, and sync each passenger's
  // location fields with where it was actually found.
  for (Station& st : state.stations) {
    std::vector<PassengerId> keep;
    for (PassengerId pid : st.passengers) {
      Passenger* p = FindPassenger(state, pid);
      if (!p || !placed.insert(pid).second) {
        ++repairs;
        continue;
      }
      if (!p->currentStationId || *p->currentStationId != st.id || p->currentTrainId) ++repairs;
      p->currentStationId = st.id;
      p->currentTrainId.reset();
      keep.push_back(pid);
    }
    st.passengers = std::move(keep);
  }

  for (MetroLine& l : state.lines) {
    for (Train& t : l.trains) {
      std::vector<PassengerId> keep;
      for (PassengerId pid : t.passengers) {
        Passenger* p = FindPassenger(state, pid);
        // Riders beyond capacity stay unplaced so pass 2 can requeue them.
        if (!p || placed.count(pid) || static_cast<int>(keep.size()) >= t.capacity) {
          ++repairs;
          continue;
        }
        placed.insert(pid);
        if (!p->currentTrainId || *p->currentTrainId != t.id || p->currentStationId) ++repairs;
        p->currentTrainId = t.id;
        p->currentStationId.reset();
        keep.push_back(pid);
      }
      t.passengers = std::move(keep);
    }
  }

  // Pass 2: roster passengers found nowhere are requeued where they claim to be,
  // or removed when that place no longer exists.
  for (auto it = state.passengers.begin(); it != state.passengers.end();) {
    if (placed.count(it->first)) {
      ++it;
      continue;
    }

    Passenger& p = it->second;
    ++repairs;

    Station* st = p.currentStationId ? FindStation(state, *p.currentStationId) : nullptr;
    Train* tr = (!st && p.currentTrainId) ? FindTrain(state, *p.currentTrainId) : nullptr;

    if (st) {
      p.currentTrainId.reset();
      st->passengers.push_back(p.id);
      ++it;
    } else if (tr && static_cast<int>(tr->passengers.size()) < tr->capacity) {
      p.currentStationId.reset();
      tr->passengers.push_back(p.id);
      ++it;
    } else {
      LogLine(LogLevel::Warn) << "save load: passenger " << p.id << " has no location; removed";
      it = state.passengers.erase(it);
    }
  }

  return repairs;
}

} // namespace metro
