#include "metro/ConfigIO.hpp"

#include "metro/FileSync.hpp"

#include <cmath>
#include <cstdint>
#include <limits>

namespace metro {

namespace {

bool IsFiniteDouble(double v) { return std::isfinite(v) != 0; }

const JsonValue* FindNumber(const JsonValue& root, const char* key, std::string& err, bool& ok)
{
  ok = true;
  const JsonValue* v = FindJsonMember(root, key);
  if (!v) return nullptr; // missing => keep
  if (!v->isNumber()) {
    err = std::string("expected number for key '") + key + "'";
    ok = false;
    return nullptr;
  }
  if (!IsFiniteDouble(v->numberValue)) {
    err = std::string("non-finite number for key '") + key + "'";
    ok = false;
    return nullptr;
  }
  return v;
}

bool ApplyI32(const JsonValue& root, const char* key, int& io, std::string& err)
{
  bool ok = true;
  const JsonValue* v = FindNumber(root, key, err, ok);
  if (!v) return ok;
  const double dv = std::round(v->numberValue);
  if (dv < static_cast<double>(std::numeric_limits<int>::min()) ||
      dv > static_cast<double>(std::numeric_limits<int>::max())) {
    err = std::string("out-of-range integer for key '") + key + "'";
    return false;
  }
  io = static_cast<int>(dv);
  return true;
}

bool ApplyI64(const JsonValue& root, const char* key, std::int64_t& io, std::string& err)
{
  bool ok = true;
  const JsonValue* v = FindNumber(root, key, err, ok);
  if (!v) return ok;
  if (std::fabs(v->numberValue) > 9007199254740992.0) {
    err = std::string("out-of-range integer for key '") + key + "'";
    return false;
  }
  io = static_cast<std::int64_t>(std::llround(v->numberValue));
  return true;
}

bool ApplyF64(const JsonValue& root, const char* key, double& io, std::string& err)
{
  bool ok = true;
  const JsonValue* v = FindNumber(root, key, err, ok);
  if (!v) return ok;
  io = v->numberValue;
  return true;
}

bool RequirePositive(int v, const char* key, std::string& err)
{
  if (v > 0) return true;
  err = std::string("key '") + key + "' must be positive";
  return false;
}

bool RequireMapDimension(int v, const char* key, std::string& err)
{
  if (v > 0 && v <= kMaxMapDimension) return true;
  err = std::string("key '") + key + "' must be within [1, " + std::to_string(kMaxMapDimension) + "]";
  return false;
}

JsonValue Num(double v) { return JsonValue::MakeNumber(v); }

} // namespace

JsonValue GameConfigToJson(const GameConfig& c)
{
  JsonValue o = JsonValue::MakeObject();
  o.set("map_width", Num(c.mapWidth));
  o.set("map_height", Num(c.mapHeight));
  o.set("train_capacity", Num(c.trainCapacity));
  o.set("train_speed", Num(c.trainSpeed));
  o.set("dwell_distance", Num(c.dwellDistance));
  o.set("acceleration_distance", Num(c.accelerationDistance));
  o.set("max_trains_per_line", Num(c.maxTrainsPerLine));
  o.set("min_trains_per_line", Num(c.minTrainsPerLine));
  o.set("base_spawn_rate", Num(c.baseSpawnRate));
  o.set("spawn_density_normalizer", Num(c.spawnDensityNormalizer));
  o.set("rush_hour_multiplier", Num(c.rushHourMultiplier));
  o.set("night_multiplier", Num(c.nightMultiplier));
  o.set("catchment_radius", Num(c.catchmentRadius));
  o.set("game_time_scale", Num(c.gameTimeScale));
  o.set("start_time_ms", Num(static_cast<double>(c.startTimeMs)));
  o.set("starting_money", Num(c.startingMoney));
  o.set("station_cost", Num(c.stationCost));
  o.set("line_cost_per_unit", Num(c.lineCostPerUnit));
  o.set("running_cost_per_unit", Num(c.runningCostPerUnit));
  o.set("fare", Num(c.fare));
  o.set("density_ceiling", Num(c.densityCeiling));
  o.set("hotspot_falloff", Num(c.hotspotFalloff));
  return o;
}

JsonValue MapGenConfigToJson(const MapGenConfig& c)
{
  JsonValue o = JsonValue::MakeObject();
  o.set("width", Num(c.width));
  o.set("height", Num(c.height));
  o.set("map_type", c.forceType ? JsonValue::MakeString(ToString(*c.forceType)) : JsonValue::MakeNull());
  o.set("hotspot_falloff", Num(c.hotspotFalloff));
  o.set("density_ceiling", Num(c.densityCeiling));
  return o;
}

bool ApplyGameConfigJson(const JsonValue& root, GameConfig& ioCfg, std::string& outError)
{
  outError.clear();
  if (!root.isObject()) {
    outError = "game config must be a JSON object";
    return false;
  }

  // Work on a copy so a failure leaves ioCfg untouched.
  GameConfig c = ioCfg;
  std::string& err = outError;

  if (!ApplyI32(root, "map_width", c.mapWidth, err)) return false;
  if (!ApplyI32(root, "map_height", c.mapHeight, err)) return false;
  if (!ApplyI32(root, "train_capacity", c.trainCapacity, err)) return false;
  if (!ApplyF64(root, "train_speed", c.trainSpeed, err)) return false;
  if (!ApplyF64(root, "dwell_distance", c.dwellDistance, err)) return false;
  if (!ApplyF64(root, "acceleration_distance", c.accelerationDistance, err)) return false;
  if (!ApplyI32(root, "max_trains_per_line", c.maxTrainsPerLine, err)) return false;
  if (!ApplyI32(root, "min_trains_per_line", c.minTrainsPerLine, err)) return false;
  if (!ApplyF64(root, "base_spawn_rate", c.baseSpawnRate, err)) return false;
  if (!ApplyF64(root, "spawn_density_normalizer", c.spawnDensityNormalizer, err)) return false;
  if (!ApplyF64(root, "rush_hour_multiplier", c.rushHourMultiplier, err)) return false;
  if (!ApplyF64(root, "night_multiplier", c.nightMultiplier, err)) return false;
  if (!ApplyI32(root, "catchment_radius", c.catchmentRadius, err)) return false;
  if (!ApplyF64(root, "game_time_scale", c.gameTimeScale, err)) return false;
  if (!ApplyI64(root, "start_time_ms", c.startTimeMs, err)) return false;
  if (!ApplyF64(root, "starting_money", c.startingMoney, err)) return false;
  if (!ApplyF64(root, "station_cost", c.stationCost, err)) return false;
  if (!ApplyF64(root, "line_cost_per_unit", c.lineCostPerUnit, err)) return false;
  if (!ApplyF64(root, "running_cost_per_unit", c.runningCostPerUnit, err)) return false;
  if (!ApplyF64(root, "fare", c.fare, err)) return false;
  if (!ApplyI32(root, "density_ceiling", c.densityCeiling, err)) return false;
  if (!ApplyF64(root, "hotspot_falloff", c.hotspotFalloff, err)) return false;

  if (!RequireMapDimension(c.mapWidth, "map_width", err)) return false;
  if (!RequireMapDimension(c.mapHeight, "map_height", err)) return false;
  if (!RequirePositive(c.trainCapacity, "train_capacity", err)) return false;
  if (!RequirePositive(c.maxTrainsPerLine, "max_trains_per_line", err)) return false;
  if (c.minTrainsPerLine < 0 || c.minTrainsPerLine > c.maxTrainsPerLine) {
    err = "min_trains_per_line must be within [0, max_trains_per_line]";
    return false;
  }
  if (c.catchmentRadius < 0) {
    err = "catchment_radius must be non-negative";
    return false;
  }
  if (c.spawnDensityNormalizer <= 0.0) {
    err = "spawn_density_normalizer must be positive";
    return false;
  }

  ioCfg = c;
  return true;
}

bool ApplyMapGenConfigJson(const JsonValue& root, MapGenConfig& ioCfg, std::string& outError)
{
  outError.clear();
  if (!root.isObject()) {
    outError = "map config must be a JSON object";
    return false;
  }

  MapGenConfig c = ioCfg;
  std::string& err = outError;

  if (!ApplyI32(root, "width", c.width, err)) return false;
  if (!ApplyI32(root, "height", c.height, err)) return false;
  if (!ApplyF64(root, "hotspot_falloff", c.hotspotFalloff, err)) return false;
  if (!ApplyI32(root, "density_ceiling", c.densityCeiling, err)) return false;

  if (const JsonValue* t = FindJsonMember(root, "map_type")) {
    if (t->isNull()) {
      c.forceType.reset();
    } else if (t->isString()) {
      MapType mt = MapType::River;
      if (!ParseMapType(t->stringValue, mt)) {
        err = "unknown map_type '" + t->stringValue + "'";
        return false;
      }
      c.forceType = mt;
    } else {
      err = "expected string or null for key 'map_type'";
      return false;
    }
  }

  if (!RequireMapDimension(c.width, "width", err)) return false;
  if (!RequireMapDimension(c.height, "height", err)) return false;

  ioCfg = c;
  return true;
}

bool LoadConfigJsonFile(const std::string& path, GameConfig* ioGame, MapGenConfig* ioMap, std::string& outError)
{
  std::string text;
  if (!ReadFileText(path, text, outError)) return false;

  JsonValue root;
  if (!ParseJson(text, root, outError)) {
    outError = path + ": " + outError;
    return false;
  }
  if (!root.isObject()) {
    outError = path + ": config root must be an object";
    return false;
  }

  GameConfig game = ioGame ? *ioGame : GameConfig{};
  MapGenConfig map = ioMap ? *ioMap : MapGenConfig{};

  if (const JsonValue* g = FindJsonMember(root, "game")) {
    if (!ApplyGameConfigJson(*g, game, outError)) {
      outError = path + ": game: " + outError;
      return false;
    }
  }
  if (const JsonValue* m = FindJsonMember(root, "map")) {
    if (!ApplyMapGenConfigJson(*m, map, outError)) {
      outError = path + ": map: " + outError;
      return false;
    }
  }

  if (ioGame) *ioGame = game;
  if (ioMap) *ioMap = map;
  return true;
}

bool WriteConfigJsonFile(const std::string& path, const GameConfig& game, const MapGenConfig& map,
                         std::string& outError)
{
  JsonValue root = JsonValue::MakeObject();
  root.set("game", GameConfigToJson(game));
  root.set("map", MapGenConfigToJson(map));
  return WriteFileAtomic(path, JsonStringify(root) + "\n", outError);
}

} // namespace metro
