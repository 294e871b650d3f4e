#pragma once

#include "metro/Config.hpp"
#include "metro/Json.hpp"
#include "metro/MapGen.hpp"

#include <string>

namespace metro {

// JSON overrides for GameConfig and MapGenConfig.
//
// Merge semantics: keys missing from the JSON leave the existing value alone; a
// key with the wrong type is an error naming the key. Field names are snake_case.
//
// A config file is an object with optional "game" and "map" members:
//   {"game": {"train_capacity": 40}, "map": {"map_type": "river"}}

JsonValue GameConfigToJson(const GameConfig& cfg);
JsonValue MapGenConfigToJson(const MapGenConfig& cfg);

bool ApplyGameConfigJson(const JsonValue& root, GameConfig& ioCfg, std::string& outError);
bool ApplyMapGenConfigJson(const JsonValue& root, MapGenConfig& ioCfg, std::string& outError);

// Either output may be null to skip that section.
bool LoadConfigJsonFile(const std::string& path, GameConfig* ioGame, MapGenConfig* ioMap, std::string& outError);

bool WriteConfigJsonFile(const std::string& path, const GameConfig& game, const MapGenConfig& map,
                         std::string& outError);

} // namespace metro
