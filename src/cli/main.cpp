#include "metro/ConfigIO.hpp"
#include "metro/FileSync.hpp"
#include "metro/Hash.hpp"
#include "metro/Json.hpp"
#include "metro/Log.hpp"
#include "metro/MapGen.hpp"
#include "metro/MapGrid.hpp"
#include "metro/TextParse.hpp"

#include <cstdint>
#include <iostream>
#include <optional>
#include <string>

namespace {

void PrintHelp()
{
  std::cout
      << "metro_cli (headless map generator)\n\n"
      << "Usage:\n"
      << "  metro_cli [--seed <u64>] [--type river|archipelago] [--size <WxH>] [--config <cfg.json>]\n"
      << "            [--ascii] [--out <summary.json>] [--log-level <level>]\n\n"
      << "Notes:\n"
      << "  - Without --type the seed decides between a river map and an archipelago.\n"
      << "  - --config reads {\"game\": {...}, \"map\": {...}}; command-line flags override it.\n"
      << "  - --ascii prints the map ('.' land, '~' water, '#' dense residential, '%' dense office).\n"
      << "  - The summary always contains a stable 64-bit map hash.\n";
}

struct DensitySummary {
  long long residential = 0;
  long long office = 0;
  int maxResidential = 0;
  int maxOffice = 0;
};

DensitySummary SummarizeDensity(const metro::MapGrid& map)
{
  DensitySummary s;
  for (const metro::Tile& t : map.tiles()) {
    s.residential += t.residentialDensity;
    s.office += t.officeDensity;
    if (t.residentialDensity > s.maxResidential) s.maxResidential = t.residentialDensity;
    if (t.officeDensity > s.maxOffice) s.maxOffice = t.officeDensity;
  }
  return s;
}

void PrintAscii(const metro::MapGrid& map)
{
  for (int y = 0; y < map.height(); ++y) {
    std::string row;
    row.reserve(static_cast<std::size_t>(map.width()));
    for (int x = 0; x < map.width(); ++x) {
      const metro::Tile& t = map.at(x, y);
      char c = '.';
      if (t.type == metro::TileType::Water) {
        c = '~';
      } else if (t.residentialDensity >= 60 && t.residentialDensity >= t.officeDensity) {
        c = '#';
      } else if (t.officeDensity >= 60) {
        c = '%';
      }
      row.push_back(c);
    }
    std::cout << row << '\n';
  }
}

metro::JsonValue MakeSummary(const metro::MapGrid& map, std::uint64_t seed)
{
  using metro::JsonValue;

  const DensitySummary d = SummarizeDensity(map);
  const int water = map.countTiles(metro::TileType::Water);

  JsonValue root = JsonValue::MakeObject();
  root.set("seed", JsonValue::MakeString(std::to_string(seed)));
  root.set("width", JsonValue::MakeNumber(map.width()));
  root.set("height", JsonValue::MakeNumber(map.height()));
  root.set("type", JsonValue::MakeString(metro::ToString(map.mapType())));
  root.set("hash", JsonValue::MakeString(metro::FormatHex64(metro::HashMap(map))));
  root.set("land_ratio", JsonValue::MakeNumber(map.landRatio()));
  root.set("water_tiles", JsonValue::MakeNumber(water));

  JsonValue density = JsonValue::MakeObject();
  density.set("residential_total", JsonValue::MakeNumber(static_cast<double>(d.residential)));
  density.set("office_total", JsonValue::MakeNumber(static_cast<double>(d.office)));
  density.set("residential_max", JsonValue::MakeNumber(d.maxResidential));
  density.set("office_max", JsonValue::MakeNumber(d.maxOffice));
  root.set("density", std::move(density));
  return root;
}

} // namespace

int main(int argc, char** argv)
{
  using namespace metro;

  std::uint64_t seed = 1;
  std::string outJson;
  std::string configPath;
  bool ascii = false;

  int w = 0;
  int h = 0;
  bool sizeProvided = false;
  std::optional<MapType> forceType;

  auto requireValue = [&](int& i, std::string& out) -> bool {
    if (i + 1 >= argc) return false;
    out = argv[++i];
    return true;
  };

  for (int i = 1; i < argc; ++i) {
    const std::string arg = argv[i];
    std::string val;

    if (arg == "--help" || arg == "-h") {
      PrintHelp();
      return 0;
    } else if (arg == "--seed") {
      if (!requireValue(i, val) || !ParseSeed(val, seed)) {
        std::cerr << "--seed requires a valid integer (decimal or 0x...)\n";
        return 2;
      }
    } else if (arg == "--type") {
      MapType t = MapType::River;
      if (!requireValue(i, val) || !ParseMapType(val, t)) {
        std::cerr << "--type requires river or archipelago\n";
        return 2;
      }
      forceType = t;
    } else if (arg == "--size") {
      if (!requireValue(i, val) || !ParseMapSize(val, w, h)) {
        std::cerr << "--size requires format WxH (e.g. 48x32)\n";
        return 2;
      }
      sizeProvided = true;
    } else if (arg == "--config") {
      if (!requireValue(i, configPath)) {
        std::cerr << "--config requires a path\n";
        return 2;
      }
    } else if (arg == "--out" || arg == "--json") {
      if (!requireValue(i, outJson)) {
        std::cerr << arg << " requires a path\n";
        return 2;
      }
    } else if (arg == "--ascii") {
      ascii = true;
    } else if (arg == "--log-level") {
      if (!requireValue(i, val)) {
        std::cerr << "--log-level requires a level\n";
        return 2;
      }
      SetLogLevel(ParseLogLevel(val, LogLevel::Warn));
    } else {
      std::cerr << "Unknown argument: " << arg << "\n\n";
      PrintHelp();
      return 2;
    }
  }

  GameConfig gameCfg;
  MapGenConfig mapCfg = MapGenConfigFromGame(gameCfg);
  if (!configPath.empty()) {
    std::string err;
    if (!LoadConfigJsonFile(configPath, &gameCfg, &mapCfg, err)) {
      std::cerr << "config error: " << err << "\n";
      return 2;
    }
  }
  if (sizeProvided) {
    mapCfg.width = w;
    mapCfg.height = h;
  }
  if (forceType) mapCfg.forceType = forceType;

  const MapGrid map = GenerateMap(seed, mapCfg);

  if (ascii) PrintAscii(map);

  const std::string summary = JsonStringify(MakeSummary(map, seed)) + "\n";
  if (outJson.empty()) {
    std::cout << summary;
    return 0;
  }

  std::string err;
  if (!WriteFileAtomic(outJson, summary, err)) {
    std::cerr << "write failed: " << err << "\n";
    return 1;
  }
  std::cout << "wrote " << outJson << " (hash " << FormatHex64(HashMap(map)) << ")\n";
  return 0;
}
