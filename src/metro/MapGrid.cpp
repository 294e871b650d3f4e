#include "metro/MapGrid.hpp"

#include <algorithm>
#include <cctype>

namespace metro {

const char* ToString(MapType t)
{
  switch (t) {
  case MapType::River: return "river";
  case MapType::Archipelago: return "archipelago";
  }
  return "river";
}

bool ParseMapType(const std::string& s, MapType& out)
{
  std::string k = s;
  std::transform(k.begin(), k.end(), k.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

  if (k == "river" || k == "0") {
    out = MapType::River;
    return true;
  }
  if (k == "archipelago" || k == "islands" || k == "1") {
    out = MapType::Archipelago;
    return true;
  }
  return false;
}

MapGrid::MapGrid(int w, int h, std::uint64_t seed, TileType fill)
    : m_w(std::max(0, w)), m_h(std::max(0, h)), m_seed(seed)
{
  Tile t;
  t.type = fill;
  m_tiles.assign(static_cast<std::size_t>(m_w) * static_cast<std::size_t>(m_h), t);
}

bool MapGrid::isWaterVertex(int vx, int vy) const
{
  return isWater(vx - 1, vy - 1) && isWater(vx, vy - 1) && isWater(vx - 1, vy) && isWater(vx, vy);
}

int MapGrid::countTiles(TileType t) const
{
  int n = 0;
  for (const Tile& tile : m_tiles) {
    if (tile.type == t) ++n;
  }
  return n;
}

double MapGrid::landRatio() const
{
  if (m_tiles.empty()) return 0.0;
  return static_cast<double>(countTiles(TileType::Land)) / static_cast<double>(m_tiles.size());
}

} // namespace metro
