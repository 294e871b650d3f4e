#pragma once

#include "metro/Types.hpp"

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace metro {

enum class TileType : std::uint8_t {
  Land = 0,
  Water = 1,
};

enum class MapType : std::uint8_t {
  River = 0,
  Archipelago = 1,
};

// Station ids pack each vertex coordinate into 16 bits; maps stay well inside that.
constexpr int kMaxMapDimension = 4096;

const char* ToString(MapType t);
bool ParseMapType(const std::string& s, MapType& out);

struct Tile {
  TileType type = TileType::Land;

  // 0..99. Always 0 on water.
  std::uint8_t residentialDensity = 0;
  std::uint8_t officeDensity = 0;
};

// Row-major width x height tile matrix.
//
// Tiles are addressed by their top-left vertex: tile (x,y) spans vertices (x,y)..(x+1,y+1).
// Stations live on vertices, so a station at (vx,vy) touches tiles (vx-1,vy-1), (vx,vy-1),
// (vx-1,vy) and (vx,vy).
class MapGrid {
public:
  MapGrid() = default;
  MapGrid(int w, int h, std::uint64_t seed, TileType fill = TileType::Land);

  int width() const { return m_w; }
  int height() const { return m_h; }
  std::uint64_t seed() const { return m_seed; }

  MapType mapType() const { return m_type; }
  void setMapType(MapType t) { m_type = t; }

  bool empty() const { return m_tiles.empty(); }

  bool inBounds(int x, int y) const { return x >= 0 && y >= 0 && x < m_w && y < m_h; }

  Tile& at(int x, int y) { return m_tiles[static_cast<std::size_t>(y) * m_w + x]; }
  const Tile& at(int x, int y) const { return m_tiles[static_cast<std::size_t>(y) * m_w + x]; }

  bool isWater(int x, int y) const { return inBounds(x, y) && at(x, y).type == TileType::Water; }
  bool isLand(int x, int y) const { return inBounds(x, y) && at(x, y).type == TileType::Land; }

  // True if all four tiles touching the vertex exist and are water.
  bool isWaterVertex(int vx, int vy) const;

  int countTiles(TileType t) const;
  double landRatio() const;

  const std::vector<Tile>& tiles() const { return m_tiles; }

private:
  int m_w = 0;
  int m_h = 0;
  std::uint64_t m_seed = 0;
  MapType m_type = MapType::River;
  std::vector<Tile> m_tiles;
};

} // namespace metro
