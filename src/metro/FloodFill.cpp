#include "metro/FloodFill.hpp"

#include <cstddef>
#include <utility>

namespace metro {

namespace {

template <typename CanFill>
void FillFrom(int w, int h, Point start, std::vector<std::uint8_t>& mask, std::vector<Point>* outTiles,
              CanFill canFill)
{
  std::vector<Point> stack;

  auto markPush = [&](int x, int y) {
    const std::size_t idx = static_cast<std::size_t>(y) * static_cast<std::size_t>(w) + static_cast<std::size_t>(x);
    if (mask[idx]) return;
    mask[idx] = 1;
    stack.push_back(Point{x, y});
  };

  markPush(start.x, start.y);

  while (!stack.empty()) {
    const Point p = stack.back();
    stack.pop_back();

    if (outTiles) outTiles->push_back(p);

    const int x = p.x;
    const int y = p.y;

    if (x > 0 && canFill(x - 1, y)) markPush(x - 1, y);
    if (x + 1 < w && canFill(x + 1, y)) markPush(x + 1, y);
    if (y > 0 && canFill(x, y - 1)) markPush(x, y - 1);
    if (y + 1 < h && canFill(x, y + 1)) markPush(x, y + 1);
  }
}

} // namespace

FloodFillResult FloodFillRegion(const MapGrid& map, Point start)
{
  FloodFillResult out;
  out.w = map.width();
  out.h = map.height();
  out.mask.assign(static_cast<std::size_t>(out.w) * static_cast<std::size_t>(out.h), 0);

  if (!map.inBounds(start.x, start.y)) return out;

  const TileType type = map.at(start.x, start.y).type;
  FillFrom(out.w, out.h, start, out.mask, &out.tiles,
           [&](int x, int y) { return map.at(x, y).type == type; });
  return out;
}

std::vector<std::vector<Point>> FindComponents(const MapGrid& map, TileType type)
{
  const int w = map.width();
  const int h = map.height();

  std::vector<std::uint8_t> visited(static_cast<std::size_t>(w) * static_cast<std::size_t>(h), 0);
  std::vector<std::vector<Point>> comps;

  for (int y = 0; y < h; ++y) {
    for (int x = 0; x < w; ++x) {
      const std::size_t idx = static_cast<std::size_t>(y) * static_cast<std::size_t>(w) + static_cast<std::size_t>(x);
      if (visited[idx] || map.at(x, y).type != type) continue;

      std::vector<Point> comp;
      FillFrom(w, h, Point{x, y}, visited, &comp, [&](int nx, int ny) { return map.at(nx, ny).type == type; });
      comps.push_back(std::move(comp));
    }
  }

  return comps;
}

std::vector<std::uint8_t> EdgeConnectedWaterMask(const MapGrid& map)
{
  const int w = map.width();
  const int h = map.height();
  std::vector<std::uint8_t> mask(static_cast<std::size_t>(w) * static_cast<std::size_t>(h), 0);

  auto isWater = [&](int x, int y) { return map.at(x, y).type == TileType::Water; };

  auto seed = [&](int x, int y) {
    const std::size_t idx = static_cast<std::size_t>(y) * static_cast<std::size_t>(w) + static_cast<std::size_t>(x);
    if (mask[idx] || !isWater(x, y)) return;
    FillFrom(w, h, Point{x, y}, mask, nullptr, isWater);
  };

  for (int x = 0; x < w; ++x) {
    seed(x, 0);
    if (h > 1) seed(x, h - 1);
  }
  for (int y = 0; y < h; ++y) {
    seed(0, y);
    if (w > 1) seed(w - 1, y);
  }

  return mask;
}

} // namespace metro
