#include "metro/MapGen.hpp"

#include "metro/FloodFill.hpp"
#include "metro/Random.hpp"

#include <algorithm>
#include <cmath>
#include <cstddef>
#include <deque>
#include <utility>
#include <vector>

namespace metro {

namespace {

constexpr double kPi = 3.14159265358979323846;

enum class RiverKind : std::uint8_t {
  Single,
  Branching,
  TwoSeparate,
};

enum class Edge : std::uint8_t {
  Top,
  Bottom,
  Left,
  Right,
};

struct Hotspot {
  int x = 0;
  int y = 0;
  int strength = 0;
};

class Generator {
public:
  Generator(std::uint64_t seed, const MapGenConfig& cfg)
      : m_cfg(cfg), m_rng(seed), m_map(cfg.width, cfg.height, seed, TileType::Land)
  {}

  MapGrid run()
  {
    const bool river = m_rng.chance(0.5);
    MapType type = river ? MapType::River : MapType::Archipelago;
    if (m_cfg.forceType) type = *m_cfg.forceType;
    m_map.setMapType(type);

    if (m_map.width() > 0 && m_map.height() > 0) {
      if (type == MapType::River) {
        generateRivers();
      } else {
        generateArchipelago();
      }
      generateDensities();
    }

    return std::move(m_map);
  }

private:
  int W() const { return m_map.width(); }
  int H() const { return m_map.height(); }

  void setWater(int x, int y)
  {
    if (m_map.inBounds(x, y)) m_map.at(x, y).type = TileType::Water;
  }

  // ---------------------------------------------------------------------------
  // Rivers
  // ---------------------------------------------------------------------------

  void generateRivers()
  {
    const double roll = m_rng.nextF01();
    RiverKind kind = RiverKind::TwoSeparate;
    if (roll < 0.5) {
      kind = RiverKind::Single;
    } else if (roll < 0.75) {
      kind = RiverKind::Branching;
    }

    const bool horizontal = m_rng.chance(0.5);
    const Edge startEdge = horizontal ? Edge::Left : Edge::Top;
    const Edge endEdge = horizontal ? Edge::Right : Edge::Bottom;

    switch (kind) {
    case RiverKind::Single: {
      const Point a = edgePosition(startEdge, 0.3, 0.7);
      const Point b = edgePosition(endEdge, 0.3, 0.7);
      const int width = m_rng.rangeInt(1, 4);
      drawRiver(a, b, width);
      break;
    }
    case RiverKind::Branching: {
      const Point a1 = edgePosition(startEdge, 0.15, 0.4);
      const Point a2 = edgePosition(startEdge, 0.6, 0.85);
      const Point b = edgePosition(endEdge, 0.35, 0.65);

      // Merge point: mid-map along the flow axis, between the two sources across it.
      Point merge;
      if (horizontal) {
        merge.x = static_cast<int>(std::floor(W() * m_rng.rangeFloat(0.4, 0.6)));
        merge.y = static_cast<int>(std::floor((a1.y + a2.y) / 2.0 + m_rng.rangeInt(-3, 3)));
      } else {
        merge.x = static_cast<int>(std::floor((a1.x + a2.x) / 2.0 + m_rng.rangeInt(-3, 3)));
        merge.y = static_cast<int>(std::floor(H() * m_rng.rangeFloat(0.4, 0.6)));
      }
      merge.x = std::max(2, std::min(W() - 3, merge.x));
      merge.y = std::max(2, std::min(H() - 3, merge.y));

      const int w1 = m_rng.rangeInt(1, 4);
      const int w2 = m_rng.rangeInt(1, 4);
      const int w3 = std::min(4, w1 + w2);

      drawRiver(a1, merge, w1);
      drawRiver(a2, merge, w2);
      drawRiver(merge, b, w3);
      break;
    }
    case RiverKind::TwoSeparate: {
      const Point a1 = edgePosition(startEdge, 0.1, 0.35);
      const Point b1 = edgePosition(endEdge, 0.1, 0.35);
      const Point a2 = edgePosition(startEdge, 0.65, 0.9);
      const Point b2 = edgePosition(endEdge, 0.65, 0.9);

      const int w1 = m_rng.rangeInt(1, 4);
      const int w2 = m_rng.rangeInt(1, 4);

      drawRiver(a1, b1, w1);
      drawRiver(a2, b2, w2);
      break;
    }
    }
  }

  Point edgePosition(Edge edge, double minRatio, double maxRatio)
  {
    auto along = [&](int extent) {
      return m_rng.rangeInt(static_cast<int>(std::floor(extent * minRatio)),
                            static_cast<int>(std::floor(extent * maxRatio)));
    };

    switch (edge) {
    case Edge::Top: return Point{along(W()), 0};
    case Edge::Bottom: return Point{along(W()), H() - 1};
    case Edge::Left: return Point{0, along(H())};
    case Edge::Right: return Point{W() - 1, along(H())};
    }
    return Point{0, 0};
  }

  void drawRiver(Point a, Point b, int width)
  {
    if (width <= 1) {
      drawStraightRiver(a, b);
    } else {
      drawMeanderingRiver(a, b, width);
    }
  }

  // Bresenham variant taking exactly one axis step per iteration, so consecutive
  // tiles always share an edge.
  void drawStraightRiver(Point a, Point b)
  {
    int x = a.x;
    int y = a.y;
    const int dx = std::abs(b.x - a.x);
    const int dy = std::abs(b.y - a.y);
    const int sx = a.x < b.x ? 1 : -1;
    const int sy = a.y < b.y ? 1 : -1;
    int err = dx - dy;

    while (true) {
      setWater(x, y);
      if (x == b.x && y == b.y) break;

      const int e2 = 2 * err;
      if (e2 > -dy) {
        err -= dy;
        x += sx;
      } else if (e2 < dx) {
        err += dx;
        y += sy;
      }
    }
  }

  // Append 4-connected steps from `from` to `to` (exclusive of `from`), larger axis first.
  static void AppendEdgeAdjacent(std::vector<Point>& path, Point from, Point to)
  {
    int x = from.x;
    int y = from.y;
    while (x != to.x || y != to.y) {
      if (std::abs(to.x - x) > std::abs(to.y - y)) {
        x += (to.x > x) ? 1 : -1;
      } else {
        y += (to.y > y) ? 1 : -1;
      }
      path.push_back(Point{x, y});
    }
  }

  void drawMeanderingRiver(Point a, Point b, int width)
  {
    std::vector<Point> centerline;
    centerline.push_back(a);

    double x = a.x;
    double y = a.y;
    const double totalDist = std::hypot(static_cast<double>(b.x - a.x), static_cast<double>(b.y - a.y));
    const int maxSteps = W() + H() + 100;

    for (int step = 0; step < maxSteps; ++step) {
      const double distToEnd = std::hypot(x - b.x, y - b.y);
      if (distToEnd < 1.5) break;

      const double distFromStart = std::hypot(x - a.x, y - a.y);
      const double progress = std::min(1.0, distFromStart / totalDist);

      const double dirX = (b.x - x) / distToEnd;
      const double dirY = (b.y - y) / distToEnd;

      // Meander is strongest mid-river and vanishes at both banks.
      const double strength = std::sin(progress * kPi) * 0.4;
      const double meander = (m_rng.nextF01() - 0.5) * 2.0 * strength;

      double mx = dirX + (-dirY) * meander;
      double my = dirY + dirX * meander;
      const double mlen = std::hypot(mx, my);
      mx /= mlen;
      my /= mlen;

      x = std::max(0.0, std::min(static_cast<double>(W() - 1), x + mx));
      y = std::max(0.0, std::min(static_cast<double>(H() - 1), y + my));

      const Point np{static_cast<int>(std::lround(x)), static_cast<int>(std::lround(y))};
      if (np != centerline.back()) AppendEdgeAdjacent(centerline, centerline.back(), np);
    }

    // Always finish on the end point so the band reaches the far edge even when the
    // walk runs out of steps.
    AppendEdgeAdjacent(centerline, centerline.back(), b);

    expandCenterline(centerline, width);
  }

  void expandCenterline(const std::vector<Point>& centerline, int width)
  {
    const std::size_t n = static_cast<std::size_t>(W()) * static_cast<std::size_t>(H());
    std::vector<std::uint8_t> inRiver(n, 0);
    std::size_t count = 0;

    auto idx = [&](int x, int y) { return static_cast<std::size_t>(y) * static_cast<std::size_t>(W()) + x; };

    for (const Point& p : centerline) {
      if (!m_map.inBounds(p.x, p.y)) continue;
      if (!inRiver[idx(p.x, p.y)]) {
        inRiver[idx(p.x, p.y)] = 1;
        ++count;
      }
      setWater(p.x, p.y);
    }

    const std::size_t target = static_cast<std::size_t>(std::floor(centerline.size() * width * 0.8));
    std::deque<Point> queue(centerline.begin(), centerline.end());

    while (count < target && !queue.empty()) {
      const Point cur = queue.front();
      queue.pop_front();

      Point nbs[4] = {{cur.x + 1, cur.y}, {cur.x - 1, cur.y}, {cur.x, cur.y + 1}, {cur.x, cur.y - 1}};

      // Fisher-Yates for organic banks.
      for (int i = 3; i > 0; --i) {
        const int j = static_cast<int>(std::floor(m_rng.nextF01() * (i + 1)));
        std::swap(nbs[i], nbs[j]);
      }

      for (const Point& nb : nbs) {
        if (!m_map.inBounds(nb.x, nb.y) || inRiver[idx(nb.x, nb.y)]) continue;
        if (!m_rng.chance(0.6)) continue;

        inRiver[idx(nb.x, nb.y)] = 1;
        ++count;
        setWater(nb.x, nb.y);
        queue.push_back(nb);

        if (count >= target) break;
      }
    }
  }

  // ---------------------------------------------------------------------------
  // Archipelago
  // ---------------------------------------------------------------------------

  struct IslandSeed {
    int x = 0;
    int y = 0;
    int size = 0;
  };

  void generateArchipelago()
  {
    for (int y = 0; y < H(); ++y) {
      for (int x = 0; x < W(); ++x) setWater(x, y);
    }

    const int islandCount = m_rng.rangeInt(4, 6);
    const int gridCols = islandCount <= 4 ? 2 : 3;
    const int gridRows = 2;
    const double cellW = static_cast<double>(W()) / gridCols;
    const double cellH = static_cast<double>(H()) / gridRows;
    constexpr int kPadding = 4;

    std::vector<IslandSeed> seeds;
    seeds.reserve(static_cast<std::size_t>(islandCount));
    for (int i = 0; i < islandCount; ++i) {
      const int gx = i % gridCols;
      const int gy = i / gridCols;

      const double cx = gx * cellW + m_rng.rangeInt(kPadding, static_cast<int>(std::floor(cellW)) - kPadding);
      const double cy = gy * cellH + m_rng.rangeInt(kPadding, static_cast<int>(std::floor(cellH)) - kPadding);

      IslandSeed s;
      s.x = static_cast<int>(std::min(static_cast<double>(W() - 3), std::max(3.0, cx)));
      s.y = static_cast<int>(std::min(static_cast<double>(H() - 3), std::max(3.0, cy)));
      s.size = m_rng.rangeInt(5, 10);
      seeds.push_back(s);
    }

    for (int y = 0; y < H(); ++y) {
      for (int x = 0; x < W(); ++x) {
        double best = 0.0;
        for (const IslandSeed& s : seeds) {
          const double d = std::hypot(static_cast<double>(x - s.x), static_cast<double>(y - s.y));
          best = std::max(best, std::max(0.0, 1.0 - d / (s.size + 1)));
        }

        const double noise = (m_rng.nextF01() - 0.5) * 0.4;
        const double p = std::clamp(best + noise, 0.0, 1.0);
        if (p > 0.3) m_map.at(x, y).type = TileType::Land;
      }
    }

    removeSmallIslands(4);
    adjustLandRatio(0.6, 0.8);
    removeLakes();
  }

  void removeSmallIslands(int minSize)
  {
    for (const auto& comp : FindComponents(m_map, TileType::Land)) {
      if (static_cast<int>(comp.size()) >= minSize) continue;
      for (const Point& p : comp) setWater(p.x, p.y);
    }
  }

  bool hasNeighborOfType(int x, int y, TileType t) const
  {
    static const int kDx[4] = {1, -1, 0, 0};
    static const int kDy[4] = {0, 0, 1, -1};
    for (int k = 0; k < 4; ++k) {
      const int nx = x + kDx[k];
      const int ny = y + kDy[k];
      if (m_map.inBounds(nx, ny) && m_map.at(nx, ny).type == t) return true;
    }
    return false;
  }

  // Grow (or erode) the shoreline in random batches until the land ratio lands
  // inside [minRatio, maxRatio] or the iteration budget runs out.
  void adjustLandRatio(double minRatio, double maxRatio)
  {
    constexpr int kMaxIterations = 200;
    const double total = static_cast<double>(W()) * static_cast<double>(H());
    int land = m_map.countTiles(TileType::Land);

    auto step = [&](TileType from, TileType to, double deficit) {
      std::vector<Point> candidates;
      for (int y = 0; y < H(); ++y) {
        for (int x = 0; x < W(); ++x) {
          if (m_map.at(x, y).type == from && hasNeighborOfType(x, y, to)) candidates.push_back(Point{x, y});
        }
      }
      if (candidates.empty()) return false;

      const int toConvert =
          std::min(static_cast<int>(candidates.size()), static_cast<int>(std::ceil(deficit / 2.0)));
      for (int i = 0; i < toConvert && !candidates.empty(); ++i) {
        const int k = m_rng.rangeInt(0, static_cast<int>(candidates.size()) - 1);
        const Point p = candidates[static_cast<std::size_t>(k)];
        m_map.at(p.x, p.y).type = to;
        candidates.erase(candidates.begin() + k);
        land += (to == TileType::Land) ? 1 : -1;
      }
      return true;
    };

    for (int it = 0; it < kMaxIterations && land / total < minRatio; ++it) {
      if (!step(TileType::Water, TileType::Land, minRatio * total - land)) break;
    }
    for (int it = 0; it < kMaxIterations && land / total > maxRatio; ++it) {
      if (!step(TileType::Land, TileType::Water, land - maxRatio * total)) break;
    }

    removeSmallIslands(4);
  }

  void removeLakes()
  {
    const std::vector<std::uint8_t> ocean = EdgeConnectedWaterMask(m_map);
    for (int y = 0; y < H(); ++y) {
      for (int x = 0; x < W(); ++x) {
        const std::size_t i = static_cast<std::size_t>(y) * static_cast<std::size_t>(W()) + x;
        if (m_map.at(x, y).type == TileType::Water && !ocean[i]) m_map.at(x, y).type = TileType::Land;
      }
    }
  }

  // ---------------------------------------------------------------------------
  // Densities
  // ---------------------------------------------------------------------------

  std::vector<Hotspot> hotspots(int minCount, int maxCount)
  {
    const int n = m_rng.rangeInt(minCount, maxCount);
    std::vector<Hotspot> out;
    out.reserve(static_cast<std::size_t>(n));
    for (int i = 0; i < n; ++i) {
      Hotspot h;
      h.x = m_rng.rangeInt(5, W() - 5);
      h.y = m_rng.rangeInt(3, H() - 3);
      h.strength = m_rng.rangeInt(70, 99);
      out.push_back(h);
    }
    return out;
  }

  int densityAt(int x, int y, const std::vector<Hotspot>& spots) const
  {
    double best = 0.0;
    for (const Hotspot& h : spots) {
      const double d = std::hypot(static_cast<double>(x - h.x), static_cast<double>(y - h.y));
      best = std::max(best, h.strength * std::max(0.0, 1.0 - d / m_cfg.hotspotFalloff));
    }
    return static_cast<int>(std::floor(best));
  }

  void generateDensities()
  {
    std::vector<Point> land;
    for (int y = 0; y < H(); ++y) {
      for (int x = 0; x < W(); ++x) {
        if (m_map.at(x, y).type == TileType::Land) land.push_back(Point{x, y});
      }
    }
    if (land.empty()) return;

    const std::vector<Hotspot> homes = hotspots(2, 4);
    const std::vector<Hotspot> offices = hotspots(1, 3);

    long long totalHome = 0;
    long long totalOffice = 0;

    for (const Point& p : land) {
      int home = densityAt(p.x, p.y, homes);
      int office = densityAt(p.x, p.y, offices);

      // Mostly keep residential and office apart; some mixed-use tiles survive.
      if (m_rng.nextF01() < 0.7 && home > 50 && office > 50) {
        if (m_rng.chance(0.5)) {
          office = static_cast<int>(std::floor(office * 0.4));
        } else {
          home = static_cast<int>(std::floor(home * 0.4));
        }
      }

      home = std::clamp(home + m_rng.rangeInt(-10, 10), 0, 99);
      office = std::clamp(office + m_rng.rangeInt(-10, 10), 0, 99);

      Tile& t = m_map.at(p.x, p.y);
      t.residentialDensity = static_cast<std::uint8_t>(home);
      t.officeDensity = static_cast<std::uint8_t>(office);
      totalHome += home;
      totalOffice += office;
    }

    const long long ceiling = std::max(0, m_cfg.densityCeiling);
    if (totalHome > ceiling) {
      const double scale = static_cast<double>(ceiling) / static_cast<double>(totalHome);
      for (const Point& p : land) {
        Tile& t = m_map.at(p.x, p.y);
        t.residentialDensity = static_cast<std::uint8_t>(std::floor(t.residentialDensity * scale));
      }
    }
    if (totalOffice > ceiling) {
      const double scale = static_cast<double>(ceiling) / static_cast<double>(totalOffice);
      for (const Point& p : land) {
        Tile& t = m_map.at(p.x, p.y);
        t.officeDensity = static_cast<std::uint8_t>(std::floor(t.officeDensity * scale));
      }
    }
  }

  MapGenConfig m_cfg;
  RNG m_rng;
  MapGrid m_map;
};

} // namespace

MapGenConfig MapGenConfigFromGame(const GameConfig& cfg)
{
  MapGenConfig mc;
  mc.width = cfg.mapWidth;
  mc.height = cfg.mapHeight;
  mc.hotspotFalloff = cfg.hotspotFalloff;
  mc.densityCeiling = cfg.densityCeiling;
  return mc;
}

MapGrid GenerateMap(std::uint64_t seed, const MapGenConfig& cfg)
{
  Generator gen(seed, cfg);
  return gen.run();
}

} // namespace metro
