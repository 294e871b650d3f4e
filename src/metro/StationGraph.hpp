#pragma once

#include "metro/Types.hpp"

#include <optional>
#include <unordered_map>
#include <vector>

namespace metro {

struct GameState;

// Undirected station adjacency built from the current lines.
//
// Nodes are stations; edges join consecutive stations of every line (plus the
// wrap edge of loop lines). The graph is a snapshot: build a new one whenever
// lines change instead of updating it in place.
class StationGraph {
public:
  struct Edge {
    StationId to = 0;
    LineId lineId = 0;
  };

  explicit StationGraph(const GameState& state);

  bool hasStation(StationId id) const { return m_adj.find(id) != m_adj.end(); }

  // Empty for unknown stations. Order follows line order then station order.
  const std::vector<Edge>& edges(StationId id) const;

  // Breadth-first search by hop count.
  //  - nullopt when `to` is unreachable (or either station is unknown)
  //  - an empty path when from == to
  //  - otherwise the station ids from `from` to `to`, both inclusive
  std::optional<std::vector<StationId>> findRoute(StationId from, StationId to) const;

private:
  void addEdge(StationId a, StationId b, LineId line);

  std::unordered_map<StationId, std::vector<Edge>> m_adj;
};

// Convenience: build a graph for the current state and search it.
std::optional<std::vector<StationId>> FindRoute(const GameState& state, StationId from, StationId to);

} // namespace metro
