#include "metro/StationGraph.hpp"

#include "metro/GameState.hpp"

#include <algorithm>
#include <deque>

namespace metro {

StationGraph::StationGraph(const GameState& state)
{
  for (const Station& s : state.stations) m_adj[s.id];

  for (const MetroLine& line : state.lines) {
    const std::vector<StationId>& ids = line.stationIds;
    if (ids.size() < 2) continue;

    for (std::size_t i = 0; i + 1 < ids.size(); ++i) addEdge(ids[i], ids[i + 1], line.id);

    if (line.isLoop && ids.size() > 2) addEdge(ids.back(), ids.front(), line.id);
  }
}

void StationGraph::addEdge(StationId a, StationId b, LineId line)
{
  // Loops repeat their first station at the end, which would give a self edge.
  if (a == b) return;

  auto ia = m_adj.find(a);
  auto ib = m_adj.find(b);
  if (ia == m_adj.end() || ib == m_adj.end()) return;

  ia->second.push_back(Edge{b, line});
  ib->second.push_back(Edge{a, line});
}

const std::vector<StationGraph::Edge>& StationGraph::edges(StationId id) const
{
  static const std::vector<Edge> kEmpty;
  auto it = m_adj.find(id);
  return it == m_adj.end() ? kEmpty : it->second;
}

std::optional<std::vector<StationId>> StationGraph::findRoute(StationId from, StationId to) const
{
  if (from == to) return std::vector<StationId>{};
  if (!hasStation(from) || !hasStation(to)) return std::nullopt;

  std::unordered_map<StationId, StationId> parent;
  parent.emplace(from, from);

  std::deque<StationId> queue;
  queue.push_back(from);

  while (!queue.empty()) {
    const StationId cur = queue.front();
    queue.pop_front();

    if (cur == to) {
      std::vector<StationId> path;
      for (StationId at = to; at != from; at = parent[at]) path.push_back(at);
      path.push_back(from);
      std::reverse(path.begin(), path.end());
      return path;
    }

    for (const Edge& e : edges(cur)) {
      if (parent.emplace(e.to, cur).second) queue.push_back(e.to);
    }
  }

  return std::nullopt;
}

std::optional<std::vector<StationId>> FindRoute(const GameState& state, StationId from, StationId to)
{
  return StationGraph(state).findRoute(from, to);
}

} // namespace metro
