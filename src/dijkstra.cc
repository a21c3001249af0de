// dijkstra.cc
#include "dijkstra.hh"
#include "binary_heap.hh"
#include "spdlog/spdlog.h"

#include <algorithm>
#include <chrono>
#include <stdexcept>
#include <string>
#include <vector>

namespace path_tools {

std::ostream &operator<<(std::ostream &os, const NodeDistance &entry) {
  return os << "Node(" << entry.node << ", dist=" << entry.distance << ")";
}

std::ostream &operator<<(std::ostream &os, const SearchStats &stats) {
  os << "Search Statistics:\n"
     << "  Nodes finalized:       " << stats.nodes_finalized << "\n"
     << "  Stale entries skipped: " << stats.stale_entries_skipped << "\n"
     << "  Relaxations:           " << stats.relaxations << "\n"
     << "  Queue insertions:      " << stats.queue_insertions << "\n"
     << "  Peak queue size:       " << stats.peak_queue_size << "\n"
     << "  Search time:           " << stats.search_time_us << " us";
  return os;
}

double ShortestPath(const AdjacencyList &graph, NodeId start, NodeId end) {
  SearchStats stats;
  return ShortestPath(graph, start, end, stats);
}

double ShortestPath(const AdjacencyList &graph, NodeId start, NodeId end,
                    SearchStats &stats) {
  const size_t num_nodes = graph.size();
  if (start >= num_nodes || end >= num_nodes) {
    throw std::invalid_argument("Node indices must be between 0 and " +
                                std::to_string(num_nodes - 1));
  }

  auto start_time = std::chrono::steady_clock::now();
  stats = SearchStats{};
  spdlog::debug("Searching shortest path {} -> {} over {} nodes", start, end,
                num_nodes);

  std::vector<Weight> distance(num_nodes, kInfinity);
  // Separate from distance, which can overflow to kInfinity on long paths
  std::vector<bool> reached(num_nodes, false);
  std::vector<bool> finalized(num_nodes, false);
  BinaryHeap<NodeDistance> queue;

  auto push = [&](NodeId node, Weight dist) {
    queue.Insert(NodeDistance{node, dist});
    stats.queue_insertions++;
    stats.peak_queue_size =
        std::max<uint64_t>(stats.peak_queue_size, queue.size());
  };

  auto finish = [&](double result) {
    stats.search_time_us =
        std::chrono::duration_cast<std::chrono::microseconds>(
            std::chrono::steady_clock::now() - start_time)
            .count();
    spdlog::debug("Shortest path {} -> {}: {} ({} nodes finalized)", start,
                  end, result, stats.nodes_finalized);
    return result;
  };

  distance[start] = 0;
  reached[start] = true;
  push(start, 0);

  while (auto entry = queue.ExtractMin()) {
    auto [current, dist] = *entry;

    // Stale duplicate from an earlier relaxation
    if (finalized[current]) {
      stats.stale_entries_skipped++;
      continue;
    }
    finalized[current] = true;
    stats.nodes_finalized++;
    spdlog::trace("Finalized node {} at distance {}", current, dist);

    // Every remaining entry is >= dist, so nothing can improve on it
    if (current == end) {
      return finish(dist);
    }

    for (const auto &edge : graph.Neighbors(current)) {
      if (finalized[edge.destination]) {
        continue;
      }
      Weight new_dist = dist + edge.weight;
      if (!reached[edge.destination] ||
          new_dist < distance[edge.destination]) {
        distance[edge.destination] = new_dist;
        reached[edge.destination] = true;
        stats.relaxations++;
        push(edge.destination, new_dist);
      }
    }
  }

  // Queue drained without finalizing end
  return finish(kNoPath);
}

} // namespace path_tools
