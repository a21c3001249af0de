// dijkstra.hh
#ifndef __PATH_TOOLS_DIJKSTRA_HH__
#define __PATH_TOOLS_DIJKSTRA_HH__

#include "adjacency_list.hh"
#include <cstdint>
#include <ostream>

namespace path_tools {

// Returned by ShortestPath when end cannot be reached from start
constexpr double kNoPath = -1.0;

// Queue entry: a node tagged with a tentative distance.
// Ordered by distance only.
struct NodeDistance {
  NodeId node{0};
  Weight distance{0};

  bool operator<(const NodeDistance &other) const {
    return distance < other.distance;
  }
  friend std::ostream &operator<<(std::ostream &os, const NodeDistance &entry);
};

// Statistics about one shortest-path search
struct SearchStats {
  uint64_t nodes_finalized{0};
  uint64_t stale_entries_skipped{0};
  uint64_t relaxations{0};
  uint64_t queue_insertions{0};
  uint64_t peak_queue_size{0};
  int64_t search_time_us{0};
  friend std::ostream &operator<<(std::ostream &os, const SearchStats &stats);
};

// Minimum total edge weight from start to end.
// Returns 0 when start == end and kNoPath when end is unreachable. A reachable
// end whose distance overflows a double gives kInfinity.
// Throws std::invalid_argument when start or end is not a node of graph.
//
// Dijkstra with lazy deletion: a node may sit in the queue several times and
// every entry but the first one extracted is discarded. The search stops as
// soon as end is finalized. O((V + E) log V).
double ShortestPath(const AdjacencyList &graph, NodeId start, NodeId end);

// Same search, also reporting what it did.
double ShortestPath(const AdjacencyList &graph, NodeId start, NodeId end,
                    SearchStats &stats);

} // namespace path_tools

#endif // __PATH_TOOLS_DIJKSTRA_HH__
