#ifndef __PATH_TOOLS_ADJACENCY_LIST_HH__
#define __PATH_TOOLS_ADJACENCY_LIST_HH__

#include "graph_types.hh"
#include <ostream>
#include <unordered_map>
#include <vector>

namespace path_tools {

// Sparse weighted directed graph over a fixed set of nodes [0, size()).
// Each node keeps a hash map destination -> weight, so lookups, inserts and
// removals are O(1) amortized.
class AdjacencyList {
public:
  // num_nodes must be positive; throws std::invalid_argument otherwise.
  explicit AdjacencyList(size_t num_nodes);

  // Inserts source -> destination, or overwrites its weight if present.
  // Throws std::invalid_argument for out-of-range nodes, self-loops and
  // weights that are negative or not finite. Nothing changes on failure.
  void AddEdge(NodeId source, NodeId destination, Weight weight = 1.0);

  // Stored weight, or kInfinity when there is no such edge.
  Weight GetWeight(NodeId source, NodeId destination) const;
  bool HasEdge(NodeId source, NodeId destination) const;

  // Snapshot of the outgoing edges of node, in no particular order.
  // Empty for out-of-range nodes.
  std::vector<Edge> Neighbors(NodeId node) const;

  size_t Degree(NodeId node) const;

  // No-op when the edge does not exist.
  void RemoveEdge(NodeId source, NodeId destination);

  size_t size() const { return adjacency_.size(); }
  size_t EdgeCount() const;

  friend std::ostream &operator<<(std::ostream &os, const AdjacencyList &graph);

private:
  bool InRange(NodeId node) const { return node < adjacency_.size(); }

  std::vector<std::unordered_map<NodeId, Weight>> adjacency_;
};

} // namespace path_tools

#endif
