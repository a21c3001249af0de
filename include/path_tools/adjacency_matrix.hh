#ifndef __PATH_TOOLS_ADJACENCY_MATRIX_HH__
#define __PATH_TOOLS_ADJACENCY_MATRIX_HH__

#include "graph_types.hh"
#include <ostream>
#include <vector>

namespace path_tools {

// Dense alternative to AdjacencyList with the same edge surface.
// Stores num_nodes * num_nodes weights, kInfinity marking a missing edge.
class AdjacencyMatrix {
public:
  explicit AdjacencyMatrix(size_t num_nodes);

  void AddEdge(NodeId source, NodeId destination, Weight weight = 1.0);
  Weight GetWeight(NodeId source, NodeId destination) const;
  bool HasEdge(NodeId source, NodeId destination) const;
  void RemoveEdge(NodeId source, NodeId destination);

  // O(size()) row scans
  std::vector<Edge> Neighbors(NodeId node) const;
  size_t Degree(NodeId node) const;

  size_t size() const { return num_nodes_; }

  friend std::ostream &operator<<(std::ostream &os,
                                  const AdjacencyMatrix &matrix);

private:
  bool InRange(NodeId node) const { return node < num_nodes_; }
  size_t Index(NodeId source, NodeId destination) const {
    return source * num_nodes_ + destination;
  }

  size_t num_nodes_;
  std::vector<Weight> weights_; // Row-major
};

} // namespace path_tools

#endif
