#include "adjacency_matrix.hh"

#include <limits>
#include <stdexcept>
#include <string>

namespace path_tools {

AdjacencyMatrix::AdjacencyMatrix(size_t num_nodes) : num_nodes_(num_nodes) {
  ValidateNodeCount(num_nodes);
  if (num_nodes > std::numeric_limits<size_t>::max() / num_nodes) {
    throw std::invalid_argument("Too many nodes for a dense matrix: " +
                                std::to_string(num_nodes));
  }
  weights_.assign(num_nodes * num_nodes, kInfinity);
}

void AdjacencyMatrix::AddEdge(NodeId source, NodeId destination,
                              Weight weight) {
  ValidateEdge(source, destination, weight, num_nodes_);
  weights_[Index(source, destination)] = weight;
}

Weight AdjacencyMatrix::GetWeight(NodeId source, NodeId destination) const {
  if (!InRange(source) || !InRange(destination)) {
    return kInfinity;
  }
  return weights_[Index(source, destination)];
}

bool AdjacencyMatrix::HasEdge(NodeId source, NodeId destination) const {
  return GetWeight(source, destination) != kInfinity;
}

void AdjacencyMatrix::RemoveEdge(NodeId source, NodeId destination) {
  if (InRange(source) && InRange(destination)) {
    weights_[Index(source, destination)] = kInfinity;
  }
}

std::vector<Edge> AdjacencyMatrix::Neighbors(NodeId node) const {
  std::vector<Edge> neighbors;
  if (!InRange(node)) {
    return neighbors;
  }
  for (NodeId destination = 0; destination < num_nodes_; ++destination) {
    Weight weight = weights_[Index(node, destination)];
    if (weight != kInfinity) {
      neighbors.push_back(Edge{destination, weight});
    }
  }
  return neighbors;
}

size_t AdjacencyMatrix::Degree(NodeId node) const {
  return Neighbors(node).size();
}

std::ostream &operator<<(std::ostream &os, const AdjacencyMatrix &matrix) {
  os << "AdjacencyMatrix (" << matrix.size() << " nodes):\n";
  for (NodeId source = 0; source < matrix.size(); ++source) {
    for (NodeId destination = 0; destination < matrix.size(); ++destination) {
      Weight weight = matrix.GetWeight(source, destination);
      if (weight == kInfinity) {
        os << "inf";
      } else {
        os << weight;
      }
      os << (destination + 1 < matrix.size() ? " " : "\n");
    }
  }
  return os;
}

} // namespace path_tools
