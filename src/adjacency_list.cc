#include "adjacency_list.hh"

namespace path_tools {

AdjacencyList::AdjacencyList(size_t num_nodes) {
  ValidateNodeCount(num_nodes);
  adjacency_.resize(num_nodes);
}

void AdjacencyList::AddEdge(NodeId source, NodeId destination, Weight weight) {
  ValidateEdge(source, destination, weight, size());
  adjacency_[source][destination] = weight;
}

Weight AdjacencyList::GetWeight(NodeId source, NodeId destination) const {
  if (!InRange(source) || !InRange(destination)) {
    return kInfinity;
  }
  const auto &edges = adjacency_[source];
  if (auto it = edges.find(destination); it != edges.end()) {
    return it->second;
  }
  return kInfinity;
}

bool AdjacencyList::HasEdge(NodeId source, NodeId destination) const {
  if (!InRange(source) || !InRange(destination)) {
    return false;
  }
  return adjacency_[source].count(destination) != 0;
}

std::vector<Edge> AdjacencyList::Neighbors(NodeId node) const {
  std::vector<Edge> neighbors;
  if (!InRange(node)) {
    return neighbors;
  }
  neighbors.reserve(adjacency_[node].size());
  for (const auto &[destination, weight] : adjacency_[node]) {
    neighbors.push_back(Edge{destination, weight});
  }
  return neighbors;
}

size_t AdjacencyList::Degree(NodeId node) const {
  return InRange(node) ? adjacency_[node].size() : 0;
}

void AdjacencyList::RemoveEdge(NodeId source, NodeId destination) {
  if (InRange(source) && InRange(destination)) {
    adjacency_[source].erase(destination);
  }
}

size_t AdjacencyList::EdgeCount() const {
  size_t count = 0;
  for (const auto &edges : adjacency_) {
    count += edges.size();
  }
  return count;
}

std::ostream &operator<<(std::ostream &os, const AdjacencyList &graph) {
  os << "AdjacencyList (" << graph.size() << " nodes):\n";
  for (NodeId node = 0; node < graph.size(); ++node) {
    os << "Node " << node << ": ";
    const auto &edges = graph.adjacency_[node];
    if (edges.empty()) {
      os << "(no outgoing edges)";
    }
    bool first = true;
    for (const auto &[destination, weight] : edges) {
      if (!first) {
        os << ", ";
      }
      os << destination << "(" << weight << ")";
      first = false;
    }
    os << "\n";
  }
  return os;
}

} // namespace path_tools
