#include "graph_types.hh"

#include <cmath>
#include <stdexcept>
#include <string>

namespace path_tools {

void ValidateEdge(NodeId source, NodeId destination, Weight weight,
                  size_t num_nodes) {
  if (source >= num_nodes || destination >= num_nodes) {
    throw std::invalid_argument("Node indices must be between 0 and " +
                                std::to_string(num_nodes - 1) + ", got " +
                                std::to_string(source) + " -> " +
                                std::to_string(destination));
  }
  if (source == destination) {
    throw std::invalid_argument("Cannot add self-loop on node " +
                                std::to_string(source));
  }
  if (std::isnan(weight) || weight < 0) {
    throw std::invalid_argument("Weight cannot be negative");
  }
  // Infinity already means "no edge"
  if (std::isinf(weight)) {
    throw std::invalid_argument("Weight must be finite");
  }
}

void ValidateNodeCount(size_t num_nodes) {
  if (num_nodes == 0) {
    throw std::invalid_argument("Number of nodes must be positive");
  }
}

} // namespace path_tools
