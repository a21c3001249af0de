#ifndef __PATH_TOOLS_GRAPH_TYPES_HH__
#define __PATH_TOOLS_GRAPH_TYPES_HH__

#include <cstddef>
#include <limits>

namespace path_tools {

using NodeId = size_t;
using Weight = double;

// Weight of a missing edge, and distance of a node nobody has reached yet
constexpr Weight kInfinity = std::numeric_limits<Weight>::infinity();

// Outgoing edge as seen from its source
struct Edge {
  NodeId destination;
  Weight weight;
};

// Throws std::invalid_argument unless source -> destination is an edge that
// may be stored in a graph of num_nodes nodes.
void ValidateEdge(NodeId source, NodeId destination, Weight weight,
                  size_t num_nodes);

// Throws std::invalid_argument when a graph would have no nodes.
void ValidateNodeCount(size_t num_nodes);

} // namespace path_tools

#endif
