#ifndef __PATH_TOOLS_GRAPH_IO_HH__
#define __PATH_TOOLS_GRAPH_IO_HH__

#include "adjacency_list.hh"
#include <istream>
#include <random>
#include <string>

namespace path_tools {

// Reads a graph in edge-list format:
//
//   # comment (also '%')
//   <num_nodes>
//   <source> <destination> [weight]
//   ...
//
// Missing weights default to 1. Throws std::runtime_error naming the line for
// malformed input and for edges the graph rejects.
AdjacencyList ReadEdgeList(std::istream &in);

// Same as above, reading from a file. Throws std::runtime_error if it cannot
// be opened.
AdjacencyList ReadEdgeListFile(const std::string &path);

// Create a random weighted graph with about
// edge_probability * num_vertices * (num_vertices - 1) directed edges whose
// weights are drawn from [1, max_weight). Same rng state, same graph.
AdjacencyList GenerateRandomGraph(size_t num_vertices, double edge_probability,
                                  std::mt19937_64 &rng,
                                  double max_weight = 100.0);

} // namespace path_tools

#endif
