#include "graph_io.hh"
#include "spdlog/spdlog.h"

#include <fstream>
#include <new>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <string>

namespace path_tools {

namespace {
constexpr Weight kDefaultWeight = 1.0;

std::runtime_error ParseError(size_t line_number, const std::string &what) {
  return std::runtime_error("Line " + std::to_string(line_number) + ": " +
                            what);
}

// Strips comments and blank lines; returns the remaining data line.
std::optional<std::string> NextDataLine(std::istream &in, size_t &line_number) {
  std::string line;
  while (std::getline(in, line)) {
    line_number++;
    size_t first = line.find_first_not_of(" \t\r");
    if (first == std::string::npos || line[first] == '#' ||
        line[first] == '%') {
      continue;
    }
    return line;
  }
  return std::nullopt;
}

// True if nothing but whitespace is left in iss
bool AtEnd(std::istringstream &iss) {
  iss >> std::ws;
  return iss.eof();
}
} // namespace

AdjacencyList ReadEdgeList(std::istream &in) {
  size_t line_number = 0;

  auto header = NextDataLine(in, line_number);
  if (!header.has_value()) {
    throw std::runtime_error("Edge list is empty, expected a node count");
  }
  std::istringstream header_stream(*header);
  long long num_nodes = 0;
  if (!(header_stream >> num_nodes) || !AtEnd(header_stream)) {
    throw ParseError(line_number, "expected a node count, got '" + *header +
                                      "'");
  }
  if (num_nodes <= 0) {
    throw ParseError(line_number, "node count must be positive");
  }

  auto graph = [&] {
    try {
      return AdjacencyList(static_cast<size_t>(num_nodes));
    } catch (const std::length_error &) {
      throw ParseError(line_number, "node count " + std::to_string(num_nodes) +
                                        " is too large");
    } catch (const std::bad_alloc &) {
      throw ParseError(line_number, "node count " + std::to_string(num_nodes) +
                                        " is too large");
    }
  }();

  while (auto line = NextDataLine(in, line_number)) {
    std::istringstream iss(*line);
    long long source = 0;
    long long destination = 0;
    Weight weight = kDefaultWeight;

    if (!(iss >> source >> destination)) {
      throw ParseError(line_number, "expected '<source> <destination> "
                                    "[weight]', got '" +
                                        *line + "'");
    }
    if (!AtEnd(iss) && (!(iss >> weight) || !AtEnd(iss))) {
      throw ParseError(line_number, "invalid weight in '" + *line + "'");
    }
    if (source < 0 || destination < 0) {
      throw ParseError(line_number, "node indices cannot be negative");
    }

    try {
      graph.AddEdge(static_cast<NodeId>(source),
                    static_cast<NodeId>(destination), weight);
    } catch (const std::invalid_argument &e) {
      throw ParseError(line_number, e.what());
    }
  }

  spdlog::info("Read graph with {} nodes and {} edges", graph.size(),
               graph.EdgeCount());
  return graph;
}

AdjacencyList ReadEdgeListFile(const std::string &path) {
  std::ifstream in(path);
  if (!in) {
    throw std::runtime_error("Failed to open file: " + path);
  }
  spdlog::info("Reading edge list from {}", path);
  return ReadEdgeList(in);
}

AdjacencyList GenerateRandomGraph(size_t num_vertices, double edge_probability,
                                  std::mt19937_64 &rng, double max_weight) {
  if (num_vertices == 0) {
    throw std::invalid_argument("Number of vertices must be positive");
  }
  if (!(edge_probability >= 0.0 && edge_probability <= 1.0)) {
    throw std::invalid_argument("Edge probability must be between 0 and 1");
  }
  if (!(max_weight >= 1.0)) {
    throw std::invalid_argument("Maximum weight must be at least 1");
  }

  AdjacencyList graph(num_vertices);
  if (num_vertices < 2) {
    return graph;
  }

  std::uniform_real_distribution<> weight_dist(1.0, max_weight);

  // Calculate expected number of edges
  size_t expected_edges = static_cast<size_t>(
      edge_probability *
      static_cast<double>(num_vertices * (num_vertices - 1)));

  // Generate edges directly; repeated pairs overwrite each other
  std::uniform_int_distribution<size_t> vertex_dist(0, num_vertices - 1);

  for (size_t i = 0; i < expected_edges; ++i) {
    size_t src, dst;
    do {
      src = vertex_dist(rng);
      dst = vertex_dist(rng);
    } while (src == dst);

    graph.AddEdge(src, dst, weight_dist(rng));
  }

  spdlog::debug("Generated random graph: {} vertices, {} edges", num_vertices,
                graph.EdgeCount());
  return graph;
}

} // namespace path_tools
