#include "cli.hh"
#include "dijkstra.hh"
#include "graph_io.hh"
#include <CLI/CLI.hpp>
#include <iomanip>
#include <iostream>
#include <random>
#include <spdlog/spdlog.h>
#include <sstream>
#include <stdexcept>

namespace {
using namespace path_tools;

AdjacencyList BuildGraph(bool is_load, const LoadOptions &load_opts,
                         const RandomOptions &random_opts) {
  if (is_load) {
    return ReadEdgeListFile(load_opts.graph_file);
  }

  spdlog::info("Generating random graph: {} vertices, {:.3f}% edge "
               "probability, seed {}",
               random_opts.num_vertices, random_opts.edge_probability * 100,
               random_opts.seed);
  std::mt19937_64 rng(random_opts.seed);
  return GenerateRandomGraph(random_opts.num_vertices,
                             random_opts.edge_probability, rng,
                             random_opts.max_weight);
}

} // namespace

int main(int argc, char *argv[]) {
  CLI::App app{"Path Finder - shortest distance between two vertices"};
  LoadOptions load_opts;
  RandomOptions random_opts;

  auto subcmds = CreateCli(app, load_opts, random_opts);

  try {
    app.parse(argc, argv);
  } catch (const CLI::ParseError &e) {
    return app.exit(e);
  }

  const bool is_load = subcmds.load->parsed();
  const CommonOptions &active_opts =
      is_load ? static_cast<const CommonOptions &>(load_opts)
              : static_cast<const CommonOptions &>(random_opts);

  SetupLogging(active_opts);

  try {
    AdjacencyList graph = BuildGraph(is_load, load_opts, random_opts);

    if (active_opts.print_graph) {
      std::cout << graph << "\n";
    }

    SearchStats stats;
    double distance =
        ShortestPath(graph, active_opts.src, active_opts.dst, stats);

    if (distance == kNoPath) {
      std::cout << "No path exists between vertices " << active_opts.src
                << " and " << active_opts.dst << "\n";
    } else {
      std::cout << "Shortest distance from " << active_opts.src << " to "
                << active_opts.dst << ": " << std::fixed
                << std::setprecision(2) << distance << "\n";
    }

    std::stringstream ss;
    ss << stats;
    spdlog::info(ss.str());
    if (active_opts.print_stats) {
      std::cout << ss.str() << "\n";
    }
  } catch (const std::exception &e) {
    spdlog::error("{}", e.what());
    std::cerr << "Error: " << e.what() << "\n";
    return 1;
  }

  spdlog::info("Search complete");
  return 0;
}
