#ifndef __PATH_TOOLS_CLI_HH__
#define __PATH_TOOLS_CLI_HH__
#include "CLI/App.hpp"
#include "graph_types.hh"
#include "spdlog/common.h"
#include <cstdint>
#include <string>

namespace path_tools {

struct CommonOptions {
  bool verbose{false};
  std::string log_file;
  spdlog::level::level_enum log_level{spdlog::level::info};
  NodeId src{0};
  NodeId dst{0};
  bool print_graph{false};
  bool print_stats{false};
};

// Graph read from an edge-list file
struct LoadOptions : CommonOptions {
  std::string graph_file;
};

// Graph generated from a seed
struct RandomOptions : CommonOptions {
  uint64_t seed{0};
  size_t num_vertices{100};
  double edge_probability{0.01};
  double max_weight{100.0};
};

struct CliSubcommands {
  CLI::App *load;
  CLI::App *random;
};

void AddCommonOptions(CLI::App *app, CommonOptions &options);
CliSubcommands CreateCli(CLI::App &app, LoadOptions &load_opts,
                         RandomOptions &random_opts);
void SetupLogging(const CommonOptions &options);

} // namespace path_tools
#endif
