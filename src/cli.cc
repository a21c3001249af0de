#include "cli.hh"
#include "CLI/CLI.hpp"
#include "spdlog/sinks/basic_file_sink.h"
#include "spdlog/sinks/stdout_color_sinks.h"
#include "spdlog/spdlog.h"

#include <cstdlib>
#include <iostream>
#include <map>

namespace path_tools {
void SetupLogging(const CommonOptions &options) {
  try {
    std::vector<spdlog::sink_ptr> sinks;

    // File sink only if a log file was requested
    if (!options.log_file.empty()) {
      auto file_sink = std::make_shared<spdlog::sinks::basic_file_sink_mt>(
          options.log_file, true);
      file_sink->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%l] %v");
      sinks.push_back(file_sink);
    }

    // Console sink only if verbose mode is enabled. stdout carries results.
    if (options.verbose) {
      auto console_sink =
          std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
      console_sink->set_pattern("[%^%l%$] %v");
      sinks.push_back(console_sink);
    }

    auto logger = std::make_shared<spdlog::logger>("path_finder", sinks.begin(),
                                                   sinks.end());
    spdlog::set_default_logger(logger);
    spdlog::set_level(options.log_level);

    spdlog::info("Starting path finder: {} -> {}", options.src, options.dst);
  } catch (const spdlog::spdlog_ex &ex) {
    std::cerr << "Logger initialization failed: " << ex.what() << std::endl;
    exit(1);
  }
}

void AddCommonOptions(CLI::App *app, CommonOptions &options) {
  app->add_option("--src", options.src, "Start vertex")->required();
  app->add_option("--dst", options.dst, "Destination vertex")->required();

  app->add_flag("--print-graph", options.print_graph,
                "Print the adjacency list before searching");
  app->add_flag("--stats", options.print_stats,
                "Print search statistics after searching");

  app->add_flag("-v,--verbose", options.verbose,
                "Enable verbose console output");
  app->add_option("-l,--log-file", options.log_file, "Log file path");

  app->add_option("--log-level", options.log_level,
                  "Log level (trace, debug, info, warn, error, critical)")
      ->default_val(spdlog::level::info)
      ->transform(CLI::CheckedTransformer(
          std::map<std::string, spdlog::level::level_enum>{
              {"trace", spdlog::level::trace},
              {"debug", spdlog::level::debug},
              {"info", spdlog::level::info},
              {"warn", spdlog::level::warn},
              {"error", spdlog::level::err},
              {"critical", spdlog::level::critical}},
          CLI::ignore_case));
}

CliSubcommands CreateCli(CLI::App &app, LoadOptions &load_opts,
                         RandomOptions &random_opts) {
  // Main program setup
  app.require_subcommand(1, 1);

  auto load = app.add_subcommand("load", "Search a graph read from a file");
  auto random =
      app.add_subcommand("random", "Search a randomly generated graph");

  AddCommonOptions(load, load_opts);
  load->add_option("file", load_opts.graph_file, "Edge list file")
      ->required()
      ->check(CLI::ExistingFile);

  AddCommonOptions(random, random_opts);
  random->add_option("--seed", random_opts.seed, "RNG seed")->default_val(0);
  random
      ->add_option("-n,--vertices", random_opts.num_vertices,
                   "Number of vertices")
      ->default_val(100)
      ->check(CLI::Range(1, 1000000));
  random
      ->add_option("-p,--edge-probability", random_opts.edge_probability,
                   "Edge probability (0.0-1.0)")
      ->default_val(0.01)
      ->check(CLI::Range(0.0, 1.0));
  random
      ->add_option("--max-weight", random_opts.max_weight,
                   "Upper bound for edge weights")
      ->default_val(100.0)
      ->check(CLI::Range(1.0, 1e12));

  return CliSubcommands{load, random};
}

} // namespace path_tools
