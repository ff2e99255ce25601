/*
 * Copyright (c) Meta Platforms, Inc. and affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#include <csignal>
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <sstream>
#include <string>
#include <vector>

#include <boost/program_options.hpp>
#include <json/json.h>

#include "AccessTightening.h"
#include "CancellationToken.h"
#include "Debug.h"
#include "DeclarationGraph.h"
#include "GraphLoader.h"
#include "JsonWrapper.h"
#include "Macros.h"
#include "Timer.h"
#include "Trace.h"
#include "UsageIndex.h"

namespace {

const std::string k_usage_header =
    "usage: tighten --graph FILE [options...]";

void print_usage() {
  std::cout << k_usage_header << std::endl;
  std::cout << "Try 'tighten -h' for more information." << std::endl;
}

CancellationToken s_token;

void cancel_handler(int /* sig */) { s_token.cancel(); }

struct Arguments {
  std::string graph;
  std::string output;
  std::string metrics;
  Json::Value config{Json::objectValue};
  boost::optional<unsigned> jobs;
};

Json::Value parse_json_value(const std::string& value_string) {
  std::istringstream temp_stream(value_string);
  Json::CharReaderBuilder builder;
  Json::Value temp_json;
  std::string errors;
  if (!Json::parseFromStream(builder, temp_stream, &temp_json, &errors)) {
    throw tighten::InvalidConfigException(
        "Invalid JSON value", {{"value", value_string}, {"errors", errors}});
  }
  return temp_json;
}

// KEY=VALUE, with VALUE parsed as JSON.
bool add_value_to_config(Json::Value& config, const std::string& key_value) {
  const size_t equals_idx = key_value.find('=');
  if (equals_idx == std::string::npos) {
    return false;
  }
  std::string key = key_value.substr(0, equals_idx);
  config[key] = parse_json_value(key_value.substr(equals_idx + 1));
  return true;
}

Json::Value reflect_config(const Configurable::Reflection& cr) {
  Json::Value params = Json::arrayValue;
  int params_idx = 0;
  for (auto& entry : cr.params) {
    Json::Value param;
    param["name"] = entry.first;
    param["doc"] = entry.second.doc;
    param["is_required"] = entry.second.is_required;
    param["type"] = entry.second.type;
    param["default_value"] = entry.second.default_value;
    params[params_idx++] = param;
  }
  Json::Value reflected_config;
  reflected_config["name"] = cr.name;
  reflected_config["doc"] = cr.doc;
  reflected_config["params"] = params;
  return reflected_config;
}

Arguments parse_args(int argc, char* argv[]) {
  Arguments args;

  namespace po = boost::program_options;
  po::options_description od(k_usage_header);
  od.add_options()("help,h", "print this help message");
  od.add_options()("reflect-config",
                   "print a reflection of the config and exit");
  od.add_options()("graph,g", po::value<std::string>(),
                   "JSON file with the declarations and their usages");
  od.add_options()("config,c", po::value<std::string>(),
                   "JSON configuration file");
  od.add_options()("set,J", po::value<std::vector<std::string>>(),
                   "override a config value: KEY=JSON");
  od.add_options()("output,o", po::value<std::string>(),
                   "where to write the suggestions (default: stdout)");
  od.add_options()("metrics,m", po::value<std::string>(),
                   "where to write the run statistics");
  od.add_options()("jobs,j", po::value<unsigned>(),
                   "number of worker threads (0: all hardware threads)");
  po::variables_map vm;

  try {
    po::store(po::command_line_parser(argc, argv).options(od).run(), vm);
    po::notify(vm);
  } catch (std::exception& e) {
    std::cerr << e.what() << std::endl << std::endl;
    print_usage();
    exit(EXIT_FAILURE);
  }

  // -h, --help handling must be the first.
  if (vm.count("help")) {
    od.print(std::cout);
    exit(EXIT_SUCCESS);
  }

  // --reflect-config handling must be next
  if (vm.count("reflect-config")) {
    VisibilityConfig config;
    std::cout << reflect_config(config.reflect()) << std::flush;
    exit(EXIT_SUCCESS);
  }

  if (!vm.count("graph")) {
    std::cerr << "error: no graph specified" << std::endl << std::endl;
    print_usage();
    exit(EXIT_FAILURE);
  }
  args.graph = vm["graph"].as<std::string>();

  if (vm.count("config")) {
    args.config = read_json_from_file(vm["config"].as<std::string>());
  }
  if (vm.count("set")) {
    for (const auto& key_value : vm["set"].as<std::vector<std::string>>()) {
      if (!add_value_to_config(args.config, key_value)) {
        std::cerr << "warning: cannot parse -J" << key_value << std::endl;
      }
    }
  }
  if (vm.count("output")) {
    args.output = vm["output"].as<std::string>();
  }
  if (vm.count("metrics")) {
    args.metrics = vm["metrics"].as<std::string>();
  }
  if (vm.count("jobs")) {
    args.jobs = vm["jobs"].as<unsigned>();
  }
  return args;
}

void write_json(const std::string& path, const Json::Value& value) {
  if (path.empty()) {
    std::cout << value << std::endl;
    return;
  }
  std::ofstream out(path);
  assert_or_throw(out.good(), TightenError::INTERNAL_ERROR,
                  "Unable to open output file", {{"file", path}});
  out << value;
}

int run(const Arguments& args) {
  VisibilityConfig config;
  config.parse_config(JsonWrapper(args.config));
  if (args.jobs) {
    config.set_num_threads(*args.jobs);
  }

  DeclarationGraph graph;
  InMemoryUsageIndex index;
  GraphLoader(graph, index).load_file(args.graph);

  AccessTightener tightener(config);
  auto result = tightener.run(graph, index, s_token);
  if (s_token.is_cancelled()) {
    TRACE(MAIN, 1, "Cancelled; unresolved declarations keep their level");
  }

  write_json(args.output, result.to_json());
  if (!args.metrics.empty()) {
    auto metrics = tightener.get_stats().to_json();
    metrics["times"] = times_to_json();
    write_json(args.metrics, metrics);
  }
  return 0;
}

} // namespace

int main(int argc, char* argv[]) {
  signal(SIGINT, cancel_handler);
  signal(SIGSEGV, crash_backtrace_handler);
#if !IS_WINDOWS
  signal(SIGBUS, crash_backtrace_handler);
#endif

  try {
    Timer main_timer("tighten main()");
    Arguments args = parse_args(argc, argv);
    return run(args);
  } catch (const TightenException& e) {
    std::cerr << "error: " << e.what() << std::endl;
    print_stack_trace(std::cerr, e);
    return e.type;
  } catch (const std::exception& e) {
    std::cerr << "error: " << e.what() << std::endl;
    print_stack_trace(std::cerr, e);
    return TightenError::INTERNAL_ERROR;
  }
}
