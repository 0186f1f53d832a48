#include <unistd.h>
#include <iostream>

#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <argparse/argparse.hpp>
#include <oigrade/logger.h>
#include <oigrade/grading.h>

#include "config.h"

namespace {

GradingTask ParseArgs(int argc, char** argv) {
  int verbosity = 0;
  argparse::ArgumentParser parser(argc ? argv[0] : "oigrade-runner");
  parser.add_argument("problem_id")
    .help("Problem to grade");
  parser.add_argument("-c", "--config")
    .default_value(std::string(kDefaultConfig))
    .help("Path of configuration file");
  parser.add_argument("-v", "--verbose")
    .action([&](const auto &) { ++verbosity; })
    .append().default_value(false).implicit_value(true).nargs(0)
    .help("Verbose level");
  parser.add_argument("-t", "--time-limit")
    .scan<'g', double>()
    .default_value(2.0)
    .help("Time limit per test case in seconds");
  parser.add_argument("--workdir")
    .default_value(std::string("/workdir"))
    .help("Directory containing the solution");
  parser.add_argument("--problems-dir")
    .default_value(std::string("/problems"))
    .help("Directory containing {problem_id}/input/");
  parser.add_argument("--server-url")
    .help("Base URL of the verdict service");

  try {
    parser.parse_args(argc, argv);
  } catch (const std::runtime_error& err) {
    std::cerr << err.what() << std::endl;
    std::cerr << parser;
    exit(1);
  }

  spdlog::set_level(LogLevelFromVerbosity(verbosity));
  fs::path config_file = parser.get<std::string>("--config");
  if (!ParseConfig(config_file, parser.is_used("--config"))) {
    spdlog::error("Failed to parse configuration file {}", config_file.c_str());
    exit(1);
  }
  if (!LoadEnvironment()) exit(1);
  if (auto val = parser.present("--server-url")) kGradingServerUrl = *val;

  GradingTask task;
  task.problem_id = parser.get<std::string>("problem_id");
  task.time_limit = parser.get<double>("--time-limit");
  task.workdir = parser.get<std::string>("--workdir");
  task.problems_dir = parser.get<std::string>("--problems-dir");
  task.server_url = kGradingServerUrl;
  if (task.time_limit <= 0) {
    spdlog::error("Time limit must be positive");
    exit(1);
  }
  return task;
}

} // namespace

int main(int argc, char** argv) {
  // diagnostics go to stderr; stdout carries only the result
  spdlog::set_default_logger(spdlog::stderr_color_mt("oigrade"));
  spdlog::set_pattern("[%t] %+");
  InitLogger();
  if (geteuid() != 0) {
    spdlog::error("Must be run as root.");
    return 1;
  }
  GradingTask task = ParseArgs(argc, argv);
  GradingResult result = RunGrading(task);
  std::cout << GradingResultToJson(result).dump(2, ' ', false, nlohmann::json::error_handler_t::replace)
            << std::endl;
}
