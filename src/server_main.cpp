#include <iostream>

#include <httplib.h>
#include <spdlog/spdlog.h>
#include <argparse/argparse.hpp>
#include <oigrade/paths.h>
#include <oigrade/logger.h>
#include <oigrade/checker.h>

#include "config.h"
#include "oigrade/grading_service.h"

namespace {

void ParseArgs(int argc, char** argv) {
  int verbosity = 1;
  argparse::ArgumentParser parser(argc ? argv[0] : "oigrade-server");
  parser.add_argument("-c", "--config")
    .default_value(std::string(kDefaultConfig))
    .help("Path of configuration file");
  parser.add_argument("-v", "--verbose")
    .action([&](const auto &) { ++verbosity; })
    .append().default_value(false).implicit_value(true).nargs(0)
    .help("Verbose level");
  parser.add_argument("--host")
    .help("Address to listen on");
  parser.add_argument("-p", "--port")
    .scan<'d', int>()
    .help("Port to listen on");
  parser.add_argument("--grading-dir")
    .help("Directory holding inputs/ and outputs/");

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
  if (auto val = parser.present("--host")) kGradingHost = *val;
  if (auto val = parser.present<int>("--port")) {
    if (!IsValidPort(*val)) {
      spdlog::error("Invalid port {}", *val);
      exit(1);
    }
    kGradingPort = *val;
  }
  if (auto val = parser.present("--grading-dir")) kGradingDir = *val;
}

} // namespace

int main(int argc, char** argv) {
  spdlog::set_pattern("[%t] %+");
  InitLogger();
  ParseArgs(argc, argv);

  std::error_code ec;
  fs::path inputs = GradingInputsDir(kGradingDir), outputs = GradingOutputsDir(kGradingDir);
  if (!fs::is_directory(inputs, ec)) spdlog::warn("Inputs directory not found: {}", inputs.c_str());
  if (!fs::is_directory(outputs, ec)) spdlog::warn("Outputs directory not found: {}", outputs.c_str());
  spdlog::info("Inputs directory: {}", inputs.c_str());
  spdlog::info("Outputs directory: {}", outputs.c_str());

  CheckerRegistry registry;
  RegisterBuiltinCheckers(registry);
  spdlog::info("Registered {} custom checkers", registry.Size());
  GradingService service(kGradingDir, registry);

  httplib::Server svr;
  if (kServerThreads > 0) {
    svr.new_task_queue = [] { return new httplib::ThreadPool(kServerThreads); };
  }
  service.Mount(svr);
  spdlog::info("Starting grading server on {}:{}", kGradingHost, kGradingPort);
  if (!svr.listen(kGradingHost, kGradingPort)) {
    spdlog::error("Failed to listen on {}:{}", kGradingHost, kGradingPort);
    return 1;
  }
}
