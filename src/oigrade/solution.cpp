#include "solution.h"

#include <fcntl.h>
#include <signal.h>
#include <unistd.h>
#include <cstring>

#include <spdlog/spdlog.h>
#include <oigrade/paths.h>

#include "utils.h"
#include "sandbox.h"

namespace {

constexpr long kCompileTimeLimit = 60; // seconds
constexpr size_t kMaxMsgLen = 32768;

std::vector<std::string> GccCompileCommand(const std::string& input, const std::string& output) {
  return {"/usr/bin/env", "g++", "-O2", "-std=c++17", "-o", output, input};
}

} // namespace

std::optional<Solution> DetectSolution(const fs::path& workdir, const std::string& problem_id) {
  for (Language lang : {Language::CPP, Language::PYTHON}) {
    fs::path path = SolutionSource(workdir, problem_id, lang);
    std::error_code ec;
    if (fs::exists(path, ec)) return Solution{path, lang};
  }
  return std::nullopt;
}

CompileResult CompileSolution(const Solution& solution, const fs::path& output) {
  if (solution.lang != Language::CPP) return {true, ""};
  spdlog::debug("Compiling {} -> {}", solution.source.c_str(), output.c_str());

  TempDirectory tmp("oigrade-compile");
  if (!tmp.Valid()) return {false, "Failed to prepare compilation"};
  fs::path message_path = tmp.Path() / "message";

  // the compiler is trusted; it runs as ourselves so it can write into workdir
  SandboxOptions opt;
  opt.command = GccCompileCommand(solution.source, output);
  if (char* path = getenv("PATH")) opt.envs.push_back(std::string("PATH=") + path);
  opt.workdir = solution.source.parent_path();
  opt.uid = getuid();
  opt.gid = getgid();
  opt.wall_time = kCompileTimeLimit * 1'000'000;
  opt.fsize = kMaxOutput;
  opt.fd_input = open("/dev/null", O_RDONLY | O_CLOEXEC);
  opt.fd_output = open(message_path.c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC, 0600);
  opt.fd_error = opt.fd_output;

  struct cjail_result res = {};
  if (opt.fd_input < 0 || opt.fd_output < 0) {
    spdlog::warn("Failed opening compile files: {}", strerror(errno));
    res.timekill = -1;
  } else {
    res = SandboxExec(opt);
  }
  if (opt.fd_input >= 0) close(opt.fd_input);
  if (opt.fd_output >= 0) close(opt.fd_output);

  if (res.timekill == -1) return {false, "Failed to start compiler"};
  if (res.timekill) {
    spdlog::info("Compilation timed out: {}", solution.source.c_str());
    return {false, "Compilation timed out (>" + std::to_string(kCompileTimeLimit) + "s)"};
  }
  if (res.info.si_code == CLD_EXITED && res.info.si_status == 0) {
    std::error_code ec;
    if (fs::is_regular_file(output, ec)) return {true, ""};
  }
  spdlog::info("Compilation failed: code={} status={}", res.info.si_code, res.info.si_status);
  bool truncated = false;
  std::string message = ReadFile(message_path, kMaxMsgLen, truncated).value_or("");
  if (truncated) {
    message += "\n[Error message truncated after " + std::to_string(kMaxMsgLen) + " bytes]";
  }
  if (message.empty()) message = "Compilation failed";
  return {false, std::move(message)};
}
