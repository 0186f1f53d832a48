#include "executor.h"

#include <fcntl.h>
#include <signal.h>
#include <unistd.h>
#include <cstring>

#include <fmt/core.h>
#include <spdlog/spdlog.h>

#include "utils.h"
#include "sandbox.h"

long kMemoryLimit = 512 * 1024; // 512M
long kMaxOutput = 64 * 1024; // 64M
int kSandboxUid = 65534;

namespace {

inline double ToMs(const struct timeval& v) {
  return v.tv_sec * 1000.0 + v.tv_usec / 1000.0;
}

std::string ReadCaptured(const fs::path& path) {
  auto content = ReadFile(path);
  if (!content) {
    spdlog::warn("Failed reading captured output {}", path.c_str());
    return "";
  }
  return std::move(*content);
}

} // namespace

std::vector<std::string> ExecuteCommand(Language lang, const fs::path& program) {
  switch (lang) {
    case Language::CPP: return {program};
    case Language::PYTHON: return {"/usr/bin/env", "python3", program};
  }
  __builtin_unreachable();
}

ExecutionResult ExecuteCandidate(const ExecuteRequest& req) {
  ExecutionResult ret;
  TempDirectory tmp("oigrade-run");
  if (!tmp.Valid() || !WriteFile(tmp.InputPath(), req.input)) {
    ret.message = ret.stderr_text = "Failed to prepare program input";
    return ret;
  }

  SandboxOptions opt;
  opt.command = req.command;
  if (char* path = getenv("PATH")) opt.envs.push_back(std::string("PATH=") + path);
  opt.workdir = req.workdir;
  opt.uid = opt.gid = kSandboxUid;
  opt.wall_time = long(req.time_limit * 1'000'000);
  opt.vss = kMemoryLimit;
  opt.unlimited_stack = true;
  opt.fsize = kMaxOutput;
  opt.fd_input = open(tmp.InputPath().c_str(), O_RDONLY | O_CLOEXEC);
  opt.fd_output = open(tmp.OutputPath().c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC, 0600);
  opt.fd_error = open(tmp.ErrorPath().c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC, 0600);

  struct cjail_result res = {};
  if (opt.fd_input < 0 || opt.fd_output < 0 || opt.fd_error < 0) {
    spdlog::warn("Failed opening sandbox files: {}", strerror(errno));
    res.timekill = -1;
  } else {
    res = SandboxExec(opt);
  }
  for (int fd : {opt.fd_input, opt.fd_output, opt.fd_error}) {
    if (fd >= 0) close(fd);
  }

  ret.elapsed_ms = ToMs(res.time);
  if (res.timekill == -1) {
    ret.outcome = ExecutionOutcome::RE;
    ret.message = ret.stderr_text = "Failed to start program";
    ret.elapsed_ms = 0;
  } else if (res.timekill) {
    ret.outcome = ExecutionOutcome::TLE;
    ret.elapsed_ms = req.time_limit * 1000;
    ret.stderr_text = fmt::format("Time limit exceeded ({}s)", req.time_limit);
    ret.message = "Time limit exceeded";
  } else {
    ret.stdout_text = ReadCaptured(tmp.OutputPath());
    ret.stderr_text = ReadCaptured(tmp.ErrorPath());
    if (res.info.si_code == CLD_KILLED || res.info.si_code == CLD_DUMPED) {
      ret.outcome = ExecutionOutcome::RE;
      ret.exit_code = 128 + res.info.si_status;
      ret.message = fmt::format("Runtime error (killed by signal {})", res.info.si_status);
    } else if (res.info.si_status != 0) {
      ret.outcome = ExecutionOutcome::RE;
      ret.exit_code = res.info.si_status;
      ret.message = fmt::format("Runtime error (exit code {})", res.info.si_status);
    } else {
      ret.outcome = ExecutionOutcome::OK;
      ret.exit_code = 0;
    }
  }
  spdlog::debug("Execute finished: code={} status={} timekill={} time={}ms",
                res.info.si_code, res.info.si_status, res.timekill, ret.elapsed_ms);
  return ret;
}
