#ifndef OIGRADE_EXECUTOR_H_
#define OIGRADE_EXECUTOR_H_

#include <string>
#include <vector>
#include <filesystem>

#include <oigrade/grading.h>

enum class ExecutionOutcome { OK, RE, TLE };

struct ExecuteRequest {
  std::vector<std::string> command;
  std::filesystem::path workdir;
  std::string input;
  double time_limit; // seconds
};

struct ExecutionResult {
  ExecutionOutcome outcome;
  int exit_code;
  double elapsed_ms;
  std::string stdout_text, stderr_text;
  std::string message;

  ExecutionResult() : outcome(ExecutionOutcome::RE), exit_code(-1), elapsed_ms(0) {}
};

// Run one candidate against one input: kMemoryLimit address space, unlimited stack,
// kMaxOutput per output file, wall clock bounded by time_limit. Never consults expected output.
ExecutionResult ExecuteCandidate(const ExecuteRequest&);

std::vector<std::string> ExecuteCommand(Language lang, const std::filesystem::path& program);

#endif  // OIGRADE_EXECUTOR_H_
