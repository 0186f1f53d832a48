#ifndef OIGRADE_SOLUTION_H_
#define OIGRADE_SOLUTION_H_

#include <string>
#include <optional>
#include <filesystem>

#include <oigrade/grading.h>

struct Solution {
  std::filesystem::path source;
  Language lang;
};

struct CompileResult {
  bool success;
  std::string message; // compiler diagnostics on failure
};

// C++ is preferred over Python when both exist
std::optional<Solution> DetectSolution(const std::filesystem::path& workdir, const std::string& problem_id);

// Compiles solution.source into output with a fixed 60s wall limit
CompileResult CompileSolution(const Solution& solution, const std::filesystem::path& output);

#endif  // OIGRADE_SOLUTION_H_
