#ifndef INCLUDE_OIGRADE_PATHS_H_
#define INCLUDE_OIGRADE_PATHS_H_

#include <string>
#include <filesystem>

#include "grading.h"

namespace fs = std::filesystem;

// verdict service side
extern fs::path kGradingDir;
extern std::string kGradingHost;
extern int kGradingPort;

fs::path GradingInputsDir(const fs::path& grading_dir);
fs::path GradingOutputsDir(const fs::path& grading_dir);
fs::path GradingInputDir(const fs::path& grading_dir, const std::string& problem_id);
fs::path GradingInputFile(const fs::path& grading_dir, const std::string& problem_id,
                          const std::string& test_id);
fs::path GradingOutputFile(const fs::path& grading_dir, const std::string& problem_id,
                           const std::string& test_id);

// runner side
fs::path SolutionSource(const fs::path& workdir, const std::string& problem_id, Language lang);
fs::path SolutionBinary(const fs::path& workdir, const std::string& problem_id);
fs::path ProblemInputDir(const fs::path& problems_dir, const std::string& problem_id);
fs::path ProblemInputFile(const fs::path& problems_dir, const std::string& problem_id,
                          const std::string& test_id);

#endif  // INCLUDE_OIGRADE_PATHS_H_
