#include <oigrade/paths.h>

#include <oigrade/utils.h>

fs::path kGradingDir = "/grading";
std::string kGradingHost = "127.0.0.1";
int kGradingPort = 5000;

namespace {

inline std::string TestFileName(const std::string& test_id) {
  return test_id + ".txt";
}

} // namespace

fs::path GradingInputsDir(const fs::path& grading_dir) {
  return grading_dir / "inputs";
}
fs::path GradingOutputsDir(const fs::path& grading_dir) {
  return grading_dir / "outputs";
}
fs::path GradingInputDir(const fs::path& grading_dir, const std::string& problem_id) {
  return GradingInputsDir(grading_dir) / problem_id;
}
fs::path GradingInputFile(const fs::path& grading_dir, const std::string& problem_id,
                          const std::string& test_id) {
  return GradingInputDir(grading_dir, problem_id) / TestFileName(test_id);
}
fs::path GradingOutputFile(const fs::path& grading_dir, const std::string& problem_id,
                           const std::string& test_id) {
  return GradingOutputsDir(grading_dir) / problem_id / TestFileName(test_id);
}

fs::path SolutionSource(const fs::path& workdir, const std::string& problem_id, Language lang) {
  return workdir / (problem_id + LanguageExtension(lang));
}
fs::path SolutionBinary(const fs::path& workdir, const std::string& problem_id) {
  return workdir / problem_id;
}
fs::path ProblemInputDir(const fs::path& problems_dir, const std::string& problem_id) {
  return problems_dir / problem_id / "input";
}
fs::path ProblemInputFile(const fs::path& problems_dir, const std::string& problem_id,
                          const std::string& test_id) {
  return ProblemInputDir(problems_dir, problem_id) / TestFileName(test_id);
}
