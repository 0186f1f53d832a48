#include <oigrade/grading.h>

#include <spdlog/spdlog.h>
#include <oigrade/paths.h>
#include <oigrade/utils.h>
#include <oigrade/normalize.h>

#include "utils.h"
#include "executor.h"
#include "solution.h"
#include "verdict_client.h"

std::string kGradingServerUrl = "http://127.0.0.1:5000";

namespace {

std::vector<std::string> GetTestCases(const GradingTask& task, const VerdictClient& client) {
  if (auto tests = client.ListTests(task.problem_id); tests && !tests->empty()) {
    return std::move(*tests);
  }
  // enumeration only; verdicts always come from the service
  fs::path input_dir = ProblemInputDir(task.problems_dir, task.problem_id);
  if (auto tests = ListTestIds(input_dir)) return std::move(*tests);
  spdlog::warn("Input directory not found: {}", input_dir.c_str());
  return {};
}

TestResult RunTestCase(const GradingTask& task, const VerdictClient& client, const std::string& test_id,
                       const fs::path& executable, Language lang) {
  TestResult ret;
  ret.test_id = test_id;
  ret.passed = false;

  if (!IsSafeId(test_id)) {
    spdlog::warn("Skipping unsafe test id");
    ret.status = Status::RE;
    ret.message = ret.stderr_text = "Input file not found";
    return ret;
  }
  fs::path input_file = ProblemInputFile(task.problems_dir, task.problem_id, test_id);
  std::optional<std::string> input = ReadFile(input_file);
  if (!input) {
    ret.status = Status::RE;
    ret.stderr_text = "Input file not found: " + input_file.string();
    ret.message = "Input file not found";
    return ret;
  }

  ExecutionResult exec = ExecuteCandidate({ExecuteCommand(lang, executable), task.workdir,
                                           std::move(*input), task.time_limit});
  ret.elapsed_ms = exec.elapsed_ms;
  ret.stdout_text = std::move(exec.stdout_text);
  ret.stderr_text = std::move(exec.stderr_text);
  switch (exec.outcome) {
    case ExecutionOutcome::TLE:
      ret.status = Status::TLE;
      ret.message = std::move(exec.message);
      return ret;
    case ExecutionOutcome::RE:
      ret.status = Status::RE;
      ret.message = std::move(exec.message);
      return ret;
    case ExecutionOutcome::OK:
      break;
  }

  VerdictClient::Verdict verdict = client.Grade(task.problem_id, test_id, NormalizeOutput(ret.stdout_text));
  ret.passed = verdict.passed;
  ret.status = verdict.passed ? Status::AC : Status::WA;
  ret.message = std::move(verdict.message);
  return ret;
}

} // namespace

GradingResult RunGrading(const GradingTask& request) {
  GradingResult result;
  // the sandbox changes into workdir, so every path handed to it must be absolute
  GradingTask task = request;
  std::error_code ec;
  if (fs::path dir = fs::absolute(task.workdir, ec); !ec) task.workdir = dir;
  if (fs::path dir = fs::absolute(task.problems_dir, ec); !ec) task.problems_dir = dir;
  spdlog::info("Starting OI grading for problem: {}", task.problem_id);

  if (!IsSafeId(task.problem_id)) {
    result.compile_error = "Invalid problem id";
    return result;
  }
  std::optional<Solution> solution = DetectSolution(task.workdir, task.problem_id);
  if (!solution) {
    spdlog::error("No solution found for {}", task.problem_id);
    result.compile_error = "No solution file found. Expected " + task.problem_id + ".cpp or " +
        task.problem_id + ".py in " + task.workdir.string();
    return result;
  }
  result.language = LanguageName(solution->lang);
  spdlog::info("Found {} solution: {}", result.language, solution->source.c_str());

  fs::path executable = solution->source;
  if (solution->lang == Language::CPP) {
    executable = SolutionBinary(task.workdir, task.problem_id);
    spdlog::info("Compiling C++ solution...");
    CompileResult compiled = CompileSolution(*solution, executable);
    if (!compiled.success) {
      spdlog::error("Compilation failed: {}", compiled.message);
      result.compile_error = std::move(compiled.message);
      return result;
    }
    spdlog::info("Compilation successful");
  }

  VerdictClient client(task.server_url);
  std::vector<std::string> test_cases = GetTestCases(task, client);
  if (test_cases.empty()) {
    spdlog::warn("No test cases found");
    result.compile_error = "No test cases found for problem " + task.problem_id;
    return result;
  }
  spdlog::info("Found {} test cases", test_cases.size());

  // strictly sequential: one candidate process at a time
  for (auto& test_id : test_cases) {
    spdlog::info("Running test case {}...", test_id);
    TestResult res = RunTestCase(task, client, test_id, executable, solution->lang);
    if (res.passed) {
      result.passed_count++;
      spdlog::info("  Test {}: {} ({:.1f}ms)", test_id, StatusToAbr(res.status), res.elapsed_ms);
    } else {
      spdlog::info("  Test {}: {} ({:.1f}ms) - {}", test_id, StatusToAbr(res.status), res.elapsed_ms,
                   res.message);
    }
    result.test_results.push_back(std::move(res));
  }
  result.total_count = test_cases.size();
  result.score = result.total_count > 0 ? double(result.passed_count) / result.total_count : 0.0;
  spdlog::info("Grading complete: {}/{} tests passed (score: {:.2f})",
               result.passed_count, result.total_count, result.score);
  return result;
}

nlohmann::json GradingResultToJson(const GradingResult& result) {
  nlohmann::json tests = nlohmann::json::array();
  for (auto& i : result.test_results) {
    tests.push_back({
      {"test_id", i.test_id},
      {"passed", i.passed},
      {"status", StatusToAbr(i.status)},
      {"time_ms", i.elapsed_ms},
      {"stdout", i.stdout_text},
      {"stderr", i.stderr_text},
      {"message", i.message},
    });
  }
  nlohmann::json ret = {
    {"score", result.score},
    {"passed", result.passed_count},
    {"total", result.total_count},
    {"language", result.language},
    {"compilation_error", nullptr},
    {"test_results", std::move(tests)},
  };
  if (result.compile_error) ret["compilation_error"] = *result.compile_error;
  return ret;
}
