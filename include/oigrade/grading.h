#ifndef INCLUDE_OIGRADE_GRADING_H_
#define INCLUDE_OIGRADE_GRADING_H_

#include <string>
#include <vector>
#include <optional>
#include <filesystem>

#include <nlohmann/json.hpp>

// KiB
extern long kMemoryLimit;
extern long kMaxOutput;
extern int kSandboxUid;
extern std::string kGradingServerUrl;

#define ENUM_STATUS_ \
  X(AC, "AC", "Accepted") \
  X(WA, "WA", "Wrong Answer") \
  X(TLE, "TLE", "Time Limit Exceeded") \
  X(RE, "RE", "Runtime Error") \
  X(CE, "CE", "Compile Error")
enum class Status {
#define X(name, abr, desc) name,
  ENUM_STATUS_
#undef X
};

#define ENUM_LANGUAGE_ \
  X(CPP, "cpp", ".cpp") \
  X(PYTHON, "python", ".py")
enum class Language {
#define X(name, lang_name, ext) name,
  ENUM_LANGUAGE_
#undef X
};

struct TestResult {
  std::string test_id;
  bool passed;
  Status status;
  double elapsed_ms;
  std::string stdout_text, stderr_text;
  std::string message; // from the verdict service, or describing the local failure

  TestResult() : passed(false), status(Status::WA), elapsed_ms(0) {}
};

struct GradingResult {
  double score;
  int passed_count, total_count;
  std::string language;
  std::vector<TestResult> test_results;
  std::optional<std::string> compile_error;

  GradingResult() : score(0), passed_count(0), total_count(0), language("unknown") {}
};

struct GradingTask {
  std::string problem_id;
  double time_limit; // seconds, per test case
  std::filesystem::path workdir;
  std::filesystem::path problems_dir; // only {problem_id}/input/ is read
  std::string server_url;

  GradingTask() :
      time_limit(2),
      workdir("/workdir"),
      problems_dir("/problems"),
      server_url(kGradingServerUrl) {}
};

// Never throws for candidate or transport failures; a result is always produced
GradingResult RunGrading(const GradingTask&);

nlohmann::json GradingResultToJson(const GradingResult&);

#endif  // INCLUDE_OIGRADE_GRADING_H_
