#include <gmock/gmock.h>
#include <unistd.h>
#include <gtest/gtest.h>
#include <oigrade/paths.h>
#include <oigrade/grading.h>

#include "example_problem.h"
#include "oigrade/executor.h"
#include "utils.h"

using testing::HasSubstr;
using testing::StartsWith;

namespace {

constexpr fs::perms kPerm755 = fs::perms::owner_all |
    fs::perms::group_read | fs::perms::group_exec |
    fs::perms::others_read | fs::perms::others_exec;

const std::vector<std::pair<std::string, std::string>> kSumTests = {
  {"1 2\n", "3\n"}, {"2 2\n", "4\n"}, {"10 -3\n", "7\n"},
};

const char kSumPython[] = R"(a, b = map(int, input().split())
print(a + b)
)";

} // namespace

// Runs candidates in the sandbox; requires root, python3 and g++
class RunnerTest : public ExampleProblem {
 protected:
  void SetUp(const std::string& problem_id_,
             const std::vector<std::pair<std::string, std::string>>& tds) {
    ExampleProblem::SetUp(problem_id_, tds);
    StartServer();
    workdir = MakeTempDir("workdir_test", kPerm755);
    task.problem_id = problem_id;
    task.time_limit = 1;
    task.workdir = workdir;
    task.problems_dir = problems_dir;
    task.server_url = ServerUrl();
  }
  void TearDown() override {
    fs::remove_all(workdir);
    ExampleProblem::TearDown();
  }
  void WriteSolution(Language lang, const std::string& code) {
    WriteText(SolutionSource(workdir, problem_id, lang), code);
  }

  fs::path workdir;
  GradingTask task;
};

TEST_F(RunnerTest, PythonAccepted) {
  SetUp("sum", kSumTests);
  WriteSolution(Language::PYTHON, kSumPython);
  GradingResult res = RunGrading(task);
  EXPECT_FALSE(res.compile_error);
  EXPECT_EQ(res.language, "python");
  EXPECT_EQ(res.total_count, 3);
  EXPECT_EQ(res.passed_count, 3);
  EXPECT_DOUBLE_EQ(res.score, 1.0);
  for (auto& i : res.test_results) {
    EXPECT_EQ(i.status, Status::AC) << i.test_id << ": " << i.message;
    EXPECT_TRUE(i.passed);
  }
}

TEST_F(RunnerTest, CppPreferredAndWrongAnswer) {
  SetUp("sum", kSumTests);
  WriteSolution(Language::PYTHON, "raise SystemExit(1)\n");
  WriteSolution(Language::CPP, R"(#include <cstdio>
int main(){ long a, b; scanf("%ld%ld", &a, &b); printf("%ld\n", a == 2 ? 0 : a + b); })");
  GradingResult res = RunGrading(task);
  EXPECT_EQ(res.language, "cpp");
  ASSERT_EQ(res.test_results.size(), 3);
  EXPECT_EQ(res.test_results[0].status, Status::AC);
  EXPECT_EQ(res.test_results[1].status, Status::WA);
  EXPECT_EQ(res.test_results[1].stdout_text, "0\n");
  EXPECT_EQ(res.test_results[2].status, Status::AC);
  EXPECT_EQ(res.passed_count, 2);
  EXPECT_NEAR(res.score, 2.0 / 3, 1e-9);
}

TEST_F(RunnerTest, TimeLimitDoesNotBlockRemainingTests) {
  SetUp("sum", kSumTests);
  WriteSolution(Language::PYTHON, R"(a, b = map(int, input().split())
while a == 2:
    pass
print(a + b)
)");
  GradingResult res = RunGrading(task);
  ASSERT_EQ(res.test_results.size(), 3);
  EXPECT_EQ(res.test_results[0].status, Status::AC);
  EXPECT_EQ(res.test_results[1].status, Status::TLE);
  EXPECT_FALSE(res.test_results[1].passed);
  EXPECT_THAT(res.test_results[1].stderr_text, HasSubstr("Time limit exceeded"));
  EXPECT_EQ(res.test_results[2].status, Status::AC);
  EXPECT_NEAR(res.score, 2.0 / 3, 1e-9);
}

TEST_F(RunnerTest, RuntimeError) {
  SetUp("sum", kSumTests);
  WriteSolution(Language::CPP, R"(#include <cstdlib>
int main(){ return 3; })");
  GradingResult res = RunGrading(task);
  ASSERT_EQ(res.test_results.size(), 3);
  for (auto& i : res.test_results) {
    EXPECT_EQ(i.status, Status::RE);
    EXPECT_THAT(i.message, HasSubstr("exit code 3"));
  }
  EXPECT_EQ(res.score, 0);
}

TEST_F(RunnerTest, Signal) {
  SetUp("sum", {kSumTests[0]});
  WriteSolution(Language::CPP, R"(char* p; int main(){ *p = 123; })");
  GradingResult res = RunGrading(task);
  ASSERT_EQ(res.test_results.size(), 1);
  EXPECT_EQ(res.test_results[0].status, Status::RE);
  EXPECT_THAT(res.test_results[0].message, HasSubstr("signal"));
}

TEST_F(RunnerTest, DeepRecursionHasUnlimitedStack) {
  SetUp("sum", {kSumTests[0]});
  WriteSolution(Language::CPP, R"(#include <cstdio>
volatile int sink;
int f(int n){ volatile char pad[256]; pad[0] = n; return n ? f(n - 1) + pad[0] - n + 1 : 0; }
int main(){ long a, b; scanf("%ld%ld", &a, &b); sink = f(200000); printf("%ld\n", a + b); })");
  GradingResult res = RunGrading(task);
  ASSERT_EQ(res.test_results.size(), 1);
  EXPECT_EQ(res.test_results[0].status, Status::AC) << res.test_results[0].message;
}

TEST_F(RunnerTest, CompileError) {
  SetUp("sum", kSumTests);
  WriteSolution(Language::CPP, "int main( {");
  GradingResult res = RunGrading(task);
  ASSERT_TRUE(res.compile_error);
  EXPECT_FALSE(res.compile_error->empty());
  EXPECT_EQ(res.language, "cpp");
  EXPECT_EQ(res.total_count, 0);
  EXPECT_TRUE(res.test_results.empty());
  EXPECT_EQ(res.score, 0);
}

TEST_F(RunnerTest, NoSolution) {
  SetUp("sum", kSumTests);
  GradingResult res = RunGrading(task);
  ASSERT_TRUE(res.compile_error);
  EXPECT_THAT(*res.compile_error, StartsWith("No solution file found. Expected sum.cpp or sum.py"));
  EXPECT_EQ(res.language, "unknown");
  EXPECT_EQ(res.total_count, 0);
}

TEST_F(RunnerTest, NoTestCases) {
  SetUp("sum", {});
  WriteSolution(Language::PYTHON, kSumPython);
  GradingResult res = RunGrading(task);
  ASSERT_TRUE(res.compile_error);
  EXPECT_EQ(*res.compile_error, "No test cases found for problem sum");
  EXPECT_EQ(res.total_count, 0);
}

TEST_F(RunnerTest, UnreachableServiceFailsClosed) {
  SetUp("sum", kSumTests);
  WriteSolution(Language::PYTHON, kSumPython);
  task.server_url = "http://127.0.0.1:1";
  GradingResult res = RunGrading(task);
  // tests are still enumerated from the runner's own input directory
  ASSERT_EQ(res.test_results.size(), 3);
  for (auto& i : res.test_results) {
    EXPECT_FALSE(i.passed);
    EXPECT_NE(i.status, Status::AC);
  }
  EXPECT_EQ(res.passed_count, 0);
  EXPECT_EQ(res.score, 0);
}

TEST_F(RunnerTest, CertificateProblem) {
  SetUp("pastele", {{"4 2\n0 0 0\n10 10 10\n100 100 100\n200 200 200\n", "10\n"}});
  WriteSolution(Language::PYTHON, "print(10)\nprint('10 10 10')\nprint('0 0 0')\n");
  GradingResult res = RunGrading(task);
  ASSERT_EQ(res.test_results.size(), 1);
  EXPECT_EQ(res.test_results[0].status, Status::AC) << res.test_results[0].message;
}

TEST_F(RunnerTest, ResultJson) {
  SetUp("sum", {kSumTests[0]});
  WriteSolution(Language::PYTHON, kSumPython);
  nlohmann::json json = GradingResultToJson(RunGrading(task));
  EXPECT_EQ(json["score"], 1.0);
  EXPECT_EQ(json["passed"], 1);
  EXPECT_EQ(json["total"], 1);
  EXPECT_EQ(json["language"], "python");
  EXPECT_TRUE(json["compilation_error"].is_null());
  ASSERT_EQ(json["test_results"].size(), 1);
  auto& test = json["test_results"][0];
  EXPECT_EQ(test["test_id"], "1");
  EXPECT_EQ(test["status"], "AC");
  EXPECT_EQ(test["stdout"], "3\n");
  EXPECT_TRUE(test["time_ms"].is_number());
}

TEST_F(RunnerTest, MemoryLimit) {
  SetUp("sum", {kSumTests[0]});
  WriteSolution(Language::CPP, R"(#include <cstdio>
#include <cstdlib>
#include <cstring>
int main(){
  size_t len = 1UL << 30;
  char* p = (char*)malloc(len);
  if (!p) return 1;
  memset(p, 1, len);
  printf("%d\n", p[len - 1] + 2);
})");
  GradingResult res = RunGrading(task);
  ASSERT_EQ(res.test_results.size(), 1);
  EXPECT_EQ(res.test_results[0].status, Status::RE);
  EXPECT_FALSE(res.test_results[0].passed);
}

TEST_F(RunnerTest, RelativeWorkdir) {
  SetUp("sum", kSumTests);
  WriteSolution(Language::CPP, R"(#include <cstdio>
int main(){ long a, b; scanf("%ld%ld", &a, &b); printf("%ld\n", a + b); })");
  fs::path orig_cwd = fs::current_path();
  fs::current_path(workdir.parent_path());
  task.workdir = workdir.filename();
  task.problems_dir = problems_dir.filename();
  GradingResult res = RunGrading(task);
  fs::current_path(orig_cwd);
  EXPECT_FALSE(res.compile_error) << *res.compile_error;
  EXPECT_EQ(res.passed_count, 3);
}

TEST_F(RunnerTest, UnsafeTestIdIsNotAPath) {
  SetUp("sum", {kSumTests[0]});
  // "...txt" is listed with the id ".."
  WriteText(GradingInputDir(grading_dir, problem_id) / "...txt", "1 2\n");
  WriteSolution(Language::PYTHON, kSumPython);
  GradingResult res = RunGrading(task);
  ASSERT_EQ(res.test_results.size(), 2);
  EXPECT_EQ(res.test_results[0].test_id, "1");
  EXPECT_EQ(res.test_results[0].status, Status::AC);
  const TestResult& unsafe = res.test_results[1];
  EXPECT_EQ(unsafe.test_id, "..");
  EXPECT_EQ(unsafe.status, Status::RE);
  EXPECT_EQ(unsafe.stderr_text, "Input file not found");
  EXPECT_THAT(unsafe.stderr_text, testing::Not(HasSubstr(problems_dir.string())));
}

class ExecutorTest : public ::testing::Test {
 protected:
  void SetUp() override { workdir = MakeTempDir("executor_test", kPerm755); }
  void TearDown() override { fs::remove_all(workdir); }

  fs::path workdir;
};

TEST_F(ExecutorTest, MissingProgram) {
  ExecutionResult res = ExecuteCandidate({{(workdir / "missing").string()}, workdir, "", 1});
  EXPECT_EQ(res.outcome, ExecutionOutcome::RE);
  EXPECT_FALSE(res.message.empty());
}

TEST_F(ExecutorTest, NotExecutable) {
  fs::path program = workdir / "program";
  WriteText(program, "not a binary\n");
  fs::permissions(program, fs::perms::owner_read | fs::perms::owner_write);
  ExecutionResult res = ExecuteCandidate({{program.string()}, workdir, "", 1});
  EXPECT_EQ(res.outcome, ExecutionOutcome::RE);
}

TEST_F(ExecutorTest, MissingScript) {
  ExecutionResult res = ExecuteCandidate({ExecuteCommand(Language::PYTHON, workdir / "missing.py"),
                                          workdir, "", 1});
  EXPECT_EQ(res.outcome, ExecutionOutcome::RE);
}
