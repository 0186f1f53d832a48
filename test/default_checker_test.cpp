#include <gmock/gmock.h>
#include <gtest/gtest.h>
#include <oigrade/checker.h>

using testing::HasSubstr;

namespace {

struct CompareParam {
  std::string name;
  std::string expected, actual;
  bool passed;
};

std::string ParamName(const ::testing::TestParamInfo<CompareParam>& info) {
  return info.param.name;
}

CheckResult Compare(const std::string& expected, const std::string& actual) {
  DefaultChecker checker;
  std::string problem_id = "sum", input = "";
  return checker.Check({problem_id, input, expected, actual});
}

} // namespace

class DefaultCheckerCompare : public testing::TestWithParam<CompareParam> {};
TEST_P(DefaultCheckerCompare, Compare) {
  auto& param = GetParam();
  CheckResult res = Compare(param.expected, param.actual);
  EXPECT_EQ(res.passed, param.passed) << res.message;
}
INSTANTIATE_TEST_SUITE_P(Table, DefaultCheckerCompare,
    testing::Values(
      (CompareParam){"exact", "123\n234", "123\n234", true},
      (CompareParam){"surrounding_whitespace", "123\n234", "  123 \n234\n\n", true},
      (CompareParam){"relative_tolerance", "1.0\n2.0", "1.0000001\n2.0", true},
      (CompareParam){"large_relative", "1000000", "1000000.5", true},
      (CompareParam){"absolute_tolerance", "0", "0.0000000001", true},
      (CompareParam){"outside_tolerance", "1.0\n2.0", "1.1\n2.0", false},
      (CompareParam){"absolute_too_far", "0", "0.00001", false},
      (CompareParam){"token_count_differs", "1 2", "1 2 3", false},
      (CompareParam){"text_equal", "YES", "YES", true},
      (CompareParam){"text_differs", "YES", "NO", false},
      (CompareParam){"inner_spacing_is_text", "a  b", "a b", false},
      (CompareParam){"mixed_tokens_are_text", "a 1.0", "a 1.0000001", false},
      (CompareParam){"hex_is_text", "16", "0x10", false},
      (CompareParam){"line_count", "1\n2", "1", false},
      (CompareParam){"empty_both", "", "", true}
    ),
    ParamName);

TEST(DefaultChecker, ToleranceCitesLine) {
  CheckResult res = Compare("1.0\n2.0", "1.1\n2.0");
  EXPECT_FALSE(res.passed);
  EXPECT_THAT(res.message, HasSubstr("Line 1"));
}

TEST(DefaultChecker, LineCountNamesBoth) {
  CheckResult res = Compare("1\n2\n3", "1\n2");
  EXPECT_FALSE(res.passed);
  EXPECT_EQ(res.message, "Line count mismatch: expected 3, got 2");
}

TEST(DefaultChecker, TextMismatchHidesExpected) {
  CheckResult res = Compare("secret answer", "wrong");
  EXPECT_FALSE(res.passed);
  EXPECT_THAT(res.message, testing::Not(HasSubstr("secret")));
}
