#include <oigrade/checker.h>

#include <cmath>
#include <algorithm>

#include <fmt/core.h>
#include <spdlog/spdlog.h>

#include "check_utils.h"

namespace {

// same semantics as math.isclose
inline bool FloatsEqual(double a, double b) {
  if (a == b) return true;
  if (std::isinf(a) || std::isinf(b)) return false;
  double diff = std::fabs(a - b);
  return diff <= std::max(DefaultChecker::kRelTolerance * std::max(std::fabs(a), std::fabs(b)),
                          DefaultChecker::kAbsTolerance);
}

} // namespace

CheckResult DefaultChecker::Check(const CheckerInput& in) const {
  auto expected_lines = SplitLines(in.expected);
  auto actual_lines = SplitLines(in.actual);
  if (expected_lines.size() != actual_lines.size()) {
    return {false, fmt::format("Line count mismatch: expected {}, got {}",
                               expected_lines.size(), actual_lines.size())};
  }
  for (size_t i = 0; i < expected_lines.size(); i++) {
    std::string_view exp_line = Strip(expected_lines[i]);
    std::string_view act_line = Strip(actual_lines[i]);
    auto exp_floats = ParseDoubles(exp_line);
    auto act_floats = ParseDoubles(act_line);
    if (exp_floats && act_floats && exp_floats->size() == act_floats->size()) {
      for (size_t j = 0; j < exp_floats->size(); j++) {
        if (!FloatsEqual((*exp_floats)[j], (*act_floats)[j])) {
          return {false, fmt::format("Line {}, token {}: got {}", i + 1, j + 1, (*act_floats)[j])};
        }
      }
    } else if (exp_line != act_line) {
      return {false, fmt::format("Line {} differs", i + 1)};
    }
  }
  return {true, "OK"};
}

void CheckerRegistry::Register(const std::string& problem_id, std::unique_ptr<Checker>&& checker) {
  spdlog::debug("Register checker for problem {}", problem_id);
  checkers_.insert_or_assign(problem_id, std::move(checker));
}

const Checker& CheckerRegistry::Get(const std::string& problem_id) const {
  if (auto it = checkers_.find(problem_id); it != checkers_.end()) return *it->second;
  return default_checker_;
}

bool CheckerRegistry::Contains(const std::string& problem_id) const {
  return checkers_.count(problem_id);
}
