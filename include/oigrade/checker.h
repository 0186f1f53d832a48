#ifndef INCLUDE_OIGRADE_CHECKER_H_
#define INCLUDE_OIGRADE_CHECKER_H_

#include <memory>
#include <string>
#include <stdexcept>
#include <unordered_map>

struct CheckerInput {
  const std::string& problem_id;
  const std::string& input;
  const std::string& expected; // already normalized
  const std::string& actual;
};

struct CheckResult {
  bool passed;
  std::string message;
};

// Thrown when stored test data cannot be parsed. Its message is for the server log only.
class CheckerError : public std::runtime_error {
 public:
  using std::runtime_error::runtime_error;
};

class Checker {
 public:
  virtual ~Checker() = default;
  // must not quote input or expected content in the message
  virtual CheckResult Check(const CheckerInput&) const = 0;
};

// Line-by-line comparison with floating-point tolerance
class DefaultChecker : public Checker {
 public:
  static constexpr double kRelTolerance = 1e-6;
  static constexpr double kAbsTolerance = 1e-9;
  CheckResult Check(const CheckerInput&) const override;
};

class CheckerRegistry {
  std::unordered_map<std::string, std::unique_ptr<Checker>> checkers_;
  DefaultChecker default_checker_;
 public:
  void Register(const std::string& problem_id, std::unique_ptr<Checker>&& checker);
  // exact match on problem_id, otherwise the default checker
  const Checker& Get(const std::string& problem_id) const;
  bool Contains(const std::string& problem_id) const;
  size_t Size() const { return checkers_.size(); }
};

// Call once at startup
void RegisterBuiltinCheckers(CheckerRegistry&);

#endif  // INCLUDE_OIGRADE_CHECKER_H_
