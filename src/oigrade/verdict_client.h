#ifndef OIGRADE_VERDICT_CLIENT_H_
#define OIGRADE_VERDICT_CLIENT_H_

#include <string>
#include <vector>
#include <optional>

// The runner's only view of the verdict service
class VerdictClient {
  std::string url_;
 public:
  static constexpr int kListTimeout = 10; // seconds
  static constexpr int kGradeTimeout = 30;

  struct Verdict {
    bool passed;
    std::string message;
  };

  explicit VerdictClient(const std::string& url) : url_(url) {}

  // nullopt if the service could not be reached or refused the request
  std::optional<std::vector<std::string>> ListTests(const std::string& problem_id) const;
  // Fail-closed: any transport or protocol failure is a non-passing verdict
  Verdict Grade(const std::string& problem_id, const std::string& test_id,
                const std::string& actual_output) const;
};

#endif  // OIGRADE_VERDICT_CLIENT_H_
