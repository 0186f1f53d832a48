#ifndef OIGRADE_GRADING_SERVICE_H_
#define OIGRADE_GRADING_SERVICE_H_

#include <string>
#include <filesystem>

#include <nlohmann/json.hpp>
#include <oigrade/checker.h>

namespace httplib {
class Server;
} // namespace httplib

struct ServiceResponse {
  int status;
  nlohmann::json body;
};

// Holds the protected test data; the only component that opens expected outputs.
// Stateless apart from read-only references, so handlers may run concurrently.
class GradingService {
  std::filesystem::path grading_dir_;
  const CheckerRegistry& registry_;
 public:
  GradingService(const std::filesystem::path& grading_dir, const CheckerRegistry& registry) :
      grading_dir_(grading_dir), registry_(registry) {}

  ServiceResponse Health() const;
  ServiceResponse ListTests(const std::string& problem_id) const;
  ServiceResponse Grade(const std::string& request_body) const;

  // /health, /list_tests/{pid}, /grade
  void Mount(httplib::Server&) const;
};

#endif  // OIGRADE_GRADING_SERVICE_H_
