#include "grading_service.h"

#include <httplib.h>
#include <spdlog/spdlog.h>
#include <oigrade/paths.h>
#include <oigrade/utils.h>
#include <oigrade/normalize.h>

#include "utils.h"

namespace {

ServiceResponse VerdictResponse(int status, bool passed, const std::string& message) {
  return {status, {
    {"verdict", passed ? "AC" : "WA"},
    {"passed", passed},
    {"message", message},
  }};
}

ServiceResponse ErrorResponse(int status, const std::string& message) {
  return {status, {{"error", message}}};
}

void Respond(httplib::Response& res, const ServiceResponse& resp) {
  res.status = resp.status;
  res.set_content(resp.body.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace),
                  "application/json");
}

} // namespace

ServiceResponse GradingService::Health() const {
  return {200, {{"status", "ok"}, {"service", "grading-server"}}};
}

ServiceResponse GradingService::ListTests(const std::string& problem_id) const {
  if (!IsSafeId(problem_id)) return ErrorResponse(400, "Invalid problem id");
  auto tests = ListTestIds(GradingInputDir(grading_dir_, problem_id));
  if (!tests) return ErrorResponse(404, "Problem " + problem_id + " not found");
  size_t count = tests->size();
  return {200, {
    {"problem_id", problem_id},
    {"tests", std::move(*tests)},
    {"count", count},
  }};
}

ServiceResponse GradingService::Grade(const std::string& request_body) const {
  std::string problem_id, test_id, actual;
  try {
    nlohmann::json data = nlohmann::json::parse(request_body);
    if (!data.is_object()) return VerdictResponse(400, false, "Invalid request");
    problem_id = data.value("problem_id", "");
    test_id = data.value("test_id", "");
    actual = data.value("actual_output", "");
  } catch (nlohmann::json::exception&) {
    return VerdictResponse(400, false, "Invalid request");
  }
  if (problem_id.empty() || test_id.empty()) {
    return VerdictResponse(400, false, "Missing problem_id or test_id");
  }
  if (!IsSafeId(problem_id) || !IsSafeId(test_id)) {
    return VerdictResponse(400, false, "Invalid problem_id or test_id");
  }

  fs::path input_file = GradingInputFile(grading_dir_, problem_id, test_id);
  fs::path output_file = GradingOutputFile(grading_dir_, problem_id, test_id);
  std::error_code ec;
  if (!fs::is_regular_file(input_file, ec) || !fs::is_regular_file(output_file, ec)) {
    spdlog::info("Test data not found for {}/{}", problem_id, test_id);
    return VerdictResponse(404, false, "Test case not found");
  }
  auto input = ReadFile(input_file);
  auto expected = ReadFile(output_file);
  if (!input || !expected) {
    spdlog::error("Failed reading test data for {}/{}", problem_id, test_id);
    return VerdictResponse(500, false, "Failed to read test data");
  }

  const Checker& checker = registry_.Get(problem_id);
  CheckResult result;
  try {
    result = checker.Check({problem_id, *input, NormalizeOutput(*expected), actual});
  } catch (std::exception& err) {
    spdlog::error("Checker for {}/{} failed: {}", problem_id, test_id, err.what());
    result = {false, "Checker error"};
  }
  spdlog::info("Graded {}/{}: {}", problem_id, test_id, result.passed ? "AC" : "WA");
  return VerdictResponse(200, result.passed, result.message);
}

void GradingService::Mount(httplib::Server& svr) const {
  svr.Get("/health", [this](const httplib::Request&, httplib::Response& res) {
    Respond(res, Health());
  });
  svr.Get(R"(/list_tests/([^/]+))", [this](const httplib::Request& req, httplib::Response& res) {
    Respond(res, ListTests(req.matches[1]));
  });
  svr.Post("/grade", [this](const httplib::Request& req, httplib::Response& res) {
    Respond(res, Grade(req.body));
  });
  svr.set_exception_handler([](const httplib::Request& req, httplib::Response& res,
                               std::exception_ptr ep) {
    try {
      std::rethrow_exception(ep);
    } catch (std::exception& err) {
      spdlog::error("Unhandled exception on {}: {}", req.path, err.what());
    } catch (...) {
      spdlog::error("Unhandled non-standard exception on {}", req.path);
    }
    Respond(res, VerdictResponse(500, false, "Internal server error"));
  });
}
