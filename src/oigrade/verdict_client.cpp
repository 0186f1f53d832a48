#include "verdict_client.h"

#include <httplib.h>
#include <fmt/core.h>
#include <spdlog/spdlog.h>
#include <nlohmann/json.hpp>

#include "http_utils.h"

namespace {

httplib::Client MakeClient(const std::string& url, int timeout) {
  httplib::Client cli(url);
  cli.set_connection_timeout(timeout, 0);
  cli.set_read_timeout(timeout, 0);
  cli.set_write_timeout(timeout, 0);
  return cli;
}

} // namespace

std::optional<std::vector<std::string>> VerdictClient::ListTests(const std::string& problem_id) const {
  using nlohmann::json;
  httplib::Client cli = MakeClient(url_, kListTimeout);
  auto res = HTTPRequest<HTTPGet>(cli, "/list_tests/" + problem_id);
  if (!res) {
    spdlog::warn("Failed to connect to grading server: {}", httplib::to_string(res.error()));
    return std::nullopt;
  }
  if (res->status != 200) {
    spdlog::warn("Failed to get test list from API: {}", res->status);
    return std::nullopt;
  }
  try {
    json data = json::parse(res->body);
    return data.value("tests", std::vector<std::string>{});
  } catch (json::exception& err) {
    spdlog::warn("JSON decoding error: {}", err.what());
    return std::nullopt;
  }
}

VerdictClient::Verdict VerdictClient::Grade(
    const std::string& problem_id, const std::string& test_id, const std::string& actual_output) const {
  using nlohmann::json;
  httplib::Client cli = MakeClient(url_, kGradeTimeout);
  std::string body = json{
      {"problem_id", problem_id},
      {"test_id", test_id},
      {"actual_output", actual_output}}.dump(-1, ' ', false, json::error_handler_t::replace);
  auto res = HTTPRequest<HTTPPost>(cli, "/grade", body, "application/json");
  if (!res) {
    std::string err = httplib::to_string(res.error());
    spdlog::error("Failed to connect to grading server: {}", err);
    return {false, "Grading server error: " + err};
  }
  try {
    json data = json::parse(res->body);
    if (res->status == 200) {
      bool passed = data.value("passed", false) && data.value("verdict", "") == "AC";
      return {passed, data.value("message", "")};
    }
    return {false, data.value("message", fmt::format("API error: {}", res->status))};
  } catch (json::exception& err) {
    spdlog::warn("JSON decoding error: {}", err.what());
    return {false, fmt::format("API error: {}", res->status)};
  }
}
