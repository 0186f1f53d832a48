#include "config.h"

#include <cstdlib>
#include <fstream>
#include <charconv>

#include <tortellini.hh>
#include <spdlog/spdlog.h>
#include <oigrade/paths.h>
#include <oigrade/grading.h>

const char* const kDefaultConfig = "/etc/oigrade.conf";
int kServerThreads = 0;

bool ParseConfig(const fs::path& conf_path, bool required) {
  std::ifstream fin(conf_path);
  if (!fin) {
    if (required) return false;
    spdlog::info("Configuration file {} not found, using defaults", conf_path.c_str());
    return true;
  }
  tortellini::ini ini;
  fin >> ini;
  std::string grading_dir = ini[""]["grading_dir"] | "";
  if (grading_dir.size()) kGradingDir = grading_dir;
  kGradingHost = ini[""]["host"] | kGradingHost;
  std::string port = ini[""]["port"] | "";
  if (port.size()) {
    if (int val = ParsePort(port); val > 0) {
      kGradingPort = val;
    } else {
      spdlog::error("Invalid port {} in {}", port, conf_path.c_str());
      return false;
    }
  }
  kGradingServerUrl = ini[""]["server_url"] | kGradingServerUrl;
  kSandboxUid = ini[""]["sandbox_uid"] | kSandboxUid;
  kMaxOutput = (ini[""]["max_output_mb"] | (kMaxOutput / 1024)) * 1024;
  kServerThreads = ini[""]["server_threads"] | kServerThreads;
  return true;
}

bool IsValidPort(int port) {
  return port > 0 && port <= 65535;
}

int ParsePort(const std::string& str) {
  int port = 0;
  auto [ptr, ec] = std::from_chars(str.data(), str.data() + str.size(), port);
  if (ec != std::errc() || ptr != str.data() + str.size() || !IsValidPort(port)) return -1;
  return port;
}

bool LoadEnvironment() {
  if (const char* val = getenv("GRADING_DIR"); val && *val) kGradingDir = val;
  if (const char* val = getenv("GRADING_HOST"); val && *val) kGradingHost = val;
  if (const char* val = getenv("GRADING_SERVER_URL"); val && *val) kGradingServerUrl = val;
  if (const char* val = getenv("GRADING_PORT"); val && *val) {
    int port = ParsePort(val);
    if (port < 0) {
      spdlog::error("Invalid GRADING_PORT {}", val);
      return false;
    }
    kGradingPort = port;
  }
  return true;
}
