#include "check_utils.h"

#include <cmath>
#include <string>
#include <cstdlib>
#include <charconv>

#include <fmt/core.h>
#include <oigrade/checker.h>

namespace {

constexpr char kWhites[] = " \t\n\r\x0b\x0c";

} // namespace

std::string_view Strip(std::string_view str) {
  size_t begin = str.find_first_not_of(kWhites);
  if (begin == std::string_view::npos) return {};
  size_t end = str.find_last_not_of(kWhites);
  return str.substr(begin, end - begin + 1);
}

std::vector<std::string_view> SplitLines(std::string_view str) {
  str = Strip(str);
  std::vector<std::string_view> ret;
  while (true) {
    size_t pos = str.find('\n');
    ret.push_back(str.substr(0, pos));
    if (pos == std::string_view::npos) break;
    str.remove_prefix(pos + 1);
  }
  return ret;
}

std::vector<std::string_view> SplitTokens(std::string_view str) {
  std::vector<std::string_view> ret;
  for (size_t i = 0;;) {
    i = str.find_first_not_of(kWhites, i);
    if (i == std::string_view::npos) break;
    size_t j = str.find_first_of(kWhites, i);
    if (j == std::string_view::npos) j = str.size();
    ret.push_back(str.substr(i, j - i));
    i = j;
  }
  return ret;
}

std::optional<long long> ParseInt(std::string_view str) {
  str = Strip(str);
  if (!str.empty() && str[0] == '+') str.remove_prefix(1);
  if (str.empty() || str[0] == '+') return std::nullopt;
  long long ret = 0;
  auto [ptr, ec] = std::from_chars(str.data(), str.data() + str.size(), ret);
  if (ec != std::errc() || ptr != str.data() + str.size()) return std::nullopt;
  return ret;
}

std::optional<double> ParseDouble(std::string_view str) {
  str = Strip(str);
  // hexadecimal floats are accepted by strtod but are not a plain decimal answer
  if (str.empty() || str.find_first_of("xX") != std::string_view::npos) return std::nullopt;
  std::string buf(str);
  char* end = nullptr;
  double ret = std::strtod(buf.c_str(), &end);
  if (end != buf.c_str() + buf.size()) return std::nullopt;
  return ret;
}

std::optional<std::vector<long long>> ParseInts(std::string_view line) {
  std::vector<long long> ret;
  for (auto& token : SplitTokens(line)) {
    auto val = ParseInt(token);
    if (!val) return std::nullopt;
    ret.push_back(*val);
  }
  return ret;
}

std::optional<std::vector<double>> ParseDoubles(std::string_view line) {
  std::vector<double> ret;
  for (auto& token : SplitTokens(line)) {
    auto val = ParseDouble(token);
    if (!val) return std::nullopt;
    ret.push_back(*val);
  }
  return ret;
}

long long StoredInt(std::string_view str, const char* what) {
  auto val = ParseInt(str);
  if (!val) throw CheckerError(fmt::format("malformed {}", what));
  return *val;
}

std::vector<long long> StoredInts(std::string_view line, size_t count, const char* what) {
  auto val = ParseInts(line);
  if (!val || val->size() != count) throw CheckerError(fmt::format("malformed {}", what));
  return std::move(*val);
}

std::string_view StoredLine(const std::vector<std::string_view>& lines, size_t index, const char* what) {
  if (index >= lines.size()) throw CheckerError(fmt::format("missing {}", what));
  return lines[index];
}
