#include <oigrade/normalize.h>

#include <vector>

namespace {

constexpr char kWhites[] = " \t\n\r\x0b\x0c";

} // namespace

std::string NormalizeOutput(std::string_view raw) {
  std::vector<std::string_view> lines;
  std::string unified;
  unified.reserve(raw.size());
  for (size_t i = 0; i < raw.size(); i++) {
    if (raw[i] == '\r' && i + 1 < raw.size() && raw[i + 1] == '\n') continue;
    unified.push_back(raw[i]);
  }
  std::string_view rest(unified);
  while (true) {
    size_t pos = rest.find('\n');
    std::string_view line = rest.substr(0, pos);
    // std::string_view::npos + 1 == 0
    line.remove_suffix(line.size() - (line.find_last_not_of(kWhites) + 1));
    lines.push_back(line);
    if (pos == std::string_view::npos) break;
    rest.remove_prefix(pos + 1);
  }
  while (!lines.empty() && lines.back().empty()) lines.pop_back();
  std::string ret;
  ret.reserve(unified.size());
  for (size_t i = 0; i < lines.size(); i++) {
    if (i) ret.push_back('\n');
    ret.append(lines[i]);
  }
  return ret;
}
