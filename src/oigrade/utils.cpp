#include "utils.h"

#include <cstdlib>
#include <cerrno>
#include <cstring>
#include <fstream>
#include <sstream>
#include <algorithm>

#include <spdlog/spdlog.h>

#define ENUM_SWITCH_FUNCTION(DEF, typ, mac) \
  DEF(typ param) { \
    switch (param) { \
      mac \
    } \
    __builtin_unreachable(); \
  }
#define X_RETURN_ARG2(cls, x, y, ...) case cls::x: return y;
#define X_RETURN_ARG3(cls, x, y, z, ...) case cls::x: return z;

#define X(...) X_RETURN_ARG3(Status, __VA_ARGS__)
ENUM_SWITCH_FUNCTION(const char* StatusToDesc, Status, ENUM_STATUS_)
#undef X

#define X(...) X_RETURN_ARG2(Language, __VA_ARGS__)
ENUM_SWITCH_FUNCTION(const char* LanguageName, Language, ENUM_LANGUAGE_)
#undef X

#define X(...) X_RETURN_ARG3(Language, __VA_ARGS__)
ENUM_SWITCH_FUNCTION(const char* LanguageExtension, Language, ENUM_LANGUAGE_)
#undef X

#undef ENUM_SWITCH_FUNCTION
#undef X_RETURN_ARG2
#undef X_RETURN_ARG3

static const char* kStatusAbrTable[] = {
#define X(name, abr, desc) abr,
  ENUM_STATUS_
#undef X
};

const char* StatusToAbr(Status status) {
  return kStatusAbrTable[(int)status];
}

std::optional<Status> AbrToStatus(const std::string& str) {
  for (size_t i = 0; i < sizeof(kStatusAbrTable) / sizeof(kStatusAbrTable[0]); i++) {
    if (str == kStatusAbrTable[i]) return (Status)i;
  }
  return std::nullopt;
}

bool IsSafeId(const std::string& id) {
  if (id.empty() || id == "." || id == "..") return false;
  return id.find_first_of(std::string("/\\\0", 3)) == std::string::npos;
}

namespace {

inline bool IsNumeric(const std::string& str) {
  return !str.empty() && std::all_of(str.begin(), str.end(), [](char c) { return c >= '0' && c <= '9'; });
}

// compare digit strings by value without overflowing
inline bool NumericLess(const std::string& a, const std::string& b) {
  size_t pa = std::min(a.find_first_not_of('0'), a.size());
  size_t pb = std::min(b.find_first_not_of('0'), b.size());
  size_t la = a.size() - pa, lb = b.size() - pb;
  if (la != lb) return la < lb;
  int cmp = a.compare(pa, la, b, pb, lb);
  if (cmp != 0) return cmp < 0;
  return a < b; // "01" and "1" have equal value; keep the order total
}

} // namespace

void SortTestIds(std::vector<std::string>& ids) {
  std::sort(ids.begin(), ids.end(), [](const std::string& a, const std::string& b) {
    bool na = IsNumeric(a), nb = IsNumeric(b);
    if (na != nb) return na;
    if (na) return NumericLess(a, b);
    return a < b;
  });
}

std::optional<std::vector<std::string>> ListTestIds(const fs::path& dir) {
  std::error_code ec;
  if (!fs::is_directory(dir, ec)) return std::nullopt;
  std::vector<std::string> ids;
  for (fs::directory_iterator it(dir, ec), end; !ec && it != end; it.increment(ec)) {
    const fs::path& path = it->path();
    if (path.extension() != ".txt" || !it->is_regular_file(ec)) continue;
    ids.push_back(path.stem().string());
  }
  if (ec) {
    spdlog::warn("Failed listing {}: {}", dir.c_str(), ec.message());
    return std::nullopt;
  }
  SortTestIds(ids);
  return ids;
}

bool RemoveAll(const fs::path& path) {
  spdlog::debug("Delete {}", path.c_str());
  std::error_code ec;
  fs::remove_all(path, ec);
  if (ec) goto err;
  return true;
err:
  spdlog::warn("Failed deleting {}: {}", path.c_str(), strerror(ec.value()));
  return false;
}

std::optional<std::string> ReadFile(const fs::path& path) {
  std::ifstream fin(path, std::ios::binary);
  if (!fin) return std::nullopt;
  std::ostringstream buf;
  buf << fin.rdbuf();
  if (fin.bad()) return std::nullopt;
  return std::move(buf).str();
}

std::optional<std::string> ReadFile(const fs::path& path, size_t max_len, bool& truncated) {
  std::ifstream fin(path, std::ios::binary);
  if (!fin) return std::nullopt;
  std::string ret(max_len, '\0');
  fin.read(ret.data(), max_len);
  if (fin.bad()) return std::nullopt;
  ret.resize(fin.gcount());
  truncated = fin.peek() != std::ifstream::traits_type::eof();
  return ret;
}

bool WriteFile(const fs::path& path, const std::string& content) {
  std::ofstream fout(path, std::ios::binary);
  if (!fout) return false;
  fout.write(content.data(), content.size());
  return bool(fout);
}

TempDirectory::TempDirectory(const char* prefix) {
  std::string tmpl = "/tmp/" + std::string(prefix) + ".XXXXXX";
  char* res = mkdtemp(tmpl.data());
  if (res) {
    path_ = res;
  } else {
    spdlog::warn("Failed creating temporary directory: {}", strerror(errno));
  }
}

TempDirectory::~TempDirectory() {
  if (!path_.empty()) RemoveAll(path_);
}
