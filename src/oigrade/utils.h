#ifndef OIGRADE_UTILS_H_
#define OIGRADE_UTILS_H_

#include <string>
#include <optional>
#include <filesystem>

#include <oigrade/utils.h>

namespace fs = std::filesystem;

#define IGNORE_RETURN(x) { auto _ __attribute__((unused)) = x; }

bool RemoveAll(const fs::path&);

// nullopt on any read error
std::optional<std::string> ReadFile(const fs::path&);
// at most max_len bytes; sets truncated if the file is longer
std::optional<std::string> ReadFile(const fs::path&, size_t max_len, bool& truncated);
bool WriteFile(const fs::path&, const std::string&);

class TempDirectory { // RAII tempdir
  fs::path path_;
 public:
  const fs::path& Path() const { return path_; }
  bool Valid() const { return !path_.empty(); }
  fs::path InputPath() const { return path_ / "input"; }
  fs::path OutputPath() const { return path_ / "output"; }
  fs::path ErrorPath() const { return path_ / "error"; }
  TempDirectory(const char* prefix = "oigrade");
  ~TempDirectory();
  TempDirectory(const TempDirectory&) = delete;
  TempDirectory& operator=(const TempDirectory&) = delete;
};

#endif  // OIGRADE_UTILS_H_
