#include "utils.h"

#include <cstdlib>
#include <fstream>
#include <stdexcept>

fs::path MakeTempDir(const char* prefix, fs::perms mode) {
  std::string tmpl = std::string("/tmp/") + prefix + "_XXXXXX";
  if (!mkdtemp(tmpl.data())) throw std::runtime_error("Failed to create");
  fs::permissions(tmpl, mode);
  return tmpl;
}

void WriteText(const fs::path& path, const std::string& content) {
  fs::create_directories(path.parent_path());
  std::ofstream fout(path);
  if (!fout) throw std::runtime_error("Failed to write " + path.string());
  fout << content;
}
