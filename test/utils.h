#ifndef TEST_UTILS_H_
#define TEST_UTILS_H_

#include <string>
#include <filesystem>

namespace fs = std::filesystem;

// mkdtemp under /tmp; mode is applied so the sandbox user can traverse it
fs::path MakeTempDir(const char* prefix, fs::perms mode = fs::perms::owner_all);
void WriteText(const fs::path& path, const std::string& content);

#endif // TEST_UTILS_H_
