#ifndef CONFIG_H_
#define CONFIG_H_

#include <string>
#include <filesystem>

namespace fs = std::filesystem;

extern const char* const kDefaultConfig;
extern int kServerThreads; // 0: httplib default

// Overrides the compiled defaults. A missing file is an error only if required.
bool ParseConfig(const fs::path& conf_path, bool required);
// GRADING_DIR, GRADING_HOST, GRADING_PORT, GRADING_SERVER_URL
bool LoadEnvironment();

bool IsValidPort(int);
// -1 for a value that is not a valid port
int ParsePort(const std::string&);

#endif  // CONFIG_H_
