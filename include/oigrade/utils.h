#ifndef INCLUDE_OIGRADE_UTILS_H_
#define INCLUDE_OIGRADE_UTILS_H_

#include <string>
#include <vector>
#include <optional>
#include <filesystem>

#include "grading.h"

const char* StatusToAbr(Status);
const char* StatusToDesc(Status);
std::optional<Status> AbrToStatus(const std::string&);

const char* LanguageName(Language);
const char* LanguageExtension(Language);

// Ids are used as path components on both sides of the boundary
bool IsSafeId(const std::string&);

// numeric ids ascending first, then the rest lexicographically
void SortTestIds(std::vector<std::string>&);
// stems of *.txt regular files in dir, sorted; nullopt if dir is not a directory
std::optional<std::vector<std::string>> ListTestIds(const std::filesystem::path& dir);

#endif  // INCLUDE_OIGRADE_UTILS_H_
