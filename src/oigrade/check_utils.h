#ifndef OIGRADE_CHECK_UTILS_H_
#define OIGRADE_CHECK_UTILS_H_

#include <string>
#include <vector>
#include <optional>
#include <string_view>

// Helpers shared by the checkers. Parsing mirrors str.strip() / str.split() semantics:
// surrounding whitespace is ignored, tokens are separated by any whitespace.

std::string_view Strip(std::string_view);
// Strip the whole text, then split on '\n' (never returns an empty vector)
std::vector<std::string_view> SplitLines(std::string_view);
std::vector<std::string_view> SplitTokens(std::string_view);

// whole (stripped) string must be one integer
std::optional<long long> ParseInt(std::string_view);
// whole token must be a floating-point number
std::optional<double> ParseDouble(std::string_view);
// every token must parse; nullopt if any does not
std::optional<std::vector<long long>> ParseInts(std::string_view line);
std::optional<std::vector<double>> ParseDoubles(std::string_view line);

// For stored data (input / expected): throw CheckerError instead of returning nullopt
long long StoredInt(std::string_view, const char* what);
std::vector<long long> StoredInts(std::string_view line, size_t count, const char* what);
std::string_view StoredLine(const std::vector<std::string_view>& lines, size_t index, const char* what);

#endif  // OIGRADE_CHECK_UTILS_H_
