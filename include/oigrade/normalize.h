#ifndef INCLUDE_OIGRADE_NORMALIZE_H_
#define INCLUDE_OIGRADE_NORMALIZE_H_

#include <string>
#include <string_view>

// CRLF -> LF, right-trim every line, drop trailing empty lines.
// Idempotent; used by both the runner and the verdict service.
std::string NormalizeOutput(std::string_view raw);

#endif  // INCLUDE_OIGRADE_NORMALIZE_H_
