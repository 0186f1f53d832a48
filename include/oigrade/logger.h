#ifndef INCLUDE_OIGRADE_LOGGER_H_
#define INCLUDE_OIGRADE_LOGGER_H_

#include <spdlog/common.h>

// Keep the console lock consistent across fork(); call before spawning any sandbox
void InitLogger();

// 0: warn, 1 (-v): info, 2+ (-vv): debug
spdlog::level::level_enum LogLevelFromVerbosity(int verbosity);

#endif  // INCLUDE_OIGRADE_LOGGER_H_
