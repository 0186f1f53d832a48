#include <oigrade/logger.h>

#include <pthread.h>
#include <spdlog/spdlog.h>
#include <spdlog/details/console_globals.h>

namespace {

// every console color sink serializes on this one process-wide mutex
void LockConsole() {
  spdlog::details::console_mutex::mutex().lock();
}

void UnlockConsole() {
  spdlog::details::console_mutex::mutex().unlock();
}

} // namespace

void InitLogger() {
  spdlog::debug("Setup logger pthread_atfork");
  pthread_atfork(LockConsole, UnlockConsole, UnlockConsole);
}

spdlog::level::level_enum LogLevelFromVerbosity(int verbosity) {
  switch (verbosity) {
    case 0: return spdlog::level::warn;
    case 1: return spdlog::level::info;
    default: return spdlog::level::debug;
  }
}
