#include "CrashHandler.hpp"

#include <backward.hpp>

#include "core/Log.hpp"

namespace CrashHandler {

// Leaked on purpose: handlers must stay installed until the process exits.
static backward::SignalHandling *s_SignalHandler = nullptr;

void Init() {
  if (s_SignalHandler) {
    return;
  }
  s_SignalHandler = new backward::SignalHandling();
  if (s_SignalHandler->loaded()) {
    LOG_DEBUG("Crash handler installed");
  } else {
    LOG_WARN("Crash handler could not install signal handlers");
  }
}

} // namespace CrashHandler
