#pragma once

namespace CrashHandler {

// Installs backward-cpp signal handlers so SIGSEGV/SIGABRT print a stack
// trace before the process dies. Safe to call more than once.
void Init();

} // namespace CrashHandler
