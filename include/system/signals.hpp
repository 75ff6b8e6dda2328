#pragma once

#include <atomic>

namespace curator {

// Set by SIGINT/SIGTERM once InstallSignalHandlers() has run.
extern std::atomic_bool g_cancel;

void InstallSignalHandlers();

} // namespace curator
