#pragma once

#include <atomic>

namespace splitpack {

// Raised by SIGINT/SIGTERM once InstallSignalHandlers() ran. Engines poll it
// between chunks.
extern std::atomic_bool g_cancel;

void InstallSignalHandlers();

// Signal number that raised g_cancel, 0 if none.
int LastSignal();

} // namespace splitpack
