#pragma once

#include <atomic>

namespace espkit {

// Set by SIGINT/SIGTERM. Long-running transfers poll it and abort.
extern std::atomic_bool g_cancel;

void InstallSignalHandlers();

} // namespace espkit
