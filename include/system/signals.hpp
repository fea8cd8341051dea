#pragma once

#include <atomic>

namespace arcnav {

// Set by SIGINT/SIGTERM; long-running loops stop at the next safe point.
extern std::atomic_bool g_cancel;

void InstallSignalHandlers();

} // namespace arcnav
