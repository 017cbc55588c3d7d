#pragma once

#ifdef _WIN32
#include <windows.h>
#else
#include <sys/types.h>
#endif

namespace tunnelshare::tunnel {

/// A spawned agent. On POSIX the agent leads its own process group so that
/// signals reach any helpers it forks.
struct AgentProcess {
#ifdef _WIN32
  HANDLE process_handle = nullptr;
  DWORD process_id = 0;
#else
  pid_t pid = 0;
#endif

  void signal_terminate() const;
  void signal_kill() const;
};

} // namespace tunnelshare::tunnel
