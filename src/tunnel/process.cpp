#include "tunnelshare/tunnel/process.hpp"

#ifndef _WIN32
#include <cerrno>
#include <csignal>
#endif

namespace tunnelshare::tunnel {

namespace {

#ifndef _WIN32
void signal_group(const pid_t pid, const int sig) {
  if (pid <= 0) {
    return;
  }
  if (kill(-pid, sig) != 0 && errno == ESRCH) {
    kill(pid, sig);
  }
}
#endif

} // namespace

void AgentProcess::signal_terminate() const {
#ifdef _WIN32
  if (process_handle != nullptr) {
    TerminateProcess(process_handle, 1);
  }
#else
  signal_group(pid, SIGTERM);
#endif
}

void AgentProcess::signal_kill() const {
#ifdef _WIN32
  if (process_handle != nullptr) {
    TerminateProcess(process_handle, 1);
  }
#else
  signal_group(pid, SIGKILL);
#endif
}

} // namespace tunnelshare::tunnel
