#include "tunnelshare/cli/commands.hpp"

#include <csignal>

int main(int argc, char **argv) {
#ifndef _WIN32
  std::signal(SIGPIPE, SIG_IGN);
#endif
  return tunnelshare::cli::run_cli(argc, argv);
}
