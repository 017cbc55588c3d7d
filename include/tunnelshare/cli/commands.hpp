#pragma once

namespace tunnelshare::cli {

void print_help();
int run_cli(int argc, char **argv);

} // namespace tunnelshare::cli
