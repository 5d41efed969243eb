#include "revgate/log.h"
#include "revgate_cli/cli_api.h"

#include <iostream>
#include <string>
#include <vector>

int main(int argc, char** argv) {
  revgate::log::install_crash_handlers();
  std::vector<std::string> args;
  for (int i = 1; i < argc; ++i) {
    args.emplace_back(argv[i]);
  }
  const int rc = run_cli(args, nullptr, std::cout, std::cerr);
  revgate::log::shutdown();
  return rc;
}
