#pragma once

#include <filesystem>
#include <string>
#include <vector>

namespace revgate {

struct ProcessResult {
  int exit_code = -1;
  // Combined stdout and stderr, in the order the child wrote them.
  std::string output;
  std::string error_message;

  bool ok() const { return exit_code == 0 && error_message.empty(); }
};

// Runs args[0] (looked up on PATH) to completion. A child that cannot exec
// reports 127; a child killed by a signal reports 128 + signal.
ProcessResult run_process(const std::vector<std::string>& args, const std::filesystem::path& cwd);

} // namespace revgate
