#include "revgate/vcs.h"

#include "revgate/log.h"
#include "revgate/process.h"

#include <cctype>
#include <utility>
#include <vector>

namespace revgate {

namespace {
std::string trim_output(const std::string& text) {
  size_t begin = 0;
  size_t end = text.size();
  while (begin < end && std::isspace(static_cast<unsigned char>(text[begin]))) ++begin;
  while (end > begin && std::isspace(static_cast<unsigned char>(text[end - 1]))) --end;
  return text.substr(begin, end - begin);
}
} // namespace

GitVcs::GitVcs(std::filesystem::path repo_root, std::string git_executable)
    : repo_root_(std::move(repo_root)), git_executable_(std::move(git_executable)) {}

std::optional<std::string> GitVcs::current_branch() {
  const ProcessResult res = run_process({git_executable_, "branch", "--show-current"}, repo_root_);
  if (!res.ok()) {
    log::warn("current branch query failed (exit " + std::to_string(res.exit_code) + ")" +
              (res.error_message.empty() ? std::string() : ": " + res.error_message));
    return std::nullopt;
  }
  std::string branch = trim_output(res.output);
  if (branch.empty()) {
    return std::nullopt;
  }
  return branch;
}

VcsResult GitVcs::checkout(const std::string& branch) {
  return run_git("checkout", branch);
}

VcsResult GitVcs::merge(const std::string& branch) {
  return run_git("merge", branch);
}

VcsResult GitVcs::run_git(const std::string& subcommand, const std::string& arg) {
  log::info("git " + subcommand + " " + arg);
  const ProcessResult res = run_process({git_executable_, subcommand, arg}, repo_root_);
  VcsResult out;
  out.exit_code = res.exit_code;
  out.output = res.output;
  if (!res.error_message.empty()) {
    out.output += res.error_message;
    if (out.exit_code == 0) out.exit_code = -1;
  }
  if (!out.ok()) {
    log::error("git " + subcommand + " " + arg + " failed with exit " + std::to_string(out.exit_code));
  }
  return out;
}

} // namespace revgate
