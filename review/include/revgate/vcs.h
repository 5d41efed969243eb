#pragma once

#include <filesystem>
#include <optional>
#include <string>

namespace revgate {

struct VcsResult {
  int exit_code = -1;
  std::string output;

  bool ok() const { return exit_code == 0; }
};

class IVcs {
 public:
  virtual ~IVcs() = default;

  // No value when the branch cannot be determined (detached HEAD, no repo,
  // tool missing).
  virtual std::optional<std::string> current_branch() = 0;
  virtual VcsResult checkout(const std::string& branch) = 0;
  virtual VcsResult merge(const std::string& branch) = 0;
};

class GitVcs : public IVcs {
 public:
  GitVcs(std::filesystem::path repo_root, std::string git_executable);

  std::optional<std::string> current_branch() override;
  VcsResult checkout(const std::string& branch) override;
  VcsResult merge(const std::string& branch) override;

 private:
  VcsResult run_git(const std::string& subcommand, const std::string& arg);

  std::filesystem::path repo_root_;
  std::string git_executable_;
};

} // namespace revgate
