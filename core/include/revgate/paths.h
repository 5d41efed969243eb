#pragma once

#include <filesystem>
#include <optional>

namespace revgate {

struct ResolvedPaths {
  std::filesystem::path root;
  std::filesystem::path state_dir;
  std::filesystem::path logs_dir;
  std::filesystem::path audit_log;
  std::filesystem::path config_file;
};

// REVGATE_ROOT wins over the override; otherwise the nearest ancestor of
// start_dir holding a .git entry, falling back to start_dir itself.
ResolvedPaths resolve_paths(const std::optional<std::filesystem::path>& root_override,
                            const std::filesystem::path& start_dir);

std::filesystem::path find_repo_root_from(const std::filesystem::path& start);

} // namespace revgate
