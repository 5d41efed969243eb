#include "revgate/paths.h"

#include "revgate/log.h"

#include <array>
#include <cstdlib>
#include <system_error>

namespace revgate {

namespace {
bool path_exists(const std::filesystem::path& path) {
  std::error_code ec;
  return std::filesystem::exists(path, ec) && !ec;
}

std::filesystem::path find_config_file(const std::filesystem::path& state_dir) {
  if (const char* env = std::getenv("REVGATE_CONFIG")) {
    return std::filesystem::path(env);
  }
  const std::array<const char*, 3> names = {"config.yaml", "config.yml", "config.json"};
  for (const char* name : names) {
    const auto candidate = state_dir / name;
    if (path_exists(candidate)) {
      return candidate;
    }
  }
  return state_dir / "config.yaml";
}
} // namespace

std::filesystem::path find_repo_root_from(const std::filesystem::path& start) {
  std::filesystem::path cur = start;
  while (true) {
    if (path_exists(cur / ".git")) {
      return cur;
    }
    if (!cur.has_parent_path() || cur.parent_path() == cur) {
      break;
    }
    cur = cur.parent_path();
  }
  return start;
}

ResolvedPaths resolve_paths(const std::optional<std::filesystem::path>& root_override,
                            const std::filesystem::path& start_dir) {
  ResolvedPaths out;
  if (const char* env_root = std::getenv("REVGATE_ROOT")) {
    out.root = std::filesystem::path(env_root);
  } else if (root_override.has_value()) {
    const auto& p = root_override.value();
    out.root = p.is_absolute() ? p : start_dir / p;
  } else {
    out.root = find_repo_root_from(start_dir);
  }

  out.state_dir = out.root / ".revgate";
  out.logs_dir = out.state_dir / "logs";
  out.audit_log = out.state_dir / "audit.log";
  out.config_file = find_config_file(out.state_dir);

  if (!path_exists(out.root)) {
    log::warn(std::string("root path not found: ") + out.root.string());
  }

  return out;
}

} // namespace revgate
