#pragma once

#include <filesystem>
#include <string>

namespace revgate {

enum class GateScope {
  Anywhere,
  ApprovalSection
};

struct ReviewConfig {
  std::filesystem::path reviews_dir = ".revgate/reviews";
  std::string packet_extension = ".md";
  std::string git_executable = "git";
  GateScope gate_scope = GateScope::Anywhere;
  bool audit_log = true;
};

ReviewConfig load_review_config(const std::filesystem::path& path);

bool parse_gate_scope(const std::string& text, GateScope& out);
const char* gate_scope_name(GateScope scope);

} // namespace revgate
