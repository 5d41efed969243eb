#include "revgate/config.h"

#include "revgate/log.h"

#include <exception>
#include <fstream>
#include <optional>

#include <nlohmann/json.hpp>
#include <yaml-cpp/yaml.h>

namespace revgate {

namespace {
bool file_exists(const std::filesystem::path& path) {
  std::error_code ec;
  return std::filesystem::exists(path, ec);
}

void apply_common_fields(ReviewConfig& cfg, const std::string& reviews_dir,
                         const std::string& extension,
                         const std::string& git,
                         const std::string& gate_scope,
                         const std::optional<bool>& audit_log) {
  if (!reviews_dir.empty()) {
    cfg.reviews_dir = reviews_dir;
  }
  if (!extension.empty()) {
    cfg.packet_extension = extension.front() == '.' ? extension : "." + extension;
  }
  if (!git.empty()) {
    cfg.git_executable = git;
  }
  if (!gate_scope.empty()) {
    GateScope scope = cfg.gate_scope;
    if (parse_gate_scope(gate_scope, scope)) {
      cfg.gate_scope = scope;
    } else {
      log::warn("unknown gate_scope '" + gate_scope + "'; keeping " + gate_scope_name(cfg.gate_scope));
    }
  }
  if (audit_log.has_value()) {
    cfg.audit_log = *audit_log;
  }
}
} // namespace

bool parse_gate_scope(const std::string& text, GateScope& out) {
  if (text == "anywhere") {
    out = GateScope::Anywhere;
    return true;
  }
  if (text == "approval_section") {
    out = GateScope::ApprovalSection;
    return true;
  }
  return false;
}

const char* gate_scope_name(GateScope scope) {
  switch (scope) {
    case GateScope::Anywhere:
      return "anywhere";
    case GateScope::ApprovalSection:
      return "approval_section";
  }
  return "anywhere";
}

ReviewConfig load_review_config(const std::filesystem::path& path) {
  ReviewConfig cfg;

  if (!file_exists(path)) {
    log::warn(std::string("config not found: ") + path.string() + "; using defaults");
    return cfg;
  }

  std::string reviews_dir;
  std::string extension;
  std::string git;
  std::string gate_scope;
  std::optional<bool> audit_log;

  const auto ext = path.extension().string();
  if (ext == ".json") {
    try {
      std::ifstream in(path);
      nlohmann::json j;
      in >> j;
      const auto& root = j.contains("review") ? j["review"] : j;

      if (root.contains("reviews_dir")) reviews_dir = root["reviews_dir"].get<std::string>();
      if (root.contains("packet_extension")) extension = root["packet_extension"].get<std::string>();
      if (root.contains("git")) git = root["git"].get<std::string>();
      if (root.contains("gate_scope")) gate_scope = root["gate_scope"].get<std::string>();
      if (root.contains("audit_log")) audit_log = root["audit_log"].get<bool>();
    } catch (const std::exception& e) {
      log::error(std::string("config parse failed: ") + path.string() + ": " + e.what());
      return cfg;
    }

    apply_common_fields(cfg, reviews_dir, extension, git, gate_scope, audit_log);
    return cfg;
  }

  if (ext == ".yaml" || ext == ".yml") {
    try {
      YAML::Node doc = YAML::LoadFile(path.string());
      YAML::Node root = doc["review"] ? doc["review"] : doc;

      if (root["reviews_dir"]) reviews_dir = root["reviews_dir"].as<std::string>();
      if (root["packet_extension"]) extension = root["packet_extension"].as<std::string>();
      if (root["git"]) git = root["git"].as<std::string>();
      if (root["gate_scope"]) gate_scope = root["gate_scope"].as<std::string>();
      if (root["audit_log"]) audit_log = root["audit_log"].as<bool>();
    } catch (const std::exception& e) {
      log::error(std::string("config parse failed: ") + path.string() + ": " + e.what());
      return cfg;
    }

    apply_common_fields(cfg, reviews_dir, extension, git, gate_scope, audit_log);
    return cfg;
  }

  log::warn("Unknown config extension; using defaults.");
  return cfg;
}

} // namespace revgate
