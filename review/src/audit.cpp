#include "revgate/audit.h"

#include "revgate_data/serialization.h"

#include <nlohmann/json.hpp>

#include <system_error>
#include <vector>

namespace revgate {

bool append_audit_record(const std::filesystem::path& audit_path, const AuditRecord& record) {
  nlohmann::json audit;
  audit["time"] = record.time;
  audit["action_type"] = record.action_type;
  audit["branch"] = record.branch;
  audit["result"] = record.result;
  audit["message"] = record.message;
  audit["files_touched"] = record.files_touched;
  return data::append_json_line(audit_path, audit);
}

std::optional<AuditRecord> last_audit_record(const std::filesystem::path& audit_path, const std::string& branch) {
  std::error_code ec;
  if (audit_path.empty() || !std::filesystem::exists(audit_path, ec)) {
    return std::nullopt;
  }
  std::vector<nlohmann::json> records;
  if (!data::load_json_lines(audit_path, records)) {
    return std::nullopt;
  }
  for (auto it = records.rbegin(); it != records.rend(); ++it) {
    if (!it->is_object() || it->value("branch", "") != branch) continue;
    AuditRecord record;
    record.time = it->value("time", "");
    record.action_type = it->value("action_type", "");
    record.branch = branch;
    record.result = it->value("result", "");
    record.message = it->value("message", "");
    const auto files = it->find("files_touched");
    if (files != it->end() && files->is_array()) {
      for (const auto& f : *files) {
        if (f.is_string()) record.files_touched.push_back(f.get<std::string>());
      }
    }
    return record;
  }
  return std::nullopt;
}

} // namespace revgate
