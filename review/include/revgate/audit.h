#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace revgate {

struct AuditRecord {
  std::string time;
  std::string action_type;
  std::string branch;
  std::string result;
  std::string message;
  std::vector<std::string> files_touched;
};

// One JSON object per line, appended.
bool append_audit_record(const std::filesystem::path& audit_path, const AuditRecord& record);

// Most recent record for `branch`, or nullopt when the log is missing, unreadable
// or has nothing for that branch.
std::optional<AuditRecord> last_audit_record(const std::filesystem::path& audit_path, const std::string& branch);

} // namespace revgate
