#include "revgate/packet.h"

#include "revgate/branch_naming.h"

#include <array>
#include <cctype>
#include <chrono>
#include <cstdio>
#include <ctime>
#include <utility>

namespace revgate {

namespace {
constexpr std::string_view kApprovalHeading = "## Approval";
constexpr std::string_view kApprovedMarker = "- approved: yes";

constexpr std::array<std::pair<PacketField, std::string_view>, 8> kFieldPrefixes = {{
    {PacketField::Branch, "- Branch:"},
    {PacketField::Base, "- Base:"},
    {PacketField::Compare, "- Compare:"},
    {PacketField::Created, "- Created:"},
    {PacketField::Approved, "- APPROVED:"},
    {PacketField::Reviewer, "- Reviewer:"},
    {PacketField::Timestamp, "- Timestamp:"},
    {PacketField::Notes, "- Notes:"},
}};

bool is_space(char c) {
  return std::isspace(static_cast<unsigned char>(c)) != 0;
}

std::string_view trim(std::string_view text) {
  while (!text.empty() && is_space(text.front())) text.remove_prefix(1);
  while (!text.empty() && is_space(text.back())) text.remove_suffix(1);
  return text;
}

std::string to_lower(std::string_view text) {
  std::string out;
  out.reserve(text.size());
  for (char c : text) {
    out += static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
  }
  return out;
}

bool starts_with(std::string_view text, std::string_view prefix) {
  return text.substr(0, prefix.size()) == prefix;
}

std::string field_value(const PacketLine& line) {
  return std::string(trim(std::string_view(line.text).substr(field_prefix(*line.field).size())));
}
} // namespace

std::string_view field_prefix(PacketField field) {
  for (const auto& [key, prefix] : kFieldPrefixes) {
    if (key == field) return prefix;
  }
  return {};
}

bool is_approval_field(PacketField field) {
  return field == PacketField::Approved || field == PacketField::Reviewer ||
         field == PacketField::Timestamp || field == PacketField::Notes;
}

std::optional<PacketField> classify_packet_line(std::string_view line) {
  for (const auto& [key, prefix] : kFieldPrefixes) {
    if (starts_with(line, prefix)) return key;
  }
  return std::nullopt;
}

std::string format_field_line(PacketField field, std::string_view value) {
  std::string out(field_prefix(field));
  out += ' ';
  out += value;
  return out;
}

std::vector<PacketLine> parse_packet(const std::vector<std::string>& lines) {
  std::vector<PacketLine> out;
  out.reserve(lines.size());
  for (const auto& line : lines) {
    out.push_back(PacketLine{line, classify_packet_line(line)});
  }
  return out;
}

std::vector<std::string> render_new_packet(const NewPacket& packet) {
  const std::string compare = make_compare_range(packet.base, packet.branch);
  return {
      "# Review Packet",
      "",
      format_field_line(PacketField::Branch, packet.branch),
      format_field_line(PacketField::Base, packet.base),
      format_field_line(PacketField::Compare, compare),
      format_field_line(PacketField::Created, packet.created_at),
      "",
      "## Task Intent",
      "[fill in]",
      "",
      "## Summary",
      "[fill in]",
      "",
      "## Reflect Findings",
      "[fill in]",
      "",
      "## Review Commands",
      "- git diff --stat " + compare,
      "- git diff " + compare,
      "- git log --left-right --graph " + packet.base + "..." + packet.branch,
      "",
      std::string(kApprovalHeading),
      format_field_line(PacketField::Approved, "no"),
      format_field_line(PacketField::Reviewer, ""),
      format_field_line(PacketField::Timestamp, ""),
      format_field_line(PacketField::Notes, ""),
  };
}

std::vector<std::string> apply_approval_update(const std::vector<PacketLine>& lines,
                                               const ApprovalUpdate& update) {
  std::vector<std::string> out;
  out.reserve(lines.size());
  for (const auto& line : lines) {
    if (!line.field.has_value() || !is_approval_field(*line.field)) {
      out.push_back(line.text);
      continue;
    }
    switch (*line.field) {
      case PacketField::Approved:
        out.push_back(format_field_line(PacketField::Approved, update.approved ? "yes" : "no"));
        break;
      case PacketField::Reviewer:
        out.push_back(format_field_line(PacketField::Reviewer, update.reviewer));
        break;
      case PacketField::Timestamp:
        out.push_back(format_field_line(PacketField::Timestamp, update.timestamp));
        break;
      case PacketField::Notes:
        out.push_back(format_field_line(PacketField::Notes, update.notes));
        break;
      default:
        out.push_back(line.text);
        break;
    }
  }
  return out;
}

bool is_approved_marker(std::string_view line) {
  return to_lower(trim(line)) == kApprovedMarker;
}

bool packet_is_approved(const std::vector<std::string>& lines, GateScope scope) {
  bool in_approval = false;
  for (const auto& line : lines) {
    if (scope == GateScope::ApprovalSection) {
      const std::string_view trimmed = trim(line);
      if (starts_with(trimmed, "#")) {
        in_approval = trimmed == kApprovalHeading;
        continue;
      }
      if (!in_approval) continue;
    }
    if (is_approved_marker(line)) {
      return true;
    }
  }
  return false;
}

PacketSummary summarize_packet(const std::vector<PacketLine>& lines, GateScope scope) {
  PacketSummary out;
  std::array<bool, kFieldPrefixes.size()> seen{};
  std::vector<std::string> raw;
  raw.reserve(lines.size());
  for (const auto& line : lines) {
    raw.push_back(line.text);
    if (!line.field.has_value()) continue;
    const auto index = static_cast<size_t>(*line.field);
    if (seen[index]) continue;
    seen[index] = true;
    const std::string value = field_value(line);
    switch (*line.field) {
      case PacketField::Branch: out.branch = value; break;
      case PacketField::Base: out.base = value; break;
      case PacketField::Compare: out.compare = value; break;
      case PacketField::Created: out.created = value; break;
      case PacketField::Approved: out.approved = to_lower(value) == "yes"; break;
      case PacketField::Reviewer: out.reviewer = value; break;
      case PacketField::Timestamp: out.timestamp = value; break;
      case PacketField::Notes: out.notes = value; break;
    }
  }
  out.gate_open = packet_is_approved(raw, scope);
  return out;
}

std::vector<std::string> split_packet_text(const std::string& text) {
  std::vector<std::string> lines;
  size_t start = 0;
  while (start < text.size()) {
    size_t end = text.find('\n', start);
    if (end == std::string::npos) end = text.size();
    std::string line = text.substr(start, end - start);
    if (!line.empty() && line.back() == '\r') {
      line.pop_back();
    }
    lines.push_back(std::move(line));
    start = end + 1;
  }
  return lines;
}

std::string join_packet_lines(const std::vector<std::string>& lines) {
  std::string out;
  for (const auto& line : lines) {
    out += line;
    out += '\n';
  }
  return out;
}

std::string utc_now_iso() {
  using namespace std::chrono;
  const auto now = system_clock::now();
  const auto tt = system_clock::to_time_t(now);
  const auto micros = duration_cast<microseconds>(now.time_since_epoch()).count() % 1000000;
  std::tm tm{};
  gmtime_r(&tt, &tm);
  char buf[32];
  std::strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%S", &tm);
  char frac[16];
  std::snprintf(frac, sizeof(frac), ".%06lld", static_cast<long long>(micros));
  return std::string(buf) + frac + "+00:00";
}

} // namespace revgate
