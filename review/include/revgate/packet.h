#pragma once

#include "revgate/config.h"

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace revgate {

enum class PacketField {
  Branch,
  Base,
  Compare,
  Created,
  Approved,
  Reviewer,
  Timestamp,
  Notes
};

// A packet line as read from disk. Lines whose prefix names a known field
// carry that field; everything else is opaque and is never rewritten.
struct PacketLine {
  std::string text;
  std::optional<PacketField> field;
};

struct NewPacket {
  std::string branch;
  std::string base;
  std::string created_at;
};

struct ApprovalUpdate {
  bool approved = false;
  std::string reviewer;
  std::string timestamp;
  std::string notes;
};

struct PacketSummary {
  std::string branch;
  std::string base;
  std::string compare;
  std::string created;
  bool approved = false;
  std::string reviewer;
  std::string timestamp;
  std::string notes;
  bool gate_open = false;
};

std::string_view field_prefix(PacketField field);
bool is_approval_field(PacketField field);
std::optional<PacketField> classify_packet_line(std::string_view line);
std::string format_field_line(PacketField field, std::string_view value);

std::vector<PacketLine> parse_packet(const std::vector<std::string>& lines);
std::vector<std::string> render_new_packet(const NewPacket& packet);
std::vector<std::string> apply_approval_update(const std::vector<PacketLine>& lines,
                                               const ApprovalUpdate& update);

bool is_approved_marker(std::string_view line);
bool packet_is_approved(const std::vector<std::string>& lines, GateScope scope);

// First occurrence of each field wins.
PacketSummary summarize_packet(const std::vector<PacketLine>& lines, GateScope scope);

std::vector<std::string> split_packet_text(const std::string& text);
std::string join_packet_lines(const std::vector<std::string>& lines);

// UTC, microsecond precision: 2026-10-18T09:30:00.123456+00:00
std::string utc_now_iso();

} // namespace revgate
