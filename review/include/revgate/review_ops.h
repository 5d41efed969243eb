#pragma once

#include "revgate/config.h"
#include "revgate/packet.h"
#include "revgate/packet_store.h"
#include "revgate/vcs.h"

#include <filesystem>
#include <functional>
#include <string>

namespace revgate {

enum class ReviewError {
  None,
  NoBranch,
  NoBase,
  PacketNotFound,
  NotApproved,
  ToolFailure,
  InvalidRequest,
  IoFailure
};

const char* review_error_code(ReviewError error);

struct ReviewResult {
  bool ok = false;
  ReviewError error = ReviewError::None;
  std::string message;
  std::filesystem::path packet_path;
  std::string branch;
  std::string base;
  // create-review: false when the packet already existed.
  bool created = false;
  // merge-if-approved: raw output of the git calls that ran.
  std::string tool_output;
};

struct ReviewContext {
  PacketStore store;
  IVcs* vcs = nullptr;
  GateScope gate_scope = GateScope::Anywhere;
  // Empty disables the audit trail.
  std::filesystem::path audit_log;
  std::function<std::string()> clock = utc_now_iso;
};

struct CreateReviewRequest {
  std::string branch;
  std::string base;
};

struct SetApprovalRequest {
  std::string branch;
  std::string reviewer;
  bool approved = true;
  std::string notes;
};

struct MergeRequest {
  std::string branch;
  std::string base;
};

ReviewResult create_review(ReviewContext& ctx, const CreateReviewRequest& req);
ReviewResult set_approval(ReviewContext& ctx, const SetApprovalRequest& req);
ReviewResult merge_if_approved(ReviewContext& ctx, const MergeRequest& req);
ReviewResult review_status(ReviewContext& ctx, const std::string& branch, PacketSummary& out);

} // namespace revgate
