#include "revgate/review_ops.h"

#include "revgate/audit.h"
#include "revgate/branch_naming.h"
#include "revgate/log.h"

#include <optional>
#include <string>
#include <utility>

namespace revgate {

namespace {
ReviewResult fail(ReviewResult result, ReviewError error, std::string message) {
  result.ok = false;
  result.error = error;
  result.message = std::move(message);
  return result;
}

std::optional<std::string> resolve_branch(ReviewContext& ctx, const std::string& requested) {
  if (!requested.empty()) {
    return requested;
  }
  if (!ctx.vcs) {
    return std::nullopt;
  }
  return ctx.vcs->current_branch();
}

std::optional<std::string> resolve_base(const std::string& requested, const std::string& branch) {
  if (!requested.empty()) {
    return requested;
  }
  return infer_base_branch(branch);
}

ReviewResult finish(ReviewContext& ctx, const char* action_type, ReviewResult result) {
  if (result.ok) {
    log::info(std::string(action_type) + ": " + result.message);
  } else {
    log::error(std::string(action_type) + " failed [" + review_error_code(result.error) + "]: " +
               result.message);
  }
  if (!ctx.audit_log.empty()) {
    AuditRecord record;
    record.time = ctx.clock();
    record.action_type = action_type;
    record.branch = result.branch;
    record.result = result.ok ? "ok" : review_error_code(result.error);
    record.message = result.message;
    if (!result.packet_path.empty()) {
      record.files_touched.push_back(result.packet_path.generic_string());
    }
    if (!append_audit_record(ctx.audit_log, record)) {
      log::warn("audit append failed: " + ctx.audit_log.string());
    }
  }
  return result;
}
} // namespace

const char* review_error_code(ReviewError error) {
  switch (error) {
    case ReviewError::None:
      return "none";
    case ReviewError::NoBranch:
      return "no_branch";
    case ReviewError::NoBase:
      return "no_base";
    case ReviewError::PacketNotFound:
      return "packet_not_found";
    case ReviewError::NotApproved:
      return "not_approved";
    case ReviewError::ToolFailure:
      return "tool_failure";
    case ReviewError::InvalidRequest:
      return "invalid_request";
    case ReviewError::IoFailure:
      return "io_failure";
  }
  return "unknown";
}

ReviewResult create_review(ReviewContext& ctx, const CreateReviewRequest& req) {
  constexpr const char* kAction = "create_review";
  ReviewResult result;

  const auto branch = resolve_branch(ctx, req.branch);
  if (!branch.has_value()) {
    return finish(ctx, kAction, fail(result, ReviewError::NoBranch, "Could not determine current branch."));
  }
  result.branch = *branch;

  const auto base = resolve_base(req.base, *branch);
  if (!base.has_value()) {
    return finish(ctx, kAction,
                  fail(result, ReviewError::NoBase, "Base branch not provided and could not be inferred."));
  }
  result.base = *base;
  result.packet_path = ctx.store.locate(*branch);

  if (ctx.store.exists(result.packet_path)) {
    result.ok = true;
    result.message = "Review packet already exists: " + result.packet_path.string();
    return finish(ctx, kAction, result);
  }

  NewPacket packet;
  packet.branch = *branch;
  packet.base = *base;
  packet.created_at = ctx.clock();

  std::string error;
  if (!ctx.store.write(result.packet_path, render_new_packet(packet), &error)) {
    return finish(ctx, kAction, fail(result, ReviewError::IoFailure, error));
  }

  result.ok = true;
  result.created = true;
  result.message = "Created review packet: " + result.packet_path.string();
  return finish(ctx, kAction, result);
}

ReviewResult set_approval(ReviewContext& ctx, const SetApprovalRequest& req) {
  constexpr const char* kAction = "set_approval";
  ReviewResult result;

  if (req.reviewer.empty()) {
    return finish(ctx, kAction, fail(result, ReviewError::InvalidRequest, "Reviewer is required."));
  }

  const auto branch = resolve_branch(ctx, req.branch);
  if (!branch.has_value()) {
    return finish(ctx, kAction, fail(result, ReviewError::NoBranch, "Could not determine current branch."));
  }
  result.branch = *branch;
  result.packet_path = ctx.store.locate(*branch);

  if (!ctx.store.exists(result.packet_path)) {
    return finish(ctx, kAction, fail(result, ReviewError::PacketNotFound,
                                     "Review packet not found: " + result.packet_path.string()));
  }

  std::string error;
  const auto lines = ctx.store.read(result.packet_path, &error);
  if (!lines.has_value()) {
    return finish(ctx, kAction, fail(result, ReviewError::IoFailure, error));
  }

  ApprovalUpdate update;
  update.approved = req.approved;
  update.reviewer = req.reviewer;
  update.timestamp = ctx.clock();
  update.notes = req.notes;

  const auto updated = apply_approval_update(parse_packet(*lines), update);
  if (!ctx.store.write(result.packet_path, updated, &error)) {
    return finish(ctx, kAction, fail(result, ReviewError::IoFailure, error));
  }

  result.ok = true;
  result.message = "Updated review packet: " + result.packet_path.string() +
                   (req.approved ? " (approved by " : " (rejected by ") + req.reviewer + ")";
  return finish(ctx, kAction, result);
}

ReviewResult merge_if_approved(ReviewContext& ctx, const MergeRequest& req) {
  constexpr const char* kAction = "merge_if_approved";
  ReviewResult result;

  const auto branch = resolve_branch(ctx, req.branch);
  if (!branch.has_value()) {
    return finish(ctx, kAction, fail(result, ReviewError::NoBranch, "Could not determine current branch."));
  }
  result.branch = *branch;

  const auto base = resolve_base(req.base, *branch);
  if (!base.has_value()) {
    return finish(ctx, kAction,
                  fail(result, ReviewError::NoBase, "Base branch not provided and could not be inferred."));
  }
  result.base = *base;
  result.packet_path = ctx.store.locate(*branch);

  if (!ctx.store.exists(result.packet_path)) {
    return finish(ctx, kAction, fail(result, ReviewError::PacketNotFound,
                                     "Review packet not found: " + result.packet_path.string()));
  }

  std::string error;
  const auto lines = ctx.store.read(result.packet_path, &error);
  if (!lines.has_value()) {
    return finish(ctx, kAction, fail(result, ReviewError::IoFailure, error));
  }

  if (!packet_is_approved(*lines, ctx.gate_scope)) {
    return finish(ctx, kAction, fail(result, ReviewError::NotApproved, "Review packet is not approved."));
  }

  if (!ctx.vcs) {
    return finish(ctx, kAction, fail(result, ReviewError::ToolFailure, "no version control collaborator"));
  }

  const VcsResult checkout = ctx.vcs->checkout(*base);
  result.tool_output += checkout.output;
  if (!checkout.ok()) {
    return finish(ctx, kAction, fail(result, ReviewError::ToolFailure,
                                     "git checkout " + *base + " failed (exit " +
                                         std::to_string(checkout.exit_code) + ")"));
  }

  const VcsResult merge = ctx.vcs->merge(*branch);
  result.tool_output += merge.output;
  if (!merge.ok()) {
    return finish(ctx, kAction, fail(result, ReviewError::ToolFailure,
                                     "git merge " + *branch + " failed (exit " +
                                         std::to_string(merge.exit_code) + ")"));
  }

  result.ok = true;
  result.message = "Merged " + *branch + " into " + *base + ".";
  return finish(ctx, kAction, result);
}

ReviewResult review_status(ReviewContext& ctx, const std::string& branch_name, PacketSummary& out) {
  ReviewResult result;

  const auto branch = resolve_branch(ctx, branch_name);
  if (!branch.has_value()) {
    result.error = ReviewError::NoBranch;
    result.message = "Could not determine current branch.";
    return result;
  }
  result.branch = *branch;
  result.packet_path = ctx.store.locate(*branch);

  std::string error;
  if (!ctx.store.exists(result.packet_path)) {
    result.error = ReviewError::PacketNotFound;
    result.message = "Review packet not found: " + result.packet_path.string();
    return result;
  }
  const auto lines = ctx.store.read(result.packet_path, &error);
  if (!lines.has_value()) {
    result.error = ReviewError::IoFailure;
    result.message = error;
    return result;
  }

  out = summarize_packet(parse_packet(*lines), ctx.gate_scope);
  result.base = out.base;
  result.ok = true;
  result.message = result.packet_path.string();
  return result;
}

} // namespace revgate
