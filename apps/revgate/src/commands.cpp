#include "revgate/audit.h"
#include "revgate/config.h"
#include "revgate/log.h"
#include "revgate/paths.h"
#include "revgate/review_ops.h"
#include "revgate_cli/cli_api.h"

#include <nlohmann/json.hpp>

#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <system_error>

namespace fs = std::filesystem;
using json = nlohmann::json;

namespace {

struct CliOptions {
  std::optional<fs::path> root;
  bool verbose = false;
  bool as_json = false;
  std::string branch;
  std::string base;
  std::string reviewer;
  std::string decision = "approve";
  std::string notes;
};

int exit_code_for(const revgate::ReviewResult& result) {
  if (result.ok) return 0;
  return result.error == revgate::ReviewError::ToolFailure ? 2 : 1;
}

int report(const revgate::ReviewResult& result, std::ostream& out, std::ostream& err) {
  if (!result.tool_output.empty()) {
    (result.ok ? out : err) << result.tool_output;
    if (result.tool_output.back() != '\n') (result.ok ? out : err) << "\n";
  }
  if (result.ok) {
    out << result.message << "\n";
  } else {
    err << "error: " << result.message << "\n";
  }
  return exit_code_for(result);
}

void print_status(const revgate::ReviewResult& result,
                  const revgate::PacketSummary& summary,
                  const std::optional<revgate::AuditRecord>& last_action,
                  bool as_json,
                  std::ostream& out) {
  if (as_json) {
    json j;
    j["packet"] = result.packet_path.generic_string();
    j["branch"] = summary.branch;
    j["base"] = summary.base;
    j["compare"] = summary.compare;
    j["created"] = summary.created;
    j["approved"] = summary.approved;
    j["reviewer"] = summary.reviewer;
    j["timestamp"] = summary.timestamp;
    j["notes"] = summary.notes;
    j["gate_open"] = summary.gate_open;
    if (last_action.has_value()) {
      j["last_action"] = {{"time", last_action->time},
                          {"action_type", last_action->action_type},
                          {"result", last_action->result},
                          {"message", last_action->message}};
    } else {
      j["last_action"] = nullptr;
    }
    out << j.dump(2, ' ', false, json::error_handler_t::replace) << "\n";
    return;
  }
  out << "Packet:   " << result.packet_path.string() << "\n"
      << "Branch:   " << summary.branch << "\n"
      << "Base:     " << summary.base << "\n"
      << "Compare:  " << summary.compare << "\n"
      << "Created:  " << summary.created << "\n"
      << "Approved: " << (summary.approved ? "yes" : "no") << "\n"
      << "Reviewer: " << summary.reviewer << "\n"
      << "Updated:  " << summary.timestamp << "\n"
      << "Notes:    " << summary.notes << "\n"
      << "Gate:     " << (summary.gate_open ? "open" : "closed") << "\n";
  if (last_action.has_value()) {
    out << "Last:     " << last_action->action_type << " " << last_action->result << " at "
        << last_action->time << "\n";
  }
}

} // namespace

bool parse_decision(const std::string& text, bool& approved) {
  if (text == "approve") {
    approved = true;
    return true;
  }
  if (text == "reject") {
    approved = false;
    return true;
  }
  return false;
}

void print_usage(std::ostream& out) {
  out << "Usage:\n"
      << "  revgate create-review [--branch <task-branch>] [--base <base-branch>]\n"
      << "  revgate set-approval [--branch <task-branch>] --reviewer <name> [--decision approve|reject] [--notes <text>]\n"
      << "  revgate merge-if-approved [--branch <task-branch>] [--into <base-branch>]\n"
      << "  revgate review-status [--branch <task-branch>] [--json]\n"
      << "Global options: [--root <repo-dir>] [--verbose]\n";
}

int run_cli(const std::vector<std::string>& args,
            revgate::IVcs* vcs,
            std::ostream& out,
            std::ostream& err) {
  revgate::log::set_console_echo(false);
  if (args.empty()) {
    print_usage(err);
    return 1;
  }

  const std::string command = args[0];
  if (command == "--help" || command == "-h" || command == "help") {
    print_usage(out);
    return 0;
  }
  if (command != "create-review" && command != "set-approval" &&
      command != "merge-if-approved" && command != "review-status") {
    err << "unknown command: " << command << "\n";
    print_usage(err);
    return 1;
  }

  CliOptions opts;
  const size_t argc = args.size();
  for (size_t i = 1; i < argc; ++i) {
    const std::string& arg = args[i];
    const bool has_value = i + 1 < argc;
    if (arg == "--branch" && has_value) {
      opts.branch = args[++i];
    } else if (arg == "--root" && has_value) {
      opts.root = fs::path(args[++i]);
    } else if (arg == "--verbose") {
      opts.verbose = true;
    } else if (arg == "--base" && has_value && command == "create-review") {
      opts.base = args[++i];
    } else if (arg == "--into" && has_value && command == "merge-if-approved") {
      opts.base = args[++i];
    } else if (arg == "--reviewer" && has_value && command == "set-approval") {
      opts.reviewer = args[++i];
    } else if (arg == "--decision" && has_value && command == "set-approval") {
      opts.decision = args[++i];
    } else if (arg == "--notes" && has_value && command == "set-approval") {
      opts.notes = args[++i];
    } else if (arg == "--json" && command == "review-status") {
      opts.as_json = true;
    } else {
      err << "unrecognized or incomplete option: " << arg << "\n";
      print_usage(err);
      return 1;
    }
  }

  bool approved = true;
  if (command == "set-approval") {
    if (opts.reviewer.empty()) {
      err << "--reviewer <name> is required\n";
      print_usage(err);
      return 1;
    }
    if (!parse_decision(opts.decision, approved)) {
      err << "--decision must be approve or reject (got '" << opts.decision << "')\n";
      print_usage(err);
      return 1;
    }
  }

  std::error_code ec;
  fs::path start_dir = fs::current_path(ec);
  if (ec) {
    err << "error: cannot determine working directory: " << ec.message() << "\n";
    return 1;
  }
  const auto paths = revgate::resolve_paths(opts.root, start_dir);
  revgate::log::set_console_echo(opts.verbose);
  revgate::log::init("revgate", paths.logs_dir);
  revgate::log::info("command: " + command + " root: " + paths.root.string());

  const revgate::ReviewConfig cfg = revgate::load_review_config(paths.config_file);
  const fs::path reviews_dir =
      cfg.reviews_dir.is_absolute() ? cfg.reviews_dir : paths.root / cfg.reviews_dir;

  std::unique_ptr<revgate::GitVcs> git;
  if (!vcs) {
    git = std::make_unique<revgate::GitVcs>(paths.root, cfg.git_executable);
    vcs = git.get();
  }

  revgate::ReviewContext ctx{revgate::PacketStore(reviews_dir, cfg.packet_extension), vcs};
  ctx.gate_scope = cfg.gate_scope;
  if (cfg.audit_log) {
    ctx.audit_log = paths.audit_log;
  }

  if (command == "create-review") {
    revgate::CreateReviewRequest req;
    req.branch = opts.branch;
    req.base = opts.base;
    return report(revgate::create_review(ctx, req), out, err);
  }

  if (command == "set-approval") {
    revgate::SetApprovalRequest req;
    req.branch = opts.branch;
    req.reviewer = opts.reviewer;
    req.approved = approved;
    req.notes = opts.notes;
    return report(revgate::set_approval(ctx, req), out, err);
  }

  if (command == "merge-if-approved") {
    revgate::MergeRequest req;
    req.branch = opts.branch;
    req.base = opts.base;
    return report(revgate::merge_if_approved(ctx, req), out, err);
  }

  revgate::PacketSummary summary;
  const auto result = revgate::review_status(ctx, opts.branch, summary);
  if (!result.ok) {
    return report(result, out, err);
  }
  const auto last_action = revgate::last_audit_record(ctx.audit_log, result.branch);
  print_status(result, summary, last_action, opts.as_json, out);
  return 0;
}
