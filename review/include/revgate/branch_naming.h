#pragma once

#include <optional>
#include <string>
#include <string_view>

namespace revgate {

// task/<name>/... -> feat/<name>. Any other shape, including an empty <name>,
// yields no base. Older tooling inferred the invalid ref "feat/" there; this
// reports NoBase instead.
std::optional<std::string> infer_base_branch(std::string_view branch);

std::string make_compare_range(std::string_view base, std::string_view branch);

// Every path separator becomes "__". Nothing else is escaped, so distinct
// branch names can collide (task/a__b and task/a/b).
std::string sanitize_branch_name(std::string_view branch);

} // namespace revgate
