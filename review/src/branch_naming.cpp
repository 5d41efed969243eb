#include "revgate/branch_naming.h"

namespace revgate {

namespace {
constexpr std::string_view kTaskPrefix = "task";
constexpr std::string_view kFeaturePrefix = "feat";
} // namespace

std::optional<std::string> infer_base_branch(std::string_view branch) {
  const size_t first_sep = branch.find('/');
  if (first_sep == std::string_view::npos || branch.substr(0, first_sep) != kTaskPrefix) {
    return std::nullopt;
  }
  const std::string_view rest = branch.substr(first_sep + 1);
  const std::string_view name = rest.substr(0, rest.find('/'));
  if (name.empty()) {
    return std::nullopt;
  }
  std::string base(kFeaturePrefix);
  base += '/';
  base += name;
  return base;
}

std::string make_compare_range(std::string_view base, std::string_view branch) {
  std::string out(base);
  out += "..";
  out += branch;
  return out;
}

std::string sanitize_branch_name(std::string_view branch) {
  std::string out;
  out.reserve(branch.size());
  for (char c : branch) {
    if (c == '/' || c == '\\') {
      out += "__";
    } else {
      out += c;
    }
  }
  return out;
}

} // namespace revgate
