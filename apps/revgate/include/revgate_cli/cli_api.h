#pragma once

#include "revgate/vcs.h"

#include <ostream>
#include <string>
#include <vector>

// approve -> true, reject -> false; anything else is rejected.
bool parse_decision(const std::string& text, bool& approved);

void print_usage(std::ostream& out);

// args excludes argv[0]. A null vcs means git in the resolved repository root.
int run_cli(const std::vector<std::string>& args,
            revgate::IVcs* vcs,
            std::ostream& out,
            std::ostream& err);
