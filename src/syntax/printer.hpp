#pragma once

#include "ast.hpp"

#include <string>

namespace gogrep {

// Renders a node on a single line, e.g. `if x { a; b }`.
std::string
print_node(const Node& node);

// Renders a run of list elements, joined with ", " or "; " depending on what
// the list holds.
std::string
print_sequence(NodeSpan nodes, SeqClass seq_class);

}  // namespace gogrep
