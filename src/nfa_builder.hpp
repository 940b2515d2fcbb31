#ifndef NFA_BUILDER_HPP
#define NFA_BUILDER_HPP

#include "error.hpp"
#include "ir_graph.hpp"
#include "regex_ast.hpp"

namespace iregex {

// Thompson construction. The result has a single start state; the exit states
// of the whole expression are marked accepting with `accept_label`.
auto build_nfa(ast::node const& node, options const& opts = {}, int accept_label = 0)
    -> ir::graph;

} // namespace iregex

#endif // NFA_BUILDER_HPP
