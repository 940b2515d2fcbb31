#ifndef OPERATIONS_HPP
#define OPERATIONS_HPP

#include "error.hpp"
#include "ir_graph.hpp"
#include "regex_ast.hpp"

#include <vector>

namespace iregex {

// NFA union; accept labels of both operands are kept.
auto union_of(ir::graph const& a, ir::graph const& b, options const& opts = {}) -> ir::graph;

// Multi-pattern union: graph i accepts with label i.
auto union_all(std::vector<ir::graph> const& graphs, options const& opts = {}) -> ir::graph;

// Product construction over the determinized operands. Accepting states take
// the label of `a`.
auto intersection(ir::graph const& a, ir::graph const& b, options const& opts = {}) -> ir::graph;

// Accepts every sequence over `domain` that `a` rejects.
auto complement(ir::graph const& a,
                std::vector<symbol_range> const& domain = alphabet::any_char(),
                options const& opts = {}) -> ir::graph;

auto difference(ir::graph const& a, ir::graph const& b, options const& opts = {}) -> ir::graph;

// Language equality, decided on the minimal automata.
auto equivalent(ir::graph const& a, ir::graph const& b, options const& opts = {}) -> bool;

// build -> determinize -> minimize
auto compile(ast::node const& node, options const& opts = {}) -> ir::graph;

} // namespace iregex

#endif // OPERATIONS_HPP
