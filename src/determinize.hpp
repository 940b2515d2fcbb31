#ifndef DETERMINIZE_HPP
#define DETERMINIZE_HPP

#include "error.hpp"
#include "ir_graph.hpp"

namespace iregex {

// Subset construction. The input is left untouched; the output has no epsilon
// edges, pairwise disjoint outgoing ranges and edge lists sorted by range.
// DFA state 0 is the start state and states are numbered in discovery order.
auto determinize(ir::graph const& nfa, options const& opts = {}) -> ir::graph;

} // namespace iregex

#endif // DETERMINIZE_HPP
