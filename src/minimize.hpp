#ifndef MINIMIZE_HPP
#define MINIMIZE_HPP

#include "error.hpp"
#include "ir_graph.hpp"

namespace iregex {

// Minimal DFA for the language of `dfa` (an NFA is determinized first).
// Unreachable and dead states are dropped, touching ranges that lead to the
// same state are joined, and states are numbered breadth-first from the start
// following edges in range order. Equivalent automata therefore produce
// identical graphs. The empty language yields a single non-accepting state.
auto minimize(ir::graph const& dfa, options const& opts = {}) -> ir::graph;

} // namespace iregex

#endif // MINIMIZE_HPP
