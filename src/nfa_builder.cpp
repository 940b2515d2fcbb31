#include "nfa_builder.hpp"

#include <fmt/core.h>

namespace iregex {

namespace { // static linkage

struct fragment
{
    state_id entry;
    std::vector<state_id> exits;
};

struct build_state
{
    ir::graph& g;
    options const& opts;

    auto new_state() -> state_id
    {
        if (g.num_states() >= opts.state_limit) {
            throw_state_limit("NFA builder", opts.state_limit);
        }
        return g.add_state();
    }

    void connect(std::vector<state_id> const& exits, state_id entry)
    {
        for (state_id e : exits) {
            g.add_epsilon(e, entry);
        }
    }

    auto visit_ast(ast::node const& node) -> fragment
    {
        return std::visit(
            [this](auto&& node) -> fragment {
                using T = std::decay_t<decltype(node)>;
                if constexpr (std::is_same_v<T, ast::node_empty>) {
                    state_id q = new_state();
                    return {q, {q}};
                } else if constexpr (std::is_same_v<T, ast::node_symbol>) {
                    return visit_class({{node.symbol, node.symbol}});
                } else if constexpr (std::is_same_v<T, ast::node_class>) {
                    return visit_class(node.ranges);
                } else if constexpr (std::is_same_v<T, ast::node_concat>) {
                    auto a = visit_ast(node.lhs);
                    auto b = visit_ast(node.rhs);
                    connect(a.exits, b.entry);
                    return {a.entry, std::move(b.exits)};
                } else if constexpr (std::is_same_v<T, ast::node_union>) {
                    state_id entry = new_state();
                    auto a = visit_ast(node.lhs);
                    auto b = visit_ast(node.rhs);
                    g.add_epsilon(entry, a.entry);
                    g.add_epsilon(entry, b.entry);
                    auto exits = std::move(a.exits);
                    exits.insert(exits.end(), b.exits.begin(), b.exits.end());
                    return {entry, std::move(exits)};
                } else if constexpr (std::is_same_v<T, ast::node_repeat>) {
                    return visit_repeat(node);
                } else if constexpr (std::is_same_v<T, ast::node_group>) {
                    // captures are not represented in the automaton
                    return visit_ast(node.arg);
                } else {
                    static_assert(std::is_same_v<T, void>, "not implemented");
                }
            },
            node.get());
    }

    auto visit_class(std::vector<symbol_range> const& ranges) -> fragment
    {
        for (auto&& r : ranges) {
            if (r.min > r.max || r.max > IREGEX_SYMBOL_MAX) {
                throw_invalid_range(r.min, r.max);
            }
        }
        state_id entry = new_state();
        state_id exit = new_state();
        for (auto&& r : ranges) {
            g.add_transition(entry, r, exit);
        }
        return {entry, {exit}};
    }

    auto visit_repeat(ast::node_repeat const& node) -> fragment
    {
        if (node.min < 0 || (node.max && (*node.max < 0 || node.min > *node.max))) {
            throw_invalid_repetition(node.min, node.max.value_or(-1));
        }

        auto result = fragment{ir::NO_STATE, {}};
        if (node.min == 0) {
            // matches the empty sequence; copies are appended after it
            state_id q = new_state();
            result = {q, {q}};
        }

        // mandatory copies
        for (int i = 0; i < node.min; ++i) {
            auto copy = visit_ast(node.arg);
            if (i == 0) {
                result = std::move(copy);
            } else {
                connect(result.exits, copy.entry);
                result.exits = std::move(copy.exits);
            }
        }

        if (!node.max) {
            // one trailing copy looping back to its own entry
            auto copy = visit_ast(node.arg);
            connect(result.exits, copy.entry);
            connect(copy.exits, copy.entry);
            result.exits.insert(result.exits.end(), copy.exits.begin(), copy.exits.end());
            return result;
        }

        // optional copies; skipping one skips every later one as well
        auto pending = result.exits;
        for (int i = node.min; i < *node.max; ++i) {
            auto copy = visit_ast(node.arg);
            connect(pending, copy.entry);
            pending = copy.exits;
            result.exits.insert(result.exits.end(), copy.exits.begin(), copy.exits.end());
        }
        return result;
    }
};

} // namespace

auto build_nfa(ast::node const& node, options const& opts, int accept_label) -> ir::graph
{
    auto result = ir::graph{};
    auto state = build_state{result, opts};

    auto frag = state.visit_ast(node);
    result.set_start(frag.entry);
    for (state_id q : frag.exits) {
        result.set_accept(q, accept_label);
    }

    if (opts.verbose) {
        fmt::print("NFA: {} states, {} transitions\n", result.num_states(), result.num_transitions());
    }

    return result;
}

} // namespace iregex
