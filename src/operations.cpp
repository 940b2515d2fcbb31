#include "operations.hpp"
#include "determinize.hpp"
#include "minimize.hpp"
#include "nfa_builder.hpp"

#include <algorithm>
#include <map>

#include <fmt/core.h>

namespace iregex {

namespace { // static linkage

// Copies the states of `g` into `result`; returns the id offset.
auto append(ir::graph& result,
            ir::graph const& g,
            std::optional<int> relabel,
            options const& opts) -> state_id
{
    if (result.num_states() + g.num_states() > opts.state_limit) {
        throw_state_limit("Union", opts.state_limit);
    }

    state_id const offset = result.num_states();
    for (int q = 0; q < g.num_states(); ++q) {
        state_id r = result.add_state();
        if (auto label = g.accept_label(q)) {
            result.set_accept(r, relabel.value_or(*label));
        }
    }
    for (int q = 0; q < g.num_states(); ++q) {
        for (auto&& tr : g.transitions(q)) {
            if (tr.label) {
                result.add_transition(q + offset, *tr.label, tr.target + offset);
            } else {
                result.add_epsilon(q + offset, tr.target + offset);
            }
        }
    }
    return offset;
}

auto as_dfa(ir::graph const& g, options const& opts) -> ir::graph
{
    if (g.has_epsilon() || !g.is_deterministic()) {
        return determinize(g, opts);
    }
    return g;
}

} // namespace

auto union_of(ir::graph const& a, ir::graph const& b, options const& opts) -> ir::graph
{
    ir::graph result;
    state_id start = result.add_state();
    result.set_start(start);

    for (auto const* g : {&a, &b}) {
        if (g->start() == ir::NO_STATE) {
            continue;
        }
        state_id offset = append(result, *g, std::nullopt, opts);
        result.add_epsilon(start, g->start() + offset);
    }
    return result;
}

auto union_all(std::vector<ir::graph> const& graphs, options const& opts) -> ir::graph
{
    ir::graph result;
    state_id start = result.add_state();
    result.set_start(start);

    for (int i = 0; i < static_cast<int>(graphs.size()); ++i) {
        auto const& g = graphs[i];
        if (g.start() == ir::NO_STATE) {
            continue;
        }
        state_id offset = append(result, g, i, opts);
        result.add_epsilon(start, g.start() + offset);
    }

    if (opts.verbose) {
        fmt::print("Union of {} patterns: {} states\n", graphs.size(), result.num_states());
    }

    return result;
}

auto intersection(ir::graph const& a, ir::graph const& b, options const& opts) -> ir::graph
{
    auto const da = as_dfa(a, opts);
    auto const db = as_dfa(b, opts);

    ir::graph result;
    if (da.start() == ir::NO_STATE || db.start() == ir::NO_STATE) {
        result.set_start(result.add_state());
        return result;
    }

    using state_pair = std::pair<state_id, state_id>;
    std::vector<state_pair> states;
    std::map<state_pair, state_id> seen_states;

    auto add_pair = [&](state_pair p) -> state_id {
        auto it = seen_states.find(p);
        if (it != seen_states.end()) {
            return it->second;
        }
        if (result.num_states() >= opts.state_limit) {
            throw_state_limit("Intersection", opts.state_limit);
        }
        state_id q = result.add_state();
        auto la = da.accept_label(p.first);
        if (la && db.is_accepting(p.second)) {
            result.set_accept(q, *la);
        }
        seen_states.emplace(p, q);
        states.push_back(p);
        return q;
    };

    result.set_start(add_pair({da.start(), db.start()}));

    for (std::size_t s = 0; s < states.size(); ++s) {
        auto [qa, qb] = states[s];
        auto ea = da.transitions(qa);
        auto eb = db.transitions(qb);

        // both edge lists are sorted and disjoint
        auto it1 = ea.begin();
        auto it2 = eb.begin();
        while (it1 != ea.end() && it2 != eb.end()) {
            auto omin = std::max(it1->label->min, it2->label->min);
            auto omax = std::min(it1->label->max, it2->label->max);
            if (omin <= omax) {
                state_id target = add_pair({it1->target, it2->target});
                result.add_transition(static_cast<state_id>(s), {omin, omax}, target);
            }
            if (it1->label->max < it2->label->max) {
                ++it1;
            } else {
                ++it2;
            }
        }
    }

    return result;
}

auto complement(ir::graph const& a, std::vector<symbol_range> const& domain, options const& opts)
    -> ir::graph
{
    auto const d = as_dfa(a, opts);
    auto const dom = alphabet::merge_adjacent(domain);

    ir::graph result;
    if (d.num_states() + 1 > opts.state_limit) {
        throw_state_limit("Complement", opts.state_limit);
    }
    for (int q = 0; q < d.num_states(); ++q) {
        state_id r = result.add_state();
        if (!d.is_accepting(q)) {
            result.set_accept(r, 0);
        }
    }
    state_id sink = result.add_state();
    result.set_accept(sink, 0);

    if (d.start() == ir::NO_STATE) {
        result.set_start(sink);
    } else {
        result.set_start(d.start());
    }

    for (int q = 0; q < d.num_states(); ++q) {
        std::vector<symbol_range> covered;
        for (auto&& tr : d.transitions(q)) {
            for (auto&& piece : alphabet::intersect({*tr.label}, dom)) {
                result.add_transition(q, piece, tr.target);
                covered.push_back(piece);
            }
        }
        for (auto&& gap : alphabet::complement(alphabet::merge_adjacent(covered), dom)) {
            result.add_transition(q, gap, sink);
        }
    }
    for (auto&& r : dom) {
        result.add_transition(sink, r, sink);
    }
    return result;
}

auto difference(ir::graph const& a, ir::graph const& b, options const& opts) -> ir::graph
{
    // b is complemented over every symbol, so words of a outside any_char() survive
    return intersection(a, complement(b, {{0, IREGEX_SYMBOL_MAX}}, opts), opts);
}

auto equivalent(ir::graph const& a, ir::graph const& b, options const& opts) -> bool
{
    // a graph without states recognizes nothing, like the one-state empty language
    auto canonical = [&](ir::graph const& g) {
        auto m = minimize(g, opts);
        if (m.num_states() == 0) {
            m.set_start(m.add_state());
        }
        return m;
    };
    return canonical(a) == canonical(b);
}

auto compile(ast::node const& node, options const& opts) -> ir::graph
{
    if (opts.verbose) {
        fmt::print("AST: {}\n", print_ast(node));
    }

    auto nfa = build_nfa(node, opts);
    auto dfa = determinize(nfa, opts);
    return minimize(dfa, opts);
}

} // namespace iregex
