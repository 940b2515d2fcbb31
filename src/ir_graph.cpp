#include "ir_graph.hpp"
#include "error.hpp"

#include <algorithm>
#include <queue>
#include <stdexcept>

#include <fmt/core.h>
#include <fmt/ranges.h>
#include <utf8.h>

namespace iregex::ir {

namespace { // static linkage

// keeps each edge list ordered by label, epsilon edges first
void insert_edge(std::vector<transition>& edges, transition tr)
{
    edges.insert(std::upper_bound(edges.begin(), edges.end(), tr), tr);
}

} // namespace

auto graph::add_state() -> state_id
{
    states.emplace_back();
    return static_cast<state_id>(states.size() - 1);
}

void graph::check_state(state_id q) const
{
    if (q < 0 || q >= num_states()) {
        throw std::out_of_range(fmt::format("State {} is not in the graph.", q));
    }
}

void graph::add_transition(state_id source, symbol_range label, state_id target)
{
    if (label.min > label.max) {
        throw_invalid_range(label.min, label.max);
    }
    check_state(source);
    check_state(target);
    insert_edge(states[source].edges, {label, target});
}

void graph::add_epsilon(state_id source, state_id target)
{
    check_state(source);
    check_state(target);
    insert_edge(states[source].edges, {std::nullopt, target});
}

void graph::set_start(state_id q)
{
    check_state(q);
    start_state = q;
}

void graph::set_accept(state_id q, int label)
{
    states.at(q).accept = label;
}

auto graph::num_transitions() const -> int
{
    int count = 0;
    for (auto&& s : states) {
        count += static_cast<int>(s.edges.size());
    }
    return count;
}

auto graph::accepting_states() const -> std::set<state_id>
{
    std::set<state_id> result;
    for (int q = 0; q < num_states(); ++q) {
        if (states[q].accept) {
            result.insert(q);
        }
    }
    return result;
}

auto graph::epsilon_closure(std::set<state_id> qs) const -> std::set<state_id>
{
    std::vector<state_id> stack(qs.begin(), qs.end());
    while (!stack.empty()) {
        auto q = stack.back();
        stack.pop_back();
        for (auto&& tr : states.at(q).edges) {
            if (tr.is_epsilon() && qs.insert(tr.target).second) {
                stack.push_back(tr.target);
            }
        }
    }
    return qs;
}

auto graph::step(std::set<state_id> const& qs, symbol_t symbol) const -> std::set<state_id>
{
    std::set<state_id> next;
    for (state_id q : qs) {
        for (auto&& tr : states.at(q).edges) {
            if (tr.label && tr.label->contains(symbol)) {
                next.insert(tr.target);
            }
        }
    }
    return epsilon_closure(std::move(next));
}

auto graph::reachable_states() const -> std::vector<bool>
{
    std::vector<bool> visited(states.size(), false);
    if (start_state == NO_STATE) {
        return visited;
    }

    std::queue<state_id> pending;
    pending.push(start_state);
    visited[start_state] = true;
    while (!pending.empty()) {
        auto q = pending.front();
        pending.pop();
        for (auto&& tr : states[q].edges) {
            if (!visited[tr.target]) {
                visited[tr.target] = true;
                pending.push(tr.target);
            }
        }
    }
    return visited;
}

auto graph::productive_states() const -> std::vector<bool>
{
    // reverse edges
    std::vector<std::vector<state_id>> precursors(states.size());
    for (int q = 0; q < num_states(); ++q) {
        for (auto&& tr : states[q].edges) {
            precursors[tr.target].push_back(q);
        }
    }

    std::vector<bool> productive(states.size(), false);
    std::queue<state_id> pending;
    for (int q = 0; q < num_states(); ++q) {
        if (states[q].accept) {
            productive[q] = true;
            pending.push(q);
        }
    }
    while (!pending.empty()) {
        auto q = pending.front();
        pending.pop();
        for (state_id p : precursors[q]) {
            if (!productive[p]) {
                productive[p] = true;
                pending.push(p);
            }
        }
    }
    return productive;
}

auto graph::has_epsilon() const -> bool
{
    for (auto&& s : states) {
        for (auto&& tr : s.edges) {
            if (tr.is_epsilon()) {
                return true;
            }
        }
    }
    return false;
}

auto graph::is_deterministic() const -> bool
{
    for (auto&& s : states) {
        std::vector<symbol_range> ranges;
        for (auto&& tr : s.edges) {
            if (tr.is_epsilon()) {
                return false;
            }
            ranges.push_back(*tr.label);
        }
        std::sort(ranges.begin(), ranges.end());
        for (std::size_t i = 1; i < ranges.size(); ++i) {
            if (ranges[i].min <= ranges[i - 1].max) {
                return false;
            }
        }
    }
    return true;
}

auto graph::next_state(state_id q, symbol_t symbol) const -> state_id
{
    // binary search for range containing symbol
    auto const& e_list = states.at(q).edges;
    auto ubound = std::upper_bound(e_list.begin(),
                                   e_list.end(),
                                   symbol,
                                   [](symbol_t s, transition const& tr) {
                                       return s < tr.label->min;
                                   });
    if (ubound != e_list.begin()) {
        --ubound;
        if (ubound->label->contains(symbol)) {
            return ubound->target;
        }
    }

    return NO_STATE;
}

auto graph::matching_label(std::u32string_view input) const -> std::optional<int>
{
    if (start_state == NO_STATE) {
        return std::nullopt;
    }

    auto current = epsilon_closure({start_state});
    for (char32_t ch : input) {
        current = step(current, ch);
        if (current.empty()) {
            return std::nullopt;
        }
    }

    std::optional<int> result;
    for (state_id q : current) {
        auto label = states[q].accept;
        if (label && (!result || *label < *result)) {
            result = label;
        }
    }
    return result;
}

auto graph::match(std::u32string_view input) const -> bool
{
    return matching_label(input).has_value();
}

auto graph::match_utf8(std::string_view input) const -> bool
{
    auto decoded = utf8::utf8to32(input);
    return match(decoded);
}

auto graph::recognizes_empty() const -> bool
{
    return matching_label(U"").has_value();
}

auto graph::is_empty_language() const -> bool
{
    auto reachable = reachable_states();
    for (int q = 0; q < num_states(); ++q) {
        if (reachable[q] && states[q].accept) {
            return false;
        }
    }
    return true;
}

auto graph::to_singleton() const -> std::optional<std::u32string>
{
    if (start_state == NO_STATE) {
        return std::nullopt;
    }

    std::u32string result;
    std::vector<bool> visited(states.size(), false);
    state_id q = start_state;
    while (true) {
        if (visited[q]) {
            return std::nullopt;
        }
        visited[q] = true;

        auto const& edges = states[q].edges;
        if (edges.empty()) {
            break;
        }
        if (edges.size() > 1 || states[q].accept) {
            return std::nullopt;
        }
        auto const& tr = edges.front();
        if (tr.is_epsilon()) {
            q = tr.target;
            continue;
        }
        if (tr.label->min != tr.label->max) {
            return std::nullopt;
        }
        result.push_back(static_cast<char32_t>(tr.label->min));
        q = tr.target;
    }

    if (!states[q].accept) {
        return std::nullopt;
    }
    return result;
}

auto print_graph(graph const& g) -> std::string
{
    std::string out = fmt::format("start_state={}, accept_states=[{}], num_states={}\n",
                                  g.start(),
                                  fmt::join(g.accepting_states(), ", "),
                                  g.num_states());
    for (int q = 0; q < g.num_states(); ++q) {
        auto label = g.accept_label(q);
        if (label) {
            out += fmt::format("State {} (accept {})\n", q, *label);
        } else {
            out += fmt::format("State {}\n", q);
        }
        for (auto&& tr : g.transitions(q)) {
            out += fmt::format("  {} --> State {}\n",
                               tr.label ? to_string(*tr.label) : std::string("ε"),
                               tr.target);
        }
    }
    return out;
}

} // namespace iregex::ir
