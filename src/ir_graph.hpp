#ifndef IR_GRAPH_HPP
#define IR_GRAPH_HPP

#include "alphabet.hpp"

#include <optional>
#include <set>
#include <span>
#include <string>
#include <string_view>
#include <tuple>
#include <vector>

namespace iregex {
namespace ir {

static constexpr state_id NO_STATE = -1;

struct transition
{
    // nullopt is an epsilon transition
    std::optional<symbol_range> label;
    state_id target;

    auto is_epsilon() const -> bool { return !label.has_value(); }

    bool operator<(const transition& other) const
    {
        return std::make_tuple(label, target) < std::make_tuple(other.label, other.target);
    }
    bool operator==(const transition& other) const = default;
};

struct state
{
    // accepting iff set; the value tags which pattern is accepted
    std::optional<int> accept;
    std::vector<transition> edges;

    bool operator==(const state& other) const = default;
};

// Arena of states addressed by index. Used for both the NFA and the DFA form;
// in DFA form no state has epsilon edges and outgoing ranges are disjoint.
// Outgoing edges are kept sorted by label whatever order they are added in.
class graph
{
    std::vector<state> states;
    state_id start_state = NO_STATE;

    void check_state(state_id q) const;

public:
    auto add_state() -> state_id;
    void add_transition(state_id source, symbol_range label, state_id target);
    void add_epsilon(state_id source, state_id target);
    void set_start(state_id q);
    void set_accept(state_id q, int label = 0);

    auto start() const -> state_id { return start_state; }
    auto num_states() const -> int { return static_cast<int>(states.size()); }
    auto num_transitions() const -> int;

    auto is_accepting(state_id q) const -> bool { return states.at(q).accept.has_value(); }
    auto accept_label(state_id q) const -> std::optional<int> { return states.at(q).accept; }
    auto accepting_states() const -> std::set<state_id>;
    auto transitions(state_id q) const -> std::span<const transition>
    {
        return states.at(q).edges;
    }

    auto epsilon_closure(std::set<state_id> qs) const -> std::set<state_id>;
    auto step(std::set<state_id> const& qs, symbol_t symbol) const -> std::set<state_id>;
    auto reachable_states() const -> std::vector<bool>;
    auto productive_states() const -> std::vector<bool>;

    auto has_epsilon() const -> bool;
    auto is_deterministic() const -> bool;

    // Binary search over the edge list, which is kept sorted by label. Only
    // meaningful in DFA form; NO_STATE when no transition covers the symbol.
    auto next_state(state_id q, symbol_t symbol) const -> state_id;

    auto match(std::u32string_view input) const -> bool;
    auto match_utf8(std::string_view input) const -> bool;
    auto matching_label(std::u32string_view input) const -> std::optional<int>;

    auto recognizes_empty() const -> bool;
    auto is_empty_language() const -> bool;
    auto to_singleton() const -> std::optional<std::u32string>;

    // structural equality: same numbering, labels and edge lists
    bool operator==(const graph& other) const = default;
};

auto print_graph(graph const& g) -> std::string;

} // namespace ir
} // namespace iregex

#endif // IR_GRAPH_HPP
