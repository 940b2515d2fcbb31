#include "determinize.hpp"

#include <algorithm>
#include <map>
#include <optional>
#include <vector>

#include <boost/dynamic_bitset.hpp>
#include <fmt/core.h>

namespace iregex {

using state_set = boost::dynamic_bitset<>;
using subset = std::vector<state_id>; // sorted NFA state ids

namespace { // static linkage

struct labeled_edge
{
    symbol_range range;
    state_id target;
};

// epsilon closures, computed on first use
class closure_cache
{
    ir::graph const& nfa;
    std::vector<std::optional<subset>> table;

public:
    explicit closure_cache(ir::graph const& nfa)
        : nfa(nfa)
        , table(nfa.num_states())
    {}

    auto get(state_id q) -> subset const&
    {
        auto& entry = table[q];
        if (!entry) {
            auto closure = nfa.epsilon_closure({q});
            entry.emplace(closure.begin(), closure.end());
        }
        return *entry;
    }
};

auto accept_label_of(ir::graph const& nfa, subset const& set) -> std::optional<int>
{
    std::optional<int> result;
    for (state_id q : set) {
        auto label = nfa.accept_label(q);
        if (label && (!result || *label < *result)) {
            result = label;
        }
    }
    return result;
}

} // namespace

auto determinize(ir::graph const& nfa, options const& opts) -> ir::graph
{
    ir::graph result;

    if (nfa.num_states() == 0) {
        return result;
    }
    if (nfa.start() == ir::NO_STATE) {
        result.set_start(result.add_state());
        return result;
    }

    auto closure = closure_cache(nfa);

    // map nodes are stable, so `states` can point at the keys
    std::map<subset, state_id> seen_states;
    std::vector<subset const*> states;

    auto add_subset = [&](subset members) -> state_id {
        auto it = seen_states.find(members);
        if (it != seen_states.end()) {
            return it->second;
        }
        if (result.num_states() >= opts.state_limit) {
            throw_state_limit("Determinizer", opts.state_limit);
        }
        state_id new_state_id = result.add_state();
        if (auto label = accept_label_of(nfa, members)) {
            result.set_accept(new_state_id, *label);
        }
        auto inserted = seen_states.emplace(std::move(members), new_state_id).first;
        states.push_back(&inserted->first);
        return new_state_id;
    };

    result.set_start(add_subset(closure.get(nfa.start())));

    // scratch set for deduplicating the members of one target subset
    auto marked = state_set(nfa.num_states());

    // states discovered while processing are appended and visited in turn
    for (std::size_t s = 0; s < states.size(); ++s) {
        std::vector<labeled_edge> edges;
        std::vector<symbol_range> ranges;
        for (state_id q : *states[s]) {
            for (auto&& tr : nfa.transitions(q)) {
                if (tr.label) {
                    edges.push_back({*tr.label, tr.target});
                    ranges.push_back(*tr.label);
                }
            }
        }

        for (auto&& piece : alphabet::partition(ranges)) {
            subset target;
            for (auto&& e : edges) {
                // a piece lies either entirely inside or entirely outside each range
                if (!e.range.contains(piece.min)) {
                    continue;
                }
                for (state_id r : closure.get(e.target)) {
                    if (!marked.test(r)) {
                        marked.set(r);
                        target.push_back(r);
                    }
                }
            }
            for (state_id r : target) {
                marked.reset(r);
            }
            std::sort(target.begin(), target.end());

            state_id target_id = add_subset(std::move(target));
            result.add_transition(static_cast<state_id>(s), piece, target_id);
        }
    }

    if (opts.verbose) {
        fmt::print("DFA: {} states, {} transitions (from {} NFA states)\n",
                   result.num_states(),
                   result.num_transitions(),
                   nfa.num_states());
    }

    return result;
}

} // namespace iregex
