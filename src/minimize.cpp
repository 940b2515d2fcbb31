#include "minimize.hpp"
#include "determinize.hpp"

#include <algorithm>
#include <map>
#include <queue>

#include <fmt/core.h>

namespace iregex {

namespace { // static linkage

using block_edges = std::vector<std::pair<symbol_range, int>>;

// edges of `q` over blocks, with touching ranges into the same block joined
auto block_signature(ir::graph const& dfa,
                     state_id q,
                     std::vector<int> const& block_of) -> block_edges
{
    block_edges result;
    for (auto&& tr : dfa.transitions(q)) {
        int target = block_of[tr.target];
        if (target < 0) {
            continue; // dead or unreachable
        }
        auto range = *tr.label;
        if (!result.empty() && result.back().second == target
            && std::uint64_t(result.back().first.max) + 1 == range.min) {
            result.back().first.max = range.max;
        } else {
            result.push_back({range, target});
        }
    }
    return result;
}

auto empty_language() -> ir::graph
{
    ir::graph result;
    result.set_start(result.add_state());
    return result;
}

} // namespace

auto minimize(ir::graph const& dfa, options const& opts) -> ir::graph
{
    if (dfa.has_epsilon() || !dfa.is_deterministic()) {
        return minimize(determinize(dfa, opts), opts);
    }
    if (dfa.num_states() > opts.state_limit) {
        throw_state_limit("Minimizer", opts.state_limit);
    }
    if (dfa.num_states() == 0) {
        return ir::graph{};
    }
    if (dfa.start() == ir::NO_STATE) {
        return empty_language();
    }

    // remove unreachable and dead states
    auto reachable = dfa.reachable_states();
    auto productive = dfa.productive_states();
    if (!productive[dfa.start()]) {
        return empty_language();
    }
    std::vector<state_id> live;
    for (int q = 0; q < dfa.num_states(); ++q) {
        if (reachable[q] && productive[q]) {
            live.push_back(q);
        }
    }

    // initial partition by accept label; -1 marks removed states
    std::vector<int> block_of(dfa.num_states(), -1);
    int num_blocks = 0;
    {
        std::map<std::optional<int>, int> initial;
        for (state_id q : live) {
            auto [it, inserted] = initial.emplace(dfa.accept_label(q), num_blocks);
            if (inserted) {
                ++num_blocks;
            }
            block_of[q] = it->second;
        }
    }

    // refine until no block splits
    while (true) {
        using state_key = std::pair<int, block_edges>;
        std::map<state_key, int> unique_blocks;
        std::vector<int> next_block_of(dfa.num_states(), -1);
        for (state_id q : live) {
            auto key = state_key{block_of[q], block_signature(dfa, q, block_of)};
            auto [it, inserted] = unique_blocks.emplace(std::move(key),
                                                        static_cast<int>(unique_blocks.size()));
            next_block_of[q] = it->second;
        }

        block_of = std::move(next_block_of);
        if (static_cast<int>(unique_blocks.size()) == num_blocks) {
            break;
        }
        num_blocks = static_cast<int>(unique_blocks.size());
    }

    std::vector<state_id> representative(num_blocks, ir::NO_STATE);
    for (state_id q : live) {
        if (representative[block_of[q]] == ir::NO_STATE) {
            representative[block_of[q]] = q;
        }
    }

    // number the blocks breadth-first from the start block
    ir::graph result;
    std::vector<state_id> new_id(num_blocks, ir::NO_STATE);
    std::vector<int> order;
    std::queue<int> pending;

    auto visit = [&](int block) {
        if (new_id[block] == ir::NO_STATE) {
            new_id[block] = result.add_state();
            order.push_back(block);
            pending.push(block);
        }
    };

    visit(block_of[dfa.start()]);
    while (!pending.empty()) {
        int block = pending.front();
        pending.pop();
        for (auto&& [range, target] : block_signature(dfa, representative[block], block_of)) {
            visit(target);
        }
    }

    result.set_start(new_id[block_of[dfa.start()]]);
    for (int block : order) {
        state_id q = representative[block];
        if (auto label = dfa.accept_label(q)) {
            result.set_accept(new_id[block], *label);
        }
        for (auto&& [range, target] : block_signature(dfa, q, block_of)) {
            result.add_transition(new_id[block], range, new_id[target]);
        }
    }

    if (opts.verbose) {
        fmt::print("Minimized DFA: {} states, {} transitions (from {} states)\n",
                   result.num_states(),
                   result.num_transitions(),
                   dfa.num_states());
    }

    return result;
}

} // namespace iregex
