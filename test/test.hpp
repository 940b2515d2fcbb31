#ifndef TEST_HPP
#define TEST_HPP

#include "determinize.hpp"
#include "minimize.hpp"
#include "nfa_builder.hpp"
#include "operations.hpp"

#include <cstdio>
#include <random>
#include <string>
#include <vector>

#include <fmt/core.h>

struct pipeline
{
    iregex::ir::graph nfa;
    iregex::ir::graph dfa;
    iregex::ir::graph min_dfa;
};

inline auto test_compile(iregex::ast::node const& node) -> pipeline
{
    fmt::print("AST: {}\n", iregex::print_ast(node));

    auto nfa = iregex::build_nfa(node);
    fmt::print("NFA: {}", iregex::ir::print_graph(nfa));

    auto dfa = iregex::determinize(nfa);
    fmt::print("DFA: {}", iregex::ir::print_graph(dfa));

    auto min_dfa = iregex::minimize(dfa);
    fmt::print("Minimized: {}\n", iregex::ir::print_graph(min_dfa));
    std::fflush(stdout);

    return {std::move(nfa), std::move(dfa), std::move(min_dfa)};
}

// Random sequences over `symbols`, lengths 0..max_len, including the empty one.
inline auto sample_sequences(std::u32string const& symbols, int count, int max_len, unsigned seed)
    -> std::vector<std::u32string>
{
    auto rng = std::mt19937{seed};
    auto len_dist = std::uniform_int_distribution<int>(0, max_len);
    auto sym_dist = std::uniform_int_distribution<std::size_t>(0, symbols.size() - 1);

    std::vector<std::u32string> result{U""};
    for (int i = 0; i < count; ++i) {
        std::u32string seq;
        int len = len_dist(rng);
        for (int j = 0; j < len; ++j) {
            seq.push_back(symbols[sym_dist(rng)]);
        }
        result.push_back(std::move(seq));
    }
    return result;
}

inline auto to_ascii(std::u32string const& seq) -> std::string
{
    return std::string(seq.begin(), seq.end());
}

#endif // TEST_HPP
