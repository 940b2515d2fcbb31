#include "test.hpp"

#include <gmock/gmock.h>
#include <gtest/gtest.h>

namespace ast = iregex::ast;

static auto minimal(ast::node const& node) -> iregex::ir::graph
{
    return iregex::minimize(iregex::determinize(iregex::build_nfa(node)));
}

TEST(Minimize, SingleSymbol)
{
    auto p = test_compile(ast::symbol('a'));
    EXPECT_EQ(p.nfa.num_states(), 2);
    EXPECT_EQ(p.dfa.num_states(), 2);
    EXPECT_EQ(p.min_dfa.num_states(), 2);
    EXPECT_EQ(p.min_dfa.start(), 0);
    EXPECT_THAT(p.min_dfa.accepting_states(), ::testing::ElementsAre(1));
}

TEST(Minimize, IdenticalAlternativesCollapse)
{
    auto single = minimal(ast::symbol('a'));
    auto p = test_compile(ast::alt(ast::symbol('a'), ast::symbol('a')));

    EXPECT_EQ(p.min_dfa.num_states(), 2);
    EXPECT_TRUE(p.min_dfa == single) << iregex::ir::print_graph(p.min_dfa);
}

TEST(Minimize, KleeneStar)
{
    auto p = test_compile(ast::star(ast::symbol('a')));

    ASSERT_EQ(p.min_dfa.num_states(), 1);
    EXPECT_TRUE(p.min_dfa.is_accepting(0));
    EXPECT_TRUE(p.min_dfa.recognizes_empty());

    auto edges = p.min_dfa.transitions(0);
    ASSERT_EQ(edges.size(), 1u);
    EXPECT_EQ(edges[0].target, 0);
    EXPECT_EQ(*edges[0].label, (iregex::symbol_range{'a', 'a'}));
}

TEST(Minimize, BoundedRepetition)
{
    // a{2,4} needs one state per count 0..4
    auto g = minimal(ast::repeat(ast::symbol('a'), 2, 4));
    EXPECT_EQ(g.num_states(), 5);
    EXPECT_EQ(g.accepting_states(), (std::set<state_id>{2, 3, 4}));
}

TEST(Minimize, NonIncreaseAndStability)
{
    auto a = ast::symbol('a');
    auto b = ast::symbol('b');
    for (auto&& node : {
             ast::concat(ast::star(ast::alt(a, b)), ast::literal(U"abb")),
             ast::alt(ast::literal(U"abc"), ast::literal(U"abd")),
             ast::repeat(ast::alt(a, ast::concat(a, b)), 1, 5),
             ast::plus(ast::char_class({{'0', '9'}, {'a', 'f'}})),
         }) {
        auto dfa = iregex::determinize(iregex::build_nfa(node));
        auto once = iregex::minimize(dfa);
        auto twice = iregex::minimize(once);

        EXPECT_LE(once.num_states(), dfa.num_states()) << iregex::print_ast(node);
        EXPECT_TRUE(once == twice) << iregex::print_ast(node);
    }
}

TEST(Minimize, NthFromLast)
{
    // the 4th symbol from the end is an 'a'
    auto ab = ast::alt(ast::symbol('a'), ast::symbol('b'));
    auto g = minimal(ast::concat({ast::star(ab), ast::symbol('a'), ast::repeat(ab, 3, 3)}));
    EXPECT_EQ(g.num_states(), 16);
}

TEST(Minimize, EquivalentAutomataHaveSameLayout)
{
    auto a = ast::symbol('a');
    auto b = ast::symbol('b');

    std::vector<std::pair<ast::node, ast::node>> cases = {
        {ast::star(ast::alt(a, b)), ast::star(ast::concat(ast::star(a), ast::star(b)))},
        {ast::concat(a, ast::star(ast::literal(U"ba"))), ast::concat(ast::star(ast::literal(U"ab")), a)},
        {ast::repeat(a, 2, std::nullopt), ast::concat({a, a, ast::star(a)})},
        {ast::range('a', 'c'), ast::alt({a, b, ast::symbol('c')})},
        {ast::char_class({{'a', 'f'}, {'g', 'z'}}), ast::range('a', 'z')},
    };

    for (auto&& [lhs, rhs] : cases) {
        auto m1 = minimal(lhs);
        auto m2 = minimal(rhs);
        EXPECT_EQ(m1.num_states(), m2.num_states());
        EXPECT_TRUE(m1 == m2) << iregex::print_ast(lhs) << " vs " << iregex::print_ast(rhs)
                              << "\n"
                              << iregex::ir::print_graph(m1) << iregex::ir::print_graph(m2);
    }
}

TEST(Minimize, DeadAndUnreachableStatesRemoved)
{
    iregex::ir::graph dfa;
    auto s0 = dfa.add_state();
    auto s1 = dfa.add_state();
    auto dead = dfa.add_state();
    auto unreachable = dfa.add_state();
    dfa.set_start(s0);
    dfa.set_accept(s1);
    dfa.set_accept(unreachable);
    dfa.add_transition(s0, {'a', 'a'}, s1);
    dfa.add_transition(s0, {'b', 'b'}, dead);
    dfa.add_transition(dead, {'a', 'z'}, dead);
    dfa.add_transition(unreachable, {'a', 'a'}, s0);

    auto g = iregex::minimize(dfa);
    fmt::print("{}", iregex::ir::print_graph(g));
    EXPECT_EQ(g.num_states(), 2);
    EXPECT_TRUE(g.match(U"a"));
    EXPECT_FALSE(g.match(U"b"));
    EXPECT_TRUE(g == minimal(ast::symbol('a')));
}

TEST(Minimize, EmptyLanguage)
{
    auto g = minimal(ast::concat(ast::symbol('a'), ast::char_class({})));
    EXPECT_EQ(g.num_states(), 1);
    EXPECT_TRUE(g.accepting_states().empty());
    EXPECT_EQ(g.num_transitions(), 0);
    EXPECT_TRUE(g.is_empty_language());
}

TEST(Minimize, AcceptsNfaInput)
{
    auto nfa = iregex::build_nfa(ast::alt(ast::symbol('a'), ast::symbol('a')));
    EXPECT_TRUE(iregex::minimize(nfa) == minimal(ast::symbol('a')));
}

TEST(Minimize, KeepsAcceptLabelsApart)
{
    auto g = iregex::minimize(iregex::union_all({
        iregex::build_nfa(ast::symbol('a')),
        iregex::build_nfa(ast::symbol('b')),
    }));
    EXPECT_EQ(g.num_states(), 3);
    EXPECT_EQ(g.matching_label(U"a"), 0);
    EXPECT_EQ(g.matching_label(U"b"), 1);
}

TEST(Minimize, StateLimit)
{
    auto dfa = iregex::determinize(iregex::build_nfa(ast::literal(U"abc")));
    ASSERT_EQ(dfa.num_states(), 4);

    try {
        iregex::minimize(dfa, {.state_limit = 3});
        FAIL() << "expected a StateLimitExceeded error";
    } catch (iregex::error const& e) {
        fmt::print("{}\n", e.what());
        EXPECT_EQ(e.kind(), iregex::error_kind::state_limit_exceeded);
    }
    EXPECT_EQ(iregex::minimize(dfa, {.state_limit = 4}).num_states(), 4);
}

TEST(Minimize, GraphWithoutStatesStaysEmpty)
{
    iregex::ir::graph none;
    auto g = iregex::minimize(none);
    EXPECT_EQ(g.num_states(), 0);
    EXPECT_EQ(g.start(), iregex::ir::NO_STATE);
    EXPECT_FALSE(g.match(U""));
}
