#include "regex_ast.hpp"
#include "error.hpp"

#include <fmt/core.h>
#include <fmt/ranges.h>
#include <roaring.hh>

namespace iregex {

namespace ast {

auto empty() -> node
{
    return {node_empty{}};
}

auto symbol(symbol_t s) -> node
{
    return {node_symbol{s}};
}

auto range(symbol_t min, symbol_t max) -> node
{
    return {node_class{{{min, max}}}};
}

auto char_class(std::vector<symbol_range> ranges, bool negate) -> node
{
    if (!negate) {
        return {node_class{std::move(ranges)}};
    }

    auto set = roaring::Roaring{};
    for (auto&& r : ranges) {
        set |= alphabet::to_bitmap({make_range(r.min, r.max)});
    }
    set.flipClosed(0, IREGEX_SYMBOL_MAX);
    set &= alphabet::to_bitmap(alphabet::any_char());
    set.runOptimize();
    return {node_class{alphabet::from_bitmap(set)}};
}

auto any() -> node
{
    return {node_class{alphabet::any_char()}};
}

auto literal(std::u32string_view str) -> node
{
    std::vector<node> args;
    for (char32_t ch : str) {
        args.push_back(symbol(ch));
    }
    return concat(std::move(args));
}

auto concat(node lhs, node rhs) -> node
{
    return {node_concat{std::move(lhs), std::move(rhs)}};
}

// left-folded into binary nodes
auto concat(std::vector<node> args) -> node
{
    if (args.empty()) {
        return empty();
    }
    auto result = std::move(args[0]);
    for (std::size_t i = 1; i < args.size(); ++i) {
        result = concat(std::move(result), std::move(args[i]));
    }
    return result;
}

auto alt(node lhs, node rhs) -> node
{
    return {node_union{std::move(lhs), std::move(rhs)}};
}

auto alt(std::vector<node> args) -> node
{
    if (args.empty()) {
        // the union of no alternatives matches nothing
        return {node_class{}};
    }
    auto result = std::move(args[0]);
    for (std::size_t i = 1; i < args.size(); ++i) {
        result = alt(std::move(result), std::move(args[i]));
    }
    return result;
}

auto repeat(node arg, int min, std::optional<int> max) -> node
{
    return {node_repeat{std::move(arg), min, max}};
}

auto star(node arg) -> node
{
    return repeat(std::move(arg), 0, std::nullopt);
}

auto plus(node arg) -> node
{
    return repeat(std::move(arg), 1, std::nullopt);
}

auto optional(node arg) -> node
{
    return repeat(std::move(arg), 0, 1);
}

auto group(node arg, std::optional<std::string> name) -> node
{
    return {node_group{std::move(arg), std::move(name)}};
}

} // namespace ast

auto print_ast(ast::node const& n) -> std::string
{
    return std::visit(
        [](auto&& node) -> std::string {
            using T = std::decay_t<decltype(node)>;
            if constexpr (std::is_same_v<T, ast::node_empty>) {
                return "ε";
            } else if constexpr (std::is_same_v<T, ast::node_symbol>) {
                return to_string(symbol_range{node.symbol, node.symbol});
            } else if constexpr (std::is_same_v<T, ast::node_class>) {
                if (node.ranges.size() == 1) {
                    return to_string(node.ranges[0]);
                }
                std::vector<std::string> vec;
                for (auto&& r : node.ranges) {
                    vec.push_back(to_string(r));
                }
                return fmt::format("[{}]", fmt::join(vec, ""));
            } else if constexpr (std::is_same_v<T, ast::node_concat>) {
                return fmt::format("({}·{})", print_ast(node.lhs), print_ast(node.rhs));
            } else if constexpr (std::is_same_v<T, ast::node_union>) {
                return fmt::format("({}|{})", print_ast(node.lhs), print_ast(node.rhs));
            } else if constexpr (std::is_same_v<T, ast::node_repeat>) {
                if (!node.max) {
                    return fmt::format("({}){{{},}}", print_ast(node.arg), node.min);
                }
                return fmt::format("({}){{{},{}}}", print_ast(node.arg), node.min, *node.max);
            } else if constexpr (std::is_same_v<T, ast::node_group>) {
                if (node.name) {
                    return fmt::format("(?<{}>{})", *node.name, print_ast(node.arg));
                }
                return fmt::format("({})", print_ast(node.arg));
            } else {
                static_assert(std::is_same_v<T, void>, "not implemented");
            }
        },
        n.get());
}

} // namespace iregex
