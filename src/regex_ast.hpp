#ifndef REGEX_AST_HPP
#define REGEX_AST_HPP

#include "alphabet.hpp"

#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

#include <boost/variant/recursive_wrapper.hpp>

namespace iregex {

template<typename... Ts>
using rvariant = boost::recursive_wrapper<std::variant<Ts...>>;

namespace ast {

struct node_empty;
struct node_symbol;
struct node_class;
struct node_concat;
struct node_union;
struct node_repeat;
struct node_group;

using node
    = rvariant<node_empty, node_symbol, node_class, node_concat, node_union, node_repeat, node_group>;

struct node_empty
{};
struct node_symbol
{
    symbol_t symbol;
};
// matches one symbol from any of the ranges; ranges are not validated here
struct node_class
{
    std::vector<symbol_range> ranges;
};
struct node_concat
{
    node lhs;
    node rhs;
};
struct node_union
{
    node lhs;
    node rhs;
};
// max == nullopt means unbounded
struct node_repeat
{
    node arg;
    int min;
    std::optional<int> max;
};
struct node_group
{
    node arg;
    std::optional<std::string> name;
};

auto empty() -> node;
auto symbol(symbol_t s) -> node;
auto range(symbol_t min, symbol_t max) -> node;
auto char_class(std::vector<symbol_range> ranges, bool negate = false) -> node;
auto any() -> node;
auto literal(std::u32string_view str) -> node;

auto concat(node lhs, node rhs) -> node;
auto concat(std::vector<node> args) -> node;
auto alt(node lhs, node rhs) -> node;
auto alt(std::vector<node> args) -> node;

auto repeat(node arg, int min, std::optional<int> max) -> node;
auto star(node arg) -> node;
auto plus(node arg) -> node;
auto optional(node arg) -> node;
auto group(node arg, std::optional<std::string> name = std::nullopt) -> node;

} // namespace ast

auto print_ast(ast::node const& n) -> std::string;

} // namespace iregex

#endif // REGEX_AST_HPP
