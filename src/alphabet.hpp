#ifndef ALPHABET_HPP
#define ALPHABET_HPP

#include "config.h"

#include <cstdint>
#include <string>
#include <tuple>
#include <vector>

#include <roaring.hh>

namespace iregex {

struct symbol_range
{
    symbol_t min;
    symbol_t max;

    auto contains(symbol_t s) const -> bool { return min <= s && s <= max; }
    auto size() const -> std::uint64_t { return std::uint64_t(max) - min + 1; }

    bool operator<(const symbol_range& other) const
    {
        return std::make_tuple(min, max) < std::make_tuple(other.min, other.max);
    }
    bool operator==(const symbol_range& other) const = default;
};

auto make_range(symbol_t min, symbol_t max) -> symbol_range;

auto to_string(symbol_range const& range) -> std::string;

namespace alphabet {

// Coarsest disjoint decomposition of `ranges`. Every input range is a union of
// output ranges; symbols outside all inputs are not covered.
auto partition(std::vector<symbol_range> const& ranges) -> std::vector<symbol_range>;

// Sorts and joins overlapping or touching ranges.
auto merge_adjacent(std::vector<symbol_range> ranges) -> std::vector<symbol_range>;

// The operations below take and return sorted disjoint lists.
auto intersect(std::vector<symbol_range> const& a,
               std::vector<symbol_range> const& b) -> std::vector<symbol_range>;
auto subtract(std::vector<symbol_range> const& a,
              std::vector<symbol_range> const& b) -> std::vector<symbol_range>;
auto complement(std::vector<symbol_range> const& ranges,
                std::vector<symbol_range> const& domain) -> std::vector<symbol_range>;

auto any_char() -> std::vector<symbol_range>;

auto to_bitmap(std::vector<symbol_range> const& ranges) -> roaring::Roaring;
auto from_bitmap(roaring::Roaring const& set) -> std::vector<symbol_range>;

} // namespace alphabet

} // namespace iregex

#endif // ALPHABET_HPP
