#include "alphabet.hpp"
#include "error.hpp"

#include <algorithm>
#include <cctype>

#include <fmt/core.h>

namespace iregex {

auto make_range(symbol_t min, symbol_t max) -> symbol_range
{
    if (min > max) {
        throw_invalid_range(min, max);
    }
    return {min, max};
}

auto to_string(symbol_range const& range) -> std::string
{
    auto printch = [](symbol_t ch) {
        if (ch < 0x80 && std::isprint(static_cast<int>(ch))) {
            return fmt::format("'{}'", static_cast<char>(ch));
        }
        return fmt::format("\\u{{{:x}}}", ch);
    };
    if (range.min == range.max) {
        return printch(range.min);
    }
    return fmt::format("[{}-{}]", printch(range.min), printch(range.max));
}

namespace alphabet {

auto partition(std::vector<symbol_range> const& ranges) -> std::vector<symbol_range>
{
    // boundary -> change in the number of ranges covering it
    std::vector<std::pair<std::uint64_t, int>> events;
    events.reserve(ranges.size() * 2);
    for (auto&& r : ranges) {
        if (r.min > r.max) {
            throw_invalid_range(r.min, r.max);
        }
        events.emplace_back(r.min, +1);
        events.emplace_back(std::uint64_t(r.max) + 1, -1);
    }
    std::sort(events.begin(), events.end());

    std::vector<symbol_range> result;
    int depth = 0;
    for (std::size_t i = 0; i < events.size();) {
        auto const pos = events[i].first;
        while (i < events.size() && events[i].first == pos) {
            depth += events[i].second;
            ++i;
        }
        if (depth > 0 && i < events.size()) {
            // the next breakpoint closes this piece
            auto const next = events[i].first;
            result.push_back({static_cast<symbol_t>(pos), static_cast<symbol_t>(next - 1)});
        }
    }
    return result;
}

auto merge_adjacent(std::vector<symbol_range> ranges) -> std::vector<symbol_range>
{
    std::sort(ranges.begin(), ranges.end());

    std::vector<symbol_range> result;
    for (auto&& r : ranges) {
        if (!result.empty() && std::uint64_t(result.back().max) + 1 >= r.min) {
            result.back().max = std::max(result.back().max, r.max);
        } else {
            result.push_back(r);
        }
    }
    return result;
}

auto intersect(std::vector<symbol_range> const& a,
               std::vector<symbol_range> const& b) -> std::vector<symbol_range>
{
    std::vector<symbol_range> result;

    auto it1 = a.begin();
    auto it2 = b.begin();
    while (it1 != a.end() && it2 != b.end()) {
        auto omin = std::max(it1->min, it2->min);
        auto omax = std::min(it1->max, it2->max);
        if (omin <= omax) {
            result.push_back({omin, omax});
        }
        if (it1->max < it2->max) {
            ++it1;
        } else {
            ++it2;
        }
    }
    return result;
}

auto subtract(std::vector<symbol_range> const& a,
              std::vector<symbol_range> const& b) -> std::vector<symbol_range>
{
    std::vector<symbol_range> result;

    auto it2 = b.begin();
    for (auto r : a) {
        std::uint64_t cur = r.min;
        while (it2 != b.end() && it2->max < cur) {
            ++it2;
        }
        for (auto it = it2; it != b.end() && it->min <= r.max; ++it) {
            if (cur < it->min) {
                result.push_back({static_cast<symbol_t>(cur), it->min - 1});
            }
            cur = std::max<std::uint64_t>(cur, std::uint64_t(it->max) + 1);
        }
        if (cur <= r.max) {
            result.push_back({static_cast<symbol_t>(cur), r.max});
        }
    }
    return result;
}

auto complement(std::vector<symbol_range> const& ranges,
                std::vector<symbol_range> const& domain) -> std::vector<symbol_range>
{
    return subtract(domain, ranges);
}

auto any_char() -> std::vector<symbol_range>
{
    // Unicode scalar values; surrogates are excluded
    if (IREGEX_SYMBOL_MAX < 0xD800) {
        return {{0, IREGEX_SYMBOL_MAX}};
    }
    if (IREGEX_SYMBOL_MAX <= 0xDFFF) {
        return {{0, 0xD7FF}};
    }
    return {{0, 0xD7FF}, {0xE000, IREGEX_SYMBOL_MAX}};
}

auto to_bitmap(std::vector<symbol_range> const& ranges) -> roaring::Roaring
{
    auto set = roaring::Roaring{};
    for (auto&& r : ranges) {
        set.addRange(r.min, std::uint64_t(r.max) + 1);
    }
    return set;
}

auto from_bitmap(roaring::Roaring const& set) -> std::vector<symbol_range>
{
    std::vector<symbol_range> result;

    std::uint64_t range_min = 0;
    std::int64_t range_max = -1;

    std::uint64_t const size = set.cardinality();
    constexpr std::uint64_t PAGE_SIZE = 8192;
    std::vector<std::uint32_t> page;
    for (std::uint64_t offset = 0; offset < size; offset += PAGE_SIZE) {
        auto sz = std::min(size - offset, PAGE_SIZE);
        page.resize(sz);
        set.rangeUint32Array(page.data(), offset, sz);
        for (auto cur_idx : page) {
            if (range_max == -1) {
                range_min = cur_idx;
            } else if (range_max + 1 < cur_idx) {
                result.push_back({static_cast<symbol_t>(range_min), static_cast<symbol_t>(range_max)});
                range_min = cur_idx;
            }
            range_max = cur_idx;
        }
    }
    if (range_max != -1) {
        result.push_back({static_cast<symbol_t>(range_min), static_cast<symbol_t>(range_max)});
    }

    return result;
}

} // namespace alphabet

} // namespace iregex
