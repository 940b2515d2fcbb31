#include "error.hpp"

#include <fmt/core.h>

namespace iregex {

auto to_string(error_kind kind) -> std::string_view
{
    switch (kind) {
    case error_kind::invalid_range:
        return "InvalidRange";
    case error_kind::invalid_repetition_bound:
        return "InvalidRepetitionBound";
    case error_kind::state_limit_exceeded:
        return "StateLimitExceeded";
    }
    return "unknown";
}

void throw_invalid_range(symbol_t min, symbol_t max)
{
    throw error(error_kind::invalid_range,
                fmt::format("Invalid symbol range [{:#x}, {:#x}].", min, max));
}

void throw_invalid_repetition(int min, int max)
{
    throw error(error_kind::invalid_repetition_bound,
                fmt::format("Invalid repetition bounds {{{},{}}}.", min, max));
}

void throw_state_limit(std::string_view stage, int limit)
{
    throw error(error_kind::state_limit_exceeded,
                fmt::format("{}: more than {} states generated; aborting.", stage, limit));
}

} // namespace iregex
