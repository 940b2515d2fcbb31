#ifndef ERROR_HPP
#define ERROR_HPP

#include "config.h"

#include <stdexcept>
#include <string>
#include <string_view>

namespace iregex {

enum class error_kind { invalid_range, invalid_repetition_bound, state_limit_exceeded };

auto to_string(error_kind kind) -> std::string_view;

class error : public std::runtime_error
{
    error_kind m_kind;

public:
    error(error_kind kind, std::string const &message)
        : std::runtime_error(message)
        , m_kind(kind)
    {}

    auto kind() const -> error_kind { return m_kind; }
};

struct options
{
    int state_limit = IREGEX_DEFAULT_STATE_LIMIT;
    bool verbose = false;
};

[[noreturn]] void throw_invalid_range(symbol_t min, symbol_t max);
[[noreturn]] void throw_invalid_repetition(int min, int max);
[[noreturn]] void throw_state_limit(std::string_view stage, int limit);

} // namespace iregex

#endif // ERROR_HPP
