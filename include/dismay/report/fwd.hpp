#pragma once

#include <cstddef>
#include <cstdint>

#include <type_traits>

#include <fmt/format.h>

namespace dismay
{
class report;
class report_exception;
class handler;
class section;
class help_info;
class display_value;
class hook;

enum class errc : int;

enum class report_format
{
    simple,
    with_diagnostics,
};

enum class verbosity
{
    minimal,
    medium,
    full,
};

namespace adl::reporting
{
struct type final
{
};
} // namespace adl::reporting

namespace detail
{
constexpr std::size_t report_format_stack_buffer_size = 1024;
}

using format_buffer
        = fmt::basic_memory_buffer<char, detail::report_format_stack_buffer_size>;
} // namespace dismay
