#pragma once

#include <system_error>
#include <type_traits>

#include <dismay/report/fwd.hpp>

namespace dismay
{
enum class errc : int
{
    hook_already_installed = 1,
    spawn_failed,
    not_supported,
};

auto dismay_category() noexcept -> std::error_category const &;

inline auto make_error_code(errc code) noexcept -> std::error_code
{
    return {static_cast<int>(code), dismay_category()};
}
} // namespace dismay

namespace std
{
template <>
struct is_error_code_enum<dismay::errc> : std::true_type
{
};
} // namespace std
