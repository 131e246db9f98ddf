#pragma once

#include <concepts>
#include <exception>
#include <functional>
#include <optional>
#include <source_location>
#include <stdexcept>
#include <string>
#include <string_view>
#include <type_traits>

#include <fmt/format.h>

#include <dismay/config.hpp>
#include <dismay/result.hpp>

namespace dismay
{
/**
 * @brief The exception thrown by panic(), it remembers where it has been
 * raised.
 */
class panic_error final : public std::runtime_error
{
public:
    panic_error(std::string const &message,
                std::source_location location);

    [[nodiscard]] auto location() const noexcept -> std::source_location;

private:
    std::source_location mLocation;
};

/**
 * @brief Signals a bug which the calling code cannot recover from.
 */
[[noreturn]] void panic(std::string const &message,
                        std::source_location location
                        = std::source_location::current());

/**
 * @brief Renders the exception as a panic report.
 *
 * The layout consists of the panic banner, the message and the location the
 * exception originated from, followed by the configured panic section and the
 * diagnostics captured at the time of the call.
 */
void format_panic(format_buffer &out,
                  std::exception_ptr const &cause,
                  hook const &owner);

auto panic_message(std::exception_ptr const &cause) -> std::string;

/**
 * @brief Registers a std::terminate handler which prints a panic report for
 * the active exception to stderr before aborting.
 */
void install_panic_hook(hook owner);
void install_panic_hook();

namespace detail
{
void print_error(report const &failure);
void print_panic(std::exception_ptr const &cause, hook const &owner);
} // namespace detail

template <typename Fn>
concept supervisable
        = std::invocable<Fn>
          && (std::same_as<std::invoke_result_t<Fn>, result<void>>
              || std::same_as<std::invoke_result_t<Fn>, result<int>>);

/**
 * @brief Runs fn as the top level of an application and returns the
 * process exit code.
 *
 * A failed result is printed to stderr and yields 1. An exception escaping fn
 * is treated as a panic, it is rendered with the panic verbosity and yields
 * 101. A result<int> passes its value through.
 */
template <supervisable Fn>
auto supervise(Fn &&fn, hook const &owner) -> int
{
    try
    {
        auto rx = std::invoke(std::forward<Fn>(fn));
        if (rx.has_error())
        {
            detail::print_error(rx.assume_error());
            return 1;
        }
        if constexpr (std::same_as<std::invoke_result_t<Fn>, result<int>>)
        {
            return rx.assume_value();
        }
        else
        {
            return 0;
        }
    }
    catch (...)
    {
        detail::print_panic(std::current_exception(), owner);
        return 101;
    }
}

template <supervisable Fn>
auto supervise(Fn &&fn) -> int
{
    return supervise(std::forward<Fn>(fn), hook::installed());
}

} // namespace dismay
