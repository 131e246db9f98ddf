#include <dismay/panic.hpp>

#include <cstdio>
#include <cstdlib>

#include <mutex>
#include <optional>

#include <fmt/color.h>

#include <dismay/report/handler.hpp>

#include "writers.hpp"

namespace dismay
{
namespace
{
using namespace std::string_view_literals;

std::mutex gPanicHookSync;
std::optional<hook> gPanicHook;

auto panic_location(std::exception_ptr const &cause) noexcept
        -> std::optional<std::source_location>
{
    if (!cause)
    {
        return std::nullopt;
    }
    try
    {
        std::rethrow_exception(cause);
    }
    catch (panic_error const &e)
    {
        return e.location();
    }
    catch (report_exception const &e)
    {
        if (auto const *r = e.report(); r != nullptr && r->context() != nullptr)
        {
            return r->context()->location();
        }
    }
    catch (...)
    {
        // other exceptions don't know where they have been raised
        return std::nullopt;
    }
    return std::nullopt;
}

void on_terminate() noexcept
{
    try
    {
        std::optional<hook> owner;
        {
            std::lock_guard lock(gPanicHookSync);
            owner = gPanicHook;
        }
        if (auto cause = std::current_exception(); cause && owner)
        {
            detail::print_panic(cause, *owner);
        }
        else
        {
            fmt::print(stderr, "terminate called without an active exception\n");
        }
    }
    catch (std::exception const &e)
    {
        std::fputs("failed to print the panic report: ", stderr);
        std::fputs(e.what(), stderr);
        std::fputc('\n', stderr);
    }
    std::abort();
}
} // namespace

panic_error::panic_error(std::string const &message,
                         std::source_location location)
    : std::runtime_error(message)
    , mLocation(location)
{
}

auto panic_error::location() const noexcept -> std::source_location
{
    return mLocation;
}

void panic(std::string const &message, std::source_location location)
{
    throw panic_error(message, location);
}

auto panic_message(std::exception_ptr const &cause) -> std::string
{
    if (!cause)
    {
        return "<no exception>";
    }
    try
    {
        std::rethrow_exception(cause);
    }
    catch (report_exception const &e)
    {
        if (auto const *r = e.report(); r != nullptr)
        {
            return r->diagnostic_information(report_format::simple);
        }
        return e.what();
    }
    catch (std::exception const &e)
    {
        return e.what();
    }
    catch (...)
    {
        return "<unknown exception>";
    }
}

void format_panic(format_buffer &out,
                  std::exception_ptr const &cause,
                  hook const &owner)
{
    auto const &cfg = owner.config();
    auto const &colors = cfg.colors;
    auto const outIt = std::back_inserter(out);

    fmt::format_to(outIt, colors.panic_header, "{}",
                   "The application panicked (crashed).");
    fmt::format_to(outIt, "\nMessage:  {}",
                   fmt::styled(panic_message(cause), colors.panic_message));

    detail::append(out, "\nLocation: "sv);
    if (auto const location = panic_location(cause);
        location.has_value() && location->line() != 0)
    {
        fmt::format_to(outIt, "{}:{}",
                       fmt::styled(location->file_name(), colors.panic_file),
                       fmt::styled(location->line(),
                                   colors.panic_line_number));
    }
    else
    {
        detail::append(out, "<unknown>"sv);
    }

    detail::separated_writer separated(out, "\n\n"sv, true);
    if (cfg.panic_section.has_value())
    {
        separated.write(*cfg.panic_section);
    }

    auto const context = owner.make_handler(true);
    format_buffer diagnostics;
    context->render_diagnostics(diagnostics);
    separated.write(detail::as_string_view(diagnostics));
}

void install_panic_hook(hook owner)
{
    {
        std::lock_guard lock(gPanicHookSync);
        gPanicHook.emplace(std::move(owner));
    }
    std::set_terminate(&on_terminate);
}

void install_panic_hook()
{
    install_panic_hook(hook::installed());
}

namespace detail
{
void print_error(report const &failure)
{
    fmt::print(stderr, "{}\n", failure);
}

void print_panic(std::exception_ptr const &cause, hook const &owner)
{
    format_buffer out;
    format_panic(out, cause, owner);
    fmt::print(stderr, "{}\n", as_string_view(out));
}
} // namespace detail

} // namespace dismay
