#include <cstdlib>

#include <fmt/color.h>
#include <fmt/format.h>

#include <dismay/dismay.hpp>

namespace dismay::examples
{
namespace
{
// edit this to experiment with theme values
auto example_theme() -> dismay::theme
{
    auto colors = theme::dark();
    colors.line_number = fmt::fg(fmt::terminal_color::blue);
    colors.help_info_suggestion = fmt::fg(fmt::terminal_color::red);
    return colors;
}

auto create_report(char const *message, hook const &owner) -> report
{
    DISMAY_SPAN("theme", "create_report", fmt::format("msg={:?}", message));

    auto root = report::msg(message, owner)
                        .note("I left a note")
                        .warning("this is a warning")
                        .suggestion("and a suggestion")
                        .error("error");
    return std::move(root).wrap_err("wrapping error");
}
} // namespace
} // namespace dismay::examples

auto main() -> int
{
    dismay::tracing::error_layer const layer;

    auto const owner = dismay::hook_builder()
                               .theme(dismay::examples::example_theme())
                               .library_verbosity(dismay::verbosity::full)
                               .capture_span_trace_by_default(true)
                               .into_hook();

    fmt::print("{}\n", dismay::examples::create_report("test", owner));
    return EXIT_SUCCESS;
}
