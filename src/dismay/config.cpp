#include <dismay/config.hpp>

#include <cstdlib>

#include <mutex>
#include <string_view>

#include <dismay/report/handler.hpp>

namespace dismay
{
namespace
{
using namespace std::string_view_literals;

auto env_var(char const *name) noexcept -> char const *
{
    // NOLINTNEXTLINE(concurrency-mt-unsafe)
    return std::getenv(name);
}

auto parse_verbosity(char const *value) noexcept -> verbosity
{
    if (value == nullptr)
    {
        return verbosity::minimal;
    }
    std::string_view const setting(value);
    if (setting == "full"sv)
    {
        return verbosity::full;
    }
    if (setting == "0"sv)
    {
        return verbosity::minimal;
    }
    return verbosity::medium;
}

auto env_enabled(char const *name, std::string_view disabledValue) noexcept
        -> bool
{
    auto const *value = env_var(name);
    return value == nullptr || std::string_view(value) != disabledValue;
}

std::once_flag gInstallFlag;
std::optional<hook> gInstalledHook;

} // namespace

auto theme::dark() noexcept -> theme
{
    using fmt::emphasis;
    using fmt::fg;
    using fmt::terminal_color;

    theme colors;
    colors.file = fg(terminal_color::magenta);
    colors.line_number = fg(terminal_color::magenta);
    colors.active_line = fg(terminal_color::white) | emphasis::bold;
    colors.error = fg(terminal_color::bright_red);
    colors.help_info_note = fg(terminal_color::bright_cyan);
    colors.help_info_warning = fg(terminal_color::bright_yellow);
    colors.help_info_suggestion = fg(terminal_color::bright_cyan);
    colors.help_info_error = fg(terminal_color::bright_red);
    colors.dependency_code = fg(terminal_color::green);
    colors.crate_code = fg(terminal_color::bright_red);
    colors.code_hash = fg(terminal_color::bright_black);
    colors.panic_header = fg(terminal_color::red);
    colors.panic_message = fg(terminal_color::cyan);
    colors.panic_file = fg(terminal_color::magenta);
    colors.panic_line_number = fg(terminal_color::magenta);
    colors.hidden_frames = fg(terminal_color::bright_cyan);
    colors.spantrace_target = fg(terminal_color::bright_red);
    colors.spantrace_fields = fg(terminal_color::bright_cyan);
    return colors;
}

auto theme::light() noexcept -> theme
{
    using fmt::emphasis;
    using fmt::fg;
    using fmt::terminal_color;

    theme colors;
    colors.file = fg(terminal_color::magenta);
    colors.line_number = fg(terminal_color::magenta);
    colors.active_line = fmt::text_style(emphasis::bold);
    colors.error = fg(terminal_color::red);
    colors.help_info_note = fg(terminal_color::blue);
    colors.help_info_warning = fg(terminal_color::yellow);
    colors.help_info_suggestion = fg(terminal_color::blue);
    colors.help_info_error = fg(terminal_color::red);
    colors.dependency_code = fg(terminal_color::green);
    colors.crate_code = fg(terminal_color::red);
    colors.code_hash = fg(terminal_color::bright_black);
    colors.panic_header = fg(terminal_color::red);
    colors.panic_message = fg(terminal_color::blue);
    colors.panic_file = fg(terminal_color::magenta);
    colors.panic_line_number = fg(terminal_color::magenta);
    colors.hidden_frames = fg(terminal_color::blue);
    colors.spantrace_target = fg(terminal_color::red);
    colors.spantrace_fields = fg(terminal_color::blue);
    return colors;
}

auto library_verbosity() noexcept -> verbosity
{
    auto const *value = env_var("DISMAY_LIB_BACKTRACE");
    if (value == nullptr)
    {
        value = env_var("DISMAY_BACKTRACE");
    }
    return parse_verbosity(value);
}

auto panic_verbosity() noexcept -> verbosity
{
    return parse_verbosity(env_var("DISMAY_BACKTRACE"));
}

auto verbosity_policy::from_env() noexcept -> verbosity_policy
{
    return {dismay::library_verbosity(), dismay::panic_verbosity()};
}

hook::hook(std::shared_ptr<printer_config const> config) noexcept
    : mConfig(std::move(config))
{
}

auto hook::config() const noexcept -> printer_config const &
{
    return *mConfig;
}

auto hook::make_handler(bool panicking) const -> std::unique_ptr<handler>
{
    auto const &cfg = *mConfig;

    std::optional<stack_trace> backtrace;
    if (cfg.verbosity.select(panicking) >= verbosity::medium && cfg.backtraces)
    {
        // skip make_handler() itself
        auto trace = cfg.backtraces->capture(1);
        if (!trace.empty())
        {
            backtrace.emplace(std::move(trace));
        }
    }

    std::optional<tracing::span_trace> spans;
#if DISMAY_CAPTURE_SPANTRACE
    if (cfg.capture_span_trace)
    {
        spans.emplace(tracing::span_trace::capture());
    }
#endif

    return std::make_unique<handler>(*this, panicking, std::move(backtrace),
                                     std::move(spans));
}

auto hook::install() const -> result<void>
{
    bool installed = false;
    std::call_once(gInstallFlag,
                   [&]
                   {
                       gInstalledHook.emplace(*this);
                       installed = true;
                   });
    if (!installed)
    {
        return errc::hook_already_installed;
    }
    return success();
}

auto hook::installed() -> hook const &
{
    std::call_once(gInstallFlag,
                   [] { gInstalledHook.emplace(hook_builder().into_hook()); });
    return *gInstalledHook;
}

hook_builder::hook_builder()
    : mConfig{
            .colors = dismay::theme::dark(),
            .verbosity = verbosity_policy::from_env(),
            .filters = default_frame_filters(),
            .backtraces = boost_backtrace_provider(),
            .panic_section = std::nullopt,
            .show_hidden_frames = !env_enabled("DISMAY_SHOW_HIDDEN", "1"sv),
            .capture_span_trace = false,
            .display_env_section = true,
            .display_location_section = true,
    }
{
}

auto hook_builder::theme(dismay::theme colors) -> hook_builder &
{
    mConfig.colors = colors;
    return *this;
}

auto hook_builder::library_verbosity(verbosity level) -> hook_builder &
{
    mConfig.verbosity.library = level;
    return *this;
}

auto hook_builder::panic_verbosity(verbosity level) -> hook_builder &
{
    mConfig.verbosity.panic = level;
    return *this;
}

auto hook_builder::capture_span_trace_by_default(bool enabled)
        -> hook_builder &
{
    // DISMAY_SPANTRACE=0 vetoes capturing even if enabled here
    mConfig.capture_span_trace
            = enabled && env_enabled("DISMAY_SPANTRACE", "0"sv);
    return *this;
}

auto hook_builder::display_env_section(bool enabled) -> hook_builder &
{
    mConfig.display_env_section = enabled;
    return *this;
}

auto hook_builder::display_location_section(bool enabled) -> hook_builder &
{
    mConfig.display_location_section = enabled;
    return *this;
}

auto hook_builder::show_hidden_frames(bool enabled) -> hook_builder &
{
    mConfig.show_hidden_frames = enabled;
    return *this;
}

auto hook_builder::add_frame_filter(frame_filter filter) -> hook_builder &
{
    mConfig.filters.push_back(std::move(filter));
    return *this;
}

auto hook_builder::add_default_filters() -> hook_builder &
{
    for (auto &filter : default_frame_filters())
    {
        mConfig.filters.push_back(std::move(filter));
    }
    return *this;
}

auto hook_builder::clear_frame_filters() -> hook_builder &
{
    mConfig.filters.clear();
    return *this;
}

auto hook_builder::panic_section(std::string text) -> hook_builder &
{
    mConfig.panic_section = std::move(text);
    return *this;
}

auto hook_builder::backtrace_provider(
        std::shared_ptr<dismay::backtrace_provider const> provider)
        -> hook_builder &
{
    mConfig.backtraces = std::move(provider);
    return *this;
}

auto hook_builder::into_hook() const -> hook
{
    return hook(std::make_shared<printer_config const>(mConfig));
}

auto hook_builder::install() const -> result<void>
{
    return into_hook().install();
}

} // namespace dismay
