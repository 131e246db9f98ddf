#include <dismay/report/handler.hpp>

#include <fmt/color.h>

#include "writers.hpp"

namespace dismay
{
namespace
{
using namespace std::string_view_literals;

constexpr auto backtrace_omitted
        = "Backtrace omitted.\n"
          "Run with DISMAY_BACKTRACE=1 environment variable to display it."sv;
constexpr auto frame_filter_hint
        = "Run with DISMAY_SHOW_HIDDEN=1 environment variable to disable "
          "frame filtering."sv;
constexpr auto source_snippet_hint
        = "Run with DISMAY_BACKTRACE=full to include source snippets."sv;
constexpr auto span_trace_unsupported
        = "Warning: SpanTrace capture is Unsupported.\n"
          "Ensure that you've setup an error layer and the versions match"sv;

void write_cause_chain(format_buffer &out,
                       std::span<display_value const> causes,
                       fmt::text_style const &labelStyle,
                       fmt::text_style const &causeStyle)
{
    fmt::format_to(std::back_inserter(out), labelStyle, "{}", "Error:");
    std::size_t index = 0;
    for (auto const &cause : causes)
    {
        format_buffer text;
        cause.render(text);

        format_buffer styled;
        fmt::format_to(std::back_inserter(styled), causeStyle, "{}",
                       detail::as_string_view(text));

        out.push_back('\n');
        detail::write_numbered(out, index++, detail::as_string_view(styled));
    }
}

void write_section(format_buffer &out, section const &entry)
{
    format_buffer header;
    entry.render_header(header);
    if (!entry.has_body())
    {
        detail::append(out, detail::as_string_view(header));
        return;
    }

    header.push_back('\n');
    detail::header_writer gated(out, detail::as_string_view(header));

    format_buffer body;
    entry.render_body(body);
    format_buffer indented;
    detail::write_indented(indented,
                           detail::trim_end(detail::as_string_view(body)),
                           "   "sv);
    gated.ready().write(detail::as_string_view(indented));
}

void write_sections(detail::separated_writer &separated,
                    std::span<section const> sections,
                    placement where)
{
    for (auto const &entry : sections)
    {
        if (entry.where() != where)
        {
            continue;
        }
        format_buffer block;
        write_section(block, entry);
        separated.write(detail::as_string_view(block));
    }
}

} // namespace

handler::handler(hook owner,
                 bool panicking,
                 std::optional<stack_trace> backtrace,
                 std::optional<tracing::span_trace> spans) noexcept
    : mOwner(std::move(owner))
    , mBacktrace(std::move(backtrace))
    , mSpans(std::move(spans))
    , mLocation()
    , mSections()
    , mHelp()
    , mErrors()
    , mPanicking(panicking)
{
}

void handler::track_caller(std::source_location location) noexcept
{
    if (!mLocation.has_value() && location.line() != 0)
    {
        mLocation = location;
    }
}

void handler::push_section(section entry)
{
    if (entry.where() == placement::suppressed)
    {
        return;
    }
    mSections.push_back(std::move(entry));
}

void handler::push_help(help_info entry)
{
    mHelp.push_back(std::move(entry));
}

void handler::push_error(cause_chain causes)
{
    mErrors.push_back(std::move(causes));
}

auto handler::config() const noexcept -> printer_config const &
{
    return mOwner.config();
}

auto handler::owner() const noexcept -> hook const &
{
    return mOwner;
}

auto handler::panicking() const noexcept -> bool
{
    return mPanicking;
}

auto handler::level() const noexcept -> verbosity
{
    return config().verbosity.select(mPanicking);
}

auto handler::backtrace() const noexcept -> std::optional<stack_trace> const &
{
    return mBacktrace;
}

auto handler::spans() const noexcept
        -> std::optional<tracing::span_trace> const &
{
    return mSpans;
}

auto handler::location() const noexcept
        -> std::optional<std::source_location> const &
{
    return mLocation;
}

void handler::render(format_buffer &out,
                     std::span<display_value const> causes,
                     report_format format) const
{
    auto const &cfg = config();
    auto const &colors = cfg.colors;

    if (format == report_format::simple)
    {
        bool first = true;
        for (auto const &cause : causes)
        {
            if (!first)
            {
                detail::append(out, ": "sv);
            }
            cause.render(out);
            first = false;
        }
        return;
    }

    detail::separated_writer separated(out, "\n\n"sv);
    {
        format_buffer block;
        write_cause_chain(block, causes, {}, colors.error);
        separated.write(detail::as_string_view(block));
    }

    for (auto const &aux : mErrors)
    {
        format_buffer block;
        write_cause_chain(block, aux, colors.help_info_error, colors.error);
        separated.write(detail::as_string_view(block));
    }

    if (cfg.display_location_section && mLocation.has_value())
    {
        format_buffer block;
        fmt::format_to(std::back_inserter(block), "Location:\n   {}:{}",
                       fmt::styled(mLocation->file_name(), colors.file),
                       fmt::styled(mLocation->line(), colors.line_number));
        separated.write(detail::as_string_view(block));
    }

    write_sections(separated, mSections, placement::after_primary_messages);

    {
        format_buffer block;
        detail::separated_writer lines(block, "\n"sv);
        for (auto const &entry : mHelp)
        {
            format_buffer line;
            entry.render(line, colors);
            lines.write(detail::as_string_view(line));
        }
        separated.write(detail::as_string_view(block));
    }

    {
        format_buffer block;
        render_diagnostics(block);
        separated.write(detail::as_string_view(block));
    }

    write_sections(separated, mSections, placement::after_diagnostics);
}

void handler::render_diagnostics(format_buffer &out) const
{
    auto const &cfg = config();
    detail::separated_writer separated(out, "\n\n"sv);

    if (mBacktrace.has_value())
    {
        format_buffer block;
        format_backtrace(block, *mBacktrace,
                         backtrace_format_options{
                                 .filters = cfg.filters,
                                 .colors = cfg.colors,
                                 .level = level(),
                                 .show_hidden = cfg.show_hidden_frames,
                         });
        separated.write(detail::as_string_view(block));
    }

    if (cfg.display_env_section)
    {
        format_buffer block;
        detail::separated_writer lines(block, "\n"sv);
        lines.write(mBacktrace.has_value() ? frame_filter_hint
                                                   : backtrace_omitted);
        if (level() < verbosity::full)
        {
            lines.write(source_snippet_hint);
        }
#if DISMAY_CAPTURE_SPANTRACE
        if (mSpans.has_value()
            && mSpans->status() == tracing::span_trace_status::unsupported)
        {
            lines.write(span_trace_unsupported);
        }
#endif
        separated.write(detail::as_string_view(block));
    }

#if DISMAY_CAPTURE_SPANTRACE
    if (mSpans.has_value())
    {
        format_buffer block;
        tracing::format_span_trace(block, *mSpans, cfg.colors);
        separated.write(detail::as_string_view(block));
    }
#endif
}

} // namespace dismay
