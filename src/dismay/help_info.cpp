#include <dismay/report/help_info.hpp>

#include <fmt/color.h>

#include <dismay/config.hpp>

#include "writers.hpp"

namespace dismay
{
auto label(help_kind kind) noexcept -> std::string_view
{
    using namespace std::string_view_literals;

    switch (kind)
    {
    case help_kind::note:
        return "Note"sv;
    case help_kind::warning:
        return "Warning"sv;
    case help_kind::suggestion:
        return "Suggestion"sv;
    }
    return "Help"sv;
}

namespace
{
auto label_style(help_kind kind, theme const &colors) noexcept
        -> fmt::text_style
{
    switch (kind)
    {
    case help_kind::note:
        return colors.help_info_note;
    case help_kind::warning:
        return colors.help_info_warning;
    case help_kind::suggestion:
        return colors.help_info_suggestion;
    }
    return {};
}
} // namespace

void help_info::render(format_buffer &out, theme const &colors) const
{
    fmt::format_to(std::back_inserter(out), label_style(mKind, colors),
                   "{}:", label(mKind));
    out.push_back(' ');
    mContent.render(out);
}

} // namespace dismay
