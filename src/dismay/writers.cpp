#include "writers.hpp"

#include <fmt/format.h>

namespace dismay::detail
{
namespace
{
constexpr std::string_view whitespace = " \t\r\n\f\v";

template <typename PrefixFn>
void write_lines(format_buffer &out, std::string_view text, PrefixFn &&prefix)
{
    std::size_t lineNo = 0;
    for (;;)
    {
        auto const split = text.find('\n');
        auto const line = text.substr(0, split);
        if (!line.empty())
        {
            prefix(lineNo);
            append(out, line);
        }
        if (split == std::string_view::npos)
        {
            break;
        }
        out.push_back('\n');
        text.remove_prefix(split + 1);
        ++lineNo;
    }
}
} // namespace

auto trim_end(std::string_view text) noexcept -> std::string_view
{
    auto const last = text.find_last_not_of(whitespace);
    if (last == std::string_view::npos)
    {
        return {};
    }
    return text.substr(0, last + 1);
}

void write_indented(format_buffer &out,
                    std::string_view text,
                    std::string_view indentation)
{
    write_lines(out, text,
                [&](std::size_t) { append(out, indentation); });
}

void write_numbered(format_buffer &out,
                    std::size_t index,
                    std::string_view text)
{
    using namespace std::string_view_literals;

    fmt::format_to(std::back_inserter(out), FMT_STRING("{:>4}: "), index);
    write_lines(out, text,
                [&](std::size_t lineNo)
                {
                    if (lineNo != 0)
                    {
                        append(out, "      "sv);
                    }
                });
}

} // namespace dismay::detail
