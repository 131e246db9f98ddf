#include <dismay/report/renderable.hpp>

#include "writers.hpp"

namespace dismay
{
void display_value::render(format_buffer &out) const
{
    if (auto const *text = std::get_if<std::string>(&mValue))
    {
        detail::append(out, *text);
    }
    else
    {
        std::get<renderable_ptr>(mValue)->render(out);
    }
}

auto display_value::to_string() const -> std::string
{
    if (auto const *text = std::get_if<std::string>(&mValue))
    {
        return *text;
    }
    format_buffer out;
    render(out);
    return fmt::to_string(out);
}

} // namespace dismay
