#include <dismay/report/section.hpp>

#include "writers.hpp"

namespace dismay
{
void section::render_header(format_buffer &out) const
{
    mHeader.render(out);
}

void section::render_body(format_buffer &out) const
{
    if (mBody.has_value())
    {
        mBody->render(out);
    }
}

} // namespace dismay
