#include <dismay/capture/span_trace.hpp>

#include <atomic>

#include <fmt/color.h>

#include <dismay/config.hpp>

#include "writers.hpp"

namespace dismay::tracing
{
namespace
{
std::atomic<int> gInstalledLayers{0};

// the spans entered on this thread, outermost first
thread_local std::vector<span_record const *> tActiveSpans;
} // namespace

error_layer::error_layer() noexcept
{
    gInstalledLayers.fetch_add(1, std::memory_order_acq_rel);
}

error_layer::~error_layer() noexcept
{
    gInstalledLayers.fetch_sub(1, std::memory_order_acq_rel);
}

auto error_layer::installed() noexcept -> bool
{
    return gInstalledLayers.load(std::memory_order_acquire) > 0;
}

span::span(std::string_view target,
           std::string_view name,
           std::string fields,
           std::source_location location)
    : mRecord{
            .target = std::string(target),
            .name = std::string(name),
            .fields = std::move(fields),
            .file = location.file_name(),
            .line = location.line(),
    }
    , mEntered(error_layer::installed())
{
    if (mEntered)
    {
        tActiveSpans.push_back(&mRecord);
    }
}

span::~span() noexcept
{
    if (mEntered && !tActiveSpans.empty() && tActiveSpans.back() == &mRecord)
    {
        tActiveSpans.pop_back();
    }
}

span_trace::span_trace() noexcept
    : mStatus(span_trace_status::unsupported)
    , mSpans()
{
}

span_trace::span_trace(span_trace_status status,
                       std::vector<span_record> spans) noexcept
    : mStatus(status)
    , mSpans(std::move(spans))
{
}

auto span_trace::capture() -> span_trace
{
    if (!error_layer::installed())
    {
        return span_trace(span_trace_status::unsupported, {});
    }
    if (tActiveSpans.empty())
    {
        return span_trace(span_trace_status::empty, {});
    }

    std::vector<span_record> spans;
    spans.reserve(tActiveSpans.size());
    for (auto it = tActiveSpans.rbegin(); it != tActiveSpans.rend(); ++it)
    {
        spans.push_back(**it);
    }
    return span_trace(span_trace_status::captured, std::move(spans));
}

auto span_trace::status() const noexcept -> span_trace_status
{
    return mStatus;
}

auto span_trace::spans() const noexcept -> std::vector<span_record> const &
{
    return mSpans;
}

void format_span_trace(format_buffer &out,
                       span_trace const &trace,
                       theme const &colors)
{
    if (trace.status() != span_trace_status::captured)
    {
        return;
    }

    format_buffer block;
    fmt::format_to(std::back_inserter(block), "{:━^80}", " SPANTRACE ");
    std::size_t index = 0;
    for (auto const &record : trace.spans())
    {
        fmt::format_to(std::back_inserter(block), "\n{:>4}: {}", index++,
                       fmt::styled(fmt::format("{}::{}", record.target,
                                               record.name),
                                   colors.spantrace_target));
        if (!record.fields.empty())
        {
            fmt::format_to(std::back_inserter(block), " with {}",
                           fmt::styled(record.fields, colors.spantrace_fields));
        }
        fmt::format_to(std::back_inserter(block), "\n      at {}:{}",
                       fmt::styled(record.file, colors.file),
                       fmt::styled(record.line, colors.line_number));
    }

    detail::write_indented(out, detail::as_string_view(block), "  ");
}

} // namespace dismay::tracing
