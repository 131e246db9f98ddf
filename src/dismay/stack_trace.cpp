#include <dismay/capture/stack_trace.hpp>

#include <algorithm>
#include <array>
#include <fstream>
#include <string_view>

#include <boost/stacktrace/stacktrace.hpp>
#include <fmt/color.h>

#include <dismay/config.hpp>

#include "writers.hpp"

namespace dismay
{
namespace
{
using namespace std::string_view_literals;

constexpr std::array<std::string_view, 4> dependency_prefixes{
        "std::"sv, "boost::"sv, "__gnu_cxx::"sv, "__cxxabiv1::"sv};

constexpr std::array<std::string_view, 2> capture_prefixes{
        "dismay::"sv, "boost::stacktrace::"sv};

constexpr std::array<std::string_view, 4> unwinding_prefixes{
        "__cxa_"sv, "_Unwind_"sv, "__gxx_personality"sv, "__cxxabiv1::"sv};

constexpr std::array<std::string_view, 3> runtime_init_names{
        "__libc_start_call_main"sv, "__libc_start_main"sv, "_start"sv};

template <std::size_t N>
auto starts_with_any(std::string_view name,
                     std::array<std::string_view, N> const &prefixes) noexcept
        -> bool
{
    return std::any_of(prefixes.begin(), prefixes.end(),
                       [name](std::string_view prefix)
                       { return name.starts_with(prefix); });
}

class boost_provider final : public backtrace_provider
{
public:
    auto capture(std::size_t skip) const -> stack_trace override
    {
        // skip this function, too
        boost::stacktrace::stacktrace const trace(
                skip + 1, static_cast<std::size_t>(-1));

        std::vector<frame> frames;
        frames.reserve(trace.size());
        std::size_t index = 0;
        for (auto const &f : trace)
        {
            frames.push_back(frame{
                    .index = index++,
                    .address = reinterpret_cast<std::uintptr_t>(f.address()),
                    .name = f.name(),
                    .file = f.source_file(),
                    .line = f.source_line(),
            });
        }
        return stack_trace(std::move(frames));
    }
};

void hide_capture_machinery(std::vector<frame const *> &frames)
{
    auto const firstUserFrame = std::find_if(
            frames.begin(), frames.end(), [](frame const *f)
            { return !starts_with_any(f->name, capture_prefixes); });
    frames.erase(frames.begin(), firstUserFrame);
}

void hide_runtime_init(std::vector<frame const *> &frames)
{
    auto const runtimeInit = std::find_if(
            frames.begin(), frames.end(),
            [](frame const *f)
            {
                return std::find(runtime_init_names.begin(),
                                 runtime_init_names.end(), f->name)
                       != runtime_init_names.end();
            });
    frames.erase(runtimeInit, frames.end());
}

void hide_unwinding(std::vector<frame const *> &frames)
{
    std::erase_if(frames, [](frame const *f)
                  { return starts_with_any(f->name, unwinding_prefixes); });
}

void write_hidden(format_buffer &out,
                  std::size_t numHidden,
                  fmt::text_style const &style)
{
    if (numHidden == 0)
    {
        return;
    }
    auto const text = numHidden == 1
                              ? fmt::format("⋮ {} frame hidden ⋮", numHidden)
                              : fmt::format("⋮ {} frames hidden ⋮", numHidden);
    out.push_back('\n');
    fmt::format_to(std::back_inserter(out), style, "{:^80}", text);
}

void write_source_snippet(format_buffer &out,
                          frame const &f,
                          theme const &colors)
{
    std::ifstream source(f.file);
    if (!source)
    {
        return;
    }
    auto const first = f.line > 2 ? f.line - 2 : 1;
    auto const last = f.line + 2;

    std::string text;
    for (std::size_t lineNo = 1; lineNo <= last && std::getline(source, text);
         ++lineNo)
    {
        if (lineNo < first)
        {
            continue;
        }
        out.push_back('\n');
        if (lineNo == f.line)
        {
            fmt::format_to(std::back_inserter(out), colors.active_line,
                           "{:>8} > {}", lineNo, text);
        }
        else
        {
            fmt::format_to(std::back_inserter(out), "{:>8} │ {}",
                           fmt::styled(lineNo, colors.line_number), text);
        }
    }
}

void write_frame(format_buffer &out,
                 frame const &f,
                 backtrace_format_options const &options)
{
    auto const &colors = options.colors;
    auto const &nameStyle = f.is_dependency_code() ? colors.dependency_code
                                                   : colors.crate_code;
    std::string_view const name
            = f.name.empty() ? "<unknown>"sv : std::string_view(f.name);

    out.push_back('\n');
    fmt::format_to(std::back_inserter(out), "{:>4}: {}", f.index,
                   fmt::styled(name, nameStyle));
    if (!f.has_location())
    {
        return;
    }
    fmt::format_to(std::back_inserter(out), "\n      at {}:{}",
                   fmt::styled(f.file, colors.file),
                   fmt::styled(f.line, colors.line_number));

    if (options.level == verbosity::full)
    {
        write_source_snippet(out, f, colors);
    }
}

} // namespace

auto frame::is_dependency_code() const noexcept -> bool
{
    return starts_with_any(name, dependency_prefixes);
}

auto frame::has_location() const noexcept -> bool
{
    return !file.empty() && line != 0;
}

auto default_frame_filters() -> std::vector<frame_filter>
{
    std::vector<frame_filter> filters;
    filters.emplace_back(&hide_capture_machinery);
    filters.emplace_back(&hide_runtime_init);
    filters.emplace_back(&hide_unwinding);
    return filters;
}

auto boost_backtrace_provider() -> std::shared_ptr<backtrace_provider const>
{
    static auto const sInstance = std::make_shared<boost_provider const>();
    return sInstance;
}

void format_backtrace(format_buffer &out,
                      stack_trace const &trace,
                      backtrace_format_options const &options)
{
    fmt::format_to(std::back_inserter(out), "{:━^80}", " BACKTRACE ");

    auto const &frames = trace.frames();
    std::vector<frame const *> visible;
    visible.reserve(frames.size());
    for (auto const &f : frames)
    {
        visible.push_back(&f);
    }
    if (!options.show_hidden)
    {
        for (auto const &filter : options.filters)
        {
            filter(visible);
        }
    }

    // filters only ever remove frames, so the visible frames are still
    // ordered like the captured ones
    std::size_t numHidden = 0;
    auto nextVisible = visible.begin();
    for (auto const &f : frames)
    {
        if (nextVisible != visible.end() && *nextVisible == &f)
        {
            write_hidden(out, numHidden, options.colors.hidden_frames);
            numHidden = 0;
            write_frame(out, f, options);
            ++nextVisible;
        }
        else
        {
            ++numHidden;
        }
    }
    write_hidden(out, numHidden, options.colors.hidden_frames);
}

} // namespace dismay
