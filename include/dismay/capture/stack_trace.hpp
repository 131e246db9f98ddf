#pragma once

#include <cstddef>
#include <cstdint>

#include <functional>
#include <memory>
#include <string>
#include <vector>

#include <fmt/format.h>

#include <dismay/report/fwd.hpp>

namespace dismay
{
struct theme;

struct frame
{
    std::size_t index;
    std::uintptr_t address;
    std::string name;
    std::string file;
    std::size_t line;

    [[nodiscard]] auto is_dependency_code() const noexcept -> bool;
    [[nodiscard]] auto has_location() const noexcept -> bool;
};

/**
 * @brief An ordered sequence of frames, the innermost frame first.
 */
class stack_trace final
{
public:
    stack_trace() noexcept = default;
    explicit stack_trace(std::vector<frame> frames) noexcept;

    [[nodiscard]] auto frames() const noexcept -> std::vector<frame> const &;
    [[nodiscard]] auto empty() const noexcept -> bool;

private:
    std::vector<frame> mFrames;
};

inline stack_trace::stack_trace(std::vector<frame> frames) noexcept
    : mFrames(std::move(frames))
{
}

inline auto stack_trace::frames() const noexcept -> std::vector<frame> const &
{
    return mFrames;
}

inline auto stack_trace::empty() const noexcept -> bool
{
    return mFrames.empty();
}

/**
 * @brief Removes the frames which shall not be displayed from the given list.
 */
using frame_filter = std::function<void(std::vector<frame const *> &)>;

auto default_frame_filters() -> std::vector<frame_filter>;

class backtrace_provider
{
public:
    virtual ~backtrace_provider() = default;

    /**
     * @brief Captures the calling thread's stack.
     *
     * An empty trace signals that capturing is unsupported.
     */
    virtual auto capture(std::size_t skip) const -> stack_trace = 0;
};

auto boost_backtrace_provider() -> std::shared_ptr<backtrace_provider const>;

struct backtrace_format_options
{
    std::vector<frame_filter> const &filters;
    theme const &colors;
    verbosity level;
    bool show_hidden;
};

void format_backtrace(format_buffer &out,
                      stack_trace const &trace,
                      backtrace_format_options const &options);

} // namespace dismay
