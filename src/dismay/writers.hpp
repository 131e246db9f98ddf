#pragma once

#include <cstddef>

#include <iterator>
#include <string_view>
#include <utility>

#include <fmt/format.h>

#include <dismay/report/fwd.hpp>

namespace dismay::detail
{
inline void append(format_buffer &out, std::string_view text)
{
    out.append(text.data(), text.data() + text.size());
}

/**
 * @brief Writes the header in front of the first non empty chunk of a gated
 * scope.
 *
 * Nothing is buffered. A scope is opened with ready() and the same writer
 * may be reused for any number of consecutive scopes on the same buffer.
 */
class header_writer
{
public:
    header_writer(format_buffer &out, std::string_view header) noexcept
        : mOut(out)
        , mHeader(header)
        , mStarted(false)
    {
    }

    auto ready() noexcept -> header_writer &
    {
        mStarted = false;
        return *this;
    }
    auto in_progress() noexcept -> header_writer &
    {
        mStarted = true;
        return *this;
    }

    [[nodiscard]] auto started() const noexcept -> bool
    {
        return mStarted;
    }

    void write(std::string_view chunk)
    {
        if (!mStarted && !chunk.empty())
        {
            append(mOut, mHeader);
            mStarted = true;
        }
        append(mOut, chunk);
    }

    template <typename... Args>
    void print(fmt::format_string<Args...> fmt, Args &&...args)
    {
        format_buffer chunk;
        fmt::format_to(std::back_inserter(chunk), fmt,
                       std::forward<Args>(args)...);
        write(std::string_view(chunk.data(), chunk.size()));
    }

private:
    format_buffer &mOut;
    std::string_view mHeader;
    bool mStarted;
};

/**
 * @brief Joins the non empty blocks written to it with a separator.
 */
class separated_writer
{
public:
    separated_writer(format_buffer &out,
                     std::string_view separator,
                     bool continued = false) noexcept
        : mWriter(out, separator)
        , mContinued(continued)
    {
    }

    void write(std::string_view block)
    {
        if (block.empty())
        {
            return;
        }
        (mContinued ? mWriter.ready() : mWriter.in_progress()).write(block);
        mContinued = true;
    }

private:
    header_writer mWriter;
    bool mContinued;
};

inline auto as_string_view(format_buffer const &buffer) noexcept
        -> std::string_view
{
    return {buffer.data(), buffer.size()};
}

auto trim_end(std::string_view text) noexcept -> std::string_view;

/**
 * @brief Prefixes every non empty line of text with indentation.
 */
void write_indented(format_buffer &out,
                    std::string_view text,
                    std::string_view indentation);

/**
 * @brief Writes text as the index-th entry of a numbered list, i.e. the first
 * line is prefixed with `{index:>4}: ` and the following lines are aligned
 * with it.
 */
void write_numbered(format_buffer &out, std::size_t index, std::string_view text);

} // namespace dismay::detail
