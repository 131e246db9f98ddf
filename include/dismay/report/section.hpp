#pragma once

#include <concepts>
#include <optional>
#include <utility>

#include <dismay/report/fwd.hpp>
#include <dismay/report/renderable.hpp>

namespace dismay
{
/**
 * @brief The render order class of a section.
 */
enum class placement
{
    /**
     * @brief Rendered right after the cause chain, before any help entry.
     */
    after_primary_messages,
    /**
     * @brief Rendered after the backtrace and span trace block.
     */
    after_diagnostics,
    /**
     * @brief Never rendered.
     */
    suppressed,
};

/**
 * @brief A custom block of context consisting of a header and an optional
 * body.
 *
 * The header is written as is, every line of the body is indented. Create
 * sections with make_section() and refine them with the rvalue qualified
 * builder members:
 * @code
 * make_section("Stderr:")
 *         .skip_if([&] { return stderrText.empty(); })
 *         .body(stderrText);
 * @endcode
 */
class section final
{
public:
    explicit section(display_value header) noexcept;

    section(section &&) noexcept = default;
    auto operator=(section &&) noexcept -> section & = default;

    template <displayable T>
    auto body(T &&content) && -> section;

    template <std::predicate Condition>
    auto skip_if(Condition &&condition) && -> section;

    auto place(placement where) && noexcept -> section;

    [[nodiscard]] auto where() const noexcept -> placement;
    [[nodiscard]] auto has_body() const noexcept -> bool;

    void render_header(format_buffer &out) const;
    void render_body(format_buffer &out) const;

private:
    display_value mHeader;
    std::optional<display_value> mBody;
    placement mPlacement;
};

inline section::section(display_value header) noexcept
    : mHeader(std::move(header))
    , mBody()
    , mPlacement(placement::after_primary_messages)
{
}

template <displayable T>
inline auto section::body(T &&content) && -> section
{
    mBody.emplace(make_display(std::forward<T>(content)));
    return std::move(*this);
}

template <std::predicate Condition>
inline auto section::skip_if(Condition &&condition) && -> section
{
    if (std::forward<Condition>(condition)())
    {
        mPlacement = placement::suppressed;
    }
    return std::move(*this);
}

inline auto section::place(placement where) && noexcept -> section
{
    mPlacement = where;
    return std::move(*this);
}

inline auto section::where() const noexcept -> placement
{
    return mPlacement;
}

inline auto section::has_body() const noexcept -> bool
{
    return mBody.has_value();
}

template <displayable T>
auto make_section(T &&header) -> section
{
    return section(make_display(std::forward<T>(header)));
}

/**
 * @brief Creates a section with the given body under the given header.
 */
template <displayable H, displayable B>
auto make_section(H &&header, B &&body) -> section
{
    return make_section(std::forward<H>(header)).body(std::forward<B>(body));
}

} // namespace dismay
