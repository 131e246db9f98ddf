#pragma once

#include <string_view>
#include <utility>

#include <dismay/report/fwd.hpp>
#include <dismay/report/renderable.hpp>

namespace dismay
{
struct theme;

enum class help_kind
{
    note,
    warning,
    suggestion,
};

auto label(help_kind kind) noexcept -> std::string_view;

/**
 * @brief A single line hint rendered as `<Label>: <content>` after all
 * custom sections which are placed after the primary messages.
 */
class help_info final
{
public:
    help_info(help_kind kind, display_value content) noexcept;

    help_info(help_info &&) noexcept = default;
    auto operator=(help_info &&) noexcept -> help_info & = default;

    [[nodiscard]] auto kind() const noexcept -> help_kind;

    void render(format_buffer &out, theme const &colors) const;

private:
    help_kind mKind;
    display_value mContent;
};

inline help_info::help_info(help_kind kind, display_value content) noexcept
    : mKind(kind)
    , mContent(std::move(content))
{
}

inline auto help_info::kind() const noexcept -> help_kind
{
    return mKind;
}

} // namespace dismay
