#pragma once

#include <concepts>
#include <iterator>
#include <memory>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>
#include <variant>

#include <fmt/format.h>

#include <dismay/report/fwd.hpp>

namespace dismay
{
namespace detail
{
class renderable_base
{
public:
    renderable_base() = default;
    virtual ~renderable_base() noexcept = default;

    renderable_base(renderable_base const &) = delete;
    renderable_base(renderable_base &&) = delete;
    renderable_base &operator=(renderable_base const &) = delete;
    renderable_base &operator=(renderable_base &&) = delete;

    virtual void render(format_buffer &out) const = 0;
};
} // namespace detail

template <typename T>
concept displayable = std::convertible_to<T, std::string_view>
                      || fmt::is_formattable<std::remove_cvref_t<T>>::value;

template <typename T>
class renderable final : public detail::renderable_base
{
public:
    using value_type = T;

    renderable() = delete;
    explicit renderable(T const &v) noexcept(
            std::is_nothrow_copy_constructible_v<T>);
    explicit renderable(T &&v) noexcept(
            std::is_nothrow_move_constructible_v<T>);

    void render(format_buffer &out) const override;

    [[nodiscard]] auto value() const noexcept -> value_type const &;

private:
    value_type mValue;
};

template <typename T>
inline renderable<T>::renderable(T const &v) noexcept(
        std::is_nothrow_copy_constructible_v<T>)
    : mValue(v)
{
}
template <typename T>
inline renderable<T>::renderable(T &&v) noexcept(
        std::is_nothrow_move_constructible_v<T>)
    : mValue(std::move(v))
{
}

template <typename T>
inline void renderable<T>::render(format_buffer &out) const
{
    fmt::format_to(std::back_inserter(out), FMT_STRING("{}"), mValue);
}

template <typename T>
inline auto renderable<T>::value() const noexcept -> value_type const &
{
    return mValue;
}

/**
 * @brief Either an already rendered text or an owning handle to a value
 * which is formatted only when the report gets rendered.
 */
class display_value final
{
    using renderable_ptr = std::unique_ptr<detail::renderable_base>;

public:
    explicit display_value(std::string text) noexcept;
    explicit display_value(renderable_ptr value) noexcept;

    display_value(display_value &&) noexcept = default;
    auto operator=(display_value &&) noexcept -> display_value & = default;

    void render(format_buffer &out) const;
    [[nodiscard]] auto to_string() const -> std::string;

    [[nodiscard]] auto is_text() const noexcept -> bool;

private:
    std::variant<std::string, renderable_ptr> mValue;
};

inline display_value::display_value(std::string text) noexcept
    : mValue(std::in_place_index<0>, std::move(text))
{
}
inline display_value::display_value(renderable_ptr value) noexcept
    : mValue(std::in_place_index<1>, std::move(value))
{
}

inline auto display_value::is_text() const noexcept -> bool
{
    return mValue.index() == 0;
}

template <displayable T>
auto make_display(T &&value) -> display_value
{
    using value_type = std::remove_cvref_t<T>;
    if constexpr (std::is_convertible_v<T, std::string_view>)
    {
        return display_value(std::string(std::forward<T>(value)));
    }
    else
    {
        return display_value(std::make_unique<renderable<value_type>>(
                std::forward<T>(value)));
    }
}

} // namespace dismay
