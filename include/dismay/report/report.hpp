#pragma once

#include <algorithm>
#include <concepts>
#include <exception>
#include <memory>
#include <ostream>
#include <source_location>
#include <string>
#include <system_error>
#include <type_traits>
#include <utility>
#include <vector>

#include <fmt/format.h>

#include <dismay/report/errc.hpp>
#include <dismay/report/fwd.hpp>
#include <dismay/report/help_info.hpp>
#include <dismay/report/renderable.hpp>
#include <dismay/report/section.hpp>

namespace dismay
{
/**
 * @brief Types which can be converted into a report by the make_report()
 * customization point.
 */
template <typename E>
concept report_compatible = requires(E &&e) {
    {
        make_report(static_cast<E &&>(e), adl::reporting::type{})
    } -> std::same_as<report>;
};

/**
 * @brief The canonical failure representation.
 *
 * A report consists of a cause chain, outermost cause first, and a context
 * store which collects the captured execution history and every piece of
 * context attached later on. Reports are move-only; the context store is
 * never shared.
 */
class report final
{
public:
    using cause_chain = std::vector<display_value>;

    /**
     * @brief Creates an empty report without a context store.
     *
     * Only moved-from and default constructed reports are empty.
     */
    report() noexcept;
    report(report &&other) noexcept;
    auto operator=(report &&other) noexcept -> report &;
    ~report() noexcept;

    report(report const &) = delete;
    auto operator=(report const &) -> report & = delete;

    template <typename E>
        requires(!std::same_as<std::remove_cvref_t<E>, report>)
                && report_compatible<E>
    // NOLINTNEXTLINE(bugprone-forwarding-reference-overload)
    report(E &&e, std::source_location location
                  = std::source_location::current())
        : report(make_report(std::forward<E>(e), adl::reporting::type{}))
    {
        track_caller(location);
    }

    template <displayable T>
    static auto msg(T &&message,
                    std::source_location location
                    = std::source_location::current()) -> report
    {
        return from_display(make_display(std::forward<T>(message)), nullptr,
                            location);
    }
    template <displayable T>
    static auto msg(T &&message,
                    hook const &owner,
                    std::source_location location
                    = std::source_location::current()) -> report
    {
        return from_display(make_display(std::forward<T>(message)), &owner,
                            location);
    }

    [[nodiscard]] auto empty() const noexcept -> bool;
    [[nodiscard]] auto causes() const noexcept -> cause_chain const &;

    /**
     * @brief Adds a new outermost cause to the chain.
     */
    template <displayable T>
    auto wrap_err(T &&context) & -> report &
    {
        mCauses.insert(mCauses.begin(),
                       make_display(std::forward<T>(context)));
        return *this;
    }
    template <displayable T>
    auto wrap_err(T &&context) && -> report &&
    {
        return std::move(wrap_err(std::forward<T>(context)));
    }

    auto section(dismay::section entry) & -> report &;
    auto section(dismay::section entry) && -> report &&;
    template <displayable T>
        requires(!std::same_as<std::remove_cvref_t<T>, dismay::section>)
    auto section(T &&header) & -> report &
    {
        return section(make_section(std::forward<T>(header)));
    }
    template <displayable T>
        requires(!std::same_as<std::remove_cvref_t<T>, dismay::section>)
    auto section(T &&header) && -> report &&
    {
        return std::move(section(make_section(std::forward<T>(header))));
    }

    template <displayable T>
    auto note(T &&content) & -> report &
    {
        push_help(help_kind::note, make_display(std::forward<T>(content)));
        return *this;
    }
    template <displayable T>
    auto note(T &&content) && -> report &&
    {
        return std::move(note(std::forward<T>(content)));
    }

    template <displayable T>
    auto warning(T &&content) & -> report &
    {
        push_help(help_kind::warning, make_display(std::forward<T>(content)));
        return *this;
    }
    template <displayable T>
    auto warning(T &&content) && -> report &&
    {
        return std::move(warning(std::forward<T>(content)));
    }

    template <displayable T>
    auto suggestion(T &&content) & -> report &
    {
        push_help(help_kind::suggestion,
                  make_display(std::forward<T>(content)));
        return *this;
    }
    template <displayable T>
    auto suggestion(T &&content) && -> report &&
    {
        return std::move(suggestion(std::forward<T>(content)));
    }

    /**
     * @brief Attaches an auxiliary error which is rendered with its own cause
     * chain right after the primary cause chain.
     */
    template <typename E>
        requires report_compatible<E> || displayable<E>
    auto error(E &&e) & -> report &
    {
        if constexpr (report_compatible<E>)
        {
            report aux = make_report(std::forward<E>(e), adl::reporting::type{});
            push_error(std::move(aux.mCauses));
        }
        else
        {
            cause_chain causes;
            causes.push_back(make_display(std::forward<E>(e)));
            push_error(std::move(causes));
        }
        return *this;
    }
    template <typename E>
        requires report_compatible<E> || displayable<E>
    auto error(E &&e) && -> report &&
    {
        return std::move(error(std::forward<E>(e)));
    }

    /**
     * @brief Attaches the sections summarizing the given source, see
     * context_sections().
     */
    template <typename Source>
    auto context_from(Source const &source) & -> report &
    {
        for (auto &entry : context_sections(source))
        {
            section(std::move(entry));
        }
        return *this;
    }
    template <typename Source>
    auto context_from(Source const &source) && -> report &&
    {
        return std::move(context_from(source));
    }

    [[nodiscard]] auto diagnostic_information(report_format format) const
            -> std::string;
    void diagnostic_information(format_buffer &out,
                                report_format format) const;

    /**
     * @brief Records the given location as the creation site unless the
     * report already knows where it has been created.
     */
    void track_caller(std::source_location location) noexcept;

    [[nodiscard]] auto context() const noexcept -> handler const *;

private:
    report(cause_chain causes, std::unique_ptr<handler> store) noexcept;

    static auto from_display(display_value message,
                             hook const *owner,
                             std::source_location location) -> report;

    auto store() -> handler &;
    void push_help(help_kind kind, display_value content);
    void push_error(cause_chain causes);

    cause_chain mCauses;
    std::unique_ptr<handler> mStore;
};

inline auto operator<<(report &r, section entry) -> report &
{
    return r.section(std::move(entry));
}
inline auto operator<<(report &&r, section entry) -> report &&
{
    return std::move(r).section(std::move(entry));
}

auto operator<<(std::ostream &s, report const &r) -> std::ostream &;

// a template so that checking report_compatible never considers a
// conversion to report
template <typename R>
    requires std::same_as<R, report>
inline auto make_report(R &&r, adl::reporting::type) noexcept -> report
{
    return std::move(r);
}

auto make_report(errc code, adl::reporting::type) -> report;

namespace adl::reporting
{
/*
converts std::error_code to report
*/
auto make_report(std::error_code ec, adl::reporting::type) -> report;

/*
converts std::errc to report
*/
auto make_report(std::errc ec, adl::reporting::type) -> report;

/*
converts an exception and its nested exceptions to report
*/
auto make_report(std::exception const &e, adl::reporting::type) -> report;

/*
converts the referenced exception to report
*/
auto make_report(std::exception_ptr const &e, adl::reporting::type)
        -> report;
} // namespace adl::reporting

} // namespace dismay

namespace fmt
{
template <>
struct formatter<dismay::report>
{
    template <typename ParseContext>
    constexpr auto parse(ParseContext &ctx) -> decltype(ctx.begin())
    {
        constexpr auto errfmt = "invalid report formatter";

        auto it = ctx.begin();
        auto const end = ctx.end();
        if (it != end && *it == '!')
        {
            ++it;
            if (it == end || *it != 'v')
            {
                ctx.on_error(errfmt);
            }
            report_format = dismay::report_format::simple;
            ++it;
        }
        else if (it != end && *it == 'v')
        {
            report_format = dismay::report_format::with_diagnostics;
            ++it;
        }
        if (it != end && *it != '}')
        {
            ctx.on_error(errfmt);
        }
        return it;
    }

    template <typename FormatContext>
    auto format(dismay::report const &r, FormatContext &ctx) const
            -> decltype(ctx.out())
    {
        dismay::format_buffer buffer;
        r.diagnostic_information(buffer, report_format);
        return std::copy(buffer.begin(), buffer.end(), ctx.out());
    }

    dismay::report_format report_format
            = dismay::report_format::with_diagnostics;
};
} // namespace fmt
