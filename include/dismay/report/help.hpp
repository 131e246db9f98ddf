#pragma once

#include <concepts>
#include <functional>
#include <type_traits>
#include <utility>

#include <dismay/report/context_from.hpp>
#include <dismay/report/report.hpp>
#include <dismay/report/section.hpp>
#include <dismay/result.hpp>

/**
 * @brief Attaches context to the failure of a result.
 *
 * Every function consumes a result and passes a success through untouched.
 * The eager variants take the context itself, the lazy `with_` variants take
 * a callable producing the context which is only invoked on failure.
 * @code
 * auto rx = dismay::help::note(read_config(path), "the default config is
 * used if none is present");
 * @endcode
 */
namespace dismay::help
{
template <typename S>
concept section_content = std::same_as<std::remove_cvref_t<S>, dismay::section>
                          || displayable<S>;

template <typename E>
concept auxiliary_error = report_compatible<E> || displayable<E>;

template <typename T, typename E, typename P, section_content S>
    requires report_compatible<E>
auto section(oc::basic_result<T, E, P> rx, S &&entry) -> result<T>
{
    return inject(std::move(rx), [&](report &r)
                  { r.section(std::forward<S>(entry)); });
}

template <typename T, typename E, typename P, std::invocable Fn>
    requires report_compatible<E>
             && section_content<std::invoke_result_t<Fn>>
auto with_section(oc::basic_result<T, E, P> rx, Fn &&fn) -> result<T>
{
    return inject(std::move(rx), [&](report &r)
                  { r.section(std::invoke(std::forward<Fn>(fn))); });
}

template <typename T, typename E, typename P, displayable C>
    requires report_compatible<E>
auto note(oc::basic_result<T, E, P> rx, C &&content) -> result<T>
{
    return inject(std::move(rx), [&](report &r)
                  { r.note(std::forward<C>(content)); });
}

template <typename T, typename E, typename P, std::invocable Fn>
    requires report_compatible<E> && displayable<std::invoke_result_t<Fn>>
auto with_note(oc::basic_result<T, E, P> rx, Fn &&fn) -> result<T>
{
    return inject(std::move(rx), [&](report &r)
                  { r.note(std::invoke(std::forward<Fn>(fn))); });
}

template <typename T, typename E, typename P, displayable C>
    requires report_compatible<E>
auto warning(oc::basic_result<T, E, P> rx, C &&content) -> result<T>
{
    return inject(std::move(rx), [&](report &r)
                  { r.warning(std::forward<C>(content)); });
}

template <typename T, typename E, typename P, std::invocable Fn>
    requires report_compatible<E> && displayable<std::invoke_result_t<Fn>>
auto with_warning(oc::basic_result<T, E, P> rx, Fn &&fn) -> result<T>
{
    return inject(std::move(rx), [&](report &r)
                  { r.warning(std::invoke(std::forward<Fn>(fn))); });
}

template <typename T, typename E, typename P, displayable C>
    requires report_compatible<E>
auto suggestion(oc::basic_result<T, E, P> rx, C &&content) -> result<T>
{
    return inject(std::move(rx), [&](report &r)
                  { r.suggestion(std::forward<C>(content)); });
}

template <typename T, typename E, typename P, std::invocable Fn>
    requires report_compatible<E> && displayable<std::invoke_result_t<Fn>>
auto with_suggestion(oc::basic_result<T, E, P> rx, Fn &&fn) -> result<T>
{
    return inject(std::move(rx), [&](report &r)
                  { r.suggestion(std::invoke(std::forward<Fn>(fn))); });
}

template <typename T, typename E, typename P, auxiliary_error A>
    requires report_compatible<E>
auto error(oc::basic_result<T, E, P> rx, A &&aux) -> result<T>
{
    return inject(std::move(rx), [&](report &r)
                  { r.error(std::forward<A>(aux)); });
}

template <typename T, typename E, typename P, std::invocable Fn>
    requires report_compatible<E> && auxiliary_error<std::invoke_result_t<Fn>>
auto with_error(oc::basic_result<T, E, P> rx, Fn &&fn) -> result<T>
{
    return inject(std::move(rx), [&](report &r)
                  { r.error(std::invoke(std::forward<Fn>(fn))); });
}

/**
 * @brief Attaches the sections summarizing a command, its exit status or its
 * output.
 */
template <typename T, typename E, typename P, typename Source>
    requires report_compatible<E>
auto context_from(oc::basic_result<T, E, P> rx, Source const &source)
        -> result<T>
{
    return inject(std::move(rx),
                  [&](report &r) { r.context_from(source); });
}

} // namespace dismay::help
