#pragma once

#include <concepts>
#include <type_traits>
#include <utility>

#include <boost/predef.h>

#if defined BOOST_COMP_MSVC_AVAILABLE
#pragma warning(push, 3)
#pragma warning(disable : 6285)
#endif

#include <boost/outcome/bad_access.hpp>
#include <boost/outcome/basic_result.hpp>
#include <boost/outcome/policy/base.hpp>
#include <boost/outcome/success_failure.hpp>
#include <boost/outcome/try.hpp>

#if defined BOOST_COMP_MSVC_AVAILABLE
#pragma warning(pop)
#endif

#include <dismay/report/report.hpp>
#include <dismay/report/report_exception.hpp>

namespace dismay
{
namespace outcome = BOOST_OUTCOME_V2_NAMESPACE;
namespace oc = BOOST_OUTCOME_V2_NAMESPACE;

namespace detail
{
class result_no_value_policy : public outcome::policy::base
{
public:
    //! Performs a narrow check of state, used in the assume_value()
    //! functions.
    using base::narrow_value_check;

    //! Performs a narrow check of state, used in the assume_error()
    //! functions.
    using base::narrow_error_check;

    //! Performs a wide check of state, used in the value() functions.
    //! The report is moved into the thrown report_exception unless the
    //! result is const in which case only its rendered text is captured.
    template <class Impl>
    static constexpr void wide_value_check(Impl &&self)
    {
        if (!base::_has_value(self))
        {
            if (base::_has_error(self))
            {
                if constexpr (std::is_const_v<std::remove_reference_t<Impl>>)
                {
                    auto const &err = base::_error(self);
                    if constexpr (std::same_as<
                                          std::remove_cvref_t<decltype(err)>,
                                          report>)
                    {
                        throw report_exception(err.diagnostic_information(
                                report_format::with_diagnostics));
                    }
                    else
                    {
                        throw report_exception(report(err));
                    }
                }
                else
                {
                    // moving lvalues is expected in this case.
                    // NOLINTNEXTLINE(bugprone-move-forwarding-reference)
                    throw report_exception(report(base::_error(std::move(self))));
                }
            }
            throw outcome::bad_result_access("no value");
        }
    }

    //! Performs a wide check of state, used in the error() functions.
    template <class Impl>
    static constexpr void wide_error_check(Impl &&self)
    {
        if (!base::_has_error(self))
        {
            throw outcome::bad_result_access("no error");
        }
    }
};

} // namespace detail

using oc::failure;
using oc::success;

template <typename R, typename E = report>
using result = oc::basic_result<R, E, detail::result_no_value_policy>;

/**
 * @brief Invokes injectFn with the report of a failed result and passes the
 * result on. injectFn is never invoked for a successful result.
 */
template <typename T, typename E, typename P, typename InjectFn>
    requires report_compatible<E>
auto inject(oc::basic_result<T, E, P> rx, InjectFn &&injectFn) -> result<T>
{
    if (rx.has_value())
    {
        if constexpr (std::is_void_v<T>)
        {
            return oc::success();
        }
        else
        {
            return std::move(rx).assume_value();
        }
    }
    report r = make_report(std::move(rx).assume_error(),
                           adl::reporting::type{});
    std::forward<InjectFn>(injectFn)(r);
    return oc::failure(std::move(r));
}

} // namespace dismay

// NOLINTBEGIN(cppcoreguidelines-macro-usage)

#define DISMAY_TRY(...) BOOST_OUTCOME_TRY(__VA_ARGS__)

#define DISMAY_TRY_INJECT(stmt, injected)                                      \
    DISMAY_TRY(::dismay::inject((stmt), [&](::dismay::report &_dismayReport)   \
                                { _dismayReport << injected; }))

// NOLINTEND(cppcoreguidelines-macro-usage)
