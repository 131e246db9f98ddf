#include <dismay/report/report.hpp>

#include <ostream>
#include <string>
#include <vector>

#include <fmt/format.h>

#include <dismay/config.hpp>
#include <dismay/report/handler.hpp>
#include <dismay/report/report_exception.hpp>

#include "writers.hpp"

namespace dismay
{
namespace
{
using namespace std::string_view_literals;

auto describe(std::error_code const &ec) -> std::string
{
    return fmt::format(FMT_STRING("{} => {}"), ec.category().name(),
                       ec.message());
}

auto from_code(std::error_code const &ec) -> report
{
    return report::msg(describe(ec), std::source_location{});
}

// collects the messages of e and its nested exceptions, outermost first
void unroll(std::vector<std::string> &messages, std::exception const &e)
{
    messages.emplace_back(e.what());
    try
    {
        std::rethrow_if_nested(e);
    }
    catch (std::exception const &nested)
    {
        unroll(messages, nested);
    }
    catch (...)
    {
        messages.emplace_back("<unknown exception>");
    }
}
} // namespace

report::report() noexcept
    : mCauses()
    , mStore()
{
}

report::report(report &&other) noexcept = default;
auto report::operator=(report &&other) noexcept -> report & = default;
report::~report() noexcept = default;

report::report(cause_chain causes, std::unique_ptr<handler> store) noexcept
    : mCauses(std::move(causes))
    , mStore(std::move(store))
{
}

auto report::from_display(display_value message,
                          hook const *owner,
                          std::source_location location) -> report
{
    hook const &creator = owner != nullptr ? *owner : hook::installed();

    cause_chain causes;
    causes.push_back(std::move(message));
    report r(std::move(causes), creator.make_handler(false));
    r.track_caller(location);
    return r;
}

auto report::empty() const noexcept -> bool
{
    return mCauses.empty();
}

auto report::causes() const noexcept -> cause_chain const &
{
    return mCauses;
}

auto report::section(dismay::section entry) & -> report &
{
    store().push_section(std::move(entry));
    return *this;
}

auto report::section(dismay::section entry) && -> report &&
{
    return std::move(section(std::move(entry)));
}

auto report::diagnostic_information(report_format format) const -> std::string
{
    format_buffer out;
    diagnostic_information(out, format);
    return fmt::to_string(out);
}

void report::diagnostic_information(format_buffer &out,
                                    report_format format) const
{
    if (mStore)
    {
        mStore->render(out, mCauses, format);
        return;
    }

    // only empty reports lack a context store
    bool first = true;
    for (auto const &cause : mCauses)
    {
        if (!first)
        {
            detail::append(out, ": "sv);
        }
        cause.render(out);
        first = false;
    }
}

void report::track_caller(std::source_location location) noexcept
{
    if (mStore)
    {
        mStore->track_caller(location);
    }
}

auto report::context() const noexcept -> handler const *
{
    return mStore.get();
}

auto report::store() -> handler &
{
    if (!mStore)
    {
        mStore = hook::installed().make_handler(false);
    }
    return *mStore;
}

void report::push_help(help_kind kind, display_value content)
{
    store().push_help(help_info(kind, std::move(content)));
}

void report::push_error(cause_chain causes)
{
    store().push_error(std::move(causes));
}

auto operator<<(std::ostream &s, report const &r) -> std::ostream &
{
    format_buffer out;
    r.diagnostic_information(out, report_format::with_diagnostics);
    s.write(out.data(), static_cast<std::streamsize>(out.size()));
    return s;
}

auto make_report(errc code, adl::reporting::type) -> report
{
    return from_code(make_error_code(code));
}

namespace adl::reporting
{
auto make_report(std::error_code ec, adl::reporting::type) -> report
{
    return from_code(ec);
}

auto make_report(std::errc ec, adl::reporting::type) -> report
{
    return from_code(std::make_error_code(ec));
}

auto make_report(std::exception const &e, adl::reporting::type) -> report
{
    if (auto const *carrier = dynamic_cast<report_exception const *>(&e);
        carrier != nullptr && carrier->has_report())
    {
        // the report is shared by all copies of the exception, hence it
        // cannot be moved out of a const reference
        return report::msg(std::string(carrier->what()),
                           std::source_location{});
    }

    std::vector<std::string> messages;
    unroll(messages, e);

    // the innermost exception is the root cause
    report r = report::msg(std::move(messages.back()), std::source_location{});
    messages.pop_back();
    for (auto it = messages.rbegin(); it != messages.rend(); ++it)
    {
        r.wrap_err(std::move(*it));
    }
    return r;
}

auto make_report(std::exception_ptr const &e, adl::reporting::type) -> report
{
    if (!e)
    {
        return report::msg("<no exception>"sv, std::source_location{});
    }
    try
    {
        std::rethrow_exception(e);
    }
    catch (report_exception &carrier)
    {
        if (carrier.has_report())
        {
            return carrier.take_report();
        }
        return report::msg(std::string(carrier.what()),
                           std::source_location{});
    }
    catch (std::exception const &ex)
    {
        return make_report(ex, adl::reporting::type{});
    }
    catch (...)
    {
        return report::msg("<unknown exception>"sv, std::source_location{});
    }
}
} // namespace adl::reporting

} // namespace dismay
