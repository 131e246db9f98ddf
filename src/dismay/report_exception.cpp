#include <dismay/report/report_exception.hpp>

#include <new>

namespace dismay
{
report_exception::report_exception(dismay::report r)
    : mReport(std::make_shared<dismay::report>(std::move(r)))
    , mDescription()
{
}

auto report_exception::what() const noexcept -> char const *
{
    if (mDescription.empty() && mReport && !mReport->empty())
    {
        try
        {
            mDescription = mReport->diagnostic_information(
                    report_format::with_diagnostics);
        }
        catch (std::bad_alloc const &)
        {
            return "<report_exception|failed to allocate the diagnostic "
                   "information string>";
        }
        catch (std::exception const &)
        {
            return "<report_exception|failed to render the report>";
        }
    }
    if (mDescription.empty())
    {
        return "<report_exception|empty report>";
    }
    return mDescription.c_str();
}

auto report_exception::has_report() const noexcept -> bool
{
    return mReport && !mReport->empty();
}

auto report_exception::report() const noexcept -> dismay::report const *
{
    return has_report() ? mReport.get() : nullptr;
}

auto report_exception::take_report() noexcept -> dismay::report
{
    if (!mReport)
    {
        return dismay::report();
    }
    return std::move(*mReport);
}

auto make_report(report_exception &&e, adl::reporting::type) -> dismay::report
{
    if (e.has_report())
    {
        return e.take_report();
    }
    return dismay::report::msg(std::string(e.what()), std::source_location{});
}

} // namespace dismay
