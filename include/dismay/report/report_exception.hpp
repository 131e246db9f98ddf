#pragma once

#include <exception>
#include <memory>
#include <string>

#include <dismay/report/report.hpp>

namespace dismay
{
/**
 * @brief Carries a report through stack unwinding.
 *
 * Copies of the exception share the report. The exception either owns the
 * report itself or only its rendered text if the report couldn't be moved
 * out of its origin.
 */
class report_exception final : public std::exception
{
public:
    report_exception() = delete;
    explicit report_exception(dismay::report r);
    explicit report_exception(std::string description) noexcept;

    [[nodiscard]] auto what() const noexcept -> char const * override;

    [[nodiscard]] auto has_report() const noexcept -> bool;
    /**
     * @brief The carried report or nullptr if it has been taken or only the
     * rendered text is known.
     */
    [[nodiscard]] auto report() const noexcept -> dismay::report const *;
    /**
     * @brief Moves the report out of the exception. Every copy of this
     * exception observes an empty report afterwards.
     */
    auto take_report() noexcept -> dismay::report;

private:
    std::shared_ptr<dismay::report> mReport;
    mutable std::string mDescription;
};

inline report_exception::report_exception(std::string description) noexcept
    : mReport()
    , mDescription(std::move(description))
{
}

auto make_report(report_exception &&e, adl::reporting::type) -> report;

} // namespace dismay
