#pragma once

#include <memory>
#include <optional>
#include <source_location>
#include <span>
#include <vector>

#include <dismay/capture/span_trace.hpp>
#include <dismay/capture/stack_trace.hpp>
#include <dismay/config.hpp>
#include <dismay/report/fwd.hpp>
#include <dismay/report/help_info.hpp>
#include <dismay/report/renderable.hpp>
#include <dismay/report/section.hpp>

namespace dismay
{
/**
 * @brief The context store of a single report.
 *
 * Holds the execution history captured while the report got created and the
 * sections, help entries and auxiliary errors attached afterwards. A handler
 * is exclusively owned by one report and is never shared.
 */
class handler final
{
public:
    using cause_chain = std::vector<display_value>;

    handler(hook owner,
            bool panicking,
            std::optional<stack_trace> backtrace,
            std::optional<tracing::span_trace> spans) noexcept;

    handler(handler const &) = delete;
    auto operator=(handler const &) -> handler & = delete;

    void track_caller(std::source_location location) noexcept;

    /**
     * @brief Appends the section unless it has been suppressed.
     */
    void push_section(section entry);
    void push_help(help_info entry);
    void push_error(cause_chain causes);

    [[nodiscard]] auto config() const noexcept -> printer_config const &;
    [[nodiscard]] auto owner() const noexcept -> hook const &;
    [[nodiscard]] auto panicking() const noexcept -> bool;
    [[nodiscard]] auto level() const noexcept -> verbosity;

    [[nodiscard]] auto backtrace() const noexcept
            -> std::optional<stack_trace> const &;
    [[nodiscard]] auto spans() const noexcept
            -> std::optional<tracing::span_trace> const &;
    [[nodiscard]] auto location() const noexcept
            -> std::optional<std::source_location> const &;

    /**
     * @brief Writes the complete report for the given cause chain.
     *
     * Rendering doesn't modify the handler, repeated calls produce identical
     * output.
     */
    void render(format_buffer &out,
                std::span<display_value const> causes,
                report_format format) const;

    /**
     * @brief Writes the backtrace, the environment hints and the span trace.
     */
    void render_diagnostics(format_buffer &out) const;

private:
    hook mOwner;
    std::optional<stack_trace> mBacktrace;
    std::optional<tracing::span_trace> mSpans;
    std::optional<std::source_location> mLocation;
    std::vector<section> mSections;
    std::vector<help_info> mHelp;
    std::vector<cause_chain> mErrors;
    bool mPanicking;
};

} // namespace dismay
