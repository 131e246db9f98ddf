#pragma once

#include <memory>
#include <optional>
#include <string>
#include <vector>

#include <fmt/color.h>

#include <dismay/capture/stack_trace.hpp>
#include <dismay/report/fwd.hpp>
#include <dismay/result.hpp>

namespace dismay
{
/**
 * @brief Maps the abstract parts of a report to terminal styles.
 *
 * A default constructed theme doesn't style anything.
 */
struct theme
{
    fmt::text_style file;
    fmt::text_style line_number;
    fmt::text_style active_line;
    fmt::text_style error;
    fmt::text_style help_info_note;
    fmt::text_style help_info_warning;
    fmt::text_style help_info_suggestion;
    fmt::text_style help_info_error;
    fmt::text_style dependency_code;
    fmt::text_style crate_code;
    fmt::text_style code_hash;
    fmt::text_style panic_header;
    fmt::text_style panic_message;
    fmt::text_style panic_file;
    fmt::text_style panic_line_number;
    fmt::text_style hidden_frames;
    fmt::text_style spantrace_target;
    fmt::text_style spantrace_fields;

    static auto dark() noexcept -> theme;
    static auto light() noexcept -> theme;
};

auto library_verbosity() noexcept -> verbosity;
auto panic_verbosity() noexcept -> verbosity;

struct verbosity_policy
{
    verbosity library;
    verbosity panic;

    static auto from_env() noexcept -> verbosity_policy;

    [[nodiscard]] constexpr auto select(bool panicking) const noexcept
            -> verbosity
    {
        return panicking ? panic : library;
    }
};

struct printer_config
{
    dismay::theme colors;
    verbosity_policy verbosity;
    std::vector<frame_filter> filters;
    std::shared_ptr<backtrace_provider const> backtraces;
    std::optional<std::string> panic_section;
    bool show_hidden_frames;
    bool capture_span_trace;
    bool display_env_section;
    bool display_location_section;
};

/**
 * @brief Cheaply copyable handle to an immutable printer configuration.
 *
 * Every report keeps the hook which created it alive.
 */
class hook final
{
public:
    explicit hook(std::shared_ptr<printer_config const> config) noexcept;

    [[nodiscard]] auto config() const noexcept -> printer_config const &;

    /**
     * @brief Creates an empty context store and captures the execution
     * history the verbosity policy asks for.
     */
    [[nodiscard]] auto make_handler(bool panicking) const
            -> std::unique_ptr<handler>;

    /**
     * @brief Makes this the process wide configuration.
     *
     * Only the first installation succeeds, every later attempt fails with
     * errc::hook_already_installed.
     */
    [[nodiscard]] auto install() const -> result<void>;

    /**
     * @brief The process wide configuration, installs the default
     * configuration if no hook has been installed yet.
     */
    static auto installed() -> hook const &;

private:
    std::shared_ptr<printer_config const> mConfig;
};

class hook_builder final
{
public:
    /**
     * @brief Starts with the dark theme, the default frame filters and the
     * verbosity and span trace settings from the environment.
     */
    hook_builder();

    auto theme(dismay::theme colors) -> hook_builder &;
    auto library_verbosity(verbosity level) -> hook_builder &;
    auto panic_verbosity(verbosity level) -> hook_builder &;
    auto capture_span_trace_by_default(bool enabled) -> hook_builder &;
    auto display_env_section(bool enabled) -> hook_builder &;
    auto display_location_section(bool enabled) -> hook_builder &;
    auto show_hidden_frames(bool enabled) -> hook_builder &;
    auto add_frame_filter(frame_filter filter) -> hook_builder &;
    auto add_default_filters() -> hook_builder &;
    auto clear_frame_filters() -> hook_builder &;
    /**
     * @brief Adds a section to every panic report, e.g. to point at the bug
     * tracker.
     */
    auto panic_section(std::string text) -> hook_builder &;
    auto backtrace_provider(
            std::shared_ptr<dismay::backtrace_provider const> provider)
            -> hook_builder &;

    [[nodiscard]] auto into_hook() const -> hook;
    [[nodiscard]] auto install() const -> result<void>;

private:
    printer_config mConfig;
};

} // namespace dismay
