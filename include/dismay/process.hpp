#pragma once

#include <filesystem>
#include <initializer_list>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <fmt/format.h>

#include <dismay/result.hpp>

namespace dismay
{
/**
 * @brief How a process terminated.
 *
 * Either an exit code or a terminating signal is known, or neither if the
 * platform doesn't report it.
 */
class exit_status final
{
public:
    static constexpr auto from_code(int code) noexcept -> exit_status
    {
        return exit_status(code, std::nullopt);
    }
    static constexpr auto from_signal(int signal) noexcept -> exit_status
    {
        return exit_status(std::nullopt, signal);
    }
    static constexpr auto unknown() noexcept -> exit_status
    {
        return exit_status(std::nullopt, std::nullopt);
    }
    /**
     * @brief Decodes a status as reported by waitpid().
     */
    static auto from_wait_status(int status) noexcept -> exit_status;

    [[nodiscard]] constexpr auto code() const noexcept -> std::optional<int>
    {
        return mCode;
    }
    [[nodiscard]] constexpr auto signal() const noexcept -> std::optional<int>
    {
        return mSignal;
    }
    [[nodiscard]] constexpr auto success() const noexcept -> bool
    {
        return mCode == 0;
    }

private:
    constexpr exit_status(std::optional<int> code,
                          std::optional<int> signal) noexcept
        : mCode(code)
        , mSignal(signal)
    {
    }

    std::optional<int> mCode;
    std::optional<int> mSignal;
};

struct process_output
{
    exit_status status;
    std::string stdout_data;
    std::string stderr_data;
};

/**
 * @brief Describes a program invocation.
 */
class command final
{
public:
    explicit command(std::string program);

    auto arg(std::string value) -> command &;
    auto args(std::initializer_list<std::string_view> values) -> command &;
    auto args(std::vector<std::string> const &values) -> command &;
    auto current_dir(std::filesystem::path dir) -> command &;

    [[nodiscard]] auto program() const noexcept -> std::string const &;
    [[nodiscard]] auto arguments() const noexcept
            -> std::vector<std::string> const &;
    [[nodiscard]] auto working_directory() const noexcept
            -> std::optional<std::filesystem::path> const &;

    /**
     * @brief Runs the program to completion capturing stdout and stderr.
     */
    [[nodiscard]] auto output() const -> result<process_output>;
    /**
     * @brief Runs the program to completion, the child inherits the
     * standard streams.
     */
    [[nodiscard]] auto status() const -> result<exit_status>;

private:
    std::string mProgram;
    std::vector<std::string> mArguments;
    std::optional<std::filesystem::path> mWorkingDirectory;
};

} // namespace dismay

template <>
struct fmt::formatter<dismay::command>
{
    constexpr auto parse(format_parse_context &ctx)
            -> format_parse_context::iterator
    {
        return ctx.begin();
    }

    auto format(dismay::command const &cmd, format_context &ctx) const
            -> format_context::iterator;
};
