#include <dismay/report/context_from.hpp>

#include <string_view>

#include <fmt/format.h>

#include "utf.hpp"

namespace dismay
{
namespace
{
using namespace std::string_view_literals;

constexpr auto exit_status_header = "Exit Status:"sv;

auto describe(exit_status const &status) -> std::string
{
    auto const how = status.success() ? "successfully"sv : "unsuccessfully"sv;
    if (auto const code = status.code())
    {
        return fmt::format(FMT_STRING("command exited {} with status code {}"),
                           how, *code);
    }
    if (auto const signal = status.signal())
    {
        return fmt::format(FMT_STRING("command terminated {} by signal {}"),
                           how, *signal);
    }
    return fmt::format(
            FMT_STRING("command exited {} without a status code or signal"),
            how);
}
} // namespace

auto context_sections(command const &source) -> std::vector<section>
{
    std::vector<section> sections;
    sections.push_back(make_section("Command:"sv, fmt::format("{}", source)));
    return sections;
}

auto context_sections(exit_status const &source) -> std::vector<section>
{
    std::vector<section> sections;
    sections.push_back(make_section(exit_status_header, describe(source)));
    return sections;
}

auto context_sections(process_output const &source) -> std::vector<section>
{
    auto sections = context_sections(source.status);
    sections.push_back(make_section(
            "Stdout:"sv, utf::to_string_lossy(source.stdout_data)));
    sections.push_back(make_section(
            "Stderr:"sv, utf::to_string_lossy(source.stderr_data)));
    return sections;
}

} // namespace dismay
