#include <dismay/report/context_from.hpp>
#include "boost-unit-test.hpp"

#include <string>
#include <string_view>

#include <fmt/format.h>

#include "test-utils.hpp"

using namespace std::string_view_literals;

namespace
{
auto header_of(dismay::section const &entry) -> std::string
{
    dismay::format_buffer out;
    entry.render_header(out);
    return fmt::to_string(out);
}

auto body_of(dismay::section const &entry) -> std::string
{
    dismay::format_buffer out;
    entry.render_body(out);
    return fmt::to_string(out);
}

auto describe(dismay::exit_status status) -> std::string
{
    auto const sections = dismay::context_sections(status);
    BOOST_TEST_REQUIRE(sections.size() == 1U);
    BOOST_TEST(header_of(sections[0]) == "Exit Status:");
    return body_of(sections[0]);
}
} // namespace

BOOST_AUTO_TEST_SUITE(context_from_tests)

BOOST_AUTO_TEST_CASE(exit_status_success)
{
    BOOST_TEST(describe(dismay::exit_status::from_code(0))
               == "command exited successfully with status code 0");
}

BOOST_AUTO_TEST_CASE(exit_status_failure)
{
    BOOST_TEST(describe(dismay::exit_status::from_code(2))
               == "command exited unsuccessfully with status code 2");
}

BOOST_AUTO_TEST_CASE(exit_status_signal)
{
    BOOST_TEST(describe(dismay::exit_status::from_signal(9))
               == "command terminated unsuccessfully by signal 9");
}

BOOST_AUTO_TEST_CASE(exit_status_unknown)
{
    BOOST_TEST(describe(dismay::exit_status::unknown())
               == "command exited unsuccessfully without a status code or "
                  "signal");
}

BOOST_AUTO_TEST_CASE(exit_status_code_takes_priority)
{
    // WIFEXITED() encoding of exit(3)
    auto const status = dismay::exit_status::from_wait_status(3 << 8);

    BOOST_TEST(status.code().value_or(-1) == 3);
    BOOST_TEST(!status.signal().has_value());
    BOOST_TEST(!status.success());
}

BOOST_AUTO_TEST_CASE(exit_status_from_terminating_signal)
{
    // WIFSIGNALED() encoding of SIGKILL
    auto const status = dismay::exit_status::from_wait_status(9);

    BOOST_TEST(!status.code().has_value());
    BOOST_TEST(status.signal().value_or(-1) == 9);
    BOOST_TEST(!status.success());
}

BOOST_AUTO_TEST_CASE(command_section)
{
    dismay::command cmd("ls");
    cmd.arg("-la").args({"a \"quoted\" arg"sv});

    auto const sections = dismay::context_sections(cmd);
    BOOST_TEST_REQUIRE(sections.size() == 1U);
    BOOST_TEST(header_of(sections[0]) == "Command:");
    BOOST_TEST(body_of(sections[0]) == R"("ls" "-la" "a \"quoted\" arg")");
}

BOOST_AUTO_TEST_CASE(command_with_working_directory)
{
    dismay::command cmd("make");
    cmd.current_dir("/tmp/build");

    BOOST_TEST(fmt::format("{}", cmd) == R"(cd "/tmp/build" && "make")");
}

BOOST_AUTO_TEST_CASE(output_sections)
{
    dismay::process_output const output{
            dismay::exit_status::from_code(1), "partial\xff output", ""};

    auto const sections = dismay::context_sections(output);
    BOOST_TEST_REQUIRE(sections.size() == 3U);
    BOOST_TEST(header_of(sections[0]) == "Exit Status:");
    BOOST_TEST(header_of(sections[1]) == "Stdout:");
    BOOST_TEST(body_of(sections[1]) == "partial\xef\xbf\xbd output");
    BOOST_TEST(header_of(sections[2]) == "Stderr:");
    BOOST_TEST(body_of(sections[2]).empty());
}

BOOST_AUTO_TEST_CASE(empty_streams_are_not_rendered)
{
    dismay::process_output const output{
            dismay::exit_status::from_code(1), "", "failure details\n"};

    auto r = dismay::report::msg("boom"sv, dismay_tests::plain_hook());
    r.context_from(output);

    auto const text
            = r.diagnostic_information(dismay::report_format::with_diagnostics);
    BOOST_TEST(text.find("Stdout:") == std::string::npos);
    BOOST_TEST(dismay_tests::appear_in_order(
            text,
            {"Exit Status:\n   command exited unsuccessfully with status code 1"sv,
             "Stderr:\n   failure details\n\n"sv}));
}

BOOST_AUTO_TEST_SUITE_END()
