#include <dismay/process.hpp>
#include "boost-unit-test.hpp"

#include <filesystem>
#include <string>

#include <fmt/format.h>

#include "test-utils.hpp"

BOOST_AUTO_TEST_SUITE(process_tests)

BOOST_AUTO_TEST_CASE(output_captures_both_streams_and_the_exit_code)
{
    dismay::command cmd("sh");
    cmd.args({"-c", "echo out; echo err >&2; exit 3"});

    auto rx = cmd.output();
    TEST_RESULT_REQUIRE(rx);

    auto const &out = rx.assume_value();
    BOOST_TEST(out.stdout_data == "out\n");
    BOOST_TEST(out.stderr_data == "err\n");
    BOOST_TEST(out.status.code().value_or(-1) == 3);
    BOOST_TEST(!out.status.signal().has_value());
    BOOST_TEST(!out.status.success());
}

BOOST_AUTO_TEST_CASE(output_handles_large_interleaved_streams)
{
    // larger than a pipe buffer on both streams
    dismay::command cmd("sh");
    cmd.args({"-c", "i=0; while [ $i -lt 20000 ]; do echo 0123456789; "
                    "echo abcdefghij >&2; i=$((i+1)); done"});

    auto rx = cmd.output();
    TEST_RESULT_REQUIRE(rx);

    BOOST_TEST(rx.assume_value().stdout_data.size() == 20000U * 11U);
    BOOST_TEST(rx.assume_value().stderr_data.size() == 20000U * 11U);
    BOOST_TEST(rx.assume_value().status.success());
}

BOOST_AUTO_TEST_CASE(terminating_signal_is_reported)
{
    dismay::command cmd("sh");
    cmd.args({"-c", "kill -9 $$"});

    auto rx = cmd.output();
    TEST_RESULT_REQUIRE(rx);

    BOOST_TEST(!rx.assume_value().status.code().has_value());
    BOOST_TEST(rx.assume_value().status.signal().value_or(-1) == 9);
}

BOOST_AUTO_TEST_CASE(current_dir_changes_the_working_directory)
{
    auto const tmp = std::filesystem::canonical(
            std::filesystem::temp_directory_path());

    dismay::command cmd("pwd");
    cmd.current_dir(tmp);

    auto rx = cmd.output();
    TEST_RESULT_REQUIRE(rx);
    BOOST_TEST(rx.assume_value().stdout_data == tmp.string() + "\n");
}

BOOST_AUTO_TEST_CASE(status_waits_for_the_child)
{
    dismay::command cmd("sh");
    cmd.args({"-c", "exit 0"});

    auto rx = cmd.status();
    TEST_RESULT_REQUIRE(rx);
    BOOST_TEST(rx.assume_value().success());
}

BOOST_AUTO_TEST_CASE(missing_program_fails_to_spawn)
{
    dismay::command cmd("dismay-this-program-does-not-exist");
    cmd.arg("--flag");

    auto rx = cmd.output();
    BOOST_TEST_REQUIRE(rx.has_error());

    auto const message = rx.assume_error().diagnostic_information(
            dismay::report_format::simple);
    BOOST_TEST(message.starts_with(
            "the child process could not be spawned: "
            "\"dismay-this-program-does-not-exist\" \"--flag\": system => "));
}

BOOST_AUTO_TEST_CASE(missing_working_directory_fails_to_spawn)
{
    dismay::command cmd("pwd");
    cmd.current_dir("/dismay/does/not/exist");

    auto rx = cmd.status();
    BOOST_TEST_REQUIRE(rx.has_error());
    BOOST_TEST(rx.assume_error()
                       .diagnostic_information(dismay::report_format::simple)
                       .starts_with("the child process could not be spawned"));
}

BOOST_AUTO_TEST_CASE(command_formatting_quotes_every_token)
{
    dismay::command cmd("git");
    cmd.args({"commit", "-m", "say \"hi\""});
    BOOST_TEST(fmt::format("{}", cmd)
               == R"("git" "commit" "-m" "say \"hi\"")");

    cmd.current_dir("/tmp");
    BOOST_TEST(fmt::format("{}", cmd)
               == R"(cd "/tmp" && "git" "commit" "-m" "say \"hi\"")");
}

BOOST_AUTO_TEST_CASE(exit_status_decodes_wait_status)
{
    // exit code 5
    auto const exited = dismay::exit_status::from_wait_status(5 << 8);
    BOOST_TEST(exited.code().value_or(-1) == 5);

    // killed by SIGTERM
    auto const signaled = dismay::exit_status::from_wait_status(15);
    BOOST_TEST(signaled.signal().value_or(-1) == 15);
    BOOST_TEST(!signaled.success());
}

BOOST_AUTO_TEST_SUITE_END()
