#include "writers.hpp"
#include "boost-unit-test.hpp"

#include <string_view>

#include <fmt/format.h>

using namespace std::string_view_literals;

BOOST_AUTO_TEST_SUITE(writers_tests)

BOOST_AUTO_TEST_CASE(header_writer_skips_empty_scopes)
{
    dismay::format_buffer out;
    dismay::detail::header_writer writer(out, "Header:\n"sv);

    writer.ready().write(""sv);
    BOOST_TEST(!writer.started());
    BOOST_TEST(out.size() == 0U);
}

BOOST_AUTO_TEST_CASE(header_writer_writes_the_header_once_per_scope)
{
    dismay::format_buffer out;
    dismay::detail::header_writer writer(out, "> "sv);

    writer.ready().write("a"sv);
    writer.write("b"sv);
    writer.ready().print("{}", 3);
    BOOST_TEST(fmt::to_string(out) == "> ab> 3");
}

BOOST_AUTO_TEST_CASE(header_writer_in_progress_suppresses_the_header)
{
    dismay::format_buffer out;
    dismay::detail::header_writer writer(out, "> "sv);

    writer.in_progress().write("a"sv);
    BOOST_TEST(fmt::to_string(out) == "a");
}

BOOST_AUTO_TEST_CASE(separated_writer_joins_non_empty_blocks)
{
    dismay::format_buffer out;
    dismay::detail::separated_writer writer(out, "\n\n"sv);

    writer.write(""sv);
    writer.write("first"sv);
    writer.write(""sv);
    writer.write("second"sv);
    BOOST_TEST(fmt::to_string(out) == "first\n\nsecond");
}

BOOST_AUTO_TEST_CASE(separated_writer_continues_existing_output)
{
    dismay::format_buffer out;
    dismay::detail::append(out, "prefix"sv);
    dismay::detail::separated_writer writer(out, "\n"sv, true);

    writer.write("block"sv);
    BOOST_TEST(fmt::to_string(out) == "prefix\nblock");
}

BOOST_AUTO_TEST_CASE(trim_end_removes_trailing_whitespace)
{
    BOOST_TEST(dismay::detail::trim_end("text \n\t\n"sv) == "text"sv);
    BOOST_TEST(dismay::detail::trim_end("  \n"sv).empty());
    BOOST_TEST(dismay::detail::trim_end("  lead"sv) == "  lead"sv);
}

BOOST_AUTO_TEST_CASE(write_indented_skips_empty_lines)
{
    dismay::format_buffer out;
    dismay::detail::write_indented(out, "one\n\ntwo"sv, "   "sv);
    BOOST_TEST(fmt::to_string(out) == "   one\n\n   two");
}

BOOST_AUTO_TEST_CASE(write_numbered_aligns_continuation_lines)
{
    dismay::format_buffer out;
    dismay::detail::write_numbered(out, 1, "first line\nsecond line"sv);
    BOOST_TEST(fmt::to_string(out) == "   1: first line\n      second line");
}

BOOST_AUTO_TEST_SUITE_END()
