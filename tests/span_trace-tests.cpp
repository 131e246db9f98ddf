#include <dismay/capture/span_trace.hpp>
#include "boost-unit-test.hpp"

#include <source_location>
#include <string>
#include <string_view>

#include <fmt/format.h>

#include <dismay/config.hpp>
#include <dismay/report/report.hpp>

#include "test-utils.hpp"

using namespace std::string_view_literals;

namespace
{
auto contains(std::string_view text, std::string_view needle) -> bool
{
    return text.find(needle) != std::string_view::npos;
}
} // namespace

BOOST_AUTO_TEST_SUITE(span_trace_tests)

BOOST_AUTO_TEST_CASE(capture_without_layer_is_unsupported)
{
    BOOST_TEST(!dismay::tracing::error_layer::installed());

    dismay::tracing::span const outer("tests", "outer");
    auto const trace = dismay::tracing::span_trace::capture();
    BOOST_TEST((trace.status() == dismay::tracing::span_trace_status::unsupported));
    BOOST_TEST(trace.spans().empty());
}

BOOST_AUTO_TEST_CASE(capture_without_spans_is_empty)
{
    dismay::tracing::error_layer const layer;

    auto const trace = dismay::tracing::span_trace::capture();
    BOOST_TEST((trace.status() == dismay::tracing::span_trace_status::empty));
}

BOOST_AUTO_TEST_CASE(capture_lists_the_innermost_span_first)
{
    dismay::tracing::error_layer const layer;

    DISMAY_SPAN("tests", "outer");
    std::source_location innerLocation;
    auto const trace = [&]
    {
        innerLocation = std::source_location::current();
        dismay::tracing::span const inner("tests", "inner", "id=7",
                                          innerLocation);
        return dismay::tracing::span_trace::capture();
    }();

    BOOST_TEST_REQUIRE(
            (trace.status() == dismay::tracing::span_trace_status::captured));
    BOOST_TEST_REQUIRE(trace.spans().size() == 2U);
    BOOST_TEST(trace.spans()[0].name == "inner");
    BOOST_TEST(trace.spans()[0].fields == "id=7");
    BOOST_TEST(trace.spans()[0].line == innerLocation.line());
    BOOST_TEST(trace.spans()[1].name == "outer");
    BOOST_TEST(trace.spans()[1].target == "tests");
}

BOOST_AUTO_TEST_CASE(exited_spans_are_not_captured)
{
    dismay::tracing::error_layer const layer;
    {
        DISMAY_SPAN("tests", "finished");
    }

    auto const trace = dismay::tracing::span_trace::capture();
    BOOST_TEST((trace.status() == dismay::tracing::span_trace_status::empty));
}

BOOST_AUTO_TEST_CASE(format_span_trace)
{
    std::vector<dismay::tracing::span_record> spans{
            {.target = "app",
             .name = "read_file",
             .fields = "path=\"fake_file\"",
             .file = "src/app.cpp",
             .line = 12},
            {.target = "app",
             .name = "main",
             .fields = "",
             .file = "src/main.cpp",
             .line = 3},
    };
    dismay::tracing::span_trace const trace(
            dismay::tracing::span_trace_status::captured, std::move(spans));

    dismay::format_buffer out;
    dismay::tracing::format_span_trace(out, trace, dismay::theme{});
    auto const text = fmt::to_string(out);

    BOOST_TEST(text.starts_with(
            fmt::format("  {:━^80}", " SPANTRACE ")));
    BOOST_TEST(contains(text, "\n     0: app::read_file with path=\"fake_file\""
                              "\n        at src/app.cpp:12"));
    BOOST_TEST(contains(text, "\n     1: app::main\n        at src/main.cpp:3"));
}

BOOST_AUTO_TEST_CASE(format_ignores_uncaptured_traces)
{
    dismay::format_buffer out;
    dismay::tracing::format_span_trace(out, dismay::tracing::span_trace(),
                                       dismay::theme{});
    BOOST_TEST(out.size() == 0U);
}

#if DISMAY_CAPTURE_SPANTRACE
BOOST_AUTO_TEST_CASE(reports_warn_about_a_missing_layer)
{
    auto const owner = dismay_tests::plain_hook_builder()
                               .capture_span_trace_by_default(true)
                               .into_hook();
    auto const r = dismay::report::msg("boom"sv, owner);

    BOOST_TEST(contains(
            r.diagnostic_information(dismay::report_format::with_diagnostics),
            "Warning: SpanTrace capture is Unsupported.\n"
            "Ensure that you've setup an error layer and the versions match"));
}

BOOST_AUTO_TEST_CASE(reports_show_the_active_spans)
{
    dismay::tracing::error_layer const layer;
    auto const owner = dismay_tests::plain_hook_builder()
                               .capture_span_trace_by_default(true)
                               .into_hook();

    DISMAY_SPAN("tests", "reporting", "attempt=1");
    auto const r = dismay::report::msg("boom"sv, owner);
    auto const text
            = r.diagnostic_information(dismay::report_format::with_diagnostics);

    BOOST_TEST(contains(text, " SPANTRACE "));
    BOOST_TEST(contains(text, "0: tests::reporting with attempt=1"));
    BOOST_TEST(!contains(text, "Warning: SpanTrace"));
}
#endif

BOOST_AUTO_TEST_SUITE_END()
