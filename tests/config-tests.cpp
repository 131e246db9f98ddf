#include <dismay/config.hpp>
#include "boost-unit-test.hpp"

#include <cstdlib>

#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "test-utils.hpp"

using namespace std::string_view_literals;

namespace
{
// restores the previous value of an environment variable on destruction
class scoped_env
{
public:
    scoped_env(char const *name, char const *value)
        : mName(name)
        , mPrevious()
    {
        if (auto const *previous = std::getenv(name))
        {
            mPrevious = previous;
        }
        if (value != nullptr)
        {
            ::setenv(name, value, 1);
        }
        else
        {
            ::unsetenv(name);
        }
    }
    ~scoped_env()
    {
        if (mPrevious.has_value())
        {
            ::setenv(mName, mPrevious->c_str(), 1);
        }
        else
        {
            ::unsetenv(mName);
        }
    }

    scoped_env(scoped_env const &) = delete;
    auto operator=(scoped_env const &) -> scoped_env & = delete;

private:
    char const *mName;
    std::optional<std::string> mPrevious;
};
} // namespace

BOOST_AUTO_TEST_SUITE(config_tests)

BOOST_AUTO_TEST_CASE(only_the_first_install_succeeds)
{
    // the test runner installed its hook before any test case ran
    auto const rx = dismay::hook_builder().install();

    BOOST_TEST_REQUIRE(rx.has_error());
    BOOST_TEST(rx.assume_error().diagnostic_information(
                       dismay::report_format::simple)
               == "dismay => a hook has already been installed");
}

BOOST_AUTO_TEST_CASE(installed_hook_is_the_first_one)
{
    auto const &cfg = dismay::hook::installed().config();

    BOOST_TEST(!cfg.display_location_section);
    BOOST_TEST(!cfg.capture_span_trace);
    BOOST_TEST(cfg.verbosity.library == dismay::verbosity::minimal);
}

BOOST_AUTO_TEST_CASE(verbosity_policy_select)
{
    constexpr dismay::verbosity_policy policy{dismay::verbosity::minimal,
                                              dismay::verbosity::full};

    static_assert(policy.select(false) == dismay::verbosity::minimal);
    static_assert(policy.select(true) == dismay::verbosity::full);
}

BOOST_AUTO_TEST_CASE(verbosity_levels_are_ordered)
{
    BOOST_TEST(dismay::verbosity::minimal < dismay::verbosity::medium);
    BOOST_TEST(dismay::verbosity::medium < dismay::verbosity::full);
}

BOOST_AUTO_TEST_CASE(library_verbosity_from_env)
{
    scoped_env const backtrace("DISMAY_BACKTRACE", nullptr);
    {
        scoped_env const lib("DISMAY_LIB_BACKTRACE", "full");
        BOOST_TEST(dismay::library_verbosity() == dismay::verbosity::full);
    }
    {
        scoped_env const lib("DISMAY_LIB_BACKTRACE", "1");
        BOOST_TEST(dismay::library_verbosity() == dismay::verbosity::medium);
    }
    {
        scoped_env const lib("DISMAY_LIB_BACKTRACE", "0");
        BOOST_TEST(dismay::library_verbosity() == dismay::verbosity::minimal);
    }
    {
        scoped_env const lib("DISMAY_LIB_BACKTRACE", nullptr);
        BOOST_TEST(dismay::library_verbosity() == dismay::verbosity::minimal);
    }
}

BOOST_AUTO_TEST_CASE(library_verbosity_falls_back_to_backtrace)
{
    scoped_env const lib("DISMAY_LIB_BACKTRACE", nullptr);
    scoped_env const backtrace("DISMAY_BACKTRACE", "1");

    BOOST_TEST(dismay::library_verbosity() == dismay::verbosity::medium);
    BOOST_TEST(dismay::panic_verbosity() == dismay::verbosity::medium);
}

BOOST_AUTO_TEST_CASE(panic_verbosity_ignores_lib_backtrace)
{
    scoped_env const lib("DISMAY_LIB_BACKTRACE", "full");
    scoped_env const backtrace("DISMAY_BACKTRACE", "0");

    BOOST_TEST(dismay::panic_verbosity() == dismay::verbosity::minimal);
    BOOST_TEST(dismay::verbosity_policy::from_env().library
               == dismay::verbosity::full);
}

BOOST_AUTO_TEST_CASE(builder_reads_the_switches_from_env)
{
    scoped_env const showHidden("DISMAY_SHOW_HIDDEN", "1");
    scoped_env const spanTrace("DISMAY_SPANTRACE", "0");

    auto const owner = dismay::hook_builder()
                               .capture_span_trace_by_default(true)
                               .into_hook();
    BOOST_TEST(owner.config().show_hidden_frames);
    BOOST_TEST(!owner.config().capture_span_trace);
}

BOOST_AUTO_TEST_CASE(span_trace_capture_is_opt_in)
{
    scoped_env const spanTrace("DISMAY_SPANTRACE", nullptr);

    BOOST_TEST(!dismay::hook_builder().into_hook().config().capture_span_trace);
    BOOST_TEST(dismay::hook_builder()
                       .capture_span_trace_by_default(true)
                       .into_hook()
                       .config()
                       .capture_span_trace);

    // no span trace warning for a report made with the default settings
    auto const owner = dismay::hook_builder()
                               .theme(dismay::theme{})
                               .backtrace_provider(nullptr)
                               .into_hook();
    auto const text = dismay::report::msg("boom"sv, owner)
                              .diagnostic_information(
                                      dismay::report_format::with_diagnostics);
    BOOST_TEST(text.find("SpanTrace") == std::string::npos);
}

BOOST_AUTO_TEST_CASE(builder_defaults_without_env)
{
    scoped_env const showHidden("DISMAY_SHOW_HIDDEN", nullptr);
    scoped_env const spanTrace("DISMAY_SPANTRACE", nullptr);

    auto const owner = dismay::hook_builder().into_hook();
    auto const &cfg = owner.config();
    BOOST_TEST(!cfg.show_hidden_frames);
    BOOST_TEST(!cfg.capture_span_trace);
    BOOST_TEST(cfg.display_env_section);
    BOOST_TEST(cfg.display_location_section);
    BOOST_TEST(!cfg.panic_section.has_value());
    BOOST_TEST((cfg.backtraces != nullptr));
    BOOST_TEST(cfg.filters.size() == dismay::default_frame_filters().size());
}

BOOST_AUTO_TEST_CASE(builder_frame_filters)
{
    auto const numDefaults = dismay::default_frame_filters().size();

    dismay::hook_builder builder;
    builder.add_default_filters();
    BOOST_TEST(builder.into_hook().config().filters.size() == 2 * numDefaults);

    builder.clear_frame_filters().add_frame_filter(
            [](std::vector<dismay::frame const *> &frames) { frames.clear(); });
    BOOST_TEST(builder.into_hook().config().filters.size() == 1U);
}

BOOST_AUTO_TEST_CASE(hooks_are_immutable_snapshots)
{
    dismay::hook_builder builder;
    builder.panic_section("report it");
    auto const before = builder.into_hook();

    builder.panic_section("changed");
    BOOST_TEST(before.config().panic_section.value_or("") == "report it");
    BOOST_TEST(builder.into_hook().config().panic_section.value_or("")
               == "changed");
}

BOOST_AUTO_TEST_SUITE_END()
