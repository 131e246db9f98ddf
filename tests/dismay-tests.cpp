#include "boost-unit-test.hpp"

#if defined(BOOST_COMP_MSVC_AVAILABLE)
#pragma warning(push, 3)
#pragma warning(disable : 4702) // unreachable code
#endif

#include <gmock/gmock.h>

#if defined(BOOST_COMP_MSVC_AVAILABLE)
#pragma warning(pop)
#endif

#include <dismay/config.hpp>

#if defined BOOST_COMP_GNUC_AVAILABLE
#pragma GCC diagnostic ignored "-Wmissing-declarations"
#endif

using namespace boost::unit_test;

class HookupListner : public ::testing::EmptyTestEventListener
{
public:
    void OnTestPartResult(const ::testing::TestPartResult &result) override
    {
        boost::unit_test::unit_test_log
                << boost::unit_test::log::begin(result.file_name(),
                                                result.line_number())
                << boost::unit_test::log_all_errors << result.summary()
                << boost::unit_test::log::end();
        boost::unit_test::framework::assertion_result(
                result.passed() ? boost::unit_test::AR_PASSED
                                : boost::unit_test::AR_FAILED);
    }
};

// the process wide hook is installed before any test runs, hence reports
// created without an explicit hook render identically regardless of the
// environment variables of the test process
bool init_dismay_tests()
{
    auto &suite{boost::unit_test::framework::master_test_suite()};
    ::testing::InitGoogleMock(&suite.argc, suite.argv);

    // hook up the gmock and boost test
    auto &listeners{::testing::UnitTest::GetInstance()->listeners()};
    delete listeners.Release(listeners.default_result_printer());
    listeners.Append(new HookupListner);

    auto installed = dismay::hook_builder()
                             .theme(dismay::theme{})
                             .library_verbosity(dismay::verbosity::minimal)
                             .panic_verbosity(dismay::verbosity::minimal)
                             .capture_span_trace_by_default(false)
                             .display_location_section(false)
                             .backtrace_provider(nullptr)
                             .install();
    if (installed.has_error())
    {
        return false;
    }

    framework::master_test_suite().p_name.value = "dismay test suite";
    return true;
}

auto main(int argc, char *argv[]) -> int
{
    return boost::unit_test::unit_test_main(&init_dismay_tests, argc, argv);
}
