#include "test-utils.hpp"

#include <fstream>
#include <iterator>

namespace dismay_tests
{
auto plain_hook_builder() -> dismay::hook_builder
{
    dismay::hook_builder builder;
    builder.theme(dismay::theme{})
            .library_verbosity(dismay::verbosity::minimal)
            .panic_verbosity(dismay::verbosity::minimal)
            .capture_span_trace_by_default(false)
            .show_hidden_frames(false)
            .display_location_section(false)
            .backtrace_provider(nullptr);
    return builder;
}

auto plain_hook(dismay::verbosity level) -> dismay::hook
{
    return plain_hook_builder()
            .library_verbosity(level)
            .panic_verbosity(level)
            .into_hook();
}

auto read_fixture(std::string_view name) -> std::string
{
    std::filesystem::path const path
            = std::filesystem::path(DISMAY_TEST_DATA_DIR) / name;
    std::ifstream file(path, std::ios::binary);
    BOOST_TEST_REQUIRE(file.is_open(), "cannot open " << path.string());
    return std::string(std::istreambuf_iterator<char>(file),
                       std::istreambuf_iterator<char>());
}

auto count_occurrences(std::string_view haystack, std::string_view needle)
        -> std::size_t
{
    std::size_t count = 0;
    for (auto pos = haystack.find(needle); pos != std::string_view::npos;
         pos = haystack.find(needle, pos + needle.size()))
    {
        ++count;
    }
    return count;
}

auto appear_in_order(std::string_view haystack,
                     std::initializer_list<std::string_view> needles)
        -> boost::test_tools::predicate_result
{
    std::size_t pos = 0;
    for (auto needle : needles)
    {
        auto const found = haystack.find(needle, pos);
        if (found == std::string_view::npos)
        {
            boost::test_tools::predicate_result prx{false};
            prx.message() << "\"" << needle << "\" is missing after offset "
                          << pos << " in:\n"
                          << haystack;
            return prx;
        }
        pos = found + needle.size();
    }
    return true;
}

} // namespace dismay_tests
