#include <fstream>
#include <string>

#include <fmt/format.h>

#include <dismay/dismay.hpp>

namespace dismay::examples
{
namespace
{
void read_file(std::string const &path)
{
    DISMAY_SPAN("panic_hook", "read_file", fmt::format("path={:?}", path));

    std::ifstream file(path);
    if (!file)
    {
        panic(fmt::format("failed to open {:?}", path));
    }
}

void read_config()
{
    DISMAY_SPAN("panic_hook", "read_config");
    read_file("fake_file");
}

auto main() -> result<void>
{
    read_config();
    return success();
}
} // namespace
} // namespace dismay::examples

auto main() -> int
{
    dismay::tracing::error_layer const layer;

    auto const owner
            = dismay::hook_builder()
                      .capture_span_trace_by_default(true)
                      .panic_section("consider reporting the bug on github")
                      .into_hook();
    if (auto rx = owner.install(); rx.has_error())
    {
        dismay::detail::print_error(rx.assume_error());
        return 1;
    }
    dismay::install_panic_hook(owner);

    return dismay::supervise(&dismay::examples::main, owner);
}
