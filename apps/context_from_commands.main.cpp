#include <fmt/format.h>

#include <dismay/dismay.hpp>

namespace dismay::examples
{
namespace
{
auto visit_the_shell() -> result<void>
{
    DISMAY_SPAN("context_from_commands", "visit_the_shell");

    command cmd("bash");
    // the unbalanced ' makes bash fail
    cmd.arg("-c").arg("echo 'Hello bash, I hope you're doing well!'");

    DISMAY_TRY(output, help::context_from(cmd.output(), cmd));
    if (!output.status.success())
    {
        return report::msg("invalid bash command")
                .context_from(cmd)
                .context_from(output);
    }
    return success();
}

auto main() -> result<void>
{
    DISMAY_SPAN("context_from_commands", "main");

    DISMAY_TRY(
            hook_builder().capture_span_trace_by_default(true).install());
    return visit_the_shell();
}
} // namespace
} // namespace dismay::examples

auto main() -> int
{
    dismay::tracing::error_layer const layer;
    return dismay::supervise(&dismay::examples::main);
}
