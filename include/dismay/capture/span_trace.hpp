#pragma once

#include <cstdint>

#include <source_location>
#include <string>
#include <string_view>
#include <vector>

#include <boost/preprocessor/cat.hpp>

#include <dismay/report/fwd.hpp>

namespace dismay
{
struct theme;
}

namespace dismay::tracing
{
struct span_record
{
    std::string target;
    std::string name;
    std::string fields;
    std::string file;
    std::uint_least32_t line;
};

/**
 * @brief Installs the process wide span collector for its lifetime.
 *
 * Spans are only recorded while at least one layer is alive, span trace
 * capture reports span_trace_status::unsupported otherwise.
 */
class error_layer final
{
public:
    error_layer() noexcept;
    ~error_layer() noexcept;

    error_layer(error_layer const &) = delete;
    auto operator=(error_layer const &) -> error_layer & = delete;

    static auto installed() noexcept -> bool;
};

/**
 * @brief Enters a span on the current thread, the span is exited on
 * destruction.
 */
class span final
{
public:
    span(std::string_view target,
         std::string_view name,
         std::string fields = {},
         std::source_location location = std::source_location::current());
    ~span() noexcept;

    span(span const &) = delete;
    auto operator=(span const &) -> span & = delete;

private:
    span_record mRecord;
    bool mEntered;
};

enum class span_trace_status
{
    captured,
    unsupported,
    empty,
};

class span_trace final
{
public:
    span_trace() noexcept;
    span_trace(span_trace_status status,
               std::vector<span_record> spans) noexcept;

    static auto capture() -> span_trace;

    [[nodiscard]] auto status() const noexcept -> span_trace_status;
    [[nodiscard]] auto spans() const noexcept
            -> std::vector<span_record> const &;

private:
    span_trace_status mStatus;
    std::vector<span_record> mSpans;
};

void format_span_trace(format_buffer &out,
                       span_trace const &trace,
                       theme const &colors);

} // namespace dismay::tracing

// NOLINTBEGIN(cppcoreguidelines-macro-usage)

#define DISMAY_SPAN(...)                                                       \
    ::dismay::tracing::span BOOST_PP_CAT(dismaySpan, __LINE__)                 \
    {                                                                          \
        __VA_ARGS__                                                            \
    }

// NOLINTEND(cppcoreguidelines-macro-usage)
