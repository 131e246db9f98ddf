#pragma once

#include <cstddef>

#include <gmock/gmock.h>

#include <dismay/capture/stack_trace.hpp>

class backtrace_provider_mock : public dismay::backtrace_provider
{
public:
    MOCK_METHOD(dismay::stack_trace,
                capture,
                (std::size_t skip),
                (const, override));
};
