#pragma once

#include <dismay/capture/span_trace.hpp>
#include <dismay/capture/stack_trace.hpp>
#include <dismay/config.hpp>
#include <dismay/panic.hpp>
#include <dismay/process.hpp>
#include <dismay/report/context_from.hpp>
#include <dismay/report/errc.hpp>
#include <dismay/report/help.hpp>
#include <dismay/report/report.hpp>
#include <dismay/report/report_exception.hpp>
#include <dismay/report/section.hpp>
#include <dismay/result.hpp>
