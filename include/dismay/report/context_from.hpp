#pragma once

#include <vector>

#include <dismay/process.hpp>
#include <dismay/report/section.hpp>

namespace dismay
{
/**
 * @brief A single `Command:` section holding the quoted program and its
 * arguments.
 */
auto context_sections(command const &source) -> std::vector<section>;

/**
 * @brief A single `Exit Status:` section describing the exit code, or the
 * terminating signal if no exit code is available.
 */
auto context_sections(exit_status const &source) -> std::vector<section>;

/**
 * @brief The exit status section followed by a `Stdout:` and a `Stderr:`
 * section.
 *
 * Both stream sections are added even if the stream is empty. Invalid UTF-8
 * sequences are replaced with U+FFFD.
 */
auto context_sections(process_output const &source) -> std::vector<section>;

} // namespace dismay
