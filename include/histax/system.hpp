#pragma once

#include <string>

namespace histax {
namespace system {

/**
 * @brief Reads a boolean environment flag.
 *
 * A flag is set when the variable exists and equals "1", "true", "yes" or
 * "on" (case-insensitive). Anything else, including an unset variable, is
 * false.
 */
bool env_flag(const char *name);

/**
 * @brief Whether HISTAX_TRACE asked for tracing at startup.
 *
 * Read once; later changes to the environment are ignored.
 */
bool trace_requested();

} // namespace system
} // namespace histax
