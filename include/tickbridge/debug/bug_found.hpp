#pragma once

#include <tickbridge/visibility.hpp>

#include <source_location>
#include <string_view>

namespace tickbridge::debug
{

// Call when a contract the library relies on was broken by the caller
// or by the library itself, e.g. two threads running one drain step.
//
// Prints a fatal log message with stacktrace and explanation,
// asks to report the issue and then calls `abort()`.
[[noreturn]] TICKBRIDGE_API void bugFound(std::string_view message = "",
	std::source_location where = std::source_location::current());

} // namespace tickbridge::debug
