#pragma once

#include <tickbridge/visibility.hpp>

#include <string_view>

namespace tickbridge::debug
{

// Set debugger name for the current thread. String must be pure ASCII.
// Length limit is 15 characters, longer strings are truncated.
TICKBRIDGE_API void setThreadName(std::string_view name);

[[gnu::format(__printf__, 1, 2)]] TICKBRIDGE_API void setThreadName(const char *fmt, ...);

} // namespace tickbridge::debug
