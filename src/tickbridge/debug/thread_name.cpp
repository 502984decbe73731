#include <tickbridge/debug/thread_name.hpp>

#include <tickbridge/util/log.hpp>

#include <pthread.h>

#include <algorithm>
#include <cstdarg>
#include <cstdio>
#include <cstring>

namespace tickbridge::debug
{

// Pthreads limit to 16 characters including null terminator
constexpr static size_t LIMIT = 16;

void setThreadName(std::string_view name)
{
	char buf[LIMIT] = {};
	memcpy(buf, name.data(), std::min(LIMIT - 1, name.size()));

	if (int res = pthread_setname_np(pthread_self(), buf); res != 0) [[unlikely]] {
		// Not critical, only debuggers and stacktraces care about it
		Log::debug("pthread_setname_np('{}') failed with code {}", buf, res);
	}
}

void setThreadName(const char *fmt, ...)
{
	va_list arg;
	va_start(arg, fmt);

	char buf[LIMIT];
	vsnprintf(buf, LIMIT, fmt, arg);
	va_end(arg);

	setThreadName(std::string_view(buf));
}

} // namespace tickbridge::debug
