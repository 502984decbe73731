#include <tickbridge/util/log.hpp>

#include <fmt/chrono.h>
#include <fmt/color.h>
#include <fmt/format.h>

#include <unistd.h>

#include <algorithm>
#include <cctype>
#include <chrono>
#include <cstdio>
#include <system_error>

namespace tickbridge
{

Log::Level Log::m_current_level = Log::Level::Info;

// Thread-local "waterline cache" buffer to avoid allocations on each print.
// Worker threads log concurrently, each one gets its own buffer.
static thread_local fmt::memory_buffer t_message_buffer;

static fmt::text_style styleForLevel(Log::Level level) noexcept
{
	fmt::text_style style;

	switch (level) {
	case Log::Level::Trace:
		style |= fmt::fg(fmt::color::wheat);
		break;
	case Log::Level::Debug:
		style |= fmt::fg(fmt::color::light_sea_green);
		break;
	case Log::Level::Info:
		style |= fmt::fg(fmt::color::green);
		break;
	case Log::Level::Warn:
		style |= fmt::fg(fmt::color::yellow);
		break;
	case Log::Level::Error:
		style |= fmt::fg(fmt::color::red);
		break;
	case Log::Level::Fatal:
		style = fmt::emphasis::bold | fmt::fg(fmt::color::white) | fmt::bg(fmt::color::red);
		break;
	case Log::Level::Off:
		break;
	} // No `default` to make `-Werror -Wswitch` protection work

	return style;
}

void Log::doLog(Level level, std::source_location where, std::string_view format_str,
	fmt::format_args format_args) noexcept
{
	auto &msgbuf = t_message_buffer;
	msgbuf.clear();

	try {
		fmt::vformat_to(std::back_inserter(msgbuf), format_str, format_args);
	}
	catch (const fmt::format_error &err) {
		level = std::max(level, Level::Error);
		msgbuf.clear();
		fmt::format_to(std::back_inserter(msgbuf), "Caught fmt::format_error when trying to log: {}", err.what());
	}
	catch (const std::exception &err) {
		// Most likely `std::bad_alloc` or a throwing user-defined formatter
		level = std::max(level, Level::Error);
		msgbuf.clear();
		fmt::format_to(std::back_inserter(msgbuf), "Caught exception when trying to log: {}", err.what());
	}

	const std::string_view text(msgbuf.data(), msgbuf.size());
	const auto pid = getpid();
	const auto tid = gettid();

	try {
		// stdout for `X <= Info`, stderr for `X >= Warn`
		FILE *sink = stdout;
		if (level >= Level::Warn) {
			// Flush `stdout` to not mess the messages when it's directed to same output as `stderr`
			fflush(stdout);
			sink = stderr;
		}

		fmt::print(sink, "[{:%F %T}][{} {}][{:s}:{:d}][{:s}] {:s}\n", std::chrono::system_clock::now(), pid, tid,
			where.file_name(), where.line(), fmt::styled(levelName(level), styleForLevel(level)), text);
	}
	catch (const std::system_error &err) {
		// Printing to `sink` failed for system reasons, retrying on `stderr` is the best we can do
		fflush(stdout);
		fprintf(stderr, "[XXXX-XX-XX XX:XX:XX][%d %d][%s:%u][ERROR] std::system_error when printing log: %s:%d (%s)\n",
			pid, tid, where.file_name(), where.line(), err.code().category().name(), err.code().value(), err.what());
	}
	catch (const std::exception &err) {
		fflush(stdout);
		fprintf(stderr, "[XXXX-XX-XX XX:XX:XX][%d %d][%s:%u][ERROR] Exception when printing log: %s\n", pid, tid,
			where.file_name(), where.line(), err.what());
	}
}

void Log::setLevel(Level level) noexcept
{
	m_current_level = level;
	info("Changing log level to [{}]", levelName(level));
}

std::string_view Log::levelName(Level level) noexcept
{
	using namespace std::string_view_literals;

	switch (level) {
	case Level::Trace:
		return "TRACE"sv;
	case Level::Debug:
		return "DEBUG"sv;
	case Level::Info:
		return "INFO"sv;
	case Level::Warn:
		return "WARN"sv;
	case Level::Error:
		return "ERROR"sv;
	case Level::Fatal:
		return "FATAL"sv;
	case Level::Off:
		return "OFF"sv;
	} // No `default` to make `-Werror -Wswitch` protection work

	return "UNKNOWN"sv;
}

std::optional<Log::Level> Log::levelFromName(std::string_view name) noexcept
{
	constexpr Level ALL_LEVELS[] = { Level::Trace, Level::Debug, Level::Info, Level::Warn, Level::Error,
		Level::Fatal, Level::Off };

	for (Level level : ALL_LEVELS) {
		std::string_view candidate = levelName(level);
		bool equal = std::ranges::equal(name, candidate, [](char a, char b) {
			return std::toupper(static_cast<unsigned char>(a)) == b;
		});

		if (equal) {
			return level;
		}
	}

	return std::nullopt;
}

} // namespace tickbridge
