#pragma once

#include <tickbridge/visibility.hpp>

#include <fmt/core.h>

#include <optional>
#include <source_location>
#include <string_view>
#include <type_traits>

namespace tickbridge
{

class TICKBRIDGE_API Log {
public:
	// Log levels are defined by increasing severity - it's valid to compare them as integers
	enum class Level : int {
		/* Implementation details of some specific action (e.g. state of every task wakeup).
		 * Too noisy for anything but a single debugging session. */
		Trace,
		/* Low-level workflow information (e.g. a callback delivered to a task which is already gone).
		 * Useful when investigating ordering problems between the pump and background tasks. */
		Debug,
		/* High-level workflow information (e.g. runtime start/stop, bridge registration). */
		Info,
		/* An error happened, but the current action can still be completed, though with some negative impact. */
		Warn,
		/* An error happened which makes completing the current action impossible
		 * (e.g. a main-thread callback threw) but the program can continue. */
		Error,
		/* An error happened which makes further program execution impossible. In most
		 * cases this means a bug in the code, e.g. a violated single-consumer invariant. */
		Fatal,

		Off // Not actually a logging level, use it with `setLevel` to disable logging completely
	};

	// Format string bundled with the call site location. Constructed implicitly
	// from string literals, so `Log::info("x = {}", x)` records where it was called.
	// To log "as if" from another location, construct it explicitly: `{ "text", where }`.
	struct Format {
		template<typename S>
			requires std::is_convertible_v<const S &, std::string_view>
		Format(const S &str, std::source_location loc = std::source_location::current()) noexcept
			: text(str), where(loc)
		{}

		std::string_view text;
		std::source_location where;
	};

	template<typename... Args>
	static void log(Level level, Format format, Args &&...args) noexcept
	{
		if (!willBeLogged(level)) {
			return;
		}
		doLog(level, format.where, format.text, fmt::make_format_args(args...));
	}

	template<typename... Args>
	static void trace(Format format, Args &&...args) noexcept
	{
		log(Level::Trace, format, std::forward<Args>(args)...);
	}

	template<typename... Args>
	static void debug(Format format, Args &&...args) noexcept
	{
		log(Level::Debug, format, std::forward<Args>(args)...);
	}

	template<typename... Args>
	static void info(Format format, Args &&...args) noexcept
	{
		log(Level::Info, format, std::forward<Args>(args)...);
	}

	template<typename... Args>
	static void warn(Format format, Args &&...args) noexcept
	{
		log(Level::Warn, format, std::forward<Args>(args)...);
	}

	template<typename... Args>
	static void error(Format format, Args &&...args) noexcept
	{
		log(Level::Error, format, std::forward<Args>(args)...);
	}

	template<typename... Args>
	static void fatal(Format format, Args &&...args) noexcept
	{
		log(Level::Fatal, format, std::forward<Args>(args)...);
	}

	// Returns the current logging level.
	// Initially it is set to `Info`, change it with `setLevel`.
	static Level level() noexcept { return m_current_level; }
	// Changes the current logging level
	static void setLevel(Level level) noexcept;
	// Returns whether logging with the given level will ultimately output something
	static bool willBeLogged(Level level) noexcept { return level >= m_current_level; }

	// Printable level name, e.g. "WARN"
	static std::string_view levelName(Level level) noexcept;
	// Inverse of `levelName`, case-insensitive
	static std::optional<Level> levelFromName(std::string_view name) noexcept;

private:
	Log() = delete;

	static Level m_current_level;

	static void doLog(Level level, std::source_location where, std::string_view format_str,
		fmt::format_args format_args) noexcept;
};

} // namespace tickbridge
