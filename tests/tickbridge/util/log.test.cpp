#include <tickbridge/util/log.hpp>

#include "../../tickbridge_test_common.hpp"

namespace tickbridge
{

TEST_CASE("'Log' test case 1", "[tickbridge::util::log]")
{
	CHECK(Log::levelFromName("warn") == Log::Level::Warn);
	CHECK(Log::levelFromName("WARN") == Log::Level::Warn);
	CHECK(Log::levelFromName("Trace") == Log::Level::Trace);
	CHECK(Log::levelFromName("off") == Log::Level::Off);
	CHECK_FALSE(Log::levelFromName("warning").has_value());
	CHECK_FALSE(Log::levelFromName("").has_value());

	for (Log::Level level : { Log::Level::Trace, Log::Level::Debug, Log::Level::Info, Log::Level::Warn,
			 Log::Level::Error, Log::Level::Fatal, Log::Level::Off }) {
		CHECK(Log::levelFromName(Log::levelName(level)) == level);
	}
}

TEST_CASE("'Log' test case 2", "[tickbridge::util::log]")
{
	const Log::Level initial = Log::level();

	Log::setLevel(Log::Level::Error);
	CHECK_FALSE(Log::willBeLogged(Log::Level::Warn));
	CHECK(Log::willBeLogged(Log::Level::Error));
	CHECK(Log::willBeLogged(Log::Level::Fatal));
	// Filtered out, not even formatted
	Log::info("not printed {}", 42);

	Log::setLevel(Log::Level::Off);
	CHECK_FALSE(Log::willBeLogged(Log::Level::Fatal));

	Log::setLevel(initial);
	CHECK(Log::level() == initial);
}

} // namespace tickbridge
