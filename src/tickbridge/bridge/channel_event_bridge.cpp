#include <tickbridge/bridge/channel_event_bridge.hpp>

#include <tickbridge/debug/bug_found.hpp>
#include <tickbridge/util/error_condition.hpp>

#include <fmt/format.h>

namespace tickbridge::bridge::detail
{

void reportConcurrentDrain(const std::type_info &event_type)
{
	auto msg = fmt::format("{}: drain step for event type '{}' entered by two threads at once",
		make_error_condition(BridgeErrc::InvariantViolation).message(), event_type.name());
	debug::bugFound(msg);
}

} // namespace tickbridge::bridge::detail
